#ifndef BASSLINE_PRIMITIVE_GADGETS_H
#define BASSLINE_PRIMITIVE_GADGETS_H

#include <bassline/bassline_base.h>
#include <bassline/types/gadget.h>

namespace bassline {

    /**
     * Installs the built-in gadgets. Binary gadgets read ports "a" and "b", unary gadgets read "a",
     * all of them publish "result":
     *
     * math/add, math/subtract, math/multiply, math/divide, math/negate, math/abs,
     * compare/equals, compare/less-than, compare/greater-than,
     * logic/and, logic/or, logic/not,
     * string/concat, string/uppercase,
     * control/identity, control/gate ("value" is forwarded while "control" is true),
     * control/sequence (impure, "trigger" -> an increasing counter).
     *
     * Inputs of the wrong scalar kind make the body throw, which surfaces as a gadget fault.
     */
    BASSLINE_EXPORT void register_primitive_gadgets(GadgetRegistry &registry);

    /**
     * A fresh registry holding only the built-in gadgets.
     */
    [[nodiscard]] BASSLINE_EXPORT gadget_registry_s_ptr make_primitive_registry();

} // namespace bassline

#endif  // BASSLINE_PRIMITIVE_GADGETS_H
