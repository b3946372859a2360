#ifndef BASSLINE_ERROR_TYPE_H
#define BASSLINE_ERROR_TYPE_H

#include <bassline/bassline_base.h>
#include <bassline/types/value.h>

#include <exception>
#include <ostream>
#include <stdexcept>

namespace bassline {

    /**
     * Raised when two values have no join in the lattice. The operands are kept so that callers
     * (and subscribers) can report what collided.
     */
    struct BASSLINE_EXPORT Contradiction : std::runtime_error {
        Contradiction(std::string reason_, LatticeValue left_, LatticeValue right_);

        std::string  reason;
        LatticeValue left;
        LatticeValue right;
    };

    /**
     * Topology errors: unknown or duplicate ids, wires that cannot be owned by a single group,
     * boundary invariant violations, unknown primitive ids. Always raised synchronously.
     */
    struct BASSLINE_EXPORT StructuralError : std::logic_error {
        using std::logic_error::logic_error;
    };

    /**
     * Raised when a propagation pass exceeds the configured step cap. The pass is rolled back
     * before this escapes the scheduler.
     */
    struct BASSLINE_EXPORT NonConvergenceError : std::runtime_error {
        NonConvergenceError(std::size_t steps_, std::size_t limit_, ContactId last_contact_);

        std::size_t steps;
        std::size_t limit;
        ContactId   last_contact;
    };

    /**
     * A downstream delivery that contradicted, recorded during propagation.
     */
    struct BASSLINE_EXPORT ContactContradiction {
        ContactId     contact_id;
        Contradiction error;

        [[nodiscard]] std::string to_string() const;
    };

    /**
     * A gadget body (or activation predicate) that threw. The gadget's outputs were not published.
     */
    struct BASSLINE_EXPORT GadgetFault {
        GroupId     group_id;
        std::string gadget_name;
        std::string error_msg;
        std::string inputs;
        std::string additional_context;

        [[nodiscard]] std::string to_string() const;

        friend std::ostream &operator<<(std::ostream &os, const GadgetFault &fault);

        static GadgetFault capture_error(const std::exception &e, const GroupId &group_id,
                                         const std::string &gadget_name, const std::string &inputs = "",
                                         const std::string &msg = "");

        static GadgetFault capture_error(std::exception_ptr e, const GroupId &group_id,
                                         const std::string &gadget_name, const std::string &inputs = "",
                                         const std::string &msg = "");
    };

} // namespace bassline

#endif  // BASSLINE_ERROR_TYPE_H
