#ifndef BASSLINE_NETWORK_CONFIG_H
#define BASSLINE_NETWORK_CONFIG_H

#include <bassline/bassline_base.h>

namespace bassline {

    struct BASSLINE_EXPORT NetworkConfig {
        // Dirty-queue pops allowed in one pass before it is declared non-convergent.
        std::size_t max_propagation_steps{10000};
        // Skip re-invoking a pure gadget whose inputs match its last successful invocation.
        bool        cache_pure_gadgets{true};
        std::string id_prefix_contact{"contact"};
        std::string id_prefix_wire{"wire"};
        std::string id_prefix_group{"group"};
    };

} // namespace bassline

#endif  // BASSLINE_NETWORK_CONFIG_H
