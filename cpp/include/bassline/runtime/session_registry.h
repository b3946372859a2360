#ifndef BASSLINE_SESSION_REGISTRY_H
#define BASSLINE_SESSION_REGISTRY_H

#include <bassline/bassline_base.h>
#include <bassline/runtime/network.h>

#include <map>

namespace bassline {

    /**
     * Session id -> network. Each editor session owns one network; the registry is handed to whoever
     * routes requests to sessions.
     */
    struct BASSLINE_EXPORT SessionRegistry {
        explicit SessionRegistry(gadget_registry_s_ptr gadgets, NetworkConfig config = {});

        /**
         * Create a network for session_id. Throws std::invalid_argument when the session already exists.
         */
        propagation_network_s_ptr create(const SessionId &session_id);

        [[nodiscard]] propagation_network_s_ptr find(const SessionId &session_id) const;

        /**
         * As find but throws std::out_of_range for unknown sessions.
         */
        [[nodiscard]] propagation_network_s_ptr get(const SessionId &session_id) const;

        bool remove(const SessionId &session_id);

        [[nodiscard]] std::vector<SessionId> session_ids() const;

        [[nodiscard]] std::size_t size() const { return _sessions.size(); }

    private:
        gadget_registry_s_ptr                              _gadgets;
        NetworkConfig                                      _config;
        std::map<SessionId, propagation_network_s_ptr>     _sessions;
    };

} // namespace bassline

#endif  // BASSLINE_SESSION_REGISTRY_H
