#include <bassline/runtime/session_registry.h>
#include <bassline/util/errors.h>

namespace bassline {

    SessionRegistry::SessionRegistry(gadget_registry_s_ptr gadgets, NetworkConfig config)
        : _gadgets{std::move(gadgets)}, _config{std::move(config)} {
        if (_gadgets == nullptr) { throw std::invalid_argument("SessionRegistry requires a gadget registry"); }
    }

    propagation_network_s_ptr SessionRegistry::create(const SessionId &session_id) {
        if (session_id.empty()) { throw std::invalid_argument("Session id cannot be empty"); }
        if (_sessions.contains(session_id)) {
            throw_error<std::invalid_argument>("Session '{}' already exists", session_id);
        }
        auto network{std::make_shared<PropagationNetwork>(_gadgets, _config)};
        _sessions.emplace(session_id, network);
        return network;
    }

    propagation_network_s_ptr SessionRegistry::find(const SessionId &session_id) const {
        auto it{_sessions.find(session_id)};
        return it == _sessions.end() ? nullptr : it->second;
    }

    propagation_network_s_ptr SessionRegistry::get(const SessionId &session_id) const {
        auto network{find(session_id)};
        if (network == nullptr) { throw_error<std::out_of_range>("Unknown session '{}'", session_id); }
        return network;
    }

    bool SessionRegistry::remove(const SessionId &session_id) { return _sessions.erase(session_id) > 0; }

    std::vector<SessionId> SessionRegistry::session_ids() const {
        std::vector<SessionId> result;
        result.reserve(_sessions.size());
        for (const auto &[id, _] : _sessions) { result.push_back(id); }
        return result;
    }

} // namespace bassline
