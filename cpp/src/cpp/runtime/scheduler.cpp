#include <bassline/runtime/scheduler.h>
#include <bassline/util/scope.h>

#include <algorithm>
#include <cstdio>

namespace bassline {

    namespace {
        std::string describe_ports(const PortValues &ports) {
            std::vector<std::string> parts;
            parts.reserve(ports.size());
            for (const auto &[port, value] : ports) { parts.push_back(fmt::format("{}={}", port, value)); }
            return fmt::format("{}", fmt::join(parts, ", "));
        }
    } // namespace

    bool PropagationResult::updated(const ContactId &contact) const {
        return std::find(updated_contacts.begin(), updated_contacts.end(), contact) != updated_contacts.end();
    }

    PropagationScheduler::PropagationScheduler(NetworkState &state, const NetworkConfig &config)
        : _state{state}, _config{config} {
    }

    template<typename Fn>
    void PropagationScheduler::_notify(Fn &&fn) const {
        for (const auto &observer : _observers) {
            try {
                fn(*observer);
            } catch (const std::exception &e) {
                fmt::print(stderr, "Warning: exception in propagation observer: {}\n", e.what());
            }
        }
    }

    bool PropagationScheduler::write(const ContactId &contact_id, const LatticeValue &value) {
        auto &contact{_state.contact(contact_id)};
        auto  next{contact.blend(value)};
        if (contact.content.has_value() && *contact.content == next) { return false; }

        _record_undo(contact);
        auto previous{std::exchange(contact.content, std::move(next))};
        _record_updated(contact_id);
        mark_dirty(contact_id);
        _notify([&](PropagationObserver &o) { o.on_contact_updated(contact, previous); });
        return true;
    }

    void PropagationScheduler::deliver(const ContactId &source, const ContactId &target, const LatticeValue &value) {
        auto *contact{_state.find_contact(target)};
        if (contact == nullptr) { return; }

        LatticeValue next;
        try {
            next = contact->blend(value);
        } catch (const Contradiction &e) {
            _result.contradictions.push_back(ContactContradiction{target, e});
            _notify([&](PropagationObserver &o) { o.on_contradiction(_result.contradictions.back()); });
            return;
        }

        if (contact->content.has_value() && *contact->content == next) {
            _notify([&](PropagationObserver &o) { o.on_delivery_suppressed(source, target); });
            return;
        }

        _record_undo(*contact);
        auto previous{std::exchange(contact->content, std::move(next))};
        _record_updated(target);
        mark_dirty(target);
        _notify([&](PropagationObserver &o) { o.on_contact_updated(*contact, previous); });
    }

    void PropagationScheduler::mark_dirty(const ContactId &contact_id) {
        if (_queued.insert(contact_id).second) { _queue.push_back(contact_id); }
    }

    PropagationResult PropagationScheduler::propagate() {
        if (_propagating) { throw std::logic_error("propagate() called while a propagation pass is running"); }
        _propagating = true;
        auto reset_flag{make_scope_exit([this]() { _propagating = false; })};

        _notify([&](PropagationObserver &o) { o.on_before_propagation(_queue.size()); });
        try {
            while (!_queue.empty()) {
                if (_result.steps >= _config.max_propagation_steps) {
                    throw NonConvergenceError(_result.steps, _config.max_propagation_steps, _queue.front());
                }
                auto contact_id{std::move(_queue.front())};
                _queue.pop_front();
                _queued.erase(contact_id);
                ++_result.steps;

                const auto *contact{_state.find_contact(contact_id)};
                if (contact == nullptr || !contact->content.has_value()) { continue; }
                auto value{*contact->content};

                for (const auto &wire_id : _state.wires_touching(contact_id)) {
                    const auto *wire{_state.find_wire(wire_id)};
                    if (wire == nullptr) { continue; }
                    if (auto target{wire->delivery_target(contact_id)}; target.has_value()) {
                        deliver(contact_id, *target, value);
                    }
                }

                if (auto it{_state.gadget_inputs.find(contact_id)}; it != _state.gadget_inputs.end()) {
                    _evaluate_gadget(it->second);
                }
            }
        } catch (const NonConvergenceError &e) {
            _rollback();
            _notify([&](PropagationObserver &o) { o.on_non_convergence(e); });
            throw;
        }

        auto result{std::exchange(_result, PropagationResult{})};
        _updated.clear();
        _undo.clear();
        _gadget_undo.clear();
        _state_undo.clear();
        _notify([&](PropagationObserver &o) { o.on_after_propagation(result); });
        return result;
    }

    void PropagationScheduler::reset_gadget_cache(const GroupId &group_id) {
        if (auto *instance{_state.find_gadget(group_id)}; instance != nullptr) { instance->last_inputs.reset(); }
    }

    void PropagationScheduler::add_observer(propagation_observer_s_ptr observer) {
        if (observer == nullptr) { throw std::invalid_argument("Cannot add a null propagation observer"); }
        _observers.emplace_back(std::move(observer));
    }

    void PropagationScheduler::remove_observer(const propagation_observer_s_ptr &observer) {
        auto it{std::find(_observers.begin(), _observers.end(), observer)};
        if (it != _observers.end()) { _observers.erase(it); }
    }

    void PropagationScheduler::_evaluate_gadget(const GroupId &group_id) {
        auto *instance{_state.find_gadget(group_id)};
        if (instance == nullptr) { return; }
        const auto &spec{*instance->spec};

        PortValues inputs;
        for (const auto &[port, contact_id] : instance->input_contacts) {
            const auto *contact{_state.find_contact(contact_id)};
            if (contact != nullptr && contact->content.has_value()) { inputs.emplace(port, *contact->content); }
        }

        PortValues outputs;
        auto       state{instance->state};
        try {
            if (!spec.is_ready(inputs)) { return; }
            if (_config.cache_pure_gadgets && spec.is_pure && instance->last_inputs == inputs) { return; }

            _notify([&](PropagationObserver &o) { o.on_before_gadget_evaluation(group_id, spec, inputs); });
            outputs = spec.invoke(inputs, state);
        } catch (...) {
            _result.gadget_faults.push_back(GadgetFault::capture_error(std::current_exception(), group_id,
                                                                       spec.qualified_name, describe_ports(inputs)));
            _notify([&](PropagationObserver &o) { o.on_gadget_fault(_result.gadget_faults.back()); });
            return;
        }
        ++_result.gadget_evaluations;

        if (state != instance->state) {
            if (!_state_undo.contains(group_id)) { _state_undo.emplace(group_id, instance->state); }
            instance->state = std::move(state);
        }
        if (spec.is_pure) {
            if (!_gadget_undo.contains(group_id)) { _gadget_undo.emplace(group_id, instance->last_inputs); }
            instance->last_inputs = inputs;
        }
        _notify([&](PropagationObserver &o) { o.on_after_gadget_evaluation(group_id, spec, outputs); });

        for (const auto &[port, value] : outputs) {
            auto it{instance->output_contacts.find(port)};
            if (it != instance->output_contacts.end()) { deliver(group_id, it->second, value); }
        }
    }

    void PropagationScheduler::_record_undo(const Contact &contact) {
        if (!_undo.contains(contact.id)) { _undo.emplace(contact.id, contact.content); }
    }

    void PropagationScheduler::_record_updated(const ContactId &contact_id) {
        if (_updated.insert(contact_id).second) { _result.updated_contacts.push_back(contact_id); }
    }

    void PropagationScheduler::_rollback() {
        for (auto &[contact_id, previous] : _undo) {
            if (auto *contact{_state.find_contact(contact_id)}; contact != nullptr) { contact->content = previous; }
        }
        for (auto &[group_id, previous] : _gadget_undo) {
            if (auto *instance{_state.find_gadget(group_id)}; instance != nullptr) { instance->last_inputs = previous; }
        }
        for (auto &[group_id, previous] : _state_undo) {
            if (auto *instance{_state.find_gadget(group_id)}; instance != nullptr) { instance->state = previous; }
        }
        _queue.clear();
        _queued.clear();
        _updated.clear();
        _undo.clear();
        _gadget_undo.clear();
        _state_undo.clear();
        _result = PropagationResult{};
    }

} // namespace bassline
