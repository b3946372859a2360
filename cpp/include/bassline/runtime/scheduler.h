#ifndef BASSLINE_SCHEDULER_H
#define BASSLINE_SCHEDULER_H

#include <bassline/bassline_base.h>
#include <bassline/runtime/network_config.h>
#include <bassline/runtime/network_state.h>
#include <bassline/runtime/propagation_observer.h>
#include <bassline/types/error_type.h>

#include <deque>
#include <optional>

namespace bassline {

    /**
     * What a propagation pass did. Contradictions and gadget faults do not stop a pass, they are
     * collected here.
     */
    struct BASSLINE_EXPORT PropagationResult {
        std::size_t                       steps{0};
        std::size_t                       gadget_evaluations{0};
        std::vector<ContactId>            updated_contacts{};
        std::vector<ContactContradiction> contradictions{};
        std::vector<GadgetFault>          gadget_faults{};

        [[nodiscard]] bool ok() const { return contradictions.empty() && gadget_faults.empty(); }

        [[nodiscard]] bool updated(const ContactId &contact) const;
    };

    /**
     * Drives the network to a fixpoint.
     *
     * Contacts whose value changes are queued (each at most once). A pass pops contacts, pushes
     * their value over every wire touching them and evaluates the gadget of any primitive group the
     * contact is an input port of. Deliveries that would not change the receiver are dropped, which
     * is what lets cyclic Merge topologies terminate.
     *
     * Every contact written since the last completed pass is journaled with its prior content; when
     * a pass exceeds the step cap the journal is replayed and NonConvergenceError is thrown.
     */
    struct BASSLINE_EXPORT PropagationScheduler {
        PropagationScheduler(NetworkState &state, const NetworkConfig &config);

        PropagationScheduler(const PropagationScheduler &) = delete;
        PropagationScheduler &operator=(const PropagationScheduler &) = delete;

        /**
         * External write to a contact. Throws Contradiction (contact unchanged) when the value has no
         * join with the current content. Returns true and queues the contact when the value changed.
         */
        bool write(const ContactId &contact_id, const LatticeValue &value);

        /**
         * Push value from source into target as a wire would. Contradictions are recorded in the
         * pending result rather than thrown.
         */
        void deliver(const ContactId &source, const ContactId &target, const LatticeValue &value);

        void mark_dirty(const ContactId &contact_id);

        /**
         * Drain the queue. Not re-entrant: calling it from inside a pass throws std::logic_error.
         */
        PropagationResult propagate();

        [[nodiscard]] bool is_propagating() const { return _propagating; }

        /**
         * Drop cached gadget inputs, e.g. after an import replaced the gadget's group.
         */
        void reset_gadget_cache(const GroupId &group_id);

        void add_observer(propagation_observer_s_ptr observer);

        void remove_observer(const propagation_observer_s_ptr &observer);

    private:
        void _evaluate_gadget(const GroupId &group_id);

        void _record_undo(const Contact &contact);

        void _record_updated(const ContactId &contact_id);

        void _rollback();

        template<typename Fn>
        void _notify(Fn &&fn) const;

        NetworkState        &_state;
        const NetworkConfig &_config;

        std::deque<ContactId> _queue;
        id_set<ContactId>     _queued;
        bool                  _propagating{false};

        PropagationResult                                 _result;
        id_set<ContactId>                                 _updated;
        id_map<ContactId, std::optional<LatticeValue>>    _undo;
        id_map<GroupId, std::optional<PortValues>>        _gadget_undo;
        id_map<GroupId, PortValues>                       _state_undo;
        std::vector<propagation_observer_s_ptr>           _observers;
    };

} // namespace bassline

#endif  // BASSLINE_SCHEDULER_H
