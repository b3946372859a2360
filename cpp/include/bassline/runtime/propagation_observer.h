#ifndef BASSLINE_PROPAGATION_OBSERVER_H
#define BASSLINE_PROPAGATION_OBSERVER_H

#include <bassline/bassline_base.h>
#include <bassline/types/gadget.h>

namespace bassline {

    struct Contradiction;
    struct ContactContradiction;
    struct GadgetFault;
    struct NonConvergenceError;

    // PropagationObserver - externally owned, registered on a network for the lifetime of a run
    struct BASSLINE_EXPORT PropagationObserver {
        using ptr = propagation_observer_ptr;
        using s_ptr = propagation_observer_s_ptr;

        virtual ~PropagationObserver() = default;

        virtual void on_before_propagation(std::size_t) {
        };

        virtual void on_after_propagation(const PropagationResult &) {
        };

        virtual void on_contact_updated(const Contact &, const std::optional<LatticeValue> &) {
        };

        virtual void on_delivery_suppressed(const ContactId &, const ContactId &) {
        };

        virtual void on_contradiction(const ContactContradiction &) {
        };

        virtual void on_before_gadget_evaluation(const GroupId &, const GadgetSpec &, const PortValues &) {
        };

        virtual void on_after_gadget_evaluation(const GroupId &, const GadgetSpec &, const PortValues &) {
        };

        virtual void on_gadget_fault(const GadgetFault &) {
        };

        virtual void on_non_convergence(const NonConvergenceError &) {
        };
    };

} // namespace bassline

#endif  // BASSLINE_PROPAGATION_OBSERVER_H
