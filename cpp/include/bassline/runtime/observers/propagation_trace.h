#pragma once

#include <bassline/runtime/propagation_observer.h>

#include <optional>
#include <ostream>
#include <string>

namespace bassline {

    /**
     * @brief Logs out the steps of each propagation pass.
     *
     * This is voluminous but can be helpful tracing down unexpected convergence behaviour, every
     * contact update, suppressed delivery, gadget run and failure is reported.
     */
    class BASSLINE_EXPORT PropagationTrace : public PropagationObserver {
    public:
        /**
         * @brief Construct a new Propagation Trace object
         *
         * @param filter Used to restrict which contact and gadget events to report (substring match on ids)
         * @param pass Log pass start / end events
         * @param contact Log contact related events
         * @param gadget Log gadget related events
         * @param errors Log contradictions, gadget faults and non-convergence
         * @param out Stream to write to, when null stderr (or stdout, see set_use_logger) is used
         */
        explicit PropagationTrace(const std::optional<std::string> &filter = std::nullopt, bool pass = true,
                                  bool contact = true, bool gadget = true, bool errors = true,
                                  std::ostream *out = nullptr);

        void on_before_propagation(std::size_t queued) override;
        void on_after_propagation(const PropagationResult &result) override;
        void on_contact_updated(const Contact &contact, const std::optional<LatticeValue> &previous) override;
        void on_delivery_suppressed(const ContactId &source, const ContactId &target) override;
        void on_contradiction(const ContactContradiction &contradiction) override;
        void on_before_gadget_evaluation(const GroupId &group_id, const GadgetSpec &gadget,
                                         const PortValues &inputs) override;
        void on_after_gadget_evaluation(const GroupId &group_id, const GadgetSpec &gadget,
                                        const PortValues &outputs) override;
        void on_gadget_fault(const GadgetFault &fault) override;
        void on_non_convergence(const NonConvergenceError &error) override;

        // Static configuration
        static void set_print_suppressed(bool value);
        static void set_use_logger(bool value);

    private:
        std::optional<std::string> _filter;
        bool _pass;
        bool _contact;
        bool _gadget;
        bool _errors;
        std::ostream *_out;
        std::size_t _pass_count{0};

        static bool _print_suppressed;
        static bool _use_logger;

        void _print(const std::string &msg) const;
        [[nodiscard]] bool _should_log(const std::string &id) const;
        [[nodiscard]] static std::string _ports(const PortValues &ports);
    };

} // namespace bassline
