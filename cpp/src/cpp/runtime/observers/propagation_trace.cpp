#include <bassline/runtime/observers/propagation_trace.h>
#include <bassline/runtime/scheduler.h>
#include <bassline/types/contact.h>
#include <bassline/types/error_type.h>

#include <fmt/format.h>
#include <iostream>

namespace bassline {

    // Static member initialization
    bool PropagationTrace::_print_suppressed = false;
    bool PropagationTrace::_use_logger = true;

    PropagationTrace::PropagationTrace(const std::optional<std::string> &filter, bool pass, bool contact, bool gadget,
                                       bool errors, std::ostream *out)
        : _filter(filter), _pass(pass), _contact(contact), _gadget(gadget), _errors(errors), _out(out) {
    }

    void PropagationTrace::set_print_suppressed(bool value) {
        _print_suppressed = value;
    }

    void PropagationTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void PropagationTrace::_print(const std::string &msg) const {
        std::string formatted = fmt::format("[pass {}] {}", _pass_count, msg);
        if (_out != nullptr) {
            *_out << formatted << std::endl;
        } else if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    bool PropagationTrace::_should_log(const std::string &id) const {
        if (!_filter.has_value()) {
            return true;
        }
        return id.find(_filter.value()) != std::string::npos;
    }

    std::string PropagationTrace::_ports(const PortValues &ports) {
        std::vector<std::string> parts;
        for (const auto &[port, value] : ports) {
            parts.push_back(fmt::format("{}={}", port, value));
        }
        return fmt::format("{}", fmt::join(parts, ", "));
    }

    void PropagationTrace::on_before_propagation(std::size_t queued) {
        ++_pass_count;
        if (_pass) {
            _print(fmt::format("{} Propagation Start ({} queued) {}", std::string(20, '>'), queued,
                               std::string(20, '>')));
        }
    }

    void PropagationTrace::on_after_propagation(const PropagationResult &result) {
        if (_pass) {
            _print(fmt::format("{} Propagation Done: {} steps, {} updated, {} gadget runs, {} contradictions, "
                               "{} faults {}",
                               std::string(20, '<'), result.steps, result.updated_contacts.size(),
                               result.gadget_evaluations, result.contradictions.size(), result.gadget_faults.size(),
                               std::string(20, '<')));
        }
    }

    void PropagationTrace::on_contact_updated(const Contact &contact, const std::optional<LatticeValue> &previous) {
        if (_contact && _should_log(contact.id)) {
            _print(fmt::format("{} ({}) {} -> {}", contact.id, contact.blend_mode,
                               previous.has_value() ? previous->to_string() : "<unset>",
                               contact.content.has_value() ? contact.content->to_string() : "<unset>"));
        }
    }

    void PropagationTrace::on_delivery_suppressed(const ContactId &source, const ContactId &target) {
        if (_print_suppressed && _contact && (_should_log(source) || _should_log(target))) {
            _print(fmt::format("{} -> {} unchanged", source, target));
        }
    }

    void PropagationTrace::on_contradiction(const ContactContradiction &contradiction) {
        if (_errors && _should_log(contradiction.contact_id)) {
            _print(fmt::format("!! {}", contradiction.to_string()));
        }
    }

    void PropagationTrace::on_before_gadget_evaluation(const GroupId &group_id, const GadgetSpec &gadget,
                                                       const PortValues &inputs) {
        if (_gadget && _should_log(group_id)) {
            _print(fmt::format("{}<{}>({}) [IN]", gadget.qualified_name, group_id, _ports(inputs)));
        }
    }

    void PropagationTrace::on_after_gadget_evaluation(const GroupId &group_id, const GadgetSpec &gadget,
                                                      const PortValues &outputs) {
        if (_gadget && _should_log(group_id)) {
            _print(fmt::format("{}<{}> -> ({}) [OUT]", gadget.qualified_name, group_id, _ports(outputs)));
        }
    }

    void PropagationTrace::on_gadget_fault(const GadgetFault &fault) {
        if (_errors && _should_log(fault.group_id)) {
            _print(fmt::format("!! Gadget fault {}", fault.to_string()));
        }
    }

    void PropagationTrace::on_non_convergence(const NonConvergenceError &error) {
        if (_errors) {
            _print(fmt::format("!! {} (rolled back)", error.what()));
        }
    }

} // namespace bassline
