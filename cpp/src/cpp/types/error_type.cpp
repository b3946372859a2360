#include <bassline/types/error_type.h>

#include <utility>

namespace bassline {

    Contradiction::Contradiction(std::string reason_, LatticeValue left_, LatticeValue right_)
        : std::runtime_error(fmt::format("Contradiction: {} ({} vs {})", reason_, left_, right_)),
          reason{std::move(reason_)}, left{std::move(left_)}, right{std::move(right_)} {
    }

    NonConvergenceError::NonConvergenceError(std::size_t steps_, std::size_t limit_, ContactId last_contact_)
        : std::runtime_error(fmt::format("Propagation did not converge after {} steps (limit {}), last contact '{}'",
                                         steps_, limit_, last_contact_)),
          steps{steps_}, limit{limit_}, last_contact{std::move(last_contact_)} {
    }

    std::string ContactContradiction::to_string() const {
        return fmt::format("{}: {}", contact_id, error.what());
    }

    std::string GadgetFault::to_string() const {
        return fmt::format("{}[{}]{}: {}{}", gadget_name, group_id,
                           additional_context.empty() ? "" : " :: " + additional_context, error_msg,
                           inputs.empty() ? "" : "\nInputs: " + inputs);
    }

    std::ostream &operator<<(std::ostream &os, const GadgetFault &fault) {
        os << fault.to_string();
        return os;
    }

    GadgetFault GadgetFault::capture_error(const std::exception &e, const GroupId &group_id,
                                           const std::string &gadget_name, const std::string &inputs,
                                           const std::string &msg) {
        return GadgetFault{group_id, gadget_name, e.what(), inputs, msg};
    }

    GadgetFault GadgetFault::capture_error(std::exception_ptr e, const GroupId &group_id,
                                           const std::string &gadget_name, const std::string &inputs,
                                           const std::string &msg) {
        try {
            std::rethrow_exception(std::move(e));
        } catch (const std::exception &e_) {
            return capture_error(e_, group_id, gadget_name, inputs, msg);
        } catch (...) {
            return GadgetFault{group_id, gadget_name, "Unknown non-standard exception during gadget evaluation",
                               inputs, msg};
        }
    }

} // namespace bassline
