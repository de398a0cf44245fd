#ifndef QUESTIONNAIRE_HPP
#define QUESTIONNAIRE_HPP

#include "install_plan.hpp"

// import archi
#include "archi/system_query.hpp"

#include <optional>  // for optional
#include <string>    // for string

namespace tui {

struct QuestionnaireResult final {
    installer::PlanChoices choices{};
    /// Device path typed a second time on the confirmation screen
    std::string retyped_device{};
};

/// @brief Ask every question of an interactive run.
/// @return nullopt when the operator cancels a prompt or declines the confirmation.
auto run_questionnaire(const archi::system::HardwareInfo& hw_info) noexcept -> std::optional<QuestionnaireResult>;

}  // namespace tui

#endif  // QUESTIONNAIRE_HPP
