#pragma once
#include "event_message.h"

namespace csim {

/// @brief Enumerates the experiment executive actions
enum class RunnerAction {
    /// @brief Start projection experiment
    start,

    /// @brief Begin a new scenario run
    run_begin,

    /// @brief End a scenario run
    run_end,

    /// @brief Finish projection experiment
    finish
};

/// @brief Implements the experiment executive event message data type
struct RunnerEventMessage final : public EventMessage {

    RunnerEventMessage() = delete;

    /// @brief Initialise a new instance of the RunnerEventMessage class.
    /// @param sender The sender identifier
    /// @param run_action The event action
    RunnerEventMessage(std::string sender, RunnerAction run_action) noexcept;

    /// @brief Initialise a new instance of the RunnerEventMessage class.
    /// @param sender The sender identifier
    /// @param run_action The event action
    /// @param run The scenario run number
    /// @param elapsed Action elapsed time in milliseconds
    RunnerEventMessage(std::string sender, RunnerAction run_action, unsigned int run,
                       double elapsed) noexcept;

    /// @brief The experiment executive action
    const RunnerAction action{};

    /// @brief The action elapsed time in milliseconds
    const double elapsed_ms{};

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};
} // namespace csim
