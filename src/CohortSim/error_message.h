#pragma once
#include "event_message.h"

namespace csim {

/// @brief Implements the projection error event message data type
struct ErrorEventMessage final : public EventMessage {

    ErrorEventMessage() = delete;

    /// @brief Initialises a new instance of the ErrorEventMessage structure.
    /// @param sender The sender identifier
    /// @param run Current projection run number
    /// @param time Current projection year
    /// @param what The associated error message
    ErrorEventMessage(std::string sender, unsigned int run, int time, std::string what) noexcept;

    /// @brief Gets the associated projection year
    const int model_time{};

    /// @brief Gets the error message
    const std::string message;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};
} // namespace csim
