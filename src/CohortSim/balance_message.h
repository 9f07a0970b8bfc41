#pragma once
#include "balance_validator.h"
#include "event_message.h"

namespace csim {

/// @brief Implements the population balance warning event message data type
struct BalanceEventMessage final : public EventMessage {

    BalanceEventMessage() = delete;

    /// @brief Initialises a new instance of the BalanceEventMessage structure.
    /// @param sender The sender identifier
    /// @param run Current projection run number
    /// @param result The failed conservation check
    BalanceEventMessage(std::string sender, unsigned int run, BalanceCheck result) noexcept;

    /// @brief Gets the conservation check with the components of change
    const BalanceCheck check;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};
} // namespace csim
