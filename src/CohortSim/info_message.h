#pragma once
#include "event_message.h"

namespace csim {

/// @brief Enumerates projection model actions
enum class ModelAction {
    /// @brief Projection has started, time = start year
    start,

    /// @brief Projection time has updated, time = time + 1
    update,

    /// @brief Projection has stopped, time = end year
    stop
};

/// @brief Implements the projection information event message data type
struct InfoEventMessage final : public EventMessage {

    InfoEventMessage() = delete;

    /// @brief Initialises a new instance of the InfoEventMessage structure.
    /// @param sender The sender identifier
    /// @param action Source action identification
    /// @param run Current projection run number
    /// @param time Current projection year
    InfoEventMessage(std::string sender, ModelAction action, unsigned int run, int time) noexcept;

    /// @brief Initialises a new instance of the InfoEventMessage structure.
    /// @param sender The sender identifier
    /// @param action Source action identification
    /// @param run Current projection run number
    /// @param time Current projection year
    /// @param msg The notification message
    InfoEventMessage(std::string sender, ModelAction action, unsigned int run, int time,
                     std::string msg) noexcept;

    /// @brief Gets the source action value
    const ModelAction model_action{};

    /// @brief Gets the associated projection year
    const int model_time{};

    /// @brief Gets the notification message
    const std::string message;

    int id() const noexcept override;

    std::string to_string() const override;

    void accept(EventMessageVisitor &visitor) const override;
};

namespace detail {
/// @brief Converts enumeration to string
std::string model_action_str(ModelAction action);
} // namespace detail
} // namespace csim
