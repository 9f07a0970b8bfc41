#pragma once
namespace csim {

struct RunnerEventMessage;
struct InfoEventMessage;
struct BalanceEventMessage;
struct ErrorEventMessage;

/// @brief Event message types visitor interface (double dispatcher)
class EventMessageVisitor {
  public:
    /// @brief Initialises a new instance of the visitor class
    EventMessageVisitor() = default;

    EventMessageVisitor(const EventMessageVisitor &) = delete;
    EventMessageVisitor &operator=(const EventMessageVisitor &) = delete;

    EventMessageVisitor(EventMessageVisitor &&) = delete;
    EventMessageVisitor &operator=(EventMessageVisitor &&) = delete;

    /// @brief Destroy an instance of the visitor class
    virtual ~EventMessageVisitor() = default;

    /// @brief Visits a csim::RunnerEventMessage message type
    /// @param message The message instance to visit
    virtual void visit(const RunnerEventMessage &message) = 0;

    /// @brief Visits a csim::InfoEventMessage message type
    /// @param message The message instance to visit
    virtual void visit(const InfoEventMessage &message) = 0;

    /// @brief Visits a csim::BalanceEventMessage message type
    /// @param message The message instance to visit
    virtual void visit(const BalanceEventMessage &message) = 0;

    /// @brief Visits a csim::ErrorEventMessage message type
    /// @param message The message instance to visit
    virtual void visit(const ErrorEventMessage &message) = 0;
};
} // namespace csim
