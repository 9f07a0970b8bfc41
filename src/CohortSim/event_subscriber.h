#pragma once
#include "event_aggregator.h"

namespace csim {

/// @brief Implements the event subscriber handler data type
class EventSubscriberHandler final : public EventSubscriber {
  public:
    EventSubscriberHandler() = delete;

    /// @brief Initialise a new instance of the EventSubscriberHandler class
    /// @param id The event handler identifier
    /// @param hub The event aggregator instance to subscribe
    /// @throws std::invalid_argument for null event aggregator hub argument
    EventSubscriberHandler(EventHandlerIdentifier id, EventAggregator *hub);

    /// @brief Destroys a EventSubscriberHandler instance, unsubscribing the handler
    ~EventSubscriberHandler() override;

    void unsubscribe() const override;

    [[nodiscard]] EventHandlerIdentifier id() const noexcept override;

  private:
    EventHandlerIdentifier identifier_;
    EventAggregator *event_hub_;
};
} // namespace csim
