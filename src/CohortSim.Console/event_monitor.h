#pragma once
#include <thread>

#include <oneapi/tbb/concurrent_queue.h>
#include <oneapi/tbb/task_group.h>

#include "CohortSim.Core/forward_type.h"
#include "CohortSim/event_aggregator.h"

#include <memory>
#include <vector>

namespace csim {
/// @brief Defined the event monitor class used for processing CohortSim event messages
///
/// Error messages are written to the terminal as they arrive, while progress and balance
/// warning messages are queued and printed by a background dispatch task.
class EventMonitor final : public EventMessageVisitor {
  public:
    EventMonitor() = delete;

    /// @brief Initialises a new instance of the csim::EventMonitor class.
    /// @param event_bus The message bus instance to monitor
    /// @param verbosity The progress messages verbosity, per-year updates only when verbose
    EventMonitor(EventAggregator &event_bus, core::VerboseMode verbosity);

    /// @brief Destroys a csim::EventMonitor instance
    ~EventMonitor() noexcept;

    /// @brief Stops the monitor, no new messages are processed after stop
    void stop() noexcept;

    void visit(const RunnerEventMessage &message) override;
    void visit(const InfoEventMessage &message) override;
    void visit(const BalanceEventMessage &message) override;
    void visit(const ErrorEventMessage &message) override;

  private:
    core::VerboseMode verbosity_;
    tbb::task_group_context tg_context_;
    tbb::task_group tg_;
    std::vector<std::unique_ptr<EventSubscriber>> handlers_;
    tbb::concurrent_queue<std::shared_ptr<EventMessage>> info_queue_;

    void info_event_handler(std::shared_ptr<EventMessage> message);
    void error_event_handler(const std::shared_ptr<EventMessage> &message);

    void info_dispatch_thread();
    void drain_info_queue();
};
} // namespace csim
