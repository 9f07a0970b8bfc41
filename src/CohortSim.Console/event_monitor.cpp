#include "event_monitor.h"

#include "CohortSim/balance_message.h"
#include "CohortSim/error_message.h"
#include "CohortSim/info_message.h"
#include "CohortSim/runner_message.h"

#include <fmt/color.h>
#include <fmt/core.h>

#include <chrono>

namespace csim {
EventMonitor::EventMonitor(EventAggregator &event_bus, core::VerboseMode verbosity)
    : verbosity_{verbosity}, tg_{tg_context_} {
    handlers_.emplace_back(event_bus.subscribe(EventType::runner, [this](auto &&PH1) {
        info_event_handler(std::forward<decltype(PH1)>(PH1));
    }));

    handlers_.emplace_back(event_bus.subscribe(EventType::info, [this](auto &&PH1) {
        info_event_handler(std::forward<decltype(PH1)>(PH1));
    }));

    handlers_.emplace_back(event_bus.subscribe(EventType::warning, [this](auto &&PH1) {
        info_event_handler(std::forward<decltype(PH1)>(PH1));
    }));

    handlers_.emplace_back(event_bus.subscribe(EventType::error, [this](auto &&PH1) {
        error_event_handler(std::forward<decltype(PH1)>(PH1));
    }));

    tg_.run([this] { info_dispatch_thread(); });
}

EventMonitor::~EventMonitor() noexcept {
    for (auto &handler : handlers_) {
        handler->unsubscribe();
    }

    stop();
}

void EventMonitor::stop() noexcept {
    tg_context_.cancel_group_execution();
    tg_.wait();
}

void EventMonitor::visit(const RunnerEventMessage &message) {
    fmt::print(fg(fmt::color::cornflower_blue), "{}\n", message.to_string());
}

void EventMonitor::visit(const InfoEventMessage &message) {
    if (verbosity_ == core::VerboseMode::verbose ||
        message.model_action != ModelAction::update) {
        fmt::print(fg(fmt::color::light_blue), "{}\n", message.to_string());
    }
}

void EventMonitor::visit(const BalanceEventMessage &message) {
    fmt::print(fg(fmt::color::yellow), "{}\n", message.to_string());
}

void EventMonitor::visit(const ErrorEventMessage &message) {
    fmt::print(fg(fmt::color::red), "{}\n", message.to_string());
}

void EventMonitor::info_event_handler(std::shared_ptr<EventMessage> message) {
    info_queue_.emplace(std::move(message));
}

void EventMonitor::error_event_handler(const std::shared_ptr<EventMessage> &message) {
    // handle error synchronous, no delay!
    message->accept(*this);
}

void EventMonitor::info_dispatch_thread() {
    fmt::print(fg(fmt::color::light_blue), "Info event thread started...\n");
    while (!tg_context_.is_group_execution_cancelled()) {
        std::shared_ptr<EventMessage> m;
        if (info_queue_.try_pop(m)) {
            m->accept(*this);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    drain_info_queue();
    fmt::print(fg(fmt::color::light_blue), "Info event thread exited.\n");
}

void EventMonitor::drain_info_queue() {
    std::shared_ptr<EventMessage> m;
    while (info_queue_.try_pop(m)) {
        m->accept(*this);
    }
}
} // namespace csim
