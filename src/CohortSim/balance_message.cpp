#include "balance_message.h"
#include <fmt/format.h>

namespace csim {

BalanceEventMessage::BalanceEventMessage(std::string sender, unsigned int run,
                                         BalanceCheck result) noexcept
    : EventMessage{std::move(sender), run}, check{result} {}

int BalanceEventMessage::id() const noexcept { return static_cast<int>(EventType::warning); }

std::string BalanceEventMessage::to_string() const {
    return fmt::format("Source: {}, run # {}, time: {}, population balance mismatch: expected {}, "
                       "actual {} (births: {}, deaths: {}, migration: {})",
                       source, run_number, check.year, check.expected_total, check.actual_total,
                       check.births, check.deaths, check.migration);
}

void BalanceEventMessage::accept(EventMessageVisitor &visitor) const { visitor.visit(*this); }
} // namespace csim
