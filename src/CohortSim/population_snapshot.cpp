#include "population_snapshot.h"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace csim {

PopulationSnapshot::PopulationSnapshot(std::vector<Cohort> cohorts) : cohorts_{std::move(cohorts)} {
    if (cohorts_.size() != cohort_count) {
        throw std::invalid_argument(fmt::format(
            "Population snapshot must have {} cohorts, got: {}", cohort_count, cohorts_.size()));
    }

    std::sort(cohorts_.begin(), cohorts_.end(),
              [](const Cohort &left, const Cohort &right) { return left.age < right.age; });

    auto expected_age = 0;
    for (const auto &cohort : cohorts_) {
        if (cohort.age != expected_age) {
            throw std::invalid_argument(fmt::format(
                "Population snapshot cohort age mismatch, expected: {}, got: {}", expected_age,
                cohort.age));
        }

        if (cohort.males < 0 || cohort.females < 0) {
            throw std::invalid_argument(
                fmt::format("Population snapshot has negative count at age: {}", cohort.age));
        }

        total_males_ += cohort.males;
        total_females_ += cohort.females;
        expected_age++;
    }
}

const Cohort &PopulationSnapshot::at(int age) const {
    if (age < 0 || age > terminal_age) {
        throw std::out_of_range(
            fmt::format("Age: {} is out of population range [0, {}].", age, terminal_age));
    }

    return cohorts_[static_cast<std::size_t>(age)];
}

PopulationSummary summarize(const PopulationSnapshot &snapshot, int retirement_age) noexcept {
    auto summary = PopulationSummary{};
    for (const auto &cohort : snapshot) {
        if (cohort.age < 15) {
            summary.child_population += cohort.total();
        } else if (cohort.age < retirement_age) {
            summary.working_population += cohort.total();
        } else {
            summary.retired_population += cohort.total();
        }
    }

    summary.total_population = snapshot.total();
    if (summary.working_population > 0) {
        summary.dependency_ratio = static_cast<double>(summary.retired_population) * 100.0 /
                                   static_cast<double>(summary.working_population);
    }

    auto half_total = static_cast<double>(summary.total_population) / 2.0;
    auto cumulative = std::int64_t{0};
    for (const auto &cohort : snapshot) {
        cumulative += cohort.total();
        if (static_cast<double>(cumulative) >= half_total) {
            summary.median_age = cohort.age;
            break;
        }
    }

    return summary;
}

} // namespace csim
