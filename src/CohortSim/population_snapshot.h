#pragma once

#include <cstdint>
#include <vector>

namespace csim {

/// @brief Population count for one single year of age, split by gender
struct Cohort {
    /// @brief Age in years, the last age is the open-ended aggregate group
    int age{};

    /// @brief Number of males
    std::int64_t males{};

    /// @brief Number of females
    std::int64_t females{};

    /// @brief Gets the cohort total population
    /// @return Males plus females
    std::int64_t total() const noexcept { return males + females; }

    /// @brief Compare two Cohort instances
    auto operator<=>(const Cohort &rhs) const = default;
};

/// @brief Defines an immutable population age-gender structure for one year
///
/// A snapshot holds exactly one Cohort for each age from zero to the terminal age, ordered
/// by age. The terminal cohort is the open-ended `100+` aggregate.
class PopulationSnapshot {
  public:
    /// @brief The open-ended terminal age
    static constexpr int terminal_age = 100;

    /// @brief The number of cohorts in a snapshot
    static constexpr std::size_t cohort_count = terminal_age + 1;

    /// @brief Read-only cohort iterator
    using ConstIterator = std::vector<Cohort>::const_iterator;

    /// @brief Initialises a new instance of the PopulationSnapshot class
    /// @param cohorts The cohorts, in any order
    /// @throws std::invalid_argument for missing, duplicated or out-of-range ages, or
    /// negative counts.
    explicit PopulationSnapshot(std::vector<Cohort> cohorts);

    /// @brief Gets the number of cohorts
    /// @return The number of cohorts
    std::size_t size() const noexcept { return cohorts_.size(); }

    /// @brief Gets the cohort for a given age
    /// @param age The age to lookup
    /// @return The age cohort
    /// @throws std::out_of_range for ages outside the snapshot range
    const Cohort &at(int age) const;

    /// @brief Gets the snapshot total population
    std::int64_t total() const noexcept { return total_males_ + total_females_; }

    /// @brief Gets the snapshot total males
    std::int64_t total_males() const noexcept { return total_males_; }

    /// @brief Gets the snapshot total females
    std::int64_t total_females() const noexcept { return total_females_; }

    ConstIterator begin() const noexcept { return cohorts_.cbegin(); }

    ConstIterator end() const noexcept { return cohorts_.cend(); }

    /// @brief Compare two PopulationSnapshot instances
    bool operator==(const PopulationSnapshot &rhs) const noexcept {
        return cohorts_ == rhs.cohorts_;
    }

  private:
    std::vector<Cohort> cohorts_;
    std::int64_t total_males_{};
    std::int64_t total_females_{};
};

/// @brief Aggregate statistics of a population snapshot
struct PopulationSummary {
    /// @brief Population aged under 15 years
    std::int64_t child_population{};

    /// @brief Population aged from 15 years up to the retirement age, exclusive
    std::int64_t working_population{};

    /// @brief Population at or above the retirement age
    std::int64_t retired_population{};

    /// @brief Total population
    std::int64_t total_population{};

    /// @brief Retired per 100 working age, zero when there is no working population
    double dependency_ratio{};

    /// @brief First age at which the cumulative population reaches half the total
    int median_age{};
};

/// @brief Summarise a population snapshot into age bands
/// @param snapshot The population snapshot
/// @param retirement_age The working to retired boundary age
/// @return The population summary
PopulationSummary summarize(const PopulationSnapshot &snapshot, int retirement_age) noexcept;

} // namespace csim
