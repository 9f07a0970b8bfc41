#include "simulation_parameters.h"
#include "CohortSim.Core/string_util.h"

#include <fmt/format.h>

namespace csim {

double MortalityImprovement::rate(core::Gender gender) const noexcept {
    switch (gender) {
    case core::Gender::male:
        return male;
    case core::Gender::female:
        return female;
    default:
        return 0.0;
    }
}

ParameterError::ParameterError(std::vector<std::string> violations,
                               const source_location location)
    : core::CsimException{fmt::format("Invalid simulation parameters: {}",
                                      core::join_strings("; ", violations)),
                          location},
      violations_{std::move(violations)} {}

std::vector<std::string> check_parameters(const SimulationParameters &parameters, int start_year,
                                          int end_year) {
    auto violations = std::vector<std::string>{};
    auto check = [&violations](const auto &domain, auto value, const char *name) {
        if (!domain.contains(value)) {
            violations.emplace_back(
                fmt::format("{}: {} is outside [{}]", name, value, domain.to_string()));
        }
    };

    check(parameter_domain::retirement_age, parameters.retirement_age, "retirement age");
    check(parameter_domain::fertility_rate, parameters.fertility_rate, "fertility rate");
    check(parameter_domain::net_migration, parameters.net_migration, "net migration");
    check(parameter_domain::mortality_improvement, parameters.mortality_improvement.male,
          "male mortality improvement");
    check(parameter_domain::mortality_improvement, parameters.mortality_improvement.female,
          "female mortality improvement");
    check(parameter_domain::entry_age_shift, parameters.entry_age_shift, "entry age shift");
    check(parameter_domain::unemployment_adjustment, parameters.unemployment_adjustment,
          "unemployment adjustment");

    if (start_year > end_year) {
        violations.emplace_back(
            fmt::format("start year: {} is after end year: {}", start_year, end_year));
    } else if (end_year - start_year > parameter_domain::max_projection_span) {
        violations.emplace_back(fmt::format("projection span: {} to {} exceeds {} years",
                                            start_year, end_year,
                                            parameter_domain::max_projection_span));
    }

    return violations;
}

void validate_parameters(const SimulationParameters &parameters, int start_year, int end_year) {
    auto violations = check_parameters(parameters, start_year, end_year);
    if (!violations.empty()) {
        throw ParameterError(std::move(violations));
    }
}

} // namespace csim
