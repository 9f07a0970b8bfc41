#include "advisory.h"

#include <fmt/format.h>

namespace csim {

std::string create_advisory_prompt(const YearRecord &record,
                                   const SimulationParameters &parameters) {
    const auto &summary = record.summary;
    constexpr auto million = 1000000.0;
    return fmt::format(
        "Act as a senior demographic and economic policy expert for Portugal.\n"
        "Analyze the following simulated demographic scenario for Portugal in the year {}.\n"
        "\n"
        "Simulation Parameters:\n"
        "- Retirement Age: {}\n"
        "- Fertility Rate: {}\n"
        "- Net Migration: {} / year\n"
        "\n"
        "Current Stats:\n"
        "- Total Population: {:.2f} Million\n"
        "- Old-Age Dependency Ratio: {:.1f}% (Retirees per 100 workers)\n"
        "- Median Age: {}\n"
        "- Retired Population: {:.2f} Million\n"
        "- Working Population: {:.2f} Million\n"
        "\n"
        "Provide a concise, 3-sentence high-level summary of the societal and economic mood.\n"
        "Then, provide 3 bullet points on the specific pressure points for the Portuguese "
        "economy (Social Security sustainability, Healthcare burden, Labor shortage, etc.).\n"
        "Be realistic about the consequences of such a high dependency ratio if it is high "
        "(>50%).\n",
        record.year, parameters.retirement_age, parameters.fertility_rate,
        parameters.net_migration, static_cast<double>(summary.total_population) / million,
        summary.dependency_ratio, summary.median_age,
        static_cast<double>(summary.retired_population) / million,
        static_cast<double>(summary.working_population) / million);
}

std::string request_advisory(AdvisoryService &service, const YearRecord &record,
                             const SimulationParameters &parameters) noexcept {
    try {
        auto reply = service.generate(create_advisory_prompt(record, parameters));
        if (reply.empty()) {
            return advisory_empty_reply;
        }

        return reply;
    } catch (const std::exception &) {
        return advisory_service_error;
    } catch (...) {
        return advisory_service_error;
    }
}

} // namespace csim
