#include "interval.h"

#include <string>

namespace csim::core {

IntegerInterval parse_integer_interval(const std::string_view &value,
                                       const std::string_view delims) {
    auto parts = split_string(value, delims);
    if (parts.size() == 2) {
        try {
            int start = std::stoi(std::string{parts[0]});
            int end = std::stoi(std::string{parts[1]});
            return IntegerInterval(start, end);
        } catch (const std::logic_error &e) {
            throw std::invalid_argument(
                fmt::format("Failed to parse integer interval from value: '{}', {}", value,
                            e.what()));
        }
    }

    throw std::invalid_argument(
        fmt::format("Input value:'{}' does not have the right format: xx-xx.", value));
}

IntegerInterval parse_age_group(const std::string_view &value, int open_upper) {
    auto label = trim(std::string{value});
    if (!label.empty() && label.back() == '+') {
        label.pop_back();
        auto start = 0;
        try {
            start = std::stoi(label);
        } catch (const std::logic_error &e) {
            throw std::invalid_argument(
                fmt::format("Failed to parse open age group from value: '{}', {}", value,
                            e.what()));
        }

        if (start > open_upper) {
            throw std::invalid_argument(fmt::format(
                "Open age group: '{}' starts after the upper age: {}", value, open_upper));
        }

        return IntegerInterval(start, open_upper);
    }

    return parse_integer_interval(label);
}

} // namespace csim::core
