#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace csim::core {

std::string trim(std::string value) noexcept {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }

    std::size_t pos = 0;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
        ++pos;
    }

    return value.substr(pos);
}

std::string to_lower(const std::string_view &value) noexcept {
    std::string result = std::string(value);
    std::transform(value.begin(), value.end(), result.begin(),
                   [](char c) { return static_cast<char>(std::tolower(c)); });

    return result;
}

std::vector<std::string_view> split_string(const std::string_view &value,
                                           std::string_view delims) noexcept {
    std::vector<std::string_view> output;
    size_t first = 0;

    while (first < value.size()) {
        const auto second = value.find_first_of(delims, first);
        if (first != second) {
            output.emplace_back(value.substr(first, second - first));
        }

        if (second == std::string_view::npos) {
            break;
        }

        first = second + 1;
    }

    return output;
}

bool case_insensitive::equal_char(char left, char right) noexcept {
    return left == right || std::tolower(left) == std::tolower(right);
}

bool case_insensitive::equals(const std::string_view &left,
                              const std::string_view &right) noexcept {
    return left.size() == right.size() &&
           std::equal(left.cbegin(), left.cend(), right.cbegin(), right.cend(), equal_char);
}

int case_insensitive::index_of(const std::vector<std::string> &source,
                               const std::string_view &element) noexcept {
    auto it = std::find_if(source.cbegin(), source.cend(), [&element](const std::string &other) {
        return case_insensitive::equals(element, other);
    });

    if (it != source.cend()) {
        return static_cast<int>(std::distance(source.cbegin(), it));
    }

    return -1;
}
} // namespace csim::core
