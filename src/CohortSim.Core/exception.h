#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// HACK: Clang 14 does not support std::source_location.
#if defined(__clang__) && __clang_major__ <= 14
#include <experimental/source_location>
using std::experimental::source_location;
#else
#include <source_location>
using std::source_location;
#endif // defined(__clang__) && __clang_major__ <= 14

namespace csim::core {

/// @brief CohortSim base exception class, with source location information
class CsimException : public std::runtime_error {
  public:
    /// @brief Construct a new CsimException
    /// @param what_arg The exception message
    /// @param location Source location (defaults to current location)
    CsimException(const std::string &what_arg,
                  const source_location location = source_location::current());

    /// @brief Gets the exception message, prefixed with the source location
    /// @return The full exception message
    const char *what() const noexcept override;

    /// @brief Gets the exception message without source location information
    /// @return The original exception message
    const char *message() const noexcept;

    /// @brief Gets the exception source location line
    /// @return The location line
    std::uint_least32_t line() const noexcept;

    /// @brief Gets the exception source location file name
    /// @return The location file name
    const char *file_name() const noexcept;

    /// @brief Gets the exception source location function name
    /// @return The location function name
    const char *function_name() const noexcept;

  private:
    source_location location_;
    std::string what_arg_;
};

} // namespace csim::core
