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

namespace spop::core {

/// @brief StablePop base exception class, with source location information
class SpopException : public std::runtime_error {
  public:
    /// @brief Construct a new SpopException
    /// @param what_arg The exception message
    /// @param location Source location (defaults to current location)
    SpopException(const std::string &what_arg,
                  const source_location location = source_location::current());

    /// @brief Gets the exception message prefixed with the source location
    /// @return The exception message
    const char *what() const noexcept override;

    /// @brief Gets the exception source location line
    /// @return The location line
    std::uint_least32_t line() const noexcept;

    /// @brief Gets the exception source location file name
    /// @return The location file name
    const char *file_name() const noexcept;

  private:
    source_location location_;
    std::string what_arg_;
};

/// @brief Represents an invalid model parameter or configuration value
class ConfigurationError : public SpopException {
  public:
    /// @brief Construct a new ConfigurationError
    /// @param what_arg The exception message, naming the offending field
    /// @param location Source location (defaults to current location)
    ConfigurationError(const std::string &what_arg,
                       const source_location location = source_location::current());
};

/// @brief Represents a summary requested over an empty data set
class NoDataError : public SpopException {
  public:
    /// @brief Construct a new NoDataError
    /// @param what_arg The exception message
    /// @param location Source location (defaults to current location)
    NoDataError(const std::string &what_arg,
                const source_location location = source_location::current());
};

} // namespace spop::core
