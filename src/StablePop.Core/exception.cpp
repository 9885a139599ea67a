#include "exception.h"

#include <fmt/format.h>

namespace spop::core {

SpopException::SpopException(const std::string &what_arg, const source_location location)
    : std::runtime_error{what_arg}, location_{location} {
    what_arg_ = fmt::format("{}:{}: {}", file_name(), line(), std::runtime_error::what());
}

const char *SpopException::what() const noexcept { return what_arg_.c_str(); }

std::uint_least32_t SpopException::line() const noexcept { return location_.line(); }

const char *SpopException::file_name() const noexcept { return location_.file_name(); }

ConfigurationError::ConfigurationError(const std::string &what_arg,
                                       const source_location location)
    : SpopException{what_arg, location} {}

NoDataError::NoDataError(const std::string &what_arg, const source_location location)
    : SpopException{what_arg, location} {}

} // namespace spop::core
