#include "parameters.h"
#include "StablePop.Core/exception.h"

#include <cmath>
#include <fmt/format.h>

namespace spop {

std::string Parameters::to_string() const {
    return fmt::format("initial population: {}, years: {}, max age: {}, males per 100 females: {}, "
                       "target TFR: {:.6f}, infant mortality: {:.6f}",
                       initial_population, n_years, max_age, males_per_100_females,
                       target_total_fertility_rate, infant_mortality_rate);
}

void validate(const Parameters &parameters) {
    if (parameters.initial_population < 1) {
        throw core::ConfigurationError("initial_population must be at least 1.");
    }

    if (parameters.n_years < 0 || parameters.n_years > 65535) {
        throw core::ConfigurationError(fmt::format(
            "n_years must be in range [0, 65535], given: {}.", parameters.n_years));
    }

    if (parameters.max_age < max_fertile_age || parameters.max_age > 254) {
        throw core::ConfigurationError(fmt::format("max_age must be in range [{}, 254], given: {}.",
                                                   max_fertile_age, parameters.max_age));
    }

    if (parameters.males_per_100_females < 0 || parameters.males_per_100_females > 255) {
        throw core::ConfigurationError(
            fmt::format("males_per_100_females must be in range [0, 255], given: {}.",
                        parameters.males_per_100_females));
    }

    if (!std::isfinite(parameters.target_total_fertility_rate) ||
        parameters.target_total_fertility_rate < 0.0) {
        throw core::ConfigurationError(
            fmt::format("target_total_fertility_rate must be a non-negative number, given: {}.",
                        parameters.target_total_fertility_rate));
    }

    if (!std::isfinite(parameters.infant_mortality_rate) ||
        parameters.infant_mortality_rate < 0.0 || parameters.infant_mortality_rate > 1.0) {
        throw core::ConfigurationError(
            fmt::format("infant_mortality_rate must be in range [0, 1], given: {}.",
                        parameters.infant_mortality_rate));
    }
}

Parameters default_parameters() noexcept {
    return Parameters{.initial_population = 10'000'000'000,
                      .n_years = 2'000,
                      .max_age = 120,
                      .males_per_100_females = 105,
                      .target_total_fertility_rate = 2.06406,
                      .infant_mortality_rate = 0.005};
}
} // namespace spop
