#include "configuration.h"
#include "configuration_parsing_helpers.h"

#include <fmt/color.h>
#include <fmt/format.h>

#include <fstream>
#include <string>

namespace {
using json = nlohmann::json;

spop::StabilisationStrategy parse_strategy(const std::string &name) {
    if (name == "simplex") {
        return spop::StabilisationStrategy::simplex;
    }

    if (name == "feedback") {
        return spop::StabilisationStrategy::feedback;
    }

    throw spop::core::ConfigurationError{
        fmt::format("Unknown stabilisation strategy: \"{}\", expected simplex or feedback", name)};
}
} // anonymous namespace

namespace spop::input {
using json = nlohmann::json;

nlohmann::json get(const json &j, const std::string &key) {
    try {
        return j.at(key);
    } catch (const std::exception &) {
        fmt::print(fmt::fg(fmt::color::red), "Missing key \"{}\"\n", key);
        throw core::ConfigurationError{fmt::format("Missing key \"{}\"", key)};
    }
}

Configuration load_configuration(const std::filesystem::path &config_file) {
    std::ifstream ifs(config_file, std::ifstream::in);
    if (!ifs) {
        throw core::ConfigurationError{
            fmt::format("File {} doesn't exist or cannot be read.", config_file.string())};
    }

    json opt;
    try {
        opt = json::parse(ifs);
    } catch (const json::parse_error &ex) {
        throw core::ConfigurationError{
            fmt::format("Could not parse JSON file {}: {}", config_file.string(), ex.what())};
    }

    return parse_configuration(opt);
}

Configuration parse_configuration(const json &j) {
    Configuration config;
    config.parameters = get_parameters(j);
    config.optimiser = get_optimiser_options(j);
    return config;
}

Parameters get_parameters(const json &j) {
    const auto node = get(j, "parameters");
    if (!node.is_object()) {
        throw core::ConfigurationError{"Key \"parameters\" must be an object"};
    }

    bool success = true;
    Parameters info;
    get_integer_to(node, "initial_population", info.initial_population, success);
    get_integer_to(node, "n_years", info.n_years, success);
    get_integer_to(node, "max_age", info.max_age, success);
    get_integer_to(node, "males_per_100_females", info.males_per_100_females, success);
    get_to(node, "target_total_fertility_rate", info.target_total_fertility_rate, success);
    get_to(node, "infant_mortality_rate", info.infant_mortality_rate, success);
    if (!success) {
        throw core::ConfigurationError{"Could not load simulation parameters"};
    }

    validate(info);
    return info;
}

OptimiserOptions get_optimiser_options(const json &j) {
    auto info = OptimiserOptions{};
    if (!j.contains("optimiser")) {
        return info;
    }

    const auto &node = j["optimiser"];
    if (!node.is_object()) {
        throw core::ConfigurationError{"Key \"optimiser\" must be an object"};
    }

    bool success = true;
    std::string strategy;
    if (node.contains("strategy") && get_to(node, "strategy", strategy, success)) {
        info.strategy = parse_strategy(strategy);
    }

    get_optional_integer_to(node, "max_iterations", info.max_iterations, success);
    get_optional_to(node, "initial_step", info.initial_step, success);
    get_optional_to(node, "sd_tolerance", info.sd_tolerance, success);
    get_optional_to(node, "proportional_gain", info.proportional_gain, success);
    get_optional_to(node, "integral_gain", info.integral_gain, success);
    get_optional_to(node, "feedback_tolerance", info.feedback_tolerance, success);
    get_optional_integer_to(node, "notify_interval", info.notify_interval, success);
    if (!success) {
        throw core::ConfigurationError{"Could not load optimiser options"};
    }

    if (info.max_iterations < 1) {
        throw core::ConfigurationError{"max_iterations must be at least 1"};
    }

    if (!(info.initial_step > 0.0)) {
        throw core::ConfigurationError{
            fmt::format("initial_step must be positive, given: {}", info.initial_step)};
    }

    if (info.sd_tolerance < 0.0 || info.feedback_tolerance < 0.0) {
        throw core::ConfigurationError{"Optimiser tolerances must not be negative"};
    }

    return info;
}
} // namespace spop::input
