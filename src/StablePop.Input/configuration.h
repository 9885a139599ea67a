/**
 * @file
 * @brief Main header file for functionality related to loading config files
 *
 * This file contains definitions for the functions required to load JSON-formatted
 * simulation and stabilisation configuration files from disk.
 */
#pragma once

#include "StablePop.Core/exception.h"
#include "StablePop/optimiser.h"
#include "StablePop/parameters.h"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace spop::input {

/// @brief Defines the application configuration data structure
struct Configuration {
    /// @brief The simulation parameters, validated
    Parameters parameters;

    /// @brief The fertility stabilisation search options
    OptimiserOptions optimiser;
};

/// @brief Loads the configuration file, *.json, information
/// @param config_file Path to config file
/// @return The configuration file information
/// @throw core::ConfigurationError: File not found, malformed or invalid content
Configuration load_configuration(const std::filesystem::path &config_file);

/// @brief Parses the configuration from a JSON document
/// @param j The root JSON object
/// @return The configuration information
/// @throw core::ConfigurationError: Invalid config format or parameters
Configuration parse_configuration(const nlohmann::json &j);

/// @brief Load parameters section of JSON object
/// @param j The root JSON object
/// @return The validated simulation parameters
/// @throw core::ConfigurationError: Missing section, key or invalid value
Parameters get_parameters(const nlohmann::json &j);

/// @brief Load the optional optimiser section of JSON object
/// @param j The root JSON object
/// @return The optimiser options, defaults for missing keys
/// @throw core::ConfigurationError: Key of wrong type or unknown strategy
OptimiserOptions get_optimiser_options(const nlohmann::json &j);
} // namespace spop::input
