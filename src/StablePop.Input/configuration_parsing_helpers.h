#pragma once
#include "StablePop.Core/exception.h"

#include <fmt/color.h>
#include <nlohmann/json.hpp>

#include <concepts>
#include <cstdint>
#include <string>
#include <utility>

namespace spop::input {
/// @brief Load value from JSON, printing an error message if it fails
/// @param j JSON object
/// @param key Key to value
/// @throw core::ConfigurationError: Key not found
/// @return Key value
nlohmann::json get(const nlohmann::json &j, const std::string &key);

/// @brief Get value from JSON object and store in out
/// @tparam T Type of output object
/// @param j JSON object
/// @param key Key to value
/// @param out Output object
/// @return True if value was retrieved successfully, false otherwise
template <class T> bool get_to(const nlohmann::json &j, const std::string &key, T &out) noexcept {
    try {
        out = j.at(key).get<T>();
        return true;
    } catch (const nlohmann::json::out_of_range &) {
        fmt::print(fg(fmt::color::red), "Missing key \"{}\"\n", key);
        return false;
    } catch (const nlohmann::json::type_error &) {
        fmt::print(fg(fmt::color::red), "Key \"{}\" is of wrong type\n", key);
        return false;
    }
}

/// @brief Get value from JSON object and store in out, setting success flag
/// @tparam T Type of output object
/// @param j JSON object
/// @param key Key to value
/// @param out Output object
/// @param success Success flag, set to false in case of failure
/// @return True if value was retrieved successfully, false otherwise
template <class T>
bool get_to(const nlohmann::json &j, const std::string &key, T &out, bool &success) noexcept {
    const bool ret = get_to(j, key, out);
    if (!ret) {
        success = false;
    }
    return ret;
}

/// @brief Get an integer value from JSON object, rejecting fractions and values
///        outside the range of the output type
/// @tparam T Integral type of output object
/// @param j JSON object
/// @param key Key to value
/// @param out Output object, unchanged on failure
/// @param success Success flag, set to false in case of failure
/// @return True if value was retrieved successfully, false otherwise
template <std::integral T>
bool get_integer_to(const nlohmann::json &j, const std::string &key, T &out,
                    bool &success) noexcept {
    const auto it = j.find(key);
    if (it == j.end()) {
        fmt::print(fg(fmt::color::red), "Missing key \"{}\"\n", key);
        success = false;
        return false;
    }

    if (!it->is_number_integer()) {
        fmt::print(fg(fmt::color::red), "Key \"{}\" must be an integer\n", key);
        success = false;
        return false;
    }

    const auto in_range = it->is_number_unsigned()
                              ? std::in_range<T>(it->template get<std::uint64_t>())
                              : std::in_range<T>(it->template get<std::int64_t>());
    if (!in_range) {
        fmt::print(fg(fmt::color::red), "Key \"{}\" value {} is out of range\n", key,
                   it->dump());
        success = false;
        return false;
    }

    out = it->is_number_unsigned() ? static_cast<T>(it->template get<std::uint64_t>())
                                   : static_cast<T>(it->template get<std::int64_t>());
    return true;
}

/// @brief Get an optional value from JSON object, keeping out unchanged when missing
/// @tparam T Type of output object
/// @param j JSON object
/// @param key Key to value
/// @param out Output object
/// @param success Success flag, set to false if the value is of wrong type
template <class T>
void get_optional_to(const nlohmann::json &j, const std::string &key, T &out,
                     bool &success) noexcept {
    if (j.contains(key)) {
        get_to(j, key, out, success);
    }
}

/// @brief Get an optional integer value from JSON object, keeping out unchanged when missing
template <std::integral T>
void get_optional_integer_to(const nlohmann::json &j, const std::string &key, T &out,
                             bool &success) noexcept {
    if (j.contains(key)) {
        get_integer_to(j, key, out, success);
    }
}
} // namespace spop::input
