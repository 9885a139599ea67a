#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

// forward type declaration
namespace spop::core {

/// @brief Population count data type, never negative
using Count = std::uint64_t;

/// @brief Enumerates gender types
enum class Gender : uint8_t {
    /// @brief Male
    male,

    /// @brief Female
    female
};

/// @brief C++20 concept for numeric values types
template <typename T>
concept Numerical = std::is_arithmetic_v<T>;

/// @brief Gets the zero-based storage index of a gender
/// @param gender The gender enumeration
/// @return The respective index
constexpr std::size_t gender_index(Gender gender) noexcept { return static_cast<std::size_t>(gender); }

} // namespace spop::core
