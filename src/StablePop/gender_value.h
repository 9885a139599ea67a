#pragma once
#include "StablePop.Core/forward_type.h"
#include "StablePop.Core/math_util.h"

#include <type_traits>

namespace spop {

/// @brief Defines a gender associated value data type
/// @tparam T The value type
template <typename T>
    requires std::is_arithmetic_v<T>
struct GenderValue {
    /// @brief Initialises a new instance of the GenderValue structure
    GenderValue() = default;

    /// @brief Initialises a new instance of the GenderValue structure
    /// @param males_value The males value
    /// @param females_value The female value
    GenderValue(T males_value, T females_value) : males{males_value}, females{females_value} {}

    /// @brief Males value
    T males{};

    /// @brief Females value
    T females{};

    /// @brief Gets the total value for males and females
    /// @return Total value, clamped for population counts
    T total() const noexcept {
        if constexpr (std::is_same_v<T, core::Count>) {
            return core::MathHelper::saturating_add(males, females);
        } else {
            return males + females;
        }
    }

    bool operator==(const GenderValue<T> &rhs) const = default;
};

/// @brief Gender value for population counts
using CountGenderValue = GenderValue<core::Count>;
} // namespace spop
