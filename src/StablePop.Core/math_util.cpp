#include "math_util.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace spop::core {

double MathHelper::machine_precision() noexcept { return std::numeric_limits<double>::epsilon(); }

double MathHelper::default_numerical_precision() noexcept {
    static const double precision = std::sqrt(machine_precision());
    return precision;
}

bool MathHelper::equal(double left, double right) noexcept {
    return equal(left, right, default_numerical_precision());
}

bool MathHelper::equal(double left, double right, double precision) noexcept {
    double norm = std::max(std::abs(left), std::abs(right));
    return norm < precision || std::abs(left - right) < precision * norm;
}

Count MathHelper::round_to_count(double expected) noexcept {
    if (!std::isfinite(expected) || expected <= 0.0) {
        return 0;
    }

    constexpr auto limit = static_cast<double>(std::numeric_limits<Count>::max());
    auto rounded = std::round(expected);
    if (rounded >= limit) {
        return std::numeric_limits<Count>::max();
    }

    return static_cast<Count>(rounded);
}

Count MathHelper::saturating_subtract(Count value, Count amount) noexcept {
    return amount >= value ? Count{0} : value - amount;
}

Count MathHelper::saturating_add(Count value, Count amount) noexcept {
    constexpr auto limit = std::numeric_limits<Count>::max();
    return amount > limit - value ? limit : value + amount;
}
} // namespace spop::core
