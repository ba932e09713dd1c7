#pragma once
// core/math/wrap.hpp - Range policies for bounded scalars
//
// Longitude and azimuth wrap cyclically, latitude and elevation reflect
// ("bounce") at the poles, other quantities may be clamped.

#include "core/types.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace georadar {

enum class WrapMode {
    None,    ///< value passes through untouched
    Bound,   ///< clamp to [min, max]
    Cycle,   ///< wrap modulo the span into [min, max)
    Bounce,  ///< reflect at min and max until inside [min, max]
};

/// Clamp to [min, max].
inline f64 wrapBound(f64 value, f64 min, f64 max) {
    return std::clamp(value, min, max);
}

/// Wrap into [min, max). A zero-width range returns min.
inline f64 wrapCycle(f64 value, f64 min, f64 max) {
    const f64 span = max - min;
    if (span <= 0.0) return min;
    f64 t = std::fmod(value - min, span);
    if (t < 0.0) t += span;
    // fmod of a tiny negative value can round up to exactly span
    return (t >= span) ? min : min + t;
}

/// Reflect into [min, max]: 95 deg latitude becomes 85 deg.
inline f64 wrapBounce(f64 value, f64 min, f64 max) {
    const f64 span = max - min;
    if (span <= 0.0) return min;
    if (value >= min && value <= max) return value;
    f64 t = std::fmod(value - min, 2.0 * span);
    if (t < 0.0) t += 2.0 * span;
    return (t <= span) ? min + t : max - (t - span);
}

/// Apply a wrap policy. Throws std::invalid_argument when min > max.
inline f64 wrap(f64 value, f64 min, f64 max, WrapMode mode) {
    if (min > max) {
        throw std::invalid_argument("wrap: minimum is greater than maximum");
    }
    switch (mode) {
        case WrapMode::None:   return value;
        case WrapMode::Bound:  return wrapBound(value, min, max);
        case WrapMode::Cycle:  return wrapCycle(value, min, max);
        case WrapMode::Bounce: return wrapBounce(value, min, max);
    }
    return value;
}

/// Normalise an angle to [0, 2pi).
inline f64 normRad(f64 rad) {
    return wrapCycle(rad, 0.0, constants::kTwoPi);
}

/// Normalise an angle to [-pi, pi).
inline f64 normSignedRad(f64 rad) {
    return wrapCycle(rad, -constants::kPi, constants::kPi);
}

/// True when the value is neither NaN nor infinite.
inline bool isFinite(f64 value) {
    return std::isfinite(value);
}

} // namespace georadar
