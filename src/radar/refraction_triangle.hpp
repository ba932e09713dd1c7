#pragma once

/// @file refraction_triangle.hpp
/// @brief Earth-center / sensor / target triangle over the effective Earth.
///
/// Over an Earth enlarged by the refraction factor k, radar rays travel in
/// straight lines, so the sensor, the target and the Earth's center form a
/// plane triangle:
///
///   Rc = Reff + h_sensor    (center → sensor)
///   Rt = Reff + h_target    (center → target)
///   c  = slant range        (sensor → target)
///
/// Knowing two sides and either the target altitude or the elevation angle
/// determines the rest by the law of cosines.

#include "core/types.hpp"

#include <optional>

namespace georadar::radar
{
    /// @brief Clamp applied to cos γ in the elevation solve.
    enum class CentralAngleClamp
    {
        Full,           ///< cos γ clamped to [-1, 1]
        UpperEpsilon,   ///< cos γ clamped to [-1, 1e-12], so γ >= ~π/2 for every input
    };

    struct TriangleInput
    {
        f64 effective_radius_m{0.0};
        f64 sensor_alt_m{0.0};
        f64 slant_range_m{0.0};
        std::optional<f64> target_alt_m;    ///< Known target altitude: solve for elevation
        std::optional<f64> elevation_rad;   ///< Known elevation: solve for target altitude
    };

    struct TriangleSolution
    {
        f64 target_alt_m{0.0};
        f64 elevation_rad{0.0};
        f64 central_angle_rad{0.0};   ///< γ, angle at the Earth's center
    };

    /// @brief Solve the refraction triangle for the missing quantities.
    ///
    /// When both the elevation and the target altitude are given, the
    /// elevation wins and the altitude is recomputed.
    ///
    /// A zero slant range with a known target altitude yields an elevation of
    /// +π/2 (-π/2 when the target is below the sensor) and a zero central angle.
    ///
    /// @throws std::invalid_argument if neither unknown is given.
    [[nodiscard]] TriangleSolution solve_refraction_triangle(
        const TriangleInput& input, CentralAngleClamp clamp = CentralAngleClamp::Full);

} // namespace georadar::radar
