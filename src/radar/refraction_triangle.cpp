/// @file refraction_triangle.cpp
/// @brief Law-of-cosines solutions of the refraction triangle.

#include "radar/refraction_triangle.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace georadar::radar
{

namespace
{
    constexpr f64 kUpperEpsilonClamp = 1e-12;

    f64 clamp_cos_gamma(f64 cos_gamma, CentralAngleClamp clamp)
    {
        switch (clamp)
        {
            case CentralAngleClamp::Full:         return std::clamp(cos_gamma, -1.0, 1.0);
            case CentralAngleClamp::UpperEpsilon: return std::clamp(cos_gamma, -1.0, kUpperEpsilonClamp);
        }
        return std::clamp(cos_gamma, -1.0, 1.0);
    }
}

// -----------------------------------------------------------------
// Elevation known (toward a target position):
//   Rt² = Rc² + c² + 2 Rc c sin(el)
//   cos γ = (Rc² + Rt² − c²) / (2 Rc Rt)
//
// Target altitude known (toward an elevation):
//   sin(el) = (Rt² − Rc² − c²) / (2 Rc c)
//   cos γ   = (Rc² + Rt² − c²) / (2 Rc Rt)
// -----------------------------------------------------------------

TriangleSolution solve_refraction_triangle(const TriangleInput& input, CentralAngleClamp clamp)
{
    const f64 re = input.effective_radius_m;
    const f64 rc = re + input.sensor_alt_m;
    const f64 c = input.slant_range_m;

    if (input.elevation_rad)
    {
        const f64 el = *input.elevation_rad;
        const f64 rt_sq = rc * rc + c * c + 2.0 * rc * c * std::sin(el);
        const f64 rt = std::sqrt(rt_sq);
        const f64 cos_gamma = (rc * rc + rt_sq - c * c) / (2.0 * rc * rt);

        return TriangleSolution{
            .target_alt_m      = rt - re,
            .elevation_rad     = el,
            .central_angle_rad = std::acos(std::clamp(cos_gamma, -1.0, 1.0)),
        };
    }

    if (input.target_alt_m)
    {
        const f64 rt = re + *input.target_alt_m;

        // No ray to measure: report straight up (or down) with no central angle
        if (c <= 0.0)
        {
            return TriangleSolution{
                .target_alt_m      = *input.target_alt_m,
                .elevation_rad     = (rt >= rc) ? constants::kHalfPi : -constants::kHalfPi,
                .central_angle_rad = 0.0,
            };
        }

        const f64 sin_el = (rt * rt - rc * rc - c * c) / (2.0 * rc * c);
        const f64 cos_gamma = (rc * rc + rt * rt - c * c) / (2.0 * rc * rt);

        return TriangleSolution{
            .target_alt_m      = *input.target_alt_m,
            .elevation_rad     = std::asin(std::clamp(sin_el, -1.0, 1.0)),
            .central_angle_rad = std::acos(clamp_cos_gamma(cos_gamma, clamp)),
        };
    }

    throw std::invalid_argument("refraction triangle: either the target altitude or the elevation is required");
}

} // namespace georadar::radar
