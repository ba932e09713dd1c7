/// @file geodesic.cpp
/// @brief Vincenty's direct/inverse formulae and spherical great-circle equivalents.

#include "geo/geodesic.hpp"

#include "core/math/wrap.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace georadar::geo
{

namespace
{
    // Series coefficients A and B of Vincenty (1975), eq. 3 and 4
    struct SeriesCoefficients
    {
        f64 a;
        f64 b;
    };

    SeriesCoefficients series_coefficients(f64 cos_sq_alpha)
    {
        constexpr f64 kA = wgs84::kSemiMajorAxis;
        constexpr f64 kB = wgs84::kSemiMinorAxis;

        const f64 u_sq = cos_sq_alpha * (kA * kA - kB * kB) / (kB * kB);
        return SeriesCoefficients{
            .a = 1.0 + u_sq / 16384.0 * (4096.0 + u_sq * (-768.0 + u_sq * (320.0 - 175.0 * u_sq))),
            .b = u_sq / 1024.0 * (256.0 + u_sq * (-128.0 + u_sq * (74.0 - 47.0 * u_sq))),
        };
    }

    // Δσ, eq. 6
    f64 delta_sigma(f64 b, f64 sin_sigma, f64 cos_sigma, f64 cos_2sigma_m)
    {
        const f64 c2 = cos_2sigma_m * cos_2sigma_m;
        return b * sin_sigma
             * (cos_2sigma_m + b / 4.0
                * (cos_sigma * (-1.0 + 2.0 * c2)
                   - b / 6.0 * cos_2sigma_m * (-3.0 + 4.0 * sin_sigma * sin_sigma) * (-3.0 + 4.0 * c2)));
    }

    // C, eq. 10
    f64 lambda_c(f64 cos_sq_alpha)
    {
        constexpr f64 f = wgs84::kFlattening;
        return f / 16.0 * cos_sq_alpha * (4.0 + f * (4.0 - 3.0 * cos_sq_alpha));
    }
}

// -----------------------------------------------------------------
// Inverse problem
//
// Iterate on λ, the longitude difference on the auxiliary sphere:
//   sin σ = √((cos U2 sin λ)² + (cos U1 sin U2 − sin U1 cos U2 cos λ)²)
//   cos σ = sin U1 sin U2 + cos U1 cos U2 cos λ
//   sin α = cos U1 cos U2 sin λ / sin σ
//   cos 2σm = cos σ − 2 sin U1 sin U2 / cos²α   (0 on equatorial lines)
//   λ = L + (1 − C) f sin α (σ + C sin σ (cos 2σm + C cos σ (−1 + 2 cos² 2σm)))
// -----------------------------------------------------------------

std::optional<InverseSolution> Geodesic::vincenty_inverse(
    const LatLon& p1, const LatLon& p2, const VincentyPolicy& policy)
{
    constexpr f64 f = wgs84::kFlattening;

    const f64 u1 = std::atan((1.0 - f) * std::tan(p1.lat_rad));
    const f64 u2 = std::atan((1.0 - f) * std::tan(p2.lat_rad));
    const f64 sin_u1 = std::sin(u1);
    const f64 cos_u1 = std::cos(u1);
    const f64 sin_u2 = std::sin(u2);
    const f64 cos_u2 = std::cos(u2);

    const f64 l = normSignedRad(p2.lon_rad - p1.lon_rad);
    f64 lambda = l;

    f64 sin_lambda = 0.0;
    f64 cos_lambda = 0.0;
    f64 sin_sigma = 0.0;
    f64 cos_sigma = 0.0;
    f64 sigma = 0.0;
    f64 sin_alpha = 0.0;
    f64 cos_sq_alpha = 0.0;
    f64 cos_2sigma_m = 0.0;

    i32 iteration = 0;
    bool converged = false;
    while (iteration < policy.max_iterations)
    {
        ++iteration;

        sin_lambda = std::sin(lambda);
        cos_lambda = std::cos(lambda);

        const f64 t1 = cos_u2 * sin_lambda;
        const f64 t2 = cos_u1 * sin_u2 - sin_u1 * cos_u2 * cos_lambda;
        sin_sigma = std::sqrt(t1 * t1 + t2 * t2);
        if (sin_sigma == 0.0)
        {
            // Co-incident points
            return InverseSolution{.distance_m = 0.0, .initial_bearing_rad = 0.0, .iterations = iteration};
        }

        cos_sigma = sin_u1 * sin_u2 + cos_u1 * cos_u2 * cos_lambda;
        sigma = std::atan2(sin_sigma, cos_sigma);
        sin_alpha = cos_u1 * cos_u2 * sin_lambda / sin_sigma;
        cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;
        cos_2sigma_m = (cos_sq_alpha != 0.0) ? cos_sigma - 2.0 * sin_u1 * sin_u2 / cos_sq_alpha : 0.0;

        const f64 c = lambda_c(cos_sq_alpha);
        const f64 lambda_prev = lambda;
        lambda = l + (1.0 - c) * f * sin_alpha
               * (sigma + c * sin_sigma * (cos_2sigma_m + c * cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m)));

        if (std::abs(lambda - lambda_prev) <= policy.tolerance)
        {
            converged = true;
            break;
        }
    }

    if (!converged)
    {
        return std::nullopt;
    }

    // Recompute with the converged λ
    sin_lambda = std::sin(lambda);
    cos_lambda = std::cos(lambda);

    const SeriesCoefficients coeff = series_coefficients(cos_sq_alpha);
    const f64 d_sigma = delta_sigma(coeff.b, sin_sigma, cos_sigma, cos_2sigma_m);
    const f64 distance = wgs84::kSemiMinorAxis * coeff.a * (sigma - d_sigma);

    const f64 bearing = std::atan2(cos_u2 * sin_lambda, cos_u1 * sin_u2 - sin_u1 * cos_u2 * cos_lambda);

    return InverseSolution{
        .distance_m          = distance,
        .initial_bearing_rad = normRad(bearing),
        .iterations          = iteration,
    };
}

// -----------------------------------------------------------------
// Direct problem
//
//   tan U1 = (1 − f) tan φ1,  σ1 = atan2(tan U1, cos α1)
//   sin α = cos U1 sin α1
//   σ = s / (b A), iterate σ = s / (b A) + Δσ until stable
//   φ2 = atan2(sin U1 cos σ + cos U1 sin σ cos α1,
//              (1 − f) √(sin²α + (sin U1 sin σ − cos U1 cos σ cos α1)²))
//   λ = atan2(sin σ sin α1, cos U1 cos σ − sin U1 sin σ cos α1)
//   L = λ − (1 − C) f sin α (σ + C sin σ (cos 2σm + C cos σ (−1 + 2 cos² 2σm)))
// -----------------------------------------------------------------

std::optional<LatLon> Geodesic::vincenty_direct(
    const LatLon& start, f64 bearing_rad, f64 distance_m, const VincentyPolicy& policy)
{
    constexpr f64 f = wgs84::kFlattening;
    constexpr f64 b = wgs84::kSemiMinorAxis;

    const f64 sin_alpha1 = std::sin(bearing_rad);
    const f64 cos_alpha1 = std::cos(bearing_rad);

    const f64 tan_u1 = (1.0 - f) * std::tan(start.lat_rad);
    const f64 cos_u1 = 1.0 / std::sqrt(1.0 + tan_u1 * tan_u1);
    const f64 sin_u1 = tan_u1 * cos_u1;
    const f64 sigma1 = std::atan2(tan_u1, cos_alpha1);
    const f64 sin_alpha = cos_u1 * sin_alpha1;
    const f64 cos_sq_alpha = 1.0 - sin_alpha * sin_alpha;

    const SeriesCoefficients coeff = series_coefficients(cos_sq_alpha);
    const f64 sigma0 = distance_m / (b * coeff.a);

    f64 sigma = sigma0;
    bool converged = false;
    for (i32 iteration = 0; iteration < policy.max_iterations; ++iteration)
    {
        const f64 cos_2sigma_m = std::cos(2.0 * sigma1 + sigma);
        const f64 d_sigma = delta_sigma(coeff.b, std::sin(sigma), std::cos(sigma), cos_2sigma_m);
        const f64 sigma_prev = sigma;
        sigma = sigma0 + d_sigma;
        if (std::abs(sigma - sigma_prev) <= policy.tolerance)
        {
            converged = true;
            break;
        }
    }

    if (!converged)
    {
        return std::nullopt;
    }

    const f64 sin_sigma = std::sin(sigma);
    const f64 cos_sigma = std::cos(sigma);
    const f64 cos_2sigma_m = std::cos(2.0 * sigma1 + sigma);

    const f64 tmp = sin_u1 * sin_sigma - cos_u1 * cos_sigma * cos_alpha1;
    const f64 lat2 = std::atan2(sin_u1 * cos_sigma + cos_u1 * sin_sigma * cos_alpha1,
                                (1.0 - f) * std::sqrt(sin_alpha * sin_alpha + tmp * tmp));
    const f64 lambda = std::atan2(sin_sigma * sin_alpha1,
                                  cos_u1 * cos_sigma - sin_u1 * sin_sigma * cos_alpha1);
    const f64 c = lambda_c(cos_sq_alpha);
    const f64 l = lambda - (1.0 - c) * f * sin_alpha
                * (sigma + c * sin_sigma * (cos_2sigma_m + c * cos_sigma * (-1.0 + 2.0 * cos_2sigma_m * cos_2sigma_m)));

    return LatLon::from_radians(lat2, start.lon_rad + l);
}

// -----------------------------------------------------------------
// Haversine: a = sin²(Δφ/2) + cos φ1 cos φ2 sin²(Δλ/2), d = 2R atan2(√a, √(1−a))
// -----------------------------------------------------------------

f64 Geodesic::haversine_distance(const LatLon& p1, const LatLon& p2, f64 radius_m)
{
    const f64 d_lat = p2.lat_rad - p1.lat_rad;
    const f64 d_lon = p2.lon_rad - p1.lon_rad;

    const f64 sin_dlat = std::sin(d_lat / 2.0);
    const f64 sin_dlon = std::sin(d_lon / 2.0);
    const f64 a = std::clamp(sin_dlat * sin_dlat
                             + std::cos(p1.lat_rad) * std::cos(p2.lat_rad) * sin_dlon * sin_dlon,
                             0.0, 1.0);
    const f64 c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));

    return radius_m * c;
}

f64 Geodesic::spherical_initial_bearing(const LatLon& p1, const LatLon& p2)
{
    const f64 d_lon = p2.lon_rad - p1.lon_rad;
    const f64 y = std::sin(d_lon) * std::cos(p2.lat_rad);
    const f64 x = std::cos(p1.lat_rad) * std::sin(p2.lat_rad)
                - std::sin(p1.lat_rad) * std::cos(p2.lat_rad) * std::cos(d_lon);
    return normRad(std::atan2(y, x));
}

LatLon Geodesic::spherical_destination(const LatLon& start, f64 bearing_rad, f64 distance_m, f64 radius_m)
{
    const f64 delta = distance_m / radius_m;  // angular distance
    const f64 sin_lat1 = std::sin(start.lat_rad);
    const f64 cos_lat1 = std::cos(start.lat_rad);

    const f64 sin_lat2 = std::clamp(sin_lat1 * std::cos(delta) + cos_lat1 * std::sin(delta) * std::cos(bearing_rad),
                                    -1.0, 1.0);
    const f64 lat2 = std::asin(sin_lat2);
    const f64 lon2 = start.lon_rad
                   + std::atan2(std::sin(bearing_rad) * std::sin(delta) * cos_lat1,
                                std::cos(delta) - sin_lat1 * sin_lat2);

    return LatLon::from_radians(lat2, lon2);
}

} // namespace georadar::geo
