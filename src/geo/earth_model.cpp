/// @file earth_model.cpp
/// @brief WGS84 ellipsoid and spherical Earth implementations.

#include "geo/earth_model.hpp"

#include "core/logger.hpp"
#include "core/math/wrap.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace georadar::geo
{

namespace
{
    /// Below this distance from the origin a position has no defined latitude.
    constexpr f64 kCenterEpsilon = 1e-9;

    /// Fixed number of latitude refinements, enough for millimeter accuracy.
    constexpr i32 kGeodeticRefinements = 5;

    Geodetic earth_center_sentinel()
    {
        constexpr f64 kNaN = std::numeric_limits<f64>::quiet_NaN();
        return Geodetic{.lon_rad = 0.0, .lat_rad = kNaN, .alt_m = kNaN};
    }
}

LatLon mean_sphere_destination(const LatLon& start, f64 bearing_rad, f64 distance_m)
{
    return Geodesic::spherical_destination(start, bearing_rad, distance_m, wgs84::kMeanRadius);
}

// =================================================================
// EllipsoidalEarth
// =================================================================

EllipsoidalEarth::EllipsoidalEarth(VincentyPolicy policy, DirectFallback fallback)
    : m_policy(policy)
    , m_fallback(std::move(fallback))
{
    if (!m_fallback)
    {
        throw std::invalid_argument("EllipsoidalEarth: direct fallback must be callable");
    }
}

// -----------------------------------------------------------------
// Geodetic → ECEF
//
//   N = a / √(1 − e² sin²φ)            (prime-vertical radius)
//   x = (N + h) cos φ cos λ
//   y = (N + h) cos φ sin λ
//   z = ((1 − e²) N + h) sin φ
// -----------------------------------------------------------------

Geocentric EllipsoidalEarth::to_geocentric(const Geodetic& point) const
{
    constexpr f64 kA = wgs84::kSemiMajorAxis;
    constexpr f64 kE2 = wgs84::kEccentricitySq;

    const f64 sin_lat = std::sin(point.lat_rad);
    const f64 cos_lat = std::cos(point.lat_rad);
    const f64 n = kA / std::sqrt(1.0 - kE2 * sin_lat * sin_lat);

    return Geocentric((n + point.alt_m) * cos_lat * std::cos(point.lon_rad),
                      (n + point.alt_m) * cos_lat * std::sin(point.lon_rad),
                      ((1.0 - kE2) * n + point.alt_m) * sin_lat);
}

// -----------------------------------------------------------------
// ECEF → Geodetic
//
// Start from φ0 = atan2(z, p (1 − e²)) and refine a fixed number of times:
//   N = a / √(1 − e² sin²φ)
//   h = p cos φ + z sin φ − N (1 − e² sin²φ)
//   φ = atan2(z, p (1 − e² N / (N + h)))
// The height form above stays finite on the polar axis (p = 0).
// -----------------------------------------------------------------

Geodetic EllipsoidalEarth::to_geodetic(const Geocentric& position) const
{
    if (position.magnitude() < kCenterEpsilon)
    {
        return earth_center_sentinel();
    }

    constexpr f64 kA = wgs84::kSemiMajorAxis;
    constexpr f64 kE2 = wgs84::kEccentricitySq;

    const f64 x = position.x();
    const f64 y = position.y();
    const f64 z = position.z();
    const f64 p = std::sqrt(x * x + y * y);

    const auto height_at = [&](f64 lat)
    {
        const f64 sin_lat = std::sin(lat);
        const f64 n = kA / std::sqrt(1.0 - kE2 * sin_lat * sin_lat);
        const f64 alt = p * std::cos(lat) + z * sin_lat - n * (1.0 - kE2 * sin_lat * sin_lat);
        return std::pair<f64, f64>{n, alt};
    };

    f64 lat = std::atan2(z, p * (1.0 - kE2));
    for (i32 i = 0; i < kGeodeticRefinements; ++i)
    {
        const auto [n, alt] = height_at(lat);
        lat = std::atan2(z, p * (1.0 - kE2 * n / (n + alt)));
    }

    const f64 alt = height_at(lat).second;
    return Geodetic::from_radians(std::atan2(y, x), lat, alt);
}

InverseSolution EllipsoidalEarth::inverse(const Geodetic& p1, const Geodetic& p2) const
{
    if (const auto solution = Geodesic::vincenty_inverse(p1.lat_lon(), p2.lat_lon(), m_policy))
    {
        return *solution;
    }

    GRD_CORE_WARN("Vincenty inverse did not converge in {} iterations between ({:.6f}, {:.6f}) and "
                  "({:.6f}, {:.6f}); using Haversine",
                  m_policy.max_iterations, p1.lat_deg(), p1.lon_deg(), p2.lat_deg(), p2.lon_deg());

    return InverseSolution{
        .distance_m          = Geodesic::haversine_distance(p1.lat_lon(), p2.lat_lon(), wgs84::kSemiMajorAxis),
        .initial_bearing_rad = Geodesic::spherical_initial_bearing(p1.lat_lon(), p2.lat_lon()),
        .iterations          = m_policy.max_iterations,
    };
}

f64 EllipsoidalEarth::surface_distance(const Geodetic& p1, const Geodetic& p2) const
{
    return inverse(p1, p2).distance_m;
}

f64 EllipsoidalEarth::initial_bearing(const Geodetic& p1, const Geodetic& p2) const
{
    return inverse(p1, p2).initial_bearing_rad;
}

// -----------------------------------------------------------------
// Geocentric radius at geodetic latitude φ:
//   R(φ) = √(((a² cos φ)² + (b² sin φ)²) / ((a cos φ)² + (b sin φ)²))
// -----------------------------------------------------------------

f64 EllipsoidalEarth::earth_radius(f64 lat_rad) const
{
    constexpr f64 kA = wgs84::kSemiMajorAxis;
    constexpr f64 kB = wgs84::kSemiMinorAxis;

    const f64 cos_lat = std::cos(lat_rad);
    const f64 sin_lat = std::sin(lat_rad);

    const f64 num = (kA * kA * cos_lat) * (kA * kA * cos_lat) + (kB * kB * sin_lat) * (kB * kB * sin_lat);
    const f64 den = (kA * cos_lat) * (kA * cos_lat) + (kB * sin_lat) * (kB * sin_lat);

    if (den < 1e-10)
    {
        return kB;
    }
    return std::sqrt(num / den);
}

LatLon EllipsoidalEarth::destination_point(const Geodetic& start, f64 bearing_rad, f64 distance_m) const
{
    if (const auto destination = Geodesic::vincenty_direct(start.lat_lon(), bearing_rad, distance_m, m_policy))
    {
        return *destination;
    }

    GRD_CORE_WARN("Vincenty direct did not converge in {} iterations from ({:.6f}, {:.6f}) over {:.1f} m; "
                  "using fallback",
                  m_policy.max_iterations, start.lat_deg(), start.lon_deg(), distance_m);
    return m_fallback(start.lat_lon(), bearing_rad, distance_m);
}

// =================================================================
// SphericalEarth
// =================================================================

SphericalEarth::SphericalEarth(f64 radius_m)
    : m_radius(radius_m)
{
    if (!(radius_m > 0.0) || !isFinite(radius_m))
    {
        throw std::invalid_argument("SphericalEarth: radius must be positive and finite");
    }
}

Geocentric SphericalEarth::to_geocentric(const Geodetic& point) const
{
    const f64 r = m_radius + point.alt_m;
    const f64 cos_lat = std::cos(point.lat_rad);
    return Geocentric(r * cos_lat * std::cos(point.lon_rad),
                      r * cos_lat * std::sin(point.lon_rad),
                      r * std::sin(point.lat_rad));
}

Geodetic SphericalEarth::to_geodetic(const Geocentric& position) const
{
    const f64 r = position.magnitude();
    if (r < kCenterEpsilon)
    {
        return earth_center_sentinel();
    }

    return Geodetic::from_radians(std::atan2(position.y(), position.x()),
                                  std::asin(std::clamp(position.z() / r, -1.0, 1.0)),
                                  r - m_radius);
}

f64 SphericalEarth::surface_distance(const Geodetic& p1, const Geodetic& p2) const
{
    return Geodesic::haversine_distance(p1.lat_lon(), p2.lat_lon(), m_radius);
}

f64 SphericalEarth::initial_bearing(const Geodetic& p1, const Geodetic& p2) const
{
    return Geodesic::spherical_initial_bearing(p1.lat_lon(), p2.lat_lon());
}

f64 SphericalEarth::earth_radius(f64 /*lat_rad*/) const
{
    return m_radius;
}

LatLon SphericalEarth::destination_point(const Geodetic& start, f64 bearing_rad, f64 distance_m) const
{
    return Geodesic::spherical_destination(start.lat_lon(), bearing_rad, distance_m, m_radius);
}

} // namespace georadar::geo
