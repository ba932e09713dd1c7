/// @file geodetic_ops.cpp
/// @brief Local-frame rotations and point-to-point geometry on an Earth model.

#include "geo/geodetic_ops.hpp"

#include <glm/matrix.hpp>

#include <cmath>

namespace georadar::geo
{

namespace
{
    /// Horizontal separation below which two points are treated as vertically stacked.
    constexpr f64 kStackedEpsilon = 1e-9;
}

Mat3d enu_rotation(const Geodetic& origin)
{
    const f64 sin_lat = std::sin(origin.lat_rad);
    const f64 cos_lat = std::cos(origin.lat_rad);
    const f64 sin_lon = std::sin(origin.lon_rad);
    const f64 cos_lon = std::cos(origin.lon_rad);

    const Vec3d east(-sin_lon, cos_lon, 0.0);
    const Vec3d north(-sin_lat * cos_lon, -sin_lat * sin_lon, cos_lat);
    const Vec3d up(cos_lat * cos_lon, cos_lat * sin_lon, sin_lat);

    // glm matrices are column-major: each argument is a column
    return Mat3d(east, north, up);
}

EnuVector to_enu(const Geodetic& origin, const Cartesian& ecef_offset)
{
    return EnuVector(glm::transpose(enu_rotation(origin)) * ecef_offset.vec());
}

Cartesian to_ecef(const Geodetic& origin, const EnuVector& enu)
{
    return Cartesian(enu_rotation(origin) * enu.vec());
}

EnuVector enu_displacement(const Geodetic& from, const Geodetic& to, const EarthModel& model)
{
    return to_enu(from, ecef_displacement(from, to, model));
}

f64 slant_range(const Geodetic& from, const Geodetic& to, const EarthModel& model)
{
    return model.to_geocentric(from).distance_to(model.to_geocentric(to));
}

Cartesian ecef_displacement(const Geodetic& from, const Geodetic& to, const EarthModel& model)
{
    return model.to_geocentric(to).subtract(model.to_geocentric(from)).to_cartesian();
}

Geodetic transform(const Geodetic& point, const Cartesian& ecef_offset, const EarthModel& model)
{
    return model.to_geodetic(model.to_geocentric(point).add(ecef_offset));
}

// -----------------------------------------------------------------
// Look angles from the ENU displacement d = (e, n, u):
//   azimuth   = atan2(e, n)        (compass: 0 = North, π/2 = East)
//   elevation = atan2(u, √(e² + n²))
//   range     = |d|
// -----------------------------------------------------------------

Spherical look_angles(const Geodetic& from, const Geodetic& to, const EarthModel& model)
{
    const EnuVector d = enu_displacement(from, to, model);
    const f64 range = d.magnitude();
    if (range < constants::kVectorEpsilon)
    {
        return Spherical{};
    }

    const f64 horizontal = std::sqrt(d.east() * d.east() + d.north() * d.north());
    return Spherical::from_radians(std::atan2(d.east(), d.north()),
                                   std::atan2(d.up(), horizontal),
                                   range);
}

f64 surface_distance(const Geodetic& from, const Geodetic& to, const EarthModel& model)
{
    return model.surface_distance(from, to);
}

f64 initial_bearing(const Geodetic& from, const Geodetic& to, const EarthModel& model)
{
    return model.initial_bearing(from, to);
}

f64 elevation_angle(const Geodetic& from, const Geodetic& to, const EarthModel& model)
{
    const f64 rise = altitude_difference(from, to);
    const f64 ground = model.surface_distance(from, to);
    if (ground < kStackedEpsilon)
    {
        return rise >= 0.0 ? constants::kHalfPi : -constants::kHalfPi;
    }
    return std::atan2(rise, ground);
}

f64 altitude_difference(const Geodetic& from, const Geodetic& to)
{
    return to.alt_m - from.alt_m;
}

Spherical geodetic_as_spherical(const Geodetic& point, const EarthModel& model)
{
    return Spherical::from_radians(point.lon_rad, point.lat_rad, model.earth_radius(0.0) + point.alt_m);
}

Geodetic spherical_as_geodetic(const Spherical& s, const EarthModel& model)
{
    return Geodetic::from_radians(s.azimuth_rad, s.elevation_rad, s.range_m - model.earth_radius(0.0));
}

} // namespace georadar::geo
