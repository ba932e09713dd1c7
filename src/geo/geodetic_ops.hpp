#pragma once

/// @file geodetic_ops.hpp
/// @brief Geodetic-level operations: ECEF/ENU frames, look angles, distances.
///
/// Every function that depends on the shape of the Earth takes the model as
/// an explicit argument.

#include "core/types.hpp"
#include "geo/cartesian.hpp"
#include "geo/earth_model.hpp"
#include "geo/points.hpp"

namespace georadar::geo
{
    [[nodiscard]] inline Geocentric to_geocentric(const Geodetic& point, const EarthModel& model)
    {
        return model.to_geocentric(point);
    }

    [[nodiscard]] inline Geodetic to_geodetic(const Geocentric& position, const EarthModel& model)
    {
        return model.to_geodetic(position);
    }

    // -----------------------------------------------------------------
    // Local tangent plane (East-North-Up)
    // -----------------------------------------------------------------

    /// @brief Rotation whose columns are the E, N, U unit vectors of the origin, in ECEF.
    ///
    ///        | -sin λ   -sin φ cos λ   cos φ cos λ |
    ///    R = |  cos λ   -sin φ sin λ   cos φ sin λ |
    ///        |    0         cos φ          sin φ   |
    [[nodiscard]] Mat3d enu_rotation(const Geodetic& origin);

    /// @brief ECEF offset → ENU displacement at the origin (Rᵀ·v).
    [[nodiscard]] EnuVector to_enu(const Geodetic& origin, const Cartesian& ecef_offset);

    /// @brief ENU displacement at the origin → ECEF offset (R·v).
    [[nodiscard]] Cartesian to_ecef(const Geodetic& origin, const EnuVector& enu);

    /// @brief ENU displacement of `to` seen from `from`.
    [[nodiscard]] EnuVector enu_displacement(const Geodetic& from, const Geodetic& to, const EarthModel& model);

    // -----------------------------------------------------------------
    // Point-to-point geometry
    // -----------------------------------------------------------------

    /// @brief Straight-line (chord) distance between the two positions.
    [[nodiscard]] f64 slant_range(const Geodetic& from, const Geodetic& to, const EarthModel& model);

    /// @brief ECEF vector from `from` to `to`.
    [[nodiscard]] Cartesian ecef_displacement(const Geodetic& from, const Geodetic& to, const EarthModel& model);

    /// @brief Move a point by an ECEF displacement.
    [[nodiscard]] Geodetic transform(const Geodetic& point, const Cartesian& ecef_offset, const EarthModel& model);

    /// @brief Topocentric view of `to` from `from`: compass azimuth, elevation above the
    /// local horizon plane, straight-line range. No refraction is applied.
    [[nodiscard]] Spherical look_angles(const Geodetic& from, const Geodetic& to, const EarthModel& model);

    [[nodiscard]] f64 surface_distance(const Geodetic& from, const Geodetic& to, const EarthModel& model);

    [[nodiscard]] f64 initial_bearing(const Geodetic& from, const Geodetic& to, const EarthModel& model);

    /// @brief atan2(altitude difference, surface distance); ±π/2 for points stacked vertically.
    [[nodiscard]] f64 elevation_angle(const Geodetic& from, const Geodetic& to, const EarthModel& model);

    /// @brief to.alt − from.alt
    [[nodiscard]] f64 altitude_difference(const Geodetic& from, const Geodetic& to);

    // -----------------------------------------------------------------
    // Reinterpretation between Geodetic and Spherical
    // -----------------------------------------------------------------

    /// @brief Read a geodetic point as a direction from the Earth's center:
    /// longitude as azimuth, latitude as elevation, equatorial radius + altitude as range.
    [[nodiscard]] Spherical geodetic_as_spherical(const Geodetic& point, const EarthModel& model);

    /// @brief Inverse of geodetic_as_spherical.
    [[nodiscard]] Geodetic spherical_as_geodetic(const Spherical& s, const EarthModel& model);

} // namespace georadar::geo
