#pragma once

/// @file points.hpp
/// @brief Point records: Geodetic, Spherical, Observation, LatLon.
///
/// All angles are radians and all lengths meters. Factories apply the range
/// policy of each component, so a record built through them is always
/// normalized; the aggregate fields stay public for designated initialization.

#include "core/math/wrap.hpp"
#include "core/types.hpp"
#include "core/units.hpp"

#include <cmath>
#include <ostream>

namespace georadar::geo
{
    /// @brief Latitude/longitude pair, the return shape of the direct geodesic problem.
    ///
    /// Altitude is intentionally absent: the direct problem does not determine it.
    struct LatLon
    {
        f64 lat_rad{0.0};   ///< Geodetic latitude (radians, -π/2..+π/2)
        f64 lon_rad{0.0};   ///< Longitude (radians, -π..π)

        [[nodiscard]] static LatLon from_radians(f64 lat_rad, f64 lon_rad)
        {
            return LatLon{
                .lat_rad = wrapBounce(lat_rad, -constants::kHalfPi, constants::kHalfPi),
                .lon_rad = normSignedRad(lon_rad),
            };
        }
    };

    /// @brief Point on or above the Earth: longitude, latitude, altitude.
    struct Geodetic
    {
        f64 lon_rad{0.0};   ///< Longitude (radians, cyclic in [-π, π), east positive)
        f64 lat_rad{0.0};   ///< Latitude (radians, reflected into [-π/2, π/2])
        f64 alt_m{0.0};     ///< Height above the reference surface (meters, any sign)

        [[nodiscard]] static Geodetic from_radians(f64 lon_rad, f64 lat_rad, f64 alt_m)
        {
            return Geodetic{
                .lon_rad = normSignedRad(lon_rad),
                .lat_rad = wrapBounce(lat_rad, -constants::kHalfPi, constants::kHalfPi),
                .alt_m   = alt_m,
            };
        }

        [[nodiscard]] static Geodetic from_degrees(f64 lon_deg, f64 lat_deg, f64 alt_m)
        {
            return from_radians(units::deg_to_rad(lon_deg), units::deg_to_rad(lat_deg), alt_m);
        }

        /// @brief Combine a direct-problem result with a separately known altitude.
        [[nodiscard]] static Geodetic from_lat_lon(const LatLon& ll, f64 alt_m)
        {
            return from_radians(ll.lon_rad, ll.lat_rad, alt_m);
        }

        [[nodiscard]] f64 lon_deg() const { return units::rad_to_deg(lon_rad); }
        [[nodiscard]] f64 lat_deg() const { return units::rad_to_deg(lat_rad); }

        [[nodiscard]] LatLon lat_lon() const { return LatLon{.lat_rad = lat_rad, .lon_rad = lon_rad}; }

        /// @brief False when any component is NaN or infinite (e.g. the Earth-center sentinel).
        [[nodiscard]] bool is_valid() const
        {
            return isFinite(lon_rad) && isFinite(lat_rad) && isFinite(alt_m);
        }
    };

    /// @brief Sensor-relative direction and distance: azimuth, elevation, range.
    struct Spherical
    {
        f64 azimuth_rad{0.0};    ///< Azimuth (radians, cyclic in [0, 2π))
        f64 elevation_rad{0.0};  ///< Elevation (radians, reflected into [-π/2, π/2])
        f64 range_m{0.0};        ///< Range (meters, non-negative)

        [[nodiscard]] static Spherical from_radians(f64 azimuth_rad, f64 elevation_rad, f64 range_m)
        {
            return Spherical{
                .azimuth_rad   = normRad(azimuth_rad),
                .elevation_rad = wrapBounce(elevation_rad, -constants::kHalfPi, constants::kHalfPi),
                .range_m       = range_m,
            };
        }

        [[nodiscard]] static Spherical from_degrees(f64 azimuth_deg, f64 elevation_deg, f64 range_m)
        {
            return from_radians(units::deg_to_rad(azimuth_deg), units::deg_to_rad(elevation_deg), range_m);
        }

        [[nodiscard]] f64 azimuth_deg() const { return units::rad_to_deg(azimuth_rad); }
        [[nodiscard]] f64 elevation_deg() const { return units::rad_to_deg(elevation_rad); }

        [[nodiscard]] bool is_valid() const
        {
            return isFinite(azimuth_rad) && isFinite(elevation_rad) && isFinite(range_m);
        }
    };

    /// @brief Sensor-native detection: azimuth, slant range and target altitude.
    ///
    /// The vertical datum is the target's altitude, not an elevation angle;
    /// it is converted to elevation by solving the refraction triangle.
    struct Observation
    {
        f64 azimuth_rad{0.0};  ///< Azimuth (radians, cyclic in [0, 2π))
        f64 range_m{0.0};      ///< Slant range (meters)
        f64 altitude_m{0.0};   ///< Target altitude (meters)

        [[nodiscard]] static Observation from_radians(f64 azimuth_rad, f64 range_m, f64 altitude_m)
        {
            return Observation{
                .azimuth_rad = normRad(azimuth_rad),
                .range_m     = range_m,
                .altitude_m  = altitude_m,
            };
        }

        [[nodiscard]] static Observation from_degrees(f64 azimuth_deg, f64 range_m, f64 altitude_m)
        {
            return from_radians(units::deg_to_rad(azimuth_deg), range_m, altitude_m);
        }

        [[nodiscard]] bool is_valid() const
        {
            return isFinite(azimuth_rad) && isFinite(range_m) && isFinite(altitude_m);
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const LatLon& p)
    {
        return os << "(lat " << units::rad_to_deg(p.lat_rad) << " deg, lon "
                  << units::rad_to_deg(p.lon_rad) << " deg)";
    }

    inline std::ostream& operator<<(std::ostream& os, const Geodetic& p)
    {
        return os << "(lon " << p.lon_deg() << " deg, lat " << p.lat_deg()
                  << " deg, alt " << p.alt_m << " m)";
    }

    inline std::ostream& operator<<(std::ostream& os, const Spherical& s)
    {
        return os << "(az " << s.azimuth_deg() << " deg, el " << s.elevation_deg()
                  << " deg, r " << s.range_m << " m)";
    }

    inline std::ostream& operator<<(std::ostream& os, const Observation& o)
    {
        return os << "(az " << units::rad_to_deg(o.azimuth_rad) << " deg, r "
                  << o.range_m << " m, alt " << o.altitude_m << " m)";
    }

} // namespace georadar::geo
