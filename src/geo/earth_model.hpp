#pragma once

/// @file earth_model.hpp
/// @brief Earth models: the shared interface, WGS84 ellipsoid and mean sphere.

#include "core/types.hpp"
#include "geo/cartesian.hpp"
#include "geo/geodesic.hpp"
#include "geo/points.hpp"

#include <functional>
#include <string_view>

namespace georadar::geo
{
    /// @brief Shape of the reference surface used by every Geodetic-level operation.
    ///
    /// Implementations are immutable after construction and safe to share
    /// between threads. An instance is always passed explicitly; there is no
    /// process-wide active model.
    class EarthModel
    {
    public:
        virtual ~EarthModel() = default;

        /// @brief Geodetic → ECEF.
        [[nodiscard]] virtual Geocentric to_geocentric(const Geodetic& point) const = 0;

        /// @brief ECEF → Geodetic.
        ///
        /// The Earth's center has no defined latitude: a position closer than
        /// 1e-9 m to the origin yields longitude 0 with NaN latitude and altitude.
        [[nodiscard]] virtual Geodetic to_geodetic(const Geocentric& position) const = 0;

        /// @brief Length of the surface path between the two points (altitude ignored).
        [[nodiscard]] virtual f64 surface_distance(const Geodetic& p1, const Geodetic& p2) const = 0;

        /// @brief Forward azimuth at p1 toward p2, [0, 2π).
        [[nodiscard]] virtual f64 initial_bearing(const Geodetic& p1, const Geodetic& p2) const = 0;

        /// @brief Distance from the Earth's center to the surface at a geodetic latitude.
        [[nodiscard]] virtual f64 earth_radius(f64 lat_rad) const = 0;

        /// @brief Direct problem: where a surface path of the given length and bearing ends.
        [[nodiscard]] virtual LatLon destination_point(
            const Geodetic& start, f64 bearing_rad, f64 distance_m) const = 0;

        /// @brief Radius of the sphere of equal volume, used by spherical shortcuts.
        [[nodiscard]] virtual f64 mean_radius() const = 0;

        [[nodiscard]] virtual std::string_view name() const = 0;

        /// @brief Earth radius enlarged by the refraction factor k.
        [[nodiscard]] f64 effective_earth_radius(f64 lat_rad, f64 k_factor = constants::kStandardKFactor) const
        {
            return earth_radius(lat_rad) * k_factor;
        }
    };

    // =================================================================
    // WGS84 ellipsoid
    // =================================================================

    /// @brief Strategy invoked when Vincenty's direct formula fails to converge.
    using DirectFallback = std::function<LatLon(const LatLon& start, f64 bearing_rad, f64 distance_m)>;

    /// @brief Closed-form great-circle destination on the WGS84 mean sphere.
    [[nodiscard]] LatLon mean_sphere_destination(const LatLon& start, f64 bearing_rad, f64 distance_m);

    /// @brief Oblate ellipsoid with WGS84 parameters.
    ///
    /// Distances and bearings use Vincenty's inverse formula. When it does not
    /// converge (nearly antipodal points) the result falls back to Haversine on
    /// a sphere of radius a. The direct problem falls back to the configured
    /// DirectFallback. Both fallbacks are logged at warn level.
    class EllipsoidalEarth final : public EarthModel
    {
    public:
        explicit EllipsoidalEarth(VincentyPolicy policy = {},
                                  DirectFallback fallback = mean_sphere_destination);

        [[nodiscard]] Geocentric to_geocentric(const Geodetic& point) const override;
        [[nodiscard]] Geodetic to_geodetic(const Geocentric& position) const override;
        [[nodiscard]] f64 surface_distance(const Geodetic& p1, const Geodetic& p2) const override;
        [[nodiscard]] f64 initial_bearing(const Geodetic& p1, const Geodetic& p2) const override;
        [[nodiscard]] f64 earth_radius(f64 lat_rad) const override;
        [[nodiscard]] LatLon destination_point(
            const Geodetic& start, f64 bearing_rad, f64 distance_m) const override;
        [[nodiscard]] f64 mean_radius() const override { return wgs84::kMeanRadius; }
        [[nodiscard]] std::string_view name() const override { return "WGS84"; }

        [[nodiscard]] const VincentyPolicy& policy() const { return m_policy; }

    private:
        /// Vincenty inverse with the Haversine fallback applied.
        [[nodiscard]] InverseSolution inverse(const Geodetic& p1, const Geodetic& p2) const;

        VincentyPolicy m_policy;
        DirectFallback m_fallback;
    };

    // =================================================================
    // Sphere
    // =================================================================

    /// @brief Sphere of constant radius (the WGS84 mean radius by default).
    class SphericalEarth final : public EarthModel
    {
    public:
        explicit SphericalEarth(f64 radius_m = wgs84::kMeanRadius);

        [[nodiscard]] Geocentric to_geocentric(const Geodetic& point) const override;
        [[nodiscard]] Geodetic to_geodetic(const Geocentric& position) const override;
        [[nodiscard]] f64 surface_distance(const Geodetic& p1, const Geodetic& p2) const override;
        [[nodiscard]] f64 initial_bearing(const Geodetic& p1, const Geodetic& p2) const override;
        [[nodiscard]] f64 earth_radius(f64 lat_rad) const override;
        [[nodiscard]] LatLon destination_point(
            const Geodetic& start, f64 bearing_rad, f64 distance_m) const override;
        [[nodiscard]] f64 mean_radius() const override { return m_radius; }
        [[nodiscard]] std::string_view name() const override { return "Sphere"; }

    private:
        f64 m_radius;
    };

} // namespace georadar::geo
