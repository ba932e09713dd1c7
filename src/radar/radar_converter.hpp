#pragma once

/// @file radar_converter.hpp
/// @brief Sensor-relative detections ↔ absolute geodetic positions, with refraction.

#include "atmosphere/standard_atmosphere.hpp"
#include "core/types.hpp"
#include "geo/earth_model.hpp"
#include "geo/points.hpp"
#include "radar/refraction_triangle.hpp"

#include <span>
#include <vector>

namespace georadar::radar
{
    struct RadarConverterConfig
    {
        f64 default_k_factor{constants::kStandardKFactor};   ///< k for overloads without one
        atmosphere::StandardAtmosphereParams atmosphere{};   ///< target side of weather-aware solves
        i32 max_k_iterations{10};
        f64 k_tolerance{1e-6};
        CentralAngleClamp central_angle_clamp{CentralAngleClamp::Full};
    };

    /// @brief Outcome of the weather-aware position solve.
    struct RefractionSolution
    {
        geo::Geodetic position;   ///< Position computed with k_factor
        f64 k_factor{0.0};
        i32 iterations{0};
        bool converged{false};    ///< |Δk| fell below the tolerance before the cap
    };

    /// @brief Converts between a sensor's view of a target and the target's geodetic position.
    ///
    /// The ray path is modelled as a straight line over an Earth whose radius
    /// is multiplied by k (the refraction triangle). Effective radii are taken
    /// at the sensor's latitude; azimuths and ground distances come from the
    /// Earth model's geodesic solvers.
    ///
    /// The converter keeps a reference to the Earth model, which must outlive
    /// it. All operations are const and safe to call concurrently.
    class RadarConverter
    {
    public:
        explicit RadarConverter(const geo::EarthModel& model, const RadarConverterConfig& config = {});
        RadarConverter(const geo::EarthModel&&, const RadarConverterConfig& = {}) = delete;

        [[nodiscard]] const geo::EarthModel& model() const { return m_model; }
        [[nodiscard]] const RadarConverterConfig& config() const { return m_config; }
        [[nodiscard]] const atmosphere::StandardAtmosphere& atmosphere() const { return m_atmosphere; }

        // -----------------------------------------------------------------
        // Position → detection
        // -----------------------------------------------------------------

        /// @brief Apparent azimuth, elevation and slant range of a target position.
        [[nodiscard]] geo::Spherical to_spherical(const geo::Geodetic& sensor, const geo::Geodetic& target) const;
        [[nodiscard]] geo::Spherical to_spherical(
            const geo::Geodetic& sensor, const geo::Geodetic& target, f64 k_factor) const;

        /// @brief Elevation of an observation, derived from its altitude.
        [[nodiscard]] geo::Spherical to_spherical(const geo::Geodetic& sensor, const geo::Observation& obs) const;
        [[nodiscard]] geo::Spherical to_spherical(
            const geo::Geodetic& sensor, const geo::Observation& obs, f64 k_factor) const;

        /// @brief As to_spherical, with k from measured weather at both ends.
        [[nodiscard]] geo::Spherical to_spherical(
            const geo::Geodetic& sensor, const atmosphere::WeatherSample& sensor_weather,
            const geo::Geodetic& target, const atmosphere::WeatherSample& target_weather) const;

        /// @brief Bearing, slant range and altitude of a target position.
        [[nodiscard]] geo::Observation to_observation(const geo::Geodetic& sensor, const geo::Geodetic& target) const;

        // -----------------------------------------------------------------
        // Detection → position
        // -----------------------------------------------------------------

        [[nodiscard]] geo::Geodetic to_geodetic(const geo::Geodetic& sensor, const geo::Spherical& detection) const;
        [[nodiscard]] geo::Geodetic to_geodetic(
            const geo::Geodetic& sensor, const geo::Spherical& detection, f64 k_factor) const;

        [[nodiscard]] geo::Geodetic to_geodetic(const geo::Geodetic& sensor, const geo::Observation& obs) const;
        [[nodiscard]] geo::Geodetic to_geodetic(
            const geo::Geodetic& sensor, const geo::Observation& obs, f64 k_factor) const;

        /// @brief Position with k refined from the sensor's weather and the target's altitude.
        ///
        /// Starts at k = 4/3, solves the position, recomputes k between the
        /// sensor (measured weather) and the new target altitude (standard
        /// atmosphere), and repeats until |Δk| < k_tolerance or the iteration
        /// cap. The last position is returned either way.
        [[nodiscard]] RefractionSolution solve_geodetic(
            const geo::Geodetic& sensor, const atmosphere::WeatherSample& sensor_weather,
            const geo::Spherical& detection) const;

        [[nodiscard]] geo::Geodetic to_geodetic(
            const geo::Geodetic& sensor, const atmosphere::WeatherSample& sensor_weather,
            const geo::Spherical& detection) const;

        // -----------------------------------------------------------------
        // Radio horizon
        // -----------------------------------------------------------------

        /// @brief Distance to the radio horizon, √(2 Reff h + h²). Zero for h <= 0.
        [[nodiscard]] f64 horizon_distance(f64 alt_m, f64 lat_rad) const;
        [[nodiscard]] f64 horizon_distance(f64 alt_m, f64 lat_rad, f64 k_factor) const;

        // -----------------------------------------------------------------
        // Batches (results in input order)
        // -----------------------------------------------------------------

        [[nodiscard]] std::vector<geo::Spherical> to_sphericals(
            const geo::Geodetic& sensor, std::span<const geo::Geodetic> targets) const;
        [[nodiscard]] std::vector<geo::Spherical> to_sphericals(
            const geo::Geodetic& sensor, std::span<const geo::Geodetic> targets, f64 k_factor) const;

        [[nodiscard]] std::vector<geo::Geodetic> to_geodetics(
            const geo::Geodetic& sensor, std::span<const geo::Spherical> detections) const;
        [[nodiscard]] std::vector<geo::Geodetic> to_geodetics(
            const geo::Geodetic& sensor, std::span<const geo::Spherical> detections, f64 k_factor) const;

        [[nodiscard]] std::vector<geo::Geodetic> to_geodetics(
            const geo::Geodetic& sensor, std::span<const geo::Observation> observations) const;

        [[nodiscard]] std::vector<geo::Observation> to_observations(
            const geo::Geodetic& sensor, std::span<const geo::Geodetic> targets) const;

    private:
        [[nodiscard]] f64 elevation_for(const geo::Geodetic& sensor, f64 target_alt_m,
                                        f64 slant_range_m, f64 k_factor) const;

        const geo::EarthModel& m_model;
        RadarConverterConfig m_config;
        atmosphere::StandardAtmosphere m_atmosphere;
    };

} // namespace georadar::radar
