/// @file radar_converter.cpp
/// @brief Refraction-triangle conversions between radar detections and geodetic positions.

#include "radar/radar_converter.hpp"

#include "atmosphere/refraction.hpp"
#include "core/logger.hpp"
#include "geo/geodetic_ops.hpp"

#include <cmath>
#include <stdexcept>

namespace georadar::radar
{

using geo::Geodetic;
using geo::Observation;
using geo::Spherical;

RadarConverter::RadarConverter(const geo::EarthModel& model, const RadarConverterConfig& config)
    : m_model(model)
    , m_config(config)
    , m_atmosphere(config.atmosphere)
{
    if (!(config.default_k_factor > 0.0))
    {
        throw std::invalid_argument("RadarConverter: default k-factor must be positive");
    }
    if (config.max_k_iterations < 1)
    {
        throw std::invalid_argument("RadarConverter: at least one k iteration is required");
    }
    if (!(config.k_tolerance > 0.0))
    {
        throw std::invalid_argument("RadarConverter: k tolerance must be positive");
    }
}

f64 RadarConverter::elevation_for(const Geodetic& sensor, f64 target_alt_m, f64 slant_range_m, f64 k_factor) const
{
    const TriangleSolution tri = solve_refraction_triangle(
        TriangleInput{
            .effective_radius_m = m_model.effective_earth_radius(sensor.lat_rad, k_factor),
            .sensor_alt_m       = sensor.alt_m,
            .slant_range_m      = slant_range_m,
            .target_alt_m       = target_alt_m,
            .elevation_rad      = std::nullopt,
        },
        m_config.central_angle_clamp);
    return tri.elevation_rad;
}

// -----------------------------------------------------------------
// Position → detection
// -----------------------------------------------------------------

Spherical RadarConverter::to_spherical(const Geodetic& sensor, const Geodetic& target) const
{
    return to_spherical(sensor, target, m_config.default_k_factor);
}

Spherical RadarConverter::to_spherical(const Geodetic& sensor, const Geodetic& target, f64 k_factor) const
{
    const f64 range = geo::slant_range(sensor, target, m_model);
    const f64 azimuth = m_model.initial_bearing(sensor, target);
    const f64 elevation = elevation_for(sensor, target.alt_m, range, k_factor);

    return Spherical::from_radians(azimuth, elevation, range);
}

Spherical RadarConverter::to_spherical(const Geodetic& sensor, const Observation& obs) const
{
    return to_spherical(sensor, obs, m_config.default_k_factor);
}

Spherical RadarConverter::to_spherical(const Geodetic& sensor, const Observation& obs, f64 k_factor) const
{
    const f64 elevation = elevation_for(sensor, obs.altitude_m, obs.range_m, k_factor);
    return Spherical::from_radians(obs.azimuth_rad, elevation, obs.range_m);
}

Spherical RadarConverter::to_spherical(
    const Geodetic& sensor, const atmosphere::WeatherSample& sensor_weather,
    const Geodetic& target, const atmosphere::WeatherSample& target_weather) const
{
    const f64 k = atmosphere::Refraction::k_factor(sensor.alt_m, sensor_weather, target.alt_m, target_weather);
    return to_spherical(sensor, target, k);
}

Observation RadarConverter::to_observation(const Geodetic& sensor, const Geodetic& target) const
{
    return Observation::from_radians(m_model.initial_bearing(sensor, target),
                                     geo::slant_range(sensor, target, m_model),
                                     target.alt_m);
}

// -----------------------------------------------------------------
// Detection → position
//
// The triangle gives the target altitude and the central angle γ; the
// ground distance Reff·γ is then walked from the sensor along the
// detection's azimuth with the model's direct geodesic solver.
// -----------------------------------------------------------------

Geodetic RadarConverter::to_geodetic(const Geodetic& sensor, const Spherical& detection) const
{
    return to_geodetic(sensor, detection, m_config.default_k_factor);
}

Geodetic RadarConverter::to_geodetic(const Geodetic& sensor, const Spherical& detection, f64 k_factor) const
{
    const f64 reff = m_model.effective_earth_radius(sensor.lat_rad, k_factor);
    const TriangleSolution tri = solve_refraction_triangle(
        TriangleInput{
            .effective_radius_m = reff,
            .sensor_alt_m       = sensor.alt_m,
            .slant_range_m      = detection.range_m,
            .target_alt_m       = std::nullopt,
            .elevation_rad      = detection.elevation_rad,
        },
        m_config.central_angle_clamp);

    const f64 ground_distance = reff * tri.central_angle_rad;
    const geo::LatLon ll = m_model.destination_point(sensor, detection.azimuth_rad, ground_distance);
    return Geodetic::from_lat_lon(ll, tri.target_alt_m);
}

Geodetic RadarConverter::to_geodetic(const Geodetic& sensor, const Observation& obs) const
{
    return to_geodetic(sensor, obs, m_config.default_k_factor);
}

Geodetic RadarConverter::to_geodetic(const Geodetic& sensor, const Observation& obs, f64 k_factor) const
{
    return to_geodetic(sensor, to_spherical(sensor, obs, k_factor), k_factor);
}

RefractionSolution RadarConverter::solve_geodetic(
    const Geodetic& sensor, const atmosphere::WeatherSample& sensor_weather, const Spherical& detection) const
{
    RefractionSolution solution;
    f64 k = constants::kStandardKFactor;

    for (i32 i = 0; i < m_config.max_k_iterations; ++i)
    {
        solution.position = to_geodetic(sensor, detection, k);
        solution.k_factor = k;
        solution.iterations = i + 1;

        const f64 next_k = atmosphere::Refraction::k_factor(
            sensor.alt_m, sensor_weather, solution.position.alt_m, m_atmosphere);

        if (std::abs(next_k - k) < m_config.k_tolerance)
        {
            solution.converged = true;
            break;
        }
        k = next_k;
    }

    if (solution.converged)
    {
        GRD_CORE_DEBUG("k-factor converged to {:.6f} after {} iteration(s)", solution.k_factor, solution.iterations);
    }
    else
    {
        GRD_CORE_WARN("k-factor did not converge within {} iterations (last k = {:.6f}); using last position",
                      m_config.max_k_iterations, solution.k_factor);
    }
    return solution;
}

Geodetic RadarConverter::to_geodetic(
    const Geodetic& sensor, const atmosphere::WeatherSample& sensor_weather, const Spherical& detection) const
{
    return solve_geodetic(sensor, sensor_weather, detection).position;
}

// -----------------------------------------------------------------
// Radio horizon: tangent from the sensor to a sphere of radius Reff
//   d² = (Reff + h)² − Reff² = 2 Reff h + h²
// -----------------------------------------------------------------

f64 RadarConverter::horizon_distance(f64 alt_m, f64 lat_rad) const
{
    return horizon_distance(alt_m, lat_rad, m_config.default_k_factor);
}

f64 RadarConverter::horizon_distance(f64 alt_m, f64 lat_rad, f64 k_factor) const
{
    if (alt_m <= 0.0)
    {
        return 0.0;
    }
    const f64 reff = m_model.effective_earth_radius(lat_rad, k_factor);
    return std::sqrt(2.0 * reff * alt_m + alt_m * alt_m);
}

// -----------------------------------------------------------------
// Batches
// -----------------------------------------------------------------

std::vector<Spherical> RadarConverter::to_sphericals(
    const Geodetic& sensor, std::span<const Geodetic> targets) const
{
    return to_sphericals(sensor, targets, m_config.default_k_factor);
}

std::vector<Spherical> RadarConverter::to_sphericals(
    const Geodetic& sensor, std::span<const Geodetic> targets, f64 k_factor) const
{
    std::vector<Spherical> result;
    result.reserve(targets.size());
    for (const Geodetic& target : targets)
    {
        result.push_back(to_spherical(sensor, target, k_factor));
    }
    return result;
}

std::vector<Geodetic> RadarConverter::to_geodetics(
    const Geodetic& sensor, std::span<const Spherical> detections) const
{
    return to_geodetics(sensor, detections, m_config.default_k_factor);
}

std::vector<Geodetic> RadarConverter::to_geodetics(
    const Geodetic& sensor, std::span<const Spherical> detections, f64 k_factor) const
{
    std::vector<Geodetic> result;
    result.reserve(detections.size());
    for (const Spherical& detection : detections)
    {
        result.push_back(to_geodetic(sensor, detection, k_factor));
    }
    return result;
}

std::vector<Geodetic> RadarConverter::to_geodetics(
    const Geodetic& sensor, std::span<const Observation> observations) const
{
    std::vector<Geodetic> result;
    result.reserve(observations.size());
    for (const Observation& obs : observations)
    {
        result.push_back(to_geodetic(sensor, obs));
    }
    return result;
}

std::vector<Observation> RadarConverter::to_observations(
    const Geodetic& sensor, std::span<const Geodetic> targets) const
{
    std::vector<Observation> result;
    result.reserve(targets.size());
    for (const Geodetic& target : targets)
    {
        result.push_back(to_observation(sensor, target));
    }
    return result;
}

} // namespace georadar::radar
