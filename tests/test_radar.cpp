/// @file test_radar.cpp
/// @brief Unit tests for the refraction triangle and georadar::radar::RadarConverter.
///
/// Round trips cover regional radar geometry (tens of kilometres) on both
/// Earth models, with fixed and weather-derived k.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "atmosphere/refraction.hpp"
#include "atmosphere/standard_atmosphere.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "geo/earth_model.hpp"
#include "radar/radar_converter.hpp"
#include "radar/radar_site.hpp"
#include "radar/refraction_triangle.hpp"

#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <vector>

using namespace georadar;
using namespace georadar::radar;
using geo::Geodetic;
using geo::Observation;
using geo::Spherical;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    georadar::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    georadar::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helpers
// =================================================================

static constexpr f64 kAngleTol = 1e-6;   ///< radians
static constexpr f64 kAltTol = 1e-3;     ///< meters

static void check_same_position(const Geodetic& actual, const Geodetic& expected)
{
    CAPTURE(actual);
    CAPTURE(expected);
    CHECK(std::abs(actual.lat_rad - expected.lat_rad) < kAngleTol);
    CHECK(std::abs(actual.lon_rad - expected.lon_rad) < kAngleTol);
    CHECK(std::abs(actual.alt_m - expected.alt_m) < kAltTol);
}

// =================================================================
// Refraction triangle
// =================================================================

TEST_CASE("Horizontal ray over the effective Earth")
{
    const TriangleSolution tri = solve_refraction_triangle(TriangleInput{
        .effective_radius_m = 8.0e6,
        .sensor_alt_m       = 0.0,
        .slant_range_m      = 1000.0,
        .target_alt_m       = std::nullopt,
        .elevation_rad      = 0.0,
    });

    CHECK(std::abs(tri.target_alt_m - 0.0625) < 1e-6);
    CHECK(tri.elevation_rad == 0.0);
    CHECK(tri.central_angle_rad == doctest::Approx(std::atan(1.25e-4)).epsilon(1e-6));
}

TEST_CASE("Triangle solves elevation from altitude and back")
{
    const TriangleSolution up = solve_refraction_triangle(TriangleInput{
        .effective_radius_m = 8.5e6,
        .sensor_alt_m       = 120.0,
        .slant_range_m      = 40000.0,
        .target_alt_m       = 3000.0,
        .elevation_rad      = std::nullopt,
    });
    CHECK(up.elevation_rad > 0.0);
    CHECK(up.target_alt_m == 3000.0);

    const TriangleSolution down = solve_refraction_triangle(TriangleInput{
        .effective_radius_m = 8.5e6,
        .sensor_alt_m       = 120.0,
        .slant_range_m      = 40000.0,
        .target_alt_m       = std::nullopt,
        .elevation_rad      = up.elevation_rad,
    });
    CHECK(std::abs(down.target_alt_m - 3000.0) < kAltTol);
    CHECK(down.central_angle_rad == doctest::Approx(up.central_angle_rad).epsilon(1e-9));
}

TEST_CASE("Elevation wins when both unknowns are given")
{
    const TriangleSolution tri = solve_refraction_triangle(TriangleInput{
        .effective_radius_m = 8.0e6,
        .sensor_alt_m       = 0.0,
        .slant_range_m      = 1000.0,
        .target_alt_m       = 5000.0,
        .elevation_rad      = 0.0,
    });
    CHECK(std::abs(tri.target_alt_m - 0.0625) < 1e-6);
}

TEST_CASE("Triangle rejects unsolvable input")
{
    const TriangleInput nothing{
        .effective_radius_m = 8.0e6,
        .sensor_alt_m       = 0.0,
        .slant_range_m      = 1000.0,
        .target_alt_m       = std::nullopt,
        .elevation_rad      = std::nullopt,
    };
    CHECK_THROWS_AS((void)solve_refraction_triangle(nothing), std::invalid_argument);
}

TEST_CASE("Zero slant range points straight up or down")
{
    TriangleInput input{
        .effective_radius_m = 8.0e6,
        .sensor_alt_m       = 100.0,
        .slant_range_m      = 0.0,
        .target_alt_m       = 100.0,
        .elevation_rad      = std::nullopt,
    };

    SUBCASE("colocated")
    {
        const TriangleSolution tri = solve_refraction_triangle(input);
        CHECK(tri.elevation_rad == constants::kHalfPi);
        CHECK(tri.central_angle_rad == 0.0);
        CHECK(tri.target_alt_m == 100.0);
    }

    SUBCASE("below the sensor")
    {
        input.target_alt_m = 50.0;
        const TriangleSolution tri = solve_refraction_triangle(input, CentralAngleClamp::UpperEpsilon);
        CHECK(tri.elevation_rad == -constants::kHalfPi);
        CHECK(tri.central_angle_rad == 0.0);
    }
}

TEST_CASE("Upper-epsilon clamp forces a wide central angle")
{
    const TriangleInput input{
        .effective_radius_m = 8.0e6,
        .sensor_alt_m       = 0.0,
        .slant_range_m      = 2000.0,
        .target_alt_m       = 1000.0,
        .elevation_rad      = std::nullopt,
    };

    const TriangleSolution full = solve_refraction_triangle(input, CentralAngleClamp::Full);
    const TriangleSolution clamped = solve_refraction_triangle(input, CentralAngleClamp::UpperEpsilon);

    CHECK(full.central_angle_rad < 1e-3);
    CHECK(clamped.central_angle_rad == doctest::Approx(constants::kHalfPi));
    CHECK(clamped.elevation_rad == full.elevation_rad);
}

// =================================================================
// Position ↔ detection round trips
// =================================================================

TEST_CASE("Round trip on the ellipsoid")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);

    SUBCASE("default k near the equator")
    {
        const Geodetic sensor = Geodetic::from_degrees(0.0, 0.0, 100.0);
        const Geodetic target = Geodetic::from_degrees(0.1, 0.1, 1000.0);

        const Spherical detection = converter.to_spherical(sensor, target);
        CHECK(detection.range_m > 0.0);
        CHECK(detection.azimuth_deg() == doctest::Approx(45.0).epsilon(0.01));
        check_same_position(converter.to_geodetic(sensor, detection), target);
    }

    SUBCASE("custom k at mid latitude")
    {
        const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);
        const Geodetic target = Geodetic::from_degrees(10.5, 45.3, 500.0);

        const Spherical detection = converter.to_spherical(sensor, target, 1.2);
        check_same_position(converter.to_geodetic(sensor, detection, 1.2), target);
    }
}

TEST_CASE("Round-trip error grows with ground range")
{
    // The forward path uses the true chord, the inverse walks Reff·γ on the
    // surface; the along-track error is a few 1e-6 rad at 3 degrees.
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);

    const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);
    const Geodetic target = Geodetic::from_degrees(10.0, 48.0, 10000.0);

    const Spherical detection = converter.to_spherical(sensor, target);
    CHECK(detection.range_m > 300000.0);

    const Geodetic back = converter.to_geodetic(sensor, detection);
    const f64 lat_error = std::abs(back.lat_rad - target.lat_rad);
    CHECK(lat_error < 1e-5);
    CHECK(std::abs(back.lon_rad - target.lon_rad) < kAngleTol);
    CHECK(std::abs(back.alt_m - target.alt_m) < kAltTol);
}

TEST_CASE("Round trip on the sphere")
{
    const geo::SphericalEarth sphere;
    const RadarConverter converter(sphere);

    const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);
    const Geodetic target = Geodetic::from_degrees(10.5, 45.3, 500.0);

    check_same_position(converter.to_geodetic(sensor, converter.to_spherical(sensor, target)), target);
    check_same_position(converter.to_geodetic(sensor, converter.to_spherical(sensor, target, 1.2), 1.2), target);
}

TEST_CASE("Observation paths")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);

    const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);
    const Geodetic target = Geodetic::from_degrees(10.2, 44.9, 2500.0);

    const Observation obs = converter.to_observation(sensor, target);
    CHECK(obs.altitude_m == target.alt_m);

    const Spherical from_obs = converter.to_spherical(sensor, obs);
    const Spherical direct = converter.to_spherical(sensor, target);
    CHECK(from_obs.azimuth_rad == doctest::Approx(direct.azimuth_rad));
    CHECK(from_obs.elevation_rad == doctest::Approx(direct.elevation_rad));
    CHECK(from_obs.range_m == doctest::Approx(direct.range_m));

    check_same_position(converter.to_geodetic(sensor, obs), target);
    check_same_position(converter.to_geodetic(sensor, obs, 1.1), target);
}

TEST_CASE("Target straight above the sensor")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);

    const Geodetic sensor = Geodetic::from_degrees(0.0, 0.0, 100.0);
    const Geodetic target = Geodetic::from_degrees(0.0, 0.0, 10100.0);

    const Spherical detection = converter.to_spherical(sensor, target);
    CHECK(detection.range_m == doctest::Approx(10000.0));
    CHECK(std::abs(detection.elevation_rad - constants::kHalfPi) < 1e-4);
}

TEST_CASE("Upper-epsilon clamp keeps conversions consistent")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter full(earth);
    const RadarConverter clamped(earth, RadarConverterConfig{.central_angle_clamp = CentralAngleClamp::UpperEpsilon});

    const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);
    const Geodetic target = Geodetic::from_degrees(10.5, 45.3, 500.0);

    const Spherical detection = clamped.to_spherical(sensor, target);
    CHECK(detection.elevation_rad == doctest::Approx(full.to_spherical(sensor, target).elevation_rad));
    check_same_position(clamped.to_geodetic(sensor, detection), target);
}

// =================================================================
// Weather-aware conversions
// =================================================================

TEST_CASE("Weather at both ends selects k")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);
    const RadarSite site = makeCoastalSite();

    const Geodetic target = Geodetic::from_degrees(10.3, 45.2, 3000.0);
    const atmosphere::WeatherSample aloft = atmosphere::StandardAtmosphere{}.sample(target.alt_m);

    const f64 k = atmosphere::Refraction::k_factor(site.position.alt_m, site.weather, target.alt_m, aloft);
    const Spherical expected = converter.to_spherical(site.position, target, k);
    const Spherical actual = converter.to_spherical(site.position, site.weather, target, aloft);

    CHECK(actual.elevation_rad == doctest::Approx(expected.elevation_rad));
    CHECK(actual.range_m == doctest::Approx(expected.range_m));
}

TEST_CASE("Iterative k solve converges")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);
    const atmosphere::StandardAtmosphere standard;

    const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);
    const Geodetic target = Geodetic::from_degrees(10.2, 45.15, 3000.0);
    const f64 k_true = atmosphere::Refraction::k_factor_from_standard_atmosphere(50.0, 3000.0);

    const Spherical detection = converter.to_spherical(sensor, target, k_true);
    const RefractionSolution solved = converter.solve_geodetic(sensor, standard.sample(50.0), detection);

    CHECK(solved.converged);
    CHECK(solved.iterations > 1);
    CHECK(solved.iterations <= converter.config().max_k_iterations);
    CHECK(std::abs(solved.k_factor - k_true) < 1e-4);
    CHECK(std::abs(solved.position.alt_m - 3000.0) < 0.1);
    CHECK(std::abs(solved.position.lat_rad - target.lat_rad) < kAngleTol);

    const Geodetic shortcut = converter.to_geodetic(sensor, standard.sample(50.0), detection);
    CHECK(shortcut.alt_m == doctest::Approx(solved.position.alt_m));
}

TEST_CASE("Iteration cap reports the last position")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth, RadarConverterConfig{.max_k_iterations = 1});
    const RadarSite site = makeCoastalSite();

    const Spherical detection = Spherical::from_degrees(60.0, 2.0, 30000.0);
    const RefractionSolution solved = converter.solve_geodetic(site.position, site.weather, detection);

    CHECK_FALSE(solved.converged);
    CHECK(solved.iterations == 1);
    CHECK(solved.k_factor == doctest::Approx(constants::kStandardKFactor));

    const Geodetic fixed = converter.to_geodetic(site.position, detection, constants::kStandardKFactor);
    CHECK(solved.position.alt_m == doctest::Approx(fixed.alt_m));
}

// =================================================================
// Radio horizon
// =================================================================

TEST_CASE("Radio horizon")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);

    CHECK(converter.horizon_distance(0.0, 0.0) == 0.0);
    CHECK(converter.horizon_distance(-10.0, 0.0) == 0.0);

    const f64 reff = earth.effective_earth_radius(0.0);
    CHECK(converter.horizon_distance(100.0, 0.0) == doctest::Approx(std::sqrt(2.0 * reff * 100.0 + 100.0 * 100.0)));

    CHECK(converter.horizon_distance(100.0, 0.0) < converter.horizon_distance(1000.0, 0.0));
    CHECK(converter.horizon_distance(100.0, 0.0, 1.0) < converter.horizon_distance(100.0, 0.0, 4.0 / 3.0));
    CHECK(converter.horizon_distance(100.0, 0.0, 4.0 / 3.0) < converter.horizon_distance(100.0, 0.0, 2.0));
}

// =================================================================
// Batches
// =================================================================

TEST_CASE("Batch conversions keep input order")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);
    const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);

    const std::vector<Geodetic> targets = {
        Geodetic::from_degrees(10.3, 45.2, 3000.0),
        Geodetic::from_degrees(9.8, 44.9, 800.0),
        Geodetic::from_degrees(10.1, 45.4, 6000.0),
    };

    const std::vector<Spherical> detections = converter.to_sphericals(sensor, targets);
    REQUIRE(detections.size() == targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i)
    {
        CAPTURE(i);
        CHECK(detections[i].range_m == doctest::Approx(converter.to_spherical(sensor, targets[i]).range_m));
    }

    const std::vector<Geodetic> recovered = converter.to_geodetics(sensor, detections);
    REQUIRE(recovered.size() == targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i)
    {
        check_same_position(recovered[i], targets[i]);
    }

    const std::vector<Spherical> bent = converter.to_sphericals(sensor, targets, 1.1);
    const std::vector<Geodetic> bent_back = converter.to_geodetics(sensor, bent, 1.1);
    REQUIRE(bent_back.size() == targets.size());
    check_same_position(bent_back[2], targets[2]);

    const std::vector<Observation> observations = converter.to_observations(sensor, targets);
    REQUIRE(observations.size() == targets.size());
    CHECK(observations[1].altitude_m == 800.0);

    const std::vector<Geodetic> from_obs = converter.to_geodetics(sensor, observations);
    REQUIRE(from_obs.size() == targets.size());
    check_same_position(from_obs[0], targets[0]);
}

TEST_CASE("Target at the sensor does not spoil a batch")
{
    const geo::EllipsoidalEarth earth;
    const RadarConverter converter(earth);
    const Geodetic sensor = Geodetic::from_degrees(10.0, 45.0, 50.0);

    const std::vector<Geodetic> targets = {
        Geodetic::from_degrees(10.3, 45.2, 3000.0),
        sensor,
        Geodetic::from_degrees(9.8, 44.9, 800.0),
    };

    const std::vector<Spherical> detections = converter.to_sphericals(sensor, targets);
    REQUIRE(detections.size() == 3);
    CHECK(detections[1].range_m == 0.0);
    CHECK(detections[1].elevation_rad == doctest::Approx(constants::kHalfPi));
    CHECK(detections[0].range_m > 0.0);
    CHECK(detections[2].range_m > 0.0);

    const std::vector<Geodetic> recovered = converter.to_geodetics(sensor, detections);
    REQUIRE(recovered.size() == 3);
    for (std::size_t i = 0; i < targets.size(); ++i)
    {
        CAPTURE(i);
        check_same_position(recovered[i], targets[i]);
    }
}

TEST_CASE("Empty batches")
{
    const geo::SphericalEarth sphere;
    const RadarConverter converter(sphere);
    const Geodetic sensor;

    CHECK(converter.to_sphericals(sensor, std::vector<Geodetic>{}).empty());
    CHECK(converter.to_geodetics(sensor, std::vector<Spherical>{}).empty());
    CHECK(converter.to_observations(sensor, std::vector<Geodetic>{}).empty());
}

// =================================================================
// Configuration and sites
// =================================================================

TEST_CASE("Converter configuration is validated")
{
    const geo::EllipsoidalEarth earth;
    CHECK_THROWS_AS(RadarConverter(earth, RadarConverterConfig{.default_k_factor = 0.0}), std::invalid_argument);
    CHECK_THROWS_AS(RadarConverter(earth, RadarConverterConfig{.max_k_iterations = 0}), std::invalid_argument);
    CHECK_THROWS_AS(RadarConverter(earth, RadarConverterConfig{.k_tolerance = 0.0}), std::invalid_argument);
    CHECK_THROWS_AS(
        RadarConverter(earth, RadarConverterConfig{.atmosphere = {.relative_humidity_pct = -1.0}}),
        std::invalid_argument);

    const RadarConverter custom(earth, RadarConverterConfig{.default_k_factor = 1.0});
    CHECK(custom.config().default_k_factor == 1.0);
    CHECK(&custom.model() == &earth);
    CHECK(custom.atmosphere().params().relative_humidity_pct == 60.0);
}

// The converter keeps a reference to its Earth model, so temporaries are refused
static_assert(std::is_constructible_v<RadarConverter, const geo::EllipsoidalEarth&>);
static_assert(!std::is_constructible_v<RadarConverter, geo::EllipsoidalEarth&&>);
static_assert(!std::is_constructible_v<RadarConverter, geo::SphericalEarth, const RadarConverterConfig&>);

TEST_CASE("Logger survives explicit initialization")
{
    auto& core_logger = core::Logger::get_core_logger();
    REQUIRE(core_logger != nullptr);
    CHECK(core_logger->name() == "GEORADAR");
    CHECK(core::Logger::get_core_logger().get() == core_logger.get());
    CHECK(core::Logger::get_app_logger()->name() == "APP");
}

TEST_CASE("Preset radar sites")
{
    const RadarSite coastal = makeCoastalSite();
    CHECK(coastal.position.lat_deg() == doctest::Approx(45.0));
    CHECK(coastal.weather.relative_humidity_pct == 85.0);

    const RadarSite mountain = makeMountainSite();
    CHECK(mountain.position.alt_m == 2200.0);
    CHECK(mountain.weather.temperature_K < 273.15);

    const RadarSite standard = makeStandardSite("Test", Geodetic::from_degrees(0.0, 0.0, 1000.0));
    CHECK(standard.name == "Test");
    CHECK(standard.weather.pressure_Pa
          == doctest::Approx(atmosphere::StandardAtmosphere::pressure_Pa(1000.0)));
}
