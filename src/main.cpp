// src/main.cpp - GeoRadar demo entry point
//
// Walks through a short radar session:
//  1. Set up the Earth model and a radar site
//  2. Inspect the site's refraction conditions
//  3. Convert a handful of aircraft positions to radar detections
//  4. Recover positions from the detections (fixed k and weather-aware)
//  5. Compare radio horizons

#include "atmosphere/refraction.hpp"
#include "atmosphere/standard_atmosphere.hpp"
#include "core/logger.hpp"
#include "core/units.hpp"
#include "geo/earth_model.hpp"
#include "geo/geodetic_ops.hpp"
#include "radar/radar_converter.hpp"
#include "radar/radar_site.hpp"

#include <exception>
#include <iomanip>
#include <iostream>
#include <vector>

using namespace georadar;

int main() {
    core::Logger::init("georadar_demo.log");

    try {
        std::cout << "================================================================\n"
                  << "  GEORADAR v0.1 - Radar Geodesy and Refraction Demo\n"
                  << "================================================================\n\n";

        // -----------------------------------------------------------------------
        // 1. Earth model and site
        // -----------------------------------------------------------------------
        const geo::EllipsoidalEarth earth;
        const radar::RadarSite site = radar::makeCoastalSite();
        const radar::RadarConverter converter(earth);

        GRD_INFO("Earth model: {}", earth.name());
        std::cout << "Radar site: " << site.name << "\n"
                  << "  Position: " << site.position << "\n"
                  << std::fixed << std::setprecision(2)
                  << "  Weather:  " << units::pa_to_hpa(site.weather.pressure_Pa) << " hPa, "
                  << units::kelvin_to_celsius(site.weather.temperature_K) << " C, "
                  << site.weather.relative_humidity_pct << " % RH\n\n";

        // -----------------------------------------------------------------------
        // 2. Refraction at the site
        // -----------------------------------------------------------------------
        const f64 n_site = atmosphere::Refraction::refractivity(site.weather);
        const f64 k_site = atmosphere::Refraction::k_factor(site.position.alt_m, site.weather, 3000.0);
        const f64 k_std  = atmosphere::Refraction::k_factor_from_standard_atmosphere(0.0, 1000.0);

        std::cout << "Refraction:\n"
                  << "  Surface refractivity N: " << n_site << " N-units\n"
                  << std::setprecision(4)
                  << "  k (site weather -> 3 km standard): " << k_site << "\n"
                  << "  k (standard atmosphere 0 -> 1 km): " << k_std << "\n\n";

        // -----------------------------------------------------------------------
        // 3. Aircraft positions -> detections
        // -----------------------------------------------------------------------
        const std::vector<geo::Geodetic> aircraft = {
            geo::Geodetic::from_degrees(10.30, 45.20, 3000.0),
            geo::Geodetic::from_degrees(10.50, 45.30, 500.0),
            geo::Geodetic::from_degrees(9.60, 44.80, 9000.0),
            geo::Geodetic::from_degrees(10.05, 45.60, 1200.0),
        };

        const std::vector<geo::Spherical> detections = converter.to_sphericals(site.position, aircraft);

        std::cout << "Detections (k = 4/3):\n";
        for (std::size_t i = 0; i < aircraft.size(); ++i) {
            const geo::Spherical& d = detections[i];
            std::cout << "  #" << i << std::setprecision(3)
                      << "  az " << std::setw(8) << d.azimuth_deg() << " deg"
                      << "  el " << std::setw(7) << d.elevation_deg() << " deg"
                      << "  r " << std::setw(9) << std::setprecision(1) << d.range_m
                      << " m\n";
        }
        std::cout << "\n";

        // -----------------------------------------------------------------------
        // 4. Detections -> positions
        // -----------------------------------------------------------------------
        std::cout << "Recovered positions:\n";
        for (std::size_t i = 0; i < detections.size(); ++i) {
            const geo::Geodetic fixed_k = converter.to_geodetic(site.position, detections[i]);
            const radar::RefractionSolution solved =
                converter.solve_geodetic(site.position, site.weather, detections[i]);
            const f64 error_m = geo::slant_range(fixed_k, aircraft[i], earth);

            std::cout << "  #" << i << "  " << fixed_k
                      << std::setprecision(3) << "  (error " << error_m << " m)\n"
                      << "      weather-aware: " << solved.position
                      << std::setprecision(4) << "  k = " << solved.k_factor
                      << " after " << solved.iterations << " iteration(s)"
                      << (solved.converged ? "" : " [not converged]") << "\n";
        }
        std::cout << "\n";

        // -----------------------------------------------------------------------
        // 5. Radio horizon
        // -----------------------------------------------------------------------
        std::cout << "Radio horizon from " << std::setprecision(0) << site.position.alt_m << " m:\n";
        for (const f64 k : {1.0, constants::kStandardKFactor, k_site}) {
            const f64 d = converter.horizon_distance(site.position.alt_m, site.position.lat_rad, k);
            std::cout << std::setprecision(4) << "  k = " << k
                      << std::setprecision(2) << "  ->  " << units::m_to_km(d) << " km\n";
        }

        GRD_INFO("Demo complete: {} targets processed", aircraft.size());
    } catch (const std::exception& e) {
        GRD_CRITICAL("Demo failed: {}", e.what());
        core::Logger::shutdown();
        return 1;
    }

    core::Logger::shutdown();
    return 0;
}
