#pragma once
// radar/radar_site.hpp - Radar site description and preset sites
//
// A site bundles the antenna position with the surface weather measured
// there, which is all the weather-aware conversions need from the sensor.

#include "atmosphere/standard_atmosphere.hpp"
#include "core/units.hpp"
#include "geo/points.hpp"

#include <string>

namespace georadar::radar {

// -----------------------------------------------------------------------
// RadarSite
// -----------------------------------------------------------------------
struct RadarSite {
    std::string              name{"Default Radar"};
    geo::Geodetic            position;   ///< Antenna position (altitude = antenna height above the ellipsoid)
    atmosphere::WeatherSample weather;   ///< Surface weather at the antenna
};

// -----------------------------------------------------------------------
// Preset sites
// -----------------------------------------------------------------------

/// Weather of the standard atmosphere at the site's altitude.
inline RadarSite makeStandardSite(const std::string& name, const geo::Geodetic& position) {
    RadarSite site;
    site.name = name;
    site.position = position;
    site.weather = atmosphere::StandardAtmosphere{}.sample(position.alt_m);
    return site;
}

/// Low coastal site on a warm, humid day (strong wet-term refractivity).
inline RadarSite makeCoastalSite() {
    RadarSite site;
    site.name = "Coastal Surveillance Radar";
    site.position = geo::Geodetic::from_degrees(10.0, 45.0, 50.0);  // lon, lat, alt
    site.weather.pressure_Pa = units::hpa_to_pa(1015.0);
    site.weather.temperature_K = units::celsius_to_kelvin(24.0);
    site.weather.relative_humidity_pct = 85.0;
    return site;
}

/// High mountain site in cold, dry air.
inline RadarSite makeMountainSite() {
    RadarSite site;
    site.name = "Mountain Approach Radar";
    site.position = geo::Geodetic::from_degrees(7.98, 46.55, 2200.0);
    site.weather.pressure_Pa = units::hpa_to_pa(780.0);
    site.weather.temperature_K = units::celsius_to_kelvin(-2.0);
    site.weather.relative_humidity_pct = 30.0;
    return site;
}

} // namespace georadar::radar
