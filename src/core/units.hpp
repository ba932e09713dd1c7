#pragma once
// core/units.hpp - Base-unit conversions
//
// Every scalar in GeoRadar is stored in one base unit per dimension:
// radians, meters, pascals, kelvin, percent. These helpers convert
// display units into base units and back.

#include "core/types.hpp"

namespace georadar::units {

constexpr f64 kPascalPerHectopascal = 100.0;
constexpr f64 kKelvinOffset         = 273.15;
constexpr f64 kMetersPerKilometer   = 1000.0;

constexpr f64 deg_to_rad(f64 deg) { return deg * constants::kDegToRad; }
constexpr f64 rad_to_deg(f64 rad) { return rad * constants::kRadToDeg; }

constexpr f64 hpa_to_pa(f64 hpa) { return hpa * kPascalPerHectopascal; }
constexpr f64 pa_to_hpa(f64 pa)  { return pa / kPascalPerHectopascal; }

constexpr f64 celsius_to_kelvin(f64 c) { return c + kKelvinOffset; }
constexpr f64 kelvin_to_celsius(f64 k) { return k - kKelvinOffset; }

constexpr f64 km_to_m(f64 km) { return km * kMetersPerKilometer; }
constexpr f64 m_to_km(f64 m)  { return m / kMetersPerKilometer; }

} // namespace georadar::units
