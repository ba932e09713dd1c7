/// @file refraction.cpp
/// @brief Refractivity, modified refractivity and k-factor computations.

#include "atmosphere/refraction.hpp"

#include "core/logger.hpp"
#include "core/units.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace georadar::atmosphere
{

void Refraction::validate_humidity(f64 relative_humidity_pct)
{
    // Negated form also rejects NaN
    if (!(relative_humidity_pct >= 0.0 && relative_humidity_pct <= 100.0))
    {
        throw std::invalid_argument("relative humidity must be within [0, 100] %, got "
                                    + std::to_string(relative_humidity_pct));
    }
}

// -----------------------------------------------------------------
// Water vapour
// -----------------------------------------------------------------

f64 Refraction::saturation_vapor_pressure_Pa(f64 temperature_K)
{
    constexpr f64 kA = 6.112;   // hPa
    constexpr f64 kB = 17.67;
    constexpr f64 kC = 243.5;   // °C

    const f64 tc = units::kelvin_to_celsius(temperature_K);
    return units::hpa_to_pa(kA * std::exp(kB * tc / (tc + kC)));
}

f64 Refraction::vapor_pressure_Pa(f64 temperature_K, f64 relative_humidity_pct)
{
    validate_humidity(relative_humidity_pct);
    return saturation_vapor_pressure_Pa(temperature_K) * relative_humidity_pct / 100.0;
}

// -----------------------------------------------------------------
// Refractivity
//
//   N = 77.6 P/T + 3.732e5 e/T²      (dry term + wet term)
// -----------------------------------------------------------------

f64 Refraction::refractivity(f64 pressure_Pa, f64 temperature_K, f64 relative_humidity_pct)
{
    const f64 e_hpa = units::pa_to_hpa(vapor_pressure_Pa(temperature_K, relative_humidity_pct));
    const f64 p_hpa = units::pa_to_hpa(pressure_Pa);

    const f64 dry = 77.6 * p_hpa / temperature_K;
    const f64 wet = 3.732e5 * e_hpa / (temperature_K * temperature_K);
    return dry + wet;
}

f64 Refraction::refractivity(const WeatherSample& weather)
{
    return refractivity(weather.pressure_Pa, weather.temperature_K, weather.relative_humidity_pct);
}

f64 Refraction::refractive_index(f64 refractivity_n)
{
    return 1.0 + refractivity_n * 1e-6;
}

f64 Refraction::modified_refractivity(f64 refractivity_n, f64 alt_m)
{
    return refractivity_n + (alt_m / refraction_constants::kEarthRadius_m) * 1e6;
}

f64 Refraction::average_modified_refractivity(f64 site_n, f64 site_alt_m, f64 target_n, f64 target_alt_m)
{
    return (modified_refractivity(site_n, site_alt_m) + modified_refractivity(target_n, target_alt_m)) / 2.0;
}

f64 Refraction::average_modified_refractivity(
    f64 site_alt_m, f64 target_alt_m, const StandardAtmosphere& atmosphere)
{
    return average_modified_refractivity(site_alt_m, atmosphere.sample(site_alt_m), target_alt_m, atmosphere);
}

f64 Refraction::average_modified_refractivity(
    f64 site_alt_m, const WeatherSample& site_weather, f64 target_alt_m, const StandardAtmosphere& atmosphere)
{
    return average_modified_refractivity(refractivity(site_weather), site_alt_m,
                                         refractivity(atmosphere.sample(target_alt_m)), target_alt_m);
}

// -----------------------------------------------------------------
// Effective Earth-radius factor
//
//   dM/dh = (M2 − M1) / (h2 − h1)
//   k     = (1e6 / Re) / (dM/dh)
//
// Standard atmosphere gives dM/dh ≈ 0.118 M-units/m, hence k ≈ 4/3.
// -----------------------------------------------------------------

f64 Refraction::k_factor_from_refractivity(f64 n1, f64 h1_m, f64 n2, f64 h2_m)
{
    using namespace refraction_constants;

    const f64 dh = h2_m - h1_m;
    f64 gradient = kStandardGradient;
    if (std::abs(dh) >= kMinAltitudeSeparation_m)
    {
        gradient = (modified_refractivity(n2, h2_m) - modified_refractivity(n1, h1_m)) / dh;
    }

    if (std::abs(gradient) < kMinGradient)
    {
        GRD_CORE_WARN("Modified refractivity gradient {:.3e} M/m between {:.1f} m and {:.1f} m; "
                      "reporting ducting k = {}", gradient, h1_m, h2_m, kDuctingKFactor);
        return kDuctingKFactor;
    }

    return (1e6 / kEarthRadius_m) / gradient;
}

f64 Refraction::k_factor(f64 h1_m, const WeatherSample& w1, f64 h2_m, const WeatherSample& w2)
{
    return k_factor_from_refractivity(refractivity(w1), h1_m, refractivity(w2), h2_m);
}

f64 Refraction::k_factor(f64 h1_m, const WeatherSample& w1, f64 h2_m, const StandardAtmosphere& atmosphere)
{
    return k_factor(h1_m, w1, h2_m, atmosphere.sample(h2_m));
}

f64 Refraction::k_factor_from_standard_atmosphere(f64 h1_m, f64 h2_m, const StandardAtmosphere& atmosphere)
{
    return k_factor(h1_m, atmosphere.sample(h1_m), h2_m, atmosphere.sample(h2_m));
}

} // namespace georadar::atmosphere
