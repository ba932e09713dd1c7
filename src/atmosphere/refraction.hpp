#pragma once

/// @file refraction.hpp
/// @brief Radio refractivity and the effective Earth-radius factor (k).

#include "atmosphere/standard_atmosphere.hpp"
#include "core/types.hpp"

namespace georadar::atmosphere
{
    namespace refraction_constants
    {
        /// True Earth radius used to fold curvature into modified refractivity.
        constexpr f64 kEarthRadius_m = wgs84::kMeanRadius;

        /// Textbook standard gradient of modified refractivity (M-units/m),
        /// used when the two altitudes coincide.
        constexpr f64 kStandardGradient = 0.118;

        /// k reported when dM/dh vanishes (trapping / ducting conditions).
        constexpr f64 kDuctingKFactor = 1000.0;

        constexpr f64 kMinAltitudeSeparation_m = 1e-6;
        constexpr f64 kMinGradient = 1e-9;
    }

    /// @brief Static utility class for tropospheric radio refraction (ITU-R P.453 form).
    ///
    /// Pressures are pascals, temperatures kelvin, humidity percent. Every
    /// function taking a humidity throws std::invalid_argument outside [0, 100].
    class Refraction
    {
    public:
        Refraction() = delete;

        /// @brief Saturation vapour pressure over water (Tetens).
        ///
        /// es = 6.112 exp(17.67 Tc / (Tc + 243.5)) hPa, Tc in °C. Returned in Pa.
        [[nodiscard]] static f64 saturation_vapor_pressure_Pa(f64 temperature_K);

        /// @brief Partial water vapour pressure e = es · RH / 100 (Pa).
        [[nodiscard]] static f64 vapor_pressure_Pa(f64 temperature_K, f64 relative_humidity_pct);

        /// @brief Refractivity N = 77.6 P/T + 3.732e5 e/T² (P, e in hPa).
        [[nodiscard]] static f64 refractivity(f64 pressure_Pa, f64 temperature_K, f64 relative_humidity_pct);

        [[nodiscard]] static f64 refractivity(const WeatherSample& weather);

        /// @brief n = 1 + N · 1e-6
        [[nodiscard]] static f64 refractive_index(f64 refractivity_n);

        /// @brief M = N + h / Re · 1e6
        [[nodiscard]] static f64 modified_refractivity(f64 refractivity_n, f64 alt_m);

        /// @brief Mean of M at the two endpoints.
        [[nodiscard]] static f64 average_modified_refractivity(
            f64 site_n, f64 site_alt_m, f64 target_n, f64 target_alt_m);

        /// @brief Mean of M with both endpoints taken from the standard atmosphere.
        [[nodiscard]] static f64 average_modified_refractivity(
            f64 site_alt_m, f64 target_alt_m, const StandardAtmosphere& atmosphere = StandardAtmosphere{});

        /// @brief Mean of M from measured site weather and a standard-atmosphere target.
        [[nodiscard]] static f64 average_modified_refractivity(
            f64 site_alt_m, const WeatherSample& site_weather, f64 target_alt_m,
            const StandardAtmosphere& atmosphere = StandardAtmosphere{});

        /// @brief k from two refractivity samples.
        ///
        /// dM/dh = (M2 − M1) / (h2 − h1), or the standard gradient when the
        /// altitudes coincide; k = (1e6 / Re) / (dM/dh), or kDuctingKFactor
        /// when the gradient vanishes.
        [[nodiscard]] static f64 k_factor_from_refractivity(f64 n1, f64 h1_m, f64 n2, f64 h2_m);

        /// @brief k from measured weather at both endpoints.
        [[nodiscard]] static f64 k_factor(f64 h1_m, const WeatherSample& w1, f64 h2_m, const WeatherSample& w2);

        /// @brief k from measured weather at the first endpoint, standard atmosphere at the second.
        [[nodiscard]] static f64 k_factor(f64 h1_m, const WeatherSample& w1, f64 h2_m,
                                          const StandardAtmosphere& atmosphere = StandardAtmosphere{});

        /// @brief k with both endpoints from the standard atmosphere.
        [[nodiscard]] static f64 k_factor_from_standard_atmosphere(
            f64 h1_m, f64 h2_m, const StandardAtmosphere& atmosphere = StandardAtmosphere{});

    private:
        static void validate_humidity(f64 relative_humidity_pct);
    };

} // namespace georadar::atmosphere
