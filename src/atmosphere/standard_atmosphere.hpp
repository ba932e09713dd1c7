#pragma once
// atmosphere/standard_atmosphere.hpp - Two-layer International Standard Atmosphere
//
// Models:
//  - Troposphere (h <= 11 km): linear temperature lapse, barometric pressure
//  - Lower stratosphere (h > 11 km): isothermal layer, exponential pressure decay
//  - Constant relative humidity (configurable, 60 % by default)

#include "core/types.hpp"

#include <cmath>
#include <stdexcept>

namespace georadar::atmosphere {

namespace isa {

constexpr f64 kSeaLevelTemperature_K = 288.15;
constexpr f64 kSeaLevelPressure_Pa   = 101325.0;
constexpr f64 kGravity               = 9.80665;   ///< m/s²
constexpr f64 kGasConstantDryAir     = 287.058;   ///< J/(kg·K)
constexpr f64 kLapseRate             = -0.0065;   ///< K/m, troposphere
constexpr f64 kTropopauseAltitude_m  = 11000.0;
constexpr f64 kTropopauseTemperature_K =
    kSeaLevelTemperature_K + kLapseRate * kTropopauseAltitude_m;  // 216.65 K

constexpr f64 kStandardRelativeHumidity_pct = 60.0;

} // namespace isa

// -----------------------------------------------------------------------
// WeatherSample - pressure, temperature and humidity at one altitude
// -----------------------------------------------------------------------
struct WeatherSample {
    f64 pressure_Pa{isa::kSeaLevelPressure_Pa};
    f64 temperature_K{isa::kSeaLevelTemperature_K};
    f64 relative_humidity_pct{isa::kStandardRelativeHumidity_pct};  ///< [0..100]
};

struct StandardAtmosphereParams {
    /// Humidity reported at every altitude. The profile has no moisture lapse.
    f64 relative_humidity_pct{isa::kStandardRelativeHumidity_pct};
};

// -----------------------------------------------------------------------
// StandardAtmosphere - substitutes for measured weather at any altitude
// -----------------------------------------------------------------------
class StandardAtmosphere {
public:
    /// Throws std::invalid_argument if the humidity is outside [0, 100].
    explicit StandardAtmosphere(const StandardAtmosphereParams& params = {})
        : m_params(params) {
        if (!(params.relative_humidity_pct >= 0.0 && params.relative_humidity_pct <= 100.0)) {
            throw std::invalid_argument("StandardAtmosphere: relative humidity must be within [0, 100] %");
        }
    }

    const StandardAtmosphereParams& params() const { return m_params; }

    /// Temperature [K]: 288.15 - 0.0065 h below the tropopause, 216.65 above.
    static f64 temperature_K(f64 alt_m) {
        if (alt_m <= isa::kTropopauseAltitude_m) {
            return isa::kSeaLevelTemperature_K + isa::kLapseRate * alt_m;
        }
        return isa::kTropopauseTemperature_K;
    }

    /// Pressure [Pa].
    ///   h <= 11 km : P0 (T/T0)^(-g / (L R))
    ///   h >  11 km : P11 exp(-g (h - 11000) / (R T11))
    static f64 pressure_Pa(f64 alt_m) {
        constexpr f64 kExponent = -isa::kGravity / (isa::kLapseRate * isa::kGasConstantDryAir);
        if (alt_m <= isa::kTropopauseAltitude_m) {
            const f64 ratio = temperature_K(alt_m) / isa::kSeaLevelTemperature_K;
            return isa::kSeaLevelPressure_Pa * std::pow(ratio, kExponent);
        }
        const f64 p_tropopause = isa::kSeaLevelPressure_Pa
            * std::pow(isa::kTropopauseTemperature_K / isa::kSeaLevelTemperature_K, kExponent);
        return p_tropopause * std::exp(-isa::kGravity * (alt_m - isa::kTropopauseAltitude_m)
                                       / (isa::kGasConstantDryAir * isa::kTropopauseTemperature_K));
    }

    f64 relative_humidity_pct(f64 /*alt_m*/) const {
        return m_params.relative_humidity_pct;
    }

    WeatherSample sample(f64 alt_m) const {
        return WeatherSample{
            .pressure_Pa           = pressure_Pa(alt_m),
            .temperature_K         = temperature_K(alt_m),
            .relative_humidity_pct = relative_humidity_pct(alt_m),
        };
    }

private:
    StandardAtmosphereParams m_params;
};

} // namespace georadar::atmosphere
