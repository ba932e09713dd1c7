#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstddef>
#include <cstdint>

namespace georadar
{
    // Precision aliases
    using f64 = double;
    using i32 = int32_t;
    using u32 = uint32_t;
    using usize = std::size_t;

    // Vector types (double precision for geodesy)
    using Vec3d = glm::dvec3;
    using Mat3d = glm::dmat3;

    // Angular constants
    namespace constants
    {
        constexpr f64 kPi       = glm::pi<f64>();
        constexpr f64 kTwoPi    = 2.0 * kPi;
        constexpr f64 kHalfPi   = kPi / 2.0;
        constexpr f64 kDegToRad = kPi / 180.0;
        constexpr f64 kRadToDeg = 180.0 / kPi;

        /// Components or magnitudes below this are treated as zero by vector algebra.
        constexpr f64 kVectorEpsilon = 1e-10;

        /// Standard effective-Earth-radius factor for radio propagation.
        constexpr f64 kStandardKFactor = 4.0 / 3.0;
    }

    // WGS84 reference ellipsoid
    namespace wgs84
    {
        constexpr f64 kSemiMajorAxis = 6378137.0;                        ///< a [m]
        constexpr f64 kFlattening    = 1.0 / 298.257223563;              ///< f
        constexpr f64 kSemiMinorAxis = kSemiMajorAxis * (1.0 - kFlattening); ///< b [m]
        constexpr f64 kEccentricitySq =
            (kSemiMajorAxis * kSemiMajorAxis - kSemiMinorAxis * kSemiMinorAxis)
            / (kSemiMajorAxis * kSemiMajorAxis);                         ///< e²
        constexpr f64 kMeanRadius    = 6371008.8;                        ///< IUGG mean radius [m]
    }
}
