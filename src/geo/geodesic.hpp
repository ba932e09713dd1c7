#pragma once

/// @file geodesic.hpp
/// @brief Geodesic direct and inverse problems on the WGS84 ellipsoid and on a sphere.

#include "core/types.hpp"
#include "geo/points.hpp"

#include <optional>

namespace georadar::geo
{
    /// @brief Iteration policy shared by both Vincenty solvers.
    struct VincentyPolicy
    {
        f64 tolerance{1e-12};   ///< Convergence threshold on λ (inverse) or σ (direct), radians
        i32 max_iterations{100};
    };

    /// @brief Result of the inverse problem.
    struct InverseSolution
    {
        f64 distance_m{0.0};        ///< Ellipsoidal surface distance
        f64 initial_bearing_rad{0.0}; ///< Forward azimuth at the first point, [0, 2π)
        i32 iterations{0};
    };

    /// @brief Static utility class for geodesic computations.
    ///
    /// Vincenty solvers return std::nullopt when the iteration cap is reached;
    /// choosing a fallback is left to the caller. Latitude/longitude of the
    /// inputs are used; altitude is ignored throughout.
    class Geodesic
    {
    public:
        Geodesic() = delete;

        /// @brief Vincenty's inverse formula (distance and initial bearing).
        ///
        /// Coincident points return distance 0 and bearing 0 immediately.
        /// Nearly antipodal points may fail to converge.
        [[nodiscard]] static std::optional<InverseSolution> vincenty_inverse(
            const LatLon& p1, const LatLon& p2, const VincentyPolicy& policy = {});

        /// @brief Vincenty's direct formula (destination from start, bearing, distance).
        [[nodiscard]] static std::optional<LatLon> vincenty_direct(
            const LatLon& start, f64 bearing_rad, f64 distance_m, const VincentyPolicy& policy = {});

        /// @brief Great-circle distance by the Haversine formula.
        [[nodiscard]] static f64 haversine_distance(const LatLon& p1, const LatLon& p2, f64 radius_m);

        /// @brief Initial great-circle bearing from p1 to p2, [0, 2π).
        [[nodiscard]] static f64 spherical_initial_bearing(const LatLon& p1, const LatLon& p2);

        /// @brief Closed-form direct problem on a sphere of the given radius.
        [[nodiscard]] static LatLon spherical_destination(
            const LatLon& start, f64 bearing_rad, f64 distance_m, f64 radius_m);
    };

} // namespace georadar::geo
