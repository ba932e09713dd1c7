#pragma once

/// @file cartesian.hpp
/// @brief Cartesian vector algebra shared by Cartesian, Geocentric and EnuVector.
///
/// The three types carry the same algebra but different meaning: a bare
/// offset, a position in the Earth-Centered Earth-Fixed frame, and a
/// displacement in a local East-North-Up frame. Every operation returns the
/// concrete type of its left operand. Components are meters.

#include "core/math/wrap.hpp"
#include "core/types.hpp"
#include "geo/points.hpp"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <ostream>

namespace georadar::geo
{
    template <typename Derived>
    class CartesianBase
    {
    public:
        CartesianBase() = default;
        CartesianBase(f64 x, f64 y, f64 z) : m_v(x, y, z) {}
        explicit CartesianBase(const Vec3d& v) : m_v(v) {}

        [[nodiscard]] f64 x() const { return m_v.x; }
        [[nodiscard]] f64 y() const { return m_v.y; }
        [[nodiscard]] f64 z() const { return m_v.z; }
        [[nodiscard]] const Vec3d& vec() const { return m_v; }

        // -----------------------------------------------------------------
        // Arithmetic (accepts any Cartesian flavour as the right operand)
        // -----------------------------------------------------------------

        template <typename Other>
        [[nodiscard]] Derived add(const CartesianBase<Other>& o) const { return Derived(m_v + o.vec()); }

        template <typename Other>
        [[nodiscard]] Derived subtract(const CartesianBase<Other>& o) const { return Derived(m_v - o.vec()); }

        /// @brief other - this
        template <typename Other>
        [[nodiscard]] Derived rsubtract(const CartesianBase<Other>& o) const { return Derived(o.vec() - m_v); }

        /// @brief this + other * scalar
        template <typename Other>
        [[nodiscard]] Derived transform(const CartesianBase<Other>& o, f64 scalar) const
        {
            return Derived(m_v + o.vec() * scalar);
        }

        [[nodiscard]] Derived negate() const { return Derived(-m_v); }
        [[nodiscard]] Derived scale(f64 factor) const { return Derived(m_v * factor); }

        template <typename Other>
        [[nodiscard]] f64 dot(const CartesianBase<Other>& o) const { return glm::dot(m_v, o.vec()); }

        template <typename Other>
        [[nodiscard]] Derived cross(const CartesianBase<Other>& o) const { return Derived(glm::cross(m_v, o.vec())); }

        [[nodiscard]] f64 magnitude() const { return glm::length(m_v); }

        /// @brief Straight-line distance between the two points.
        template <typename Other>
        [[nodiscard]] f64 distance_to(const CartesianBase<Other>& o) const { return glm::distance(m_v, o.vec()); }

        /// @brief Distance projected on the XY plane.
        template <typename Other>
        [[nodiscard]] f64 horizontal_distance_to(const CartesianBase<Other>& o) const
        {
            const f64 dx = m_v.x - o.x();
            const f64 dy = m_v.y - o.y();
            return std::sqrt(dx * dx + dy * dy);
        }

        // -----------------------------------------------------------------
        // Operations undefined near zero: std::nullopt below kVectorEpsilon
        // -----------------------------------------------------------------

        [[nodiscard]] std::optional<Derived> normalized() const
        {
            const f64 mag = magnitude();
            if (mag < constants::kVectorEpsilon)
            {
                return std::nullopt;
            }
            return Derived(m_v / mag);
        }

        /// @brief Component-wise reciprocal.
        [[nodiscard]] std::optional<Derived> inverted() const
        {
            if (is_any_zero(constants::kVectorEpsilon))
            {
                return std::nullopt;
            }
            return Derived(1.0 / m_v);
        }

        /// @brief Component-wise division by another vector.
        template <typename Other>
        [[nodiscard]] std::optional<Derived> ratio(const CartesianBase<Other>& o) const
        {
            if (o.is_any_zero(constants::kVectorEpsilon))
            {
                return std::nullopt;
            }
            return Derived(m_v / o.vec());
        }

        [[nodiscard]] std::optional<Derived> divided(f64 divisor) const
        {
            if (std::abs(divisor) < constants::kVectorEpsilon)
            {
                return std::nullopt;
            }
            return Derived(m_v / divisor);
        }

        /// @brief Angle between the two vectors (radians, 0..π).
        template <typename Other>
        [[nodiscard]] std::optional<f64> angle_to(const CartesianBase<Other>& o) const
        {
            const f64 mags = magnitude() * o.magnitude();
            if (mags < constants::kVectorEpsilon)
            {
                return std::nullopt;
            }
            return std::acos(std::clamp(dot(o) / mags, -1.0, 1.0));
        }

        // -----------------------------------------------------------------
        // Comparison and validity
        // -----------------------------------------------------------------

        /// @brief Apply a range policy to each component independently.
        template <typename Lo, typename Hi>
        [[nodiscard]] Derived clamp(const CartesianBase<Lo>& min, const CartesianBase<Hi>& max,
                                    WrapMode mode) const
        {
            return Derived(wrap(m_v.x, min.x(), max.x(), mode),
                           wrap(m_v.y, min.y(), max.y(), mode),
                           wrap(m_v.z, min.z(), max.z(), mode));
        }

        template <typename Other>
        [[nodiscard]] bool equals(const CartesianBase<Other>& o, f64 epsilon) const
        {
            return std::abs(m_v.x - o.x()) <= epsilon
                && std::abs(m_v.y - o.y()) <= epsilon
                && std::abs(m_v.z - o.z()) <= epsilon;
        }

        [[nodiscard]] bool is_zero(f64 epsilon) const
        {
            return std::abs(m_v.x) <= epsilon && std::abs(m_v.y) <= epsilon && std::abs(m_v.z) <= epsilon;
        }

        [[nodiscard]] bool is_any_zero(f64 epsilon) const
        {
            return std::abs(m_v.x) <= epsilon || std::abs(m_v.y) <= epsilon || std::abs(m_v.z) <= epsilon;
        }

        [[nodiscard]] bool is_valid() const
        {
            return isFinite(m_v.x) && isFinite(m_v.y) && isFinite(m_v.z);
        }

        // -----------------------------------------------------------------
        // Spherical view
        // -----------------------------------------------------------------

        /// @brief Mathematical spherical form: azimuth = atan2(y, x), elevation = asin(z / r).
        /// A zero vector maps to the zero Spherical.
        [[nodiscard]] Spherical to_spherical() const
        {
            const f64 range = magnitude();
            if (range < constants::kVectorEpsilon)
            {
                return Spherical{};
            }
            return Spherical::from_radians(std::atan2(m_v.y, m_v.x),
                                           std::asin(std::clamp(m_v.z / range, -1.0, 1.0)),
                                           range);
        }

        friend std::ostream& operator<<(std::ostream& os, const Derived& v)
        {
            return os << "(" << v.x() << ", " << v.y() << ", " << v.z() << ")";
        }

    protected:
        Vec3d m_v{0.0};
    };

    /// @brief Generic offset vector with no inherent frame.
    class Cartesian : public CartesianBase<Cartesian>
    {
    public:
        using CartesianBase::CartesianBase;
    };

    /// @brief Position in the Earth-Centered Earth-Fixed frame (origin at the Earth's center).
    class Geocentric : public CartesianBase<Geocentric>
    {
    public:
        using CartesianBase::CartesianBase;

        template <typename Other>
        [[nodiscard]] static Geocentric from(const CartesianBase<Other>& v) { return Geocentric(v.vec()); }

        [[nodiscard]] Cartesian to_cartesian() const { return Cartesian(m_v); }
    };

    /// @brief Displacement in a local East-North-Up frame: x = east, y = north, z = up.
    class EnuVector : public CartesianBase<EnuVector>
    {
    public:
        using CartesianBase::CartesianBase;

        [[nodiscard]] f64 east() const { return m_v.x; }
        [[nodiscard]] f64 north() const { return m_v.y; }
        [[nodiscard]] f64 up() const { return m_v.z; }

        [[nodiscard]] Cartesian to_cartesian() const { return Cartesian(m_v); }
    };

    /// @brief Inverse of CartesianBase::to_spherical, using an explicit range.
    [[nodiscard]] inline Cartesian spherical_to_cartesian(const Spherical& s, f64 range_m)
    {
        const f64 cos_el = std::cos(s.elevation_rad);
        return Cartesian(range_m * cos_el * std::cos(s.azimuth_rad),
                         range_m * cos_el * std::sin(s.azimuth_rad),
                         range_m * std::sin(s.elevation_rad));
    }

    [[nodiscard]] inline Cartesian spherical_to_cartesian(const Spherical& s)
    {
        return spherical_to_cartesian(s, s.range_m);
    }

} // namespace georadar::geo
