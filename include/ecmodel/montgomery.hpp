// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "twisted_edwards_extended.hpp"
#include <optional>
#include <ostream>

namespace ecmodel
{
namespace mont
{
/// The affine point on a Montgomery curve, with an explicit point at infinity.
template <typename P>
struct AffinePoint
{
    static_assert(MontgomeryModelParameters<P>);

    using BaseField = typename P::BaseField;

    BaseField x;
    BaseField y;
    bool infinity = true;

    constexpr AffinePoint() noexcept = default;

    constexpr AffinePoint(const BaseField& x_, const BaseField& y_) noexcept
      : x{x_}, y{y_}, infinity{false}
    {}

    constexpr bool is_zero() const noexcept { return infinity; }

    /// Checks b⋅y² = x³ + a⋅x² + x.
    constexpr bool is_on_curve() const noexcept
    {
        if (infinity)
            return true;
        const auto x2 = x.square();
        return P::COEFF_B * y.square() == x2 * x + P::COEFF_A * x2 + x;
    }

    friend constexpr bool operator==(const AffinePoint& a, const AffinePoint& b) noexcept
    {
        if (a.infinity || b.infinity)
            return a.infinity == b.infinity;
        return a.x == b.x && a.y == b.y;
    }

    friend std::ostream& operator<<(std::ostream& os, const AffinePoint& p)
    {
        if (p.infinity)
            return os << "infinity";
        return os << "(" << p.x << ", " << p.y << ")";
    }
};

/// Maps the Montgomery point (u, v) to the twisted-Edwards point (u/v, (u - 1)/(u + 1)).
///
/// The point at infinity maps to (0, 1) and (0, 0) maps to (0, -1).
/// Returns std::nullopt where the map is undefined (v = 0 or u = -1 otherwise).
template <typename P>
std::optional<te::AffinePoint<typename P::TEParameters>> to_twisted_edwards(
    const AffinePoint<P>& p) noexcept
{
    using TEPoint = te::AffinePoint<typename P::TEParameters>;
    using F = typename P::BaseField;

    if (p.is_zero())
        return TEPoint::zero();
    if (p.x.is_zero() && p.y.is_zero())
        return TEPoint{F::zero(), -F::one()};

    const auto u1 = p.x + F::one();
    if (p.y.is_zero() || u1.is_zero())
        return std::nullopt;

    return TEPoint{p.x / p.y, (p.x - F::one()) / u1};
}
}  // namespace mont

namespace te
{
/// Maps the twisted-Edwards point (x, y) to the Montgomery point (u, u/x)
/// with u = (1 + y)/(1 - y).
///
/// The neutral element maps to the point at infinity and (0, -1) maps to (0, 0).
/// Returns std::nullopt where the map is undefined.
template <typename P>
std::optional<mont::AffinePoint<typename P::MontgomeryParameters>> to_montgomery(
    const AffinePoint<P>& p) noexcept
{
    using MontPoint = mont::AffinePoint<typename P::MontgomeryParameters>;
    using F = typename P::BaseField;

    if (p.is_zero())
        return MontPoint{};
    if (p.x.is_zero())
    {
        if (p.y != -F::one())
            return std::nullopt;
        return MontPoint{F::zero(), F::zero()};
    }

    const auto y1 = F::one() - p.y;
    if (y1.is_zero())
        return std::nullopt;

    const auto u = (F::one() + p.y) / y1;
    return MontPoint{u, u / p.x};
}
}  // namespace te

/// Checks the Montgomery coefficients linked to the twisted-Edwards model P
/// against A = 2(a + d)/(a - d) and B = 4/(a - d).
///
/// Nothing in the library calls this; curve definitions are trusted as declared.
template <typename P>
    requires TEModelParameters<P>
constexpr bool linked_coefficients_match() noexcept
{
    using M = typename P::MontgomeryParameters;
    using F = typename P::BaseField;

    const F a = P::COEFF_A;
    const F d = P::COEFF_D;
    const auto a_minus_d = a - d;
    if (a_minus_d.is_zero())
        return false;

    const auto inv = a_minus_d.inv();
    const auto two = F::one().double_();
    return M::COEFF_A == two * (a + d) * inv && M::COEFF_B == two.double_() * inv;
}
}  // namespace ecmodel
