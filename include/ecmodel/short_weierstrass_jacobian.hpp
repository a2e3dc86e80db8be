// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "models.hpp"
#include <optional>
#include <ostream>

namespace ecmodel::sw
{
template <typename P>
struct JacPoint;

/// The affine point on a short Weierstrass curve, with an explicit point at infinity.
template <typename P>
struct AffinePoint
{
    static_assert(SWModelParameters<P>);

    using BaseField = typename P::BaseField;
    using ScalarField = typename P::ScalarField;

    BaseField x;
    BaseField y;
    bool infinity = true;

    /// Creates the point at infinity.
    constexpr AffinePoint() noexcept = default;

    /// Creates the point from coordinates. The curve equation is not checked.
    constexpr AffinePoint(const BaseField& x_, const BaseField& y_) noexcept
      : x{x_}, y{y_}, infinity{false}
    {}

    static constexpr AffinePoint zero() noexcept { return {}; }

    static constexpr AffinePoint prime_subgroup_generator() noexcept
    {
        return {P::AFFINE_GENERATOR_COEFFS.first, P::AFFINE_GENERATOR_COEFFS.second};
    }

    /// Finds the point with the given x coordinate. Of the two candidates the one with
    /// the lexicographically greater y is selected if `greatest` is set.
    static std::optional<AffinePoint> get_point_from_x(const BaseField& x, bool greatest) noexcept
    {
        const auto x3b = P::add_b(x.square() * x + P::mul_by_a(x));
        const auto y = x3b.sqrt();
        if (!y)
            return std::nullopt;

        const auto neg_y = -*y;
        const auto y_is_greater = y->value() > neg_y.value();
        return AffinePoint{x, (y_is_greater == greatest) ? *y : neg_y};
    }

    constexpr bool is_zero() const noexcept { return infinity; }

    /// Checks y² = x³ + a⋅x + b. The point at infinity is on the curve.
    constexpr bool is_on_curve() const noexcept
    {
        if (infinity)
            return true;
        const auto x3b = P::add_b(x.square() * x + P::mul_by_a(x));
        return y.square() == x3b;
    }

    /// Forwards to the model's subgroup check so that curve specific replacements apply.
    bool is_in_correct_subgroup_assuming_on_curve() const noexcept
    {
        return P::is_in_correct_subgroup_assuming_on_curve(*this);
    }

    /// Multiplies the point by the scalar given as a most-significant-bit-first bit sequence.
    template <typename BitsT>
    JacPoint<P> mul_bits(const BitsT& bits) const noexcept
    {
        auto res = JacPoint<P>::zero();
        for (const bool bit : bits)
        {
            res = res.dbl();
            if (bit)
                res = res.add_mixed(*this);
        }
        return res;
    }

    AffinePoint mul(const ScalarField& scalar) const noexcept
    {
        return mul_bits(BitIteratorBE{scalar.value()}).to_affine();
    }

    /// Multiplies the point by the cofactor, mapping any curve point into the subgroup.
    AffinePoint scale_by_cofactor() const noexcept
    {
        return mul_bits(BitIteratorBE{P::COFACTOR}).to_affine();
    }

    /// Multiplies the point by the inverse of the cofactor in the scalar field.
    AffinePoint mul_by_cofactor_inv() const noexcept { return mul(P::COFACTOR_INV); }

    friend constexpr bool operator==(const AffinePoint& a, const AffinePoint& b) noexcept
    {
        if (a.infinity || b.infinity)
            return a.infinity == b.infinity;
        return a.x == b.x && a.y == b.y;
    }

    friend constexpr AffinePoint operator-(const AffinePoint& p) noexcept
    {
        if (p.infinity)
            return p;
        return {p.x, -p.y};
    }

    friend std::ostream& operator<<(std::ostream& os, const AffinePoint& p)
    {
        if (p.infinity)
            return os << "infinity";
        return os << "(" << p.x << ", " << p.y << ")";
    }
};

/// The point in Jacobian coordinates (X, Y, Z) representing the affine point (X/Z², Y/Z³).
/// The point at infinity has Z = 0.
template <typename P>
struct JacPoint
{
    using BaseField = typename P::BaseField;

    BaseField x = BaseField::one();
    BaseField y = BaseField::one();
    BaseField z = BaseField::zero();

    static constexpr JacPoint zero() noexcept { return {}; }

    static constexpr JacPoint from(const AffinePoint<P>& p) noexcept
    {
        if (p.is_zero())
            return zero();
        return {p.x, p.y, BaseField::one()};
    }

    constexpr bool is_zero() const noexcept { return z.is_zero(); }

    AffinePoint<P> to_affine() const noexcept
    {
        if (is_zero())
            return {};
        const auto z_inv = z.inv();
        const auto z_inv2 = z_inv.square();
        return {x * z_inv2, y * z_inv2 * z_inv};
    }

    /// Compares the represented affine points.
    friend constexpr bool operator==(const JacPoint& a, const JacPoint& b) noexcept
    {
        if (a.is_zero() || b.is_zero())
            return a.is_zero() == b.is_zero();

        const auto az2 = a.z.square();
        const auto bz2 = b.z.square();
        return a.x * bz2 == b.x * az2 && a.y * bz2 * b.z == b.y * az2 * a.z;
    }

    friend constexpr JacPoint operator-(const JacPoint& p) noexcept { return {p.x, -p.y, p.z}; }

    /// Doubling for any a, "dbl-2007-bl" from the Explicit-Formulas Database.
    constexpr JacPoint dbl() const noexcept
    {
        if (is_zero())
            return *this;

        const auto xx = x.square();
        const auto yy = y.square();
        const auto yyyy = yy.square();
        const auto zz = z.square();
        const auto s = ((x + yy).square() - xx - yyyy).double_();
        const auto m = xx.double_() + xx + P::mul_by_a(zz.square());
        const auto t = m.square() - s.double_();

        JacPoint r;
        r.x = t;
        r.y = m * (s - t) - yyyy.double_().double_().double_();
        r.z = (y + z).square() - yy - zz;
        return r;
    }

    /// Addition, "add-2007-bl" from the Explicit-Formulas Database.
    constexpr JacPoint add(const JacPoint& q) const noexcept
    {
        if (is_zero())
            return q;
        if (q.is_zero())
            return *this;

        const auto z1z1 = z.square();
        const auto z2z2 = q.z.square();
        const auto u1 = x * z2z2;
        const auto u2 = q.x * z1z1;
        const auto s1 = y * q.z * z2z2;
        const auto s2 = q.y * z * z1z1;

        if (u1 == u2)
            return s1 == s2 ? dbl() : zero();

        const auto h = u2 - u1;
        const auto i = h.double_().square();
        const auto j = h * i;
        const auto r = (s2 - s1).double_();
        const auto v = u1 * i;

        JacPoint res;
        res.x = r.square() - j - v.double_();
        res.y = r * (v - res.x) - (s1 * j).double_();
        res.z = ((z + q.z).square() - z1z1 - z2z2) * h;
        return res;
    }

    /// Addition of an affine point, "madd-2007-bl" from the Explicit-Formulas Database.
    constexpr JacPoint add_mixed(const AffinePoint<P>& q) const noexcept
    {
        if (q.is_zero())
            return *this;
        if (is_zero())
            return from(q);

        const auto z1z1 = z.square();
        const auto u2 = q.x * z1z1;
        const auto s2 = q.y * z * z1z1;

        if (x == u2)
            return y == s2 ? dbl() : zero();

        const auto h = u2 - x;
        const auto hh = h.square();
        const auto i = hh.double_().double_();
        const auto j = h * i;
        const auto r = (s2 - y).double_();
        const auto v = x * i;

        JacPoint res;
        res.x = r.square() - j - v.double_();
        res.y = r * (v - res.x) - (y * j).double_();
        res.z = (z + h).square() - z1z1 - hh;
        return res;
    }
};
}  // namespace ecmodel::sw
