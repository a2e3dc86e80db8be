// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "models.hpp"
#include <ostream>

namespace ecmodel::te
{
template <typename P>
struct ExtPoint;

/// The affine point on a twisted Edwards curve. The neutral element is (0, 1).
template <typename P>
struct AffinePoint
{
    static_assert(TEModelParameters<P>);

    using BaseField = typename P::BaseField;
    using ScalarField = typename P::ScalarField;

    BaseField x = BaseField::zero();
    BaseField y = BaseField::one();

    static constexpr AffinePoint zero() noexcept { return {}; }

    static constexpr AffinePoint prime_subgroup_generator() noexcept
    {
        return {P::AFFINE_GENERATOR_COEFFS.first, P::AFFINE_GENERATOR_COEFFS.second};
    }

    constexpr bool is_zero() const noexcept { return x.is_zero() && y == BaseField::one(); }

    /// Checks a⋅x² + y² = 1 + d⋅x²⋅y².
    constexpr bool is_on_curve() const noexcept
    {
        const auto x2 = x.square();
        const auto y2 = y.square();
        return P::mul_by_a(x2) + y2 == BaseField::one() + P::COEFF_D * x2 * y2;
    }

    /// Checks if [r]P is the neutral element where r is the characteristic of the scalar field.
    /// The point must be on the curve.
    bool is_in_correct_subgroup_assuming_on_curve() const noexcept
    {
        return mul_bits(BitIteratorBE{ScalarField::characteristic()}).is_zero();
    }

    /// Multiplies the point by the scalar given as a most-significant-bit-first bit sequence.
    template <typename BitsT>
    ExtPoint<P> mul_bits(const BitsT& bits) const noexcept
    {
        const auto base = ExtPoint<P>::from(*this);
        auto res = ExtPoint<P>::zero();
        for (const bool bit : bits)
        {
            res = res.dbl();
            if (bit)
                res = res.add(base);
        }
        return res;
    }

    AffinePoint mul(const ScalarField& scalar) const noexcept
    {
        return mul_bits(BitIteratorBE{scalar.value()}).to_affine();
    }

    AffinePoint scale_by_cofactor() const noexcept
    {
        return mul_bits(BitIteratorBE{P::COFACTOR}).to_affine();
    }

    AffinePoint mul_by_cofactor_inv() const noexcept { return mul(P::COFACTOR_INV); }

    friend constexpr bool operator==(const AffinePoint&, const AffinePoint&) = default;

    friend constexpr AffinePoint operator-(const AffinePoint& p) noexcept { return {-p.x, p.y}; }

    friend std::ostream& operator<<(std::ostream& os, const AffinePoint& p)
    {
        return os << "(" << p.x << ", " << p.y << ")";
    }
};

/// The point in extended coordinates (X, Y, T, Z) with x = X/Z, y = Y/Z and T = XY/Z.
///
/// Addition and doubling are the unified formulas of Hisil, Wong, Carter, Dawson,
/// "Twisted Edwards Curves Revisited". They are complete when a is a square and d is not.
template <typename P>
struct ExtPoint
{
    using BaseField = typename P::BaseField;

    BaseField x = BaseField::zero();
    BaseField y = BaseField::one();
    BaseField t = BaseField::zero();
    BaseField z = BaseField::one();

    static constexpr ExtPoint zero() noexcept { return {}; }

    static constexpr ExtPoint from(const AffinePoint<P>& p) noexcept
    {
        return {p.x, p.y, p.x * p.y, BaseField::one()};
    }

    constexpr bool is_zero() const noexcept { return x.is_zero() && y == z; }

    AffinePoint<P> to_affine() const noexcept
    {
        const auto z_inv = z.inv();
        return {x * z_inv, y * z_inv};
    }

    friend constexpr bool operator==(const ExtPoint& a, const ExtPoint& b) noexcept
    {
        return a.x * b.z == b.x * a.z && a.y * b.z == b.y * a.z;
    }

    /// "add-2008-hwcd".
    constexpr ExtPoint add(const ExtPoint& q) const noexcept
    {
        const auto a = x * q.x;
        const auto b = y * q.y;
        const auto c = P::COEFF_D * t * q.t;
        const auto d = z * q.z;
        const auto e = (x + y) * (q.x + q.y) - a - b;
        const auto f = d - c;
        const auto g = d + c;
        const auto h = b - P::mul_by_a(a);
        return {e * f, g * h, e * h, f * g};
    }

    /// "dbl-2008-hwcd".
    constexpr ExtPoint dbl() const noexcept
    {
        const auto a = x.square();
        const auto b = y.square();
        const auto c = z.square().double_();
        const auto d = P::mul_by_a(a);
        const auto e = (x + y).square() - a - b;
        const auto g = d + b;
        const auto f = g - c;
        const auto h = d - b;
        return {e * f, g * h, e * h, f * g};
    }
};
}  // namespace ecmodel::te
