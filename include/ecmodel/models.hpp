// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "bit_iterator.hpp"
#include "field.hpp"
#include <concepts>
#include <type_traits>
#include <utility>

namespace ecmodel
{
namespace sw
{
template <typename P>
struct AffinePoint;
}

/// Model composed of a base field and a scalar field.
template <typename P>
concept ModelParameters = requires {
    typename P::BaseField;
    typename P::ScalarField;
} && SquareRootField<typename P::BaseField> && PrimeField<typename P::ScalarField> &&
                          SquareRootField<typename P::ScalarField>;

namespace detail
{
template <typename T, typename F>
concept CoefficientOf = std::convertible_to<const T&, F>;

template <typename P>
concept CurveConstants = ModelParameters<P> && requires {
    requires BigInt<std::remove_cvref_t<decltype(P::COFACTOR)>>;
    { P::COFACTOR_INV } -> CoefficientOf<typename P::ScalarField>;
    {
        P::AFFINE_GENERATOR_COEFFS
    } -> CoefficientOf<std::pair<typename P::BaseField, typename P::BaseField>>;
};

/// The twisted-Edwards constants, without following the Montgomery link.
template <typename P>
concept TECoefficients = CurveConstants<P> && requires(const typename P::BaseField& e) {
    { P::COEFF_A } -> CoefficientOf<typename P::BaseField>;
    { P::COEFF_D } -> CoefficientOf<typename P::BaseField>;
    { P::mul_by_a(e) } -> std::same_as<typename P::BaseField>;
    typename P::MontgomeryParameters;
};

/// The Montgomery constants, without following the twisted-Edwards link.
template <typename P>
concept MontgomeryCoefficients = ModelParameters<P> && requires {
    { P::COEFF_A } -> CoefficientOf<typename P::BaseField>;
    { P::COEFF_B } -> CoefficientOf<typename P::BaseField>;
    typename P::TEParameters;
};
}  // namespace detail

/// Model defined as the short Weierstrass form y² = x³ + a⋅x + b.
template <typename P>
concept SWModelParameters =
    detail::CurveConstants<P> && requires(const typename P::BaseField& e) {
        { P::COEFF_A } -> detail::CoefficientOf<typename P::BaseField>;
        { P::COEFF_B } -> detail::CoefficientOf<typename P::BaseField>;
        { P::mul_by_a(e) } -> std::same_as<typename P::BaseField>;
        { P::add_b(e) } -> std::same_as<typename P::BaseField>;
    };

/// Model defined as the twisted-Edwards form a⋅x² + y² = 1 + d⋅x²⋅y².
///
/// The MontgomeryParameters member names the birationally equivalent Montgomery model
/// over the same base field.
template <typename P>
concept TEModelParameters =
    detail::TECoefficients<P> &&
    detail::MontgomeryCoefficients<typename P::MontgomeryParameters> &&
    std::same_as<typename P::MontgomeryParameters::BaseField, typename P::BaseField>;

/// Model defined as the Montgomery form b⋅y² = x³ + a⋅x² + x.
///
/// The TEParameters member names the birationally equivalent twisted-Edwards model
/// over the same base field.
template <typename P>
concept MontgomeryModelParameters =
    detail::MontgomeryCoefficients<P> && detail::TECoefficients<typename P::TEParameters> &&
    std::same_as<typename P::TEParameters::BaseField, typename P::BaseField>;


/// Fixes the base and scalar field types of a model.
template <typename BaseFieldT, typename ScalarFieldT>
struct ModelFields
{
    /// Base field of the model with a square root algorithm.
    using BaseField = BaseFieldT;

    /// Prime scalar field of the model, the order of the prime subgroup.
    using ScalarField = ScalarFieldT;
};

/// Default methods of the short Weierstrass model.
///
/// A curve derives from SWModel<Curve, Fq, Fr> and declares COEFF_A, COEFF_B, COFACTOR,
/// COFACTOR_INV and AFFINE_GENERATOR_COEFFS as static constexpr members.
/// Any of the methods below may be hidden by a static method of the same name in the curve;
/// the replacement must return the same values for all inputs.
template <typename Derived, typename BaseFieldT, typename ScalarFieldT>
struct SWModel : ModelFields<BaseFieldT, ScalarFieldT>
{
    /// Multiplies the field element by the coefficient a.
    [[gnu::always_inline]] static constexpr BaseFieldT mul_by_a(const BaseFieldT& elem) noexcept
    {
        auto copy = elem;
        copy *= Derived::COEFF_A;
        return copy;
    }

    /// Adds the coefficient b to the field element. Skips the addition for b = 0.
    [[gnu::always_inline]] static constexpr BaseFieldT add_b(const BaseFieldT& elem) noexcept
    {
        if (!Derived::COEFF_B.is_zero())
        {
            auto copy = elem;
            copy += Derived::COEFF_B;
            return copy;
        }
        return elem;
    }

    /// Checks if the point is in the prime order subgroup, i.e. [r]P is the point at infinity
    /// where r is the characteristic of the scalar field.
    ///
    /// The point must be on the curve, otherwise the result is meaningless.
    static bool is_in_correct_subgroup_assuming_on_curve(
        const sw::AffinePoint<Derived>& item) noexcept
    {
        return item.mul_bits(BitIteratorBE{ScalarFieldT::characteristic()}).is_zero();
    }
};

/// Default methods of the twisted-Edwards model.
///
/// A curve derives from TEModel<Curve, Fq, Fr>, declares COEFF_A, COEFF_D, COFACTOR,
/// COFACTOR_INV and AFFINE_GENERATOR_COEFFS, and names its Montgomery form
/// with `using MontgomeryParameters = ...`.
template <typename Derived, typename BaseFieldT, typename ScalarFieldT>
struct TEModel : ModelFields<BaseFieldT, ScalarFieldT>
{
    /// Multiplies the field element by the coefficient a.
    [[gnu::always_inline]] static constexpr BaseFieldT mul_by_a(const BaseFieldT& elem) noexcept
    {
        auto copy = elem;
        copy *= Derived::COEFF_A;
        return copy;
    }
};

/// The Montgomery model. A curve derives from MontgomeryModel<Curve, Fq, Fr>,
/// declares COEFF_A and COEFF_B, and names its twisted-Edwards form
/// with `using TEParameters = ...`.
template <typename Derived, typename BaseFieldT, typename ScalarFieldT>
struct MontgomeryModel : ModelFields<BaseFieldT, ScalarFieldT>
{};
}  // namespace ecmodel
