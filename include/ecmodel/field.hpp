// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "bit_iterator.hpp"
#include <concepts>
#include <optional>
#include <ostream>

namespace ecmodel
{
/// An intx fixed-width unsigned integer, e.g. a cofactor or a field characteristic.
template <typename T>
concept BigInt = requires(const T& v) {
    { T::num_bits } -> std::convertible_to<unsigned>;
    { T::num_words } -> std::convertible_to<unsigned>;
    { v[0] } -> std::convertible_to<uint64_t>;
};

/// The arithmetic of a field.
template <typename F>
concept Field = std::regular<F> && requires(const F& a, const F& b, F& c) {
    { a + b } -> std::same_as<F>;
    { a - b } -> std::same_as<F>;
    { a * b } -> std::same_as<F>;
    { -a } -> std::same_as<F>;
    { c += b } -> std::same_as<F&>;
    { c -= b } -> std::same_as<F&>;
    { c *= b } -> std::same_as<F&>;
    { a.inv() } -> std::same_as<F>;
    { a.is_zero() } -> std::same_as<bool>;
    { F::zero() } -> std::same_as<F>;
    { F::one() } -> std::same_as<F>;
};

/// A field with a square root algorithm.
template <typename F>
concept SquareRootField = Field<F> && requires(const F& a) {
    { a.sqrt() } -> std::same_as<std::optional<F>>;
};

/// A prime field whose elements convert to canonical big integers.
template <typename F>
concept PrimeField = Field<F> && requires(const F& a) {
    typename F::uint_type;
    requires BigInt<typename F::uint_type>;
    { F::characteristic() } -> std::convertible_to<typename F::uint_type>;
    { a.value() } -> std::same_as<typename F::uint_type>;
};


namespace detail
{
/// Computes -mod⁻¹ mod 2⁶⁴ for the odd lowest word of the modulus.
/// Each Newton step doubles the number of correct low bits, starting from 3.
constexpr uint64_t neg_inv64(uint64_t mod0) noexcept
{
    uint64_t inv = mod0;
    for (int i = 0; i < 5; ++i)
        inv *= 2 - mod0 * inv;
    return 0 - inv;
}

template <typename UintT>
constexpr UintT add_mod(const UintT& x, const UintT& y, const UintT& mod) noexcept
{
    const auto [s, carry] = intx::addc(x, y);
    return (carry || s >= mod) ? s - mod : s;
}

template <typename UintT>
constexpr UintT sub_mod(const UintT& x, const UintT& y, const UintT& mod) noexcept
{
    const auto [d, borrow] = intx::subc(x, y);
    return borrow ? d + mod : d;
}

/// R² % mod for R = 2^num_bits, by doubling R % mod num_bits times.
template <typename UintT>
constexpr UintT mont_r_squared(const UintT& mod) noexcept
{
    auto r = (UintT{0} - mod) % mod;
    for (unsigned i = 0; i < UintT::num_bits; ++i)
        r = add_mod(r, r, mod);
    return r;
}

/// Montgomery reduction t⋅R⁻¹ % mod of t < mod⋅R, clearing one low word per step.
template <typename UintT>
constexpr UintT redc(const intx::uint<UintT::num_bits * 2>& t, const UintT& mod,
    uint64_t mod_inv) noexcept
{
    using Wide = intx::uint<UintT::num_bits * 2 + 64>;
    using Narrow = intx::uint<UintT::num_bits + 64>;

    Wide w{t};
    for (unsigned i = 0; i < UintT::num_words; ++i)
    {
        const uint64_t m = w[i] * mod_inv;
        w += Wide{Narrow{mod} * Narrow{m}} << (64 * i);
    }

    const auto r = static_cast<Narrow>(w >> UintT::num_bits);
    return static_cast<UintT>(r >= Narrow{mod} ? r - Narrow{mod} : r);
}
}  // namespace detail

/// An element of the prime field defined by ConfigT.
///
/// The ConfigT provides the unsigned integer type `uint_type` and the odd prime `MODULUS`.
/// Elements are stored in Montgomery form xR % MODULUS with R = 2^uint_type::num_bits.
template <typename ConfigT>
class Fp
{
public:
    using uint_type = typename ConfigT::uint_type;

    /// The bit length of the modulus.
    static constexpr unsigned NUM_BITS = uint_type::num_bits - intx::clz(ConfigT::MODULUS);

private:
    static constexpr uint64_t MOD_INV = detail::neg_inv64(ConfigT::MODULUS[0]);
    static constexpr uint_type R_SQUARED = detail::mont_r_squared(ConfigT::MODULUS);
    static constexpr uint_type R = (uint_type{0} - ConfigT::MODULUS) % ConfigT::MODULUS;

    uint_type m_value = 0;

    [[gnu::always_inline]] static constexpr Fp wrap(const uint_type& v) noexcept
    {
        Fp element;
        element.m_value = v;
        return element;
    }

    static constexpr uint_type mont_mul(const uint_type& x, const uint_type& y) noexcept
    {
        return detail::redc(intx::umul(x, y), ConfigT::MODULUS, MOD_INV);
    }

public:
    constexpr Fp() noexcept = default;

    /// Creates the element from an integer, reducing it modulo the characteristic.
    constexpr explicit Fp(const uint_type& v) noexcept
      : m_value{mont_mul(v % ConfigT::MODULUS, R_SQUARED)}
    {}

    static constexpr Fp zero() noexcept { return Fp{}; }

    static constexpr Fp one() noexcept { return wrap(R); }

    static constexpr const uint_type& characteristic() noexcept { return ConfigT::MODULUS; }

    /// The canonical integer representation of the element.
    constexpr uint_type value() const noexcept
    {
        return detail::redc(intx::uint<uint_type::num_bits * 2>{m_value}, ConfigT::MODULUS,
            MOD_INV);
    }

    constexpr bool is_zero() const noexcept { return m_value == 0; }

    constexpr Fp square() const noexcept { return wrap(mont_mul(m_value, m_value)); }

    constexpr Fp double_() const noexcept
    {
        return wrap(detail::add_mod(m_value, m_value, ConfigT::MODULUS));
    }

    /// The multiplicative inverse x^(p-2). The inverse of zero is zero.
    constexpr Fp inv() const noexcept { return pow(ConfigT::MODULUS - 2); }

    /// Left-to-right square-and-multiply.
    constexpr Fp pow(const uint_type& exponent) const noexcept
    {
        auto r = one();
        for (const bool bit : BitIteratorBE<uint_type>::without_leading_zeros(exponent))
        {
            r = r.square();
            if (bit)
                r *= *this;
        }
        return r;
    }

    /// The Legendre symbol: 0 for zero, 1 for quadratic residues, -1 otherwise.
    constexpr int legendre() const noexcept
    {
        if (is_zero())
            return 0;
        return pow((ConfigT::MODULUS - 1) >> 1) == one() ? 1 : -1;
    }

    /// Square root by the Tonelli-Shanks algorithm.
    ///
    /// @return One of the two square roots, std::nullopt for quadratic non-residues.
    std::optional<Fp> sqrt() const noexcept
    {
        switch (legendre())
        {
        case 0:
            return Fp{};
        case -1:
            return std::nullopt;
        default:
            break;
        }

        // p - 1 = 2^s * t with t odd. z is a quadratic non-residue.
        struct Constants
        {
            unsigned s = 0;
            uint_type t;
            Fp z_t;
        };
        static const auto c = [] {
            Constants r;
            r.t = ConfigT::MODULUS - 1;
            while ((r.t[0] & 1) == 0)
            {
                r.t >>= 1;
                ++r.s;
            }
            auto z = Fp::one().double_();
            while (z.legendre() != -1)
                z += Fp::one();
            r.z_t = z.pow(r.t);
            return r;
        }();

        auto m = c.s;
        auto b = c.z_t;
        auto t = pow(c.t);
        auto root = pow((c.t + 1) >> 1);

        while (t != one())
        {
            // Find the least i such that t^(2^i) == 1.
            unsigned i = 1;
            for (auto t2 = t.square(); t2 != one(); t2 = t2.square())
                ++i;

            for (unsigned j = 0; j < m - i - 1; ++j)
                b = b.square();

            m = i;
            root *= b;
            b = b.square();
            t *= b;
        }
        return root;
    }

    friend constexpr bool operator==(const Fp&, const Fp&) = default;

    friend constexpr Fp operator+(const Fp& a, const Fp& b) noexcept
    {
        return wrap(detail::add_mod(a.m_value, b.m_value, ConfigT::MODULUS));
    }

    friend constexpr Fp operator-(const Fp& a, const Fp& b) noexcept
    {
        return wrap(detail::sub_mod(a.m_value, b.m_value, ConfigT::MODULUS));
    }

    friend constexpr Fp operator*(const Fp& a, const Fp& b) noexcept
    {
        return wrap(mont_mul(a.m_value, b.m_value));
    }

    friend constexpr Fp operator/(const Fp& a, const Fp& b) noexcept { return a * b.inv(); }

    friend constexpr Fp operator-(const Fp& a) noexcept
    {
        return wrap(detail::sub_mod(uint_type{0}, a.m_value, ConfigT::MODULUS));
    }

    constexpr Fp& operator+=(const Fp& b) noexcept { return *this = *this + b; }

    constexpr Fp& operator-=(const Fp& b) noexcept { return *this = *this - b; }

    constexpr Fp& operator*=(const Fp& b) noexcept { return *this = *this * b; }

    friend std::ostream& operator<<(std::ostream& os, const Fp& a)
    {
        return os << "0x" << intx::hex(a.value());
    }
};
}  // namespace ecmodel
