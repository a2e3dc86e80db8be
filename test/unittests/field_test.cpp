// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0

#include "test_curves.hpp"
#include <gtest/gtest.h>
#include <array>

using namespace ecmodel;
using namespace ecmodel::test;

static_assert(BigInt<uint256>);
static_assert(BigInt<uint384>);
static_assert(!BigInt<uint64_t>);
static_assert(!Field<int>);
static_assert(PrimeField<F101> && SquareRootField<F101>);
static_assert(PrimeField<Bls12381Fq> && SquareRootField<Bls12381Fq>);

static_assert(F101::NUM_BITS == 7);
static_assert(Bn254Fq::NUM_BITS == 254);
static_assert(Ed25519Fq::NUM_BITS == 255);
static_assert(Bls12381Fq::NUM_BITS == 381);

static_assert(F101{3} * F101{34} == F101::one());
static_assert(F101{101}.is_zero());
static_assert(F101{102} == F101::one());
static_assert(-F101{1} == F101{100});
static_assert(F101{7}.value() == 7);
static_assert(F101::one().value() == 1);
static_assert(F101{3}.inv() == F101{34});
static_assert(F101{3}.pow(100) == F101::one());
static_assert(F101{200}.double_() == F101{97});

static_assert(detail::neg_inv64(101) * 101 == ~uint64_t{0});
static_assert(detail::neg_inv64(Bn254FqConfig::MODULUS[0]) * Bn254FqConfig::MODULUS[0] ==
              ~uint64_t{0});
static_assert(detail::mont_r_squared(101_u256) == 56);

template <typename>
class field_test : public testing::Test
{};

using field_types = testing::Types<F101, F103, F107, Bn254Fq, Ed25519Fq, Bls12381Fq,
    Bls12381Fr, Ed25519Fr>;
TYPED_TEST_SUITE(field_test, field_types);

template <typename F>
static auto get_test_values() noexcept
{
    const auto& p = F::characteristic();
    return std::array{F{p - 1}, F{p - 2}, F{p / 2}, F{p / 2 + 1}, F{7}, F{2}, F::one()};
}

TYPED_TEST(field_test, value_roundtrip)
{
    const auto& p = TypeParam::characteristic();
    for (const auto& v : {p - 1, p / 3, typename TypeParam::uint_type{5}})
        EXPECT_EQ(TypeParam{v}.value(), v);
    EXPECT_EQ(TypeParam::zero().value(), 0);
    EXPECT_EQ(TypeParam::one().value(), 1);
}

TYPED_TEST(field_test, matches_reference_arithmetic)
{
    using Uint = typename TypeParam::uint_type;
    using Wide = intx::uint<Uint::num_bits * 2>;

    const auto& p = TypeParam::characteristic();
    const std::array values{p - 1, p / 2 + 1, p / 2, Uint{3}, Uint{1}, Uint{0}};

    for (const auto& x : values)
    {
        const TypeParam a{x};
        for (const auto& y : values)
        {
            const TypeParam b{y};
            EXPECT_EQ((a * b).value(), udivrem(umul(x, y), p).rem);
            EXPECT_EQ((a + b).value(), udivrem(Wide{x} + Wide{y}, p).rem);
            EXPECT_EQ((a - b).value(), udivrem(Wide{x} + Wide{p} - Wide{y}, p).rem);
        }
        EXPECT_EQ((-a).value(), udivrem(Wide{p} - Wide{x}, p).rem);
        EXPECT_EQ(TypeParam{x + p}.value(), x);
    }
}

TYPED_TEST(field_test, ring_axioms)
{
    const auto values = get_test_values<TypeParam>();
    for (const auto& a : values)
    {
        EXPECT_EQ(a + TypeParam::zero(), a);
        EXPECT_EQ(a * TypeParam::one(), a);
        EXPECT_TRUE((a + -a).is_zero());
        EXPECT_EQ(a.double_(), a + a);
        EXPECT_EQ(a.square(), a * a);
        for (const auto& b : values)
        {
            EXPECT_EQ(a * b, b * a);
            EXPECT_EQ((a + b) - b, a);
            EXPECT_EQ((a + b) * a, a * a + b * a);

            auto c = a;
            c *= b;
            c += a;
            c -= b;
            EXPECT_EQ(c, a * b + a - b);
        }
    }
}

TYPED_TEST(field_test, inv)
{
    for (const auto& a : get_test_values<TypeParam>())
    {
        EXPECT_EQ(a * a.inv(), TypeParam::one()) << a;
        EXPECT_EQ(TypeParam::one() / a, a.inv()) << a;
    }
    EXPECT_TRUE(TypeParam::zero().inv().is_zero());
}

TYPED_TEST(field_test, pow)
{
    const auto& p = TypeParam::characteristic();
    for (const auto& a : get_test_values<TypeParam>())
    {
        EXPECT_EQ(a.pow(0), TypeParam::one());
        EXPECT_EQ(a.pow(2), a.square());
        EXPECT_EQ(a.pow(p - 1), TypeParam::one()) << a;
        EXPECT_EQ(a.pow(p), a);
    }
}

TYPED_TEST(field_test, sqrt)
{
    for (const auto& a : get_test_values<TypeParam>())
    {
        const auto a2 = a.square();
        EXPECT_EQ(a2.legendre(), 1);
        const auto root = a2.sqrt();
        ASSERT_TRUE(root.has_value()) << a;
        EXPECT_TRUE(*root == a || *root == -a) << a;
    }

    const auto zero_root = TypeParam::zero().sqrt();
    ASSERT_TRUE(zero_root.has_value());
    EXPECT_TRUE(zero_root->is_zero());
}

TYPED_TEST(field_test, sqrt_non_residue)
{
    auto n = TypeParam{2};
    while (n.legendre() != -1)
        n += TypeParam::one();

    EXPECT_FALSE(n.sqrt().has_value()) << n;
    EXPECT_FALSE((n * TypeParam{4}).sqrt().has_value()) << n;
}

TEST(field, f101_values)
{
    EXPECT_EQ(F101{2}.legendre(), -1);
    EXPECT_EQ(F101{5}.legendre(), 1);
    EXPECT_EQ(F101{0}.legendre(), 0);

    const auto root = F101{5}.sqrt();
    ASSERT_TRUE(root.has_value());
    EXPECT_TRUE(root->value() == 45 || root->value() == 56);

    EXPECT_EQ(F101{10} / F101{5}, F101{2});
    EXPECT_EQ(F101{3}.pow(5), F101{243 % 101});
}
