// ecmodel: Elliptic curve model parameters framework
// Copyright 2026 The ecmodel Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <intx/intx.hpp>
#include <cstddef>
#include <iterator>

namespace ecmodel
{
/// The bits of an unsigned big integer, most significant bit first.
///
/// By default all UintT::num_bits bits are produced, leading zeros included.
/// Use without_leading_zeros() to start at the highest set bit.
template <typename UintT>
class BitIteratorBE
{
    UintT m_value;
    unsigned m_width;

public:
    class iterator
    {
        const UintT* m_value = nullptr;
        unsigned m_pos = 0;  ///< The number of bits still to be produced.

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = bool;
        using difference_type = std::ptrdiff_t;

        iterator() = default;
        constexpr iterator(const UintT* value, unsigned pos) noexcept : m_value{value}, m_pos{pos}
        {}

        constexpr bool operator*() const noexcept
        {
            return (*m_value & (UintT{1} << (m_pos - 1))) != 0;
        }

        constexpr iterator& operator++() noexcept
        {
            --m_pos;
            return *this;
        }

        constexpr iterator operator++(int) noexcept
        {
            auto tmp = *this;
            --m_pos;
            return tmp;
        }

        friend constexpr bool operator==(const iterator& a, const iterator& b) noexcept
        {
            return a.m_pos == b.m_pos;
        }
    };

    constexpr explicit BitIteratorBE(const UintT& value) noexcept
      : m_value{value}, m_width{UintT::num_bits}
    {}

    static constexpr BitIteratorBE without_leading_zeros(const UintT& value) noexcept
    {
        BitIteratorBE bits{value};
        bits.m_width = UintT::num_bits - intx::clz(value);
        return bits;
    }

    /// The number of bits produced.
    constexpr unsigned size() const noexcept { return m_width; }

    constexpr iterator begin() const noexcept { return {&m_value, m_width}; }
    constexpr iterator end() const noexcept { return {&m_value, 0}; }
};
}  // namespace ecmodel
