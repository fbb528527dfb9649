// Copyright 2017 Alexander Bolz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <cassert>
#include <cstdint>
#include <cstring>
#include <limits>

#ifndef NUMLIT_ASSERT
#define NUMLIT_ASSERT(X) assert(X)
#endif

namespace numlit {

namespace impl {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

// Returns floor(e * log_10(2)).
// PRE: -1650 <= e <= 1650
inline constexpr int FloorLog10Pow2(int e)
{
    // 78913 / 2^18 = 0.301029968...
    return (e * 78913) >> 18;
}

} // namespace impl

//==================================================================================================
// FloatInfo
//
// Describes an IEEE-754 style binary floating-point format:
//
//      [sign: 1 bit][exponent: exponent_bits][mantissa: mantissa_bits]
//
// A finite value is either normal,    (2^(p-1) + F) * 2^(E - bias - (p-1)), 1 <= E < 2^exponent_bits - 1,
// or subnormal,                       (          F) * 2^(1 - bias - (p-1)), E == 0,
// where p = mantissa_bits + 1.
//==================================================================================================

struct FloatInfo
{
    int mantissa_bits; // = p-1 (excludes the hidden bit)
    int exponent_bits;
    int exponent_bias;

    constexpr int SignificandSize() const { // = p (includes the hidden bit)
        return mantissa_bits + 1;
    }

    // Exponents of the representation f * 2^e, where f is an integer.
    constexpr int MinExponent() const {
        return 1 - exponent_bias - mantissa_bits;
    }

    constexpr int MaxExponent() const {
        return ((1 << exponent_bits) - 2) - exponent_bias - mantissa_bits;
    }

    constexpr uint64_t HiddenBit() const {
        return uint64_t{1} << mantissa_bits;
    }

    constexpr uint64_t SignificandMask() const {
        return HiddenBit() - 1;
    }

    constexpr uint64_t ExponentMask() const {
        return ((uint64_t{1} << exponent_bits) - 1) << mantissa_bits;
    }

    constexpr uint64_t SignMask() const {
        return uint64_t{1} << (mantissa_bits + exponent_bits);
    }

    constexpr uint64_t InfinityBits() const {
        return ExponentMask();
    }

    constexpr uint64_t QuietNaNBits() const {
        return ExponentMask() | (HiddenBit() >> 1);
    }

    constexpr uint64_t MaxFiniteBits() const {
        return InfinityBits() - 1;
    }

    // Any x >= 10^MaxDecimalPower() is larger than the largest finite value
    // (and does not round down to it).
    // Binary64: max = 1.7976931348623157 * 10^308 < 10^309.
    constexpr int MaxDecimalPower() const {
        return impl::FloorLog10Pow2(MaxExponent() + SignificandSize()) + 1;
    }

    // Any x < 10^MinDecimalPower() is smaller than half the smallest subnormal
    // and is rounded to zero.
    // Binary64: denorm_min / 2 = 2.4703282292062327 * 10^-324 > 10^-324.
    constexpr int MinDecimalPower() const {
        return impl::FloorLog10Pow2(MinExponent() - 1);
    }
};

inline constexpr bool operator==(FloatInfo const& lhs, FloatInfo const& rhs)
{
    return lhs.mantissa_bits == rhs.mantissa_bits
        && lhs.exponent_bits == rhs.exponent_bits
        && lhs.exponent_bias == rhs.exponent_bias;
}

inline constexpr bool operator!=(FloatInfo const& lhs, FloatInfo const& rhs)
{
    return !(lhs == rhs);
}

constexpr FloatInfo kBinary16 = {10,  5,   15};
constexpr FloatInfo kBFloat16 = { 7,  8,  127};
constexpr FloatInfo kBinary32 = {23,  8,  127};
constexpr FloatInfo kBinary64 = {52, 11, 1023};

static_assert(kBinary64.MinExponent() == -1074, "internal error");
static_assert(kBinary64.MaxExponent() ==   971, "internal error");
static_assert(kBinary64.MaxDecimalPower() ==  309, "internal error");
static_assert(kBinary64.MinDecimalPower() == -324, "internal error");
static_assert(kBinary32.MaxDecimalPower() ==   39, "internal error");
static_assert(kBinary32.MinDecimalPower() ==  -46, "internal error");

// Returns whether the decimal to binary conversion supports the given format.
//
// The conversion works with 64-bit approximations and a bignum whose capacity
// is derived from the binary64 range. It therefore supports formats with at
// most 53 significant bits whose finite range lies within the range of binary64.
inline constexpr bool IsSupportedFormat(FloatInfo const& info)
{
    return info.mantissa_bits >= 1
        && info.mantissa_bits <= kBinary64.mantissa_bits
        && info.exponent_bits >= 2
        && info.exponent_bits <= kBinary64.exponent_bits
        && info.MinExponent() >= kBinary64.MinExponent()
        && info.MaxExponent() + info.SignificandSize() <= kBinary64.MaxExponent() + kBinary64.SignificandSize()
        && info.MaxExponent() >= info.MinExponent();
}

static_assert(IsSupportedFormat(kBinary16), "internal error");
static_assert(IsSupportedFormat(kBFloat16), "internal error");
static_assert(IsSupportedFormat(kBinary32), "internal error");
static_assert(IsSupportedFormat(kBinary64), "internal error");

//==================================================================================================
// BinaryValue
//
// A bit pattern encoded in the format described by `info`.
//==================================================================================================

struct BinaryValue
{
    FloatInfo info;
    uint64_t  bits;

    constexpr BinaryValue(FloatInfo const& info_, uint64_t bits_) : info(info_), bits(bits_) {}

    uint64_t PhysicalSignificand() const {
        return bits & info.SignificandMask();
    }

    uint64_t PhysicalExponent() const {
        return (bits & info.ExponentMask()) >> info.mantissa_bits;
    }

    bool IsFinite() const {
        return (bits & info.ExponentMask()) != info.ExponentMask();
    }

    bool IsInf() const {
        return (bits & info.ExponentMask()) == info.ExponentMask() && (bits & info.SignificandMask()) == 0;
    }

    bool IsNaN() const {
        return (bits & info.ExponentMask()) == info.ExponentMask() && (bits & info.SignificandMask()) != 0;
    }

    bool IsZero() const {
        return (bits & ~info.SignMask()) == 0;
    }

    bool SignBit() const {
        return (bits & info.SignMask()) != 0;
    }

    // Returns the next larger value.
    // If the value is +Infinity returns the value.
    // The successor of the largest finite value is +Infinity.
    BinaryValue NextValue() const {
        NUMLIT_ASSERT(!SignBit());
        NUMLIT_ASSERT(!IsNaN());
        return BinaryValue(info, IsInf() ? bits : bits + 1);
    }
};

inline double BitsToDouble(uint64_t bits)
{
    return impl::ReinterpretBits<double>(bits);
}

inline uint64_t DoubleToBits(double value)
{
    return impl::ReinterpretBits<uint64_t>(value);
}

inline float BitsToSingle(uint64_t bits)
{
    NUMLIT_ASSERT(bits <= UINT32_MAX);
    return impl::ReinterpretBits<float>(static_cast<uint32_t>(bits));
}

inline uint64_t SingleToBits(float value)
{
    return impl::ReinterpretBits<uint32_t>(value);
}

} // namespace numlit
