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

#include "float_info.h"

#include <cstdint>

namespace numlit {

// Maximum number of significant digits in decimal representation.
//
// The longest possible double in decimal representation is (2^53 - 1) * 5^1074 / 10^1074,
// which has 767 digits.
// If we parse a number whose first digits are equal to a mean of 2 adjacent doubles (that
// could have up to 768 digits) the result must be rounded to the bigger one unless the tail
// consists of zeros, so we don't need to preserve all the digits.
// All supported formats are subsets of binary64, so this bound works for them, too.
constexpr int kMaxSignificantDigits = 767 + 1;

// Explicit exponents are accumulated up to this value. Larger exponents are
// clamped. Any input which could shift the decimal point by more than this
// many places would not fit into memory.
constexpr int64_t kMaxExplicitExponent = 1000000000000000; // 10^15

constexpr char kDigitSeparator = '_';

namespace impl {

inline bool IsDigit(char ch)
{
    return '0' <= ch && ch <= '9';
}

inline int DigitValue(char ch)
{
    NUMLIT_ASSERT(IsDigit(ch));
    return ch - '0';
}

} // namespace impl

//==================================================================================================
// Decimal
//
// value = sign * digits * 10^exponent
//==================================================================================================

struct Decimal
{
    char    digits[kMaxSignificantDigits]; // ASCII '0'...'9'
    int     num_digits = 0;
    int64_t exponent   = 0;
    int     sign       = +1;
    // Set if non-zero digits have been discarded after the last digit in `digits`.
    bool    truncated  = false;

    Decimal() = default;
    Decimal(Decimal const&) = delete;             // (not needed here)
    Decimal& operator=(Decimal const&) = delete;  // (not needed here)

    bool IsZero() const {
        return num_digits == 0;
    }
};

enum class ScanStatus {
    ok,
    syntax_error,
};

struct ScanResult
{
    char const* next;
    ScanStatus  status;

    explicit operator bool() const noexcept
    {
        return status == ScanStatus::ok;
    }
};

// Parses the numeral
//
//      numeral  := ["+"|"-"] mantissa [exponent]
//      mantissa := digits ["." [digits]] | "." digits
//      exponent := ("e"|"E") ["+"|"-"] digits
//      digits   := digit {["_"] digit}
//
// and stores its value in `decimal`.
//
// The result is normalized: `digits` has no leading zeros and, unless the
// input has been truncated, no trailing zeros. A zero value has no digits and
// exponent 0.
//
// The whole input [first, last) must match. Otherwise the function returns
// ScanStatus::syntax_error and `next` points to the first character which
// does not match.
ScanResult ScanDecimal(char const* first, char const* last, Decimal& decimal);

} // namespace numlit
