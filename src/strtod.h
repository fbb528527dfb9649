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

enum class ParseStatus {
    ok,
    syntax_error,
    // The value is too large for the target format.
    range_error,
};

struct ParseResult
{
    char const* next;
    ParseStatus status;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == ParseStatus::ok;
    }
};

// Parses the floating-point literal [first, last) and converts it into the
// nearest value representable in the format described by `info`, using
// round-to-nearest, ties-to-even.
//
//      literal  := special | numeral
//      special  := ["+"|"-"] ("inf" | "infinity" | "nan")      (case-insensitive)
//      numeral  := ["+"|"-"] mantissa [exponent]
//      mantissa := digits ["." [digits]] | "." digits
//      exponent := ("e"|"E") ["+"|"-"] digits
//      digits   := digit {["_"] digit}
//
// The whole input must match. Leading or trailing whitespace is not allowed.
//
// On success `next` is `last`.
// On syntax_error `next` points to the offending character and `bits` is not
// modified.
// On range_error `bits` is set to the correctly signed infinity.
//
// PRE: IsSupportedFormat(info)
ParseResult ParseFloat(char const* first, char const* last, FloatInfo const& info, uint64_t& bits);

// Parses an IEEE double-precision number.
ParseResult ParseDouble(char const* first, char const* last, double& value);

// Parses an IEEE single-precision number.
ParseResult ParseSingle(char const* first, char const* last, float& value);

} // namespace numlit
