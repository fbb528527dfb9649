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

#include "decimal.h"
#include "float_info.h"

#include <cstdint>

namespace numlit {

enum class ConversionStatus {
    ok,
    // The value is larger than the largest finite value of the target format
    // and does not round down to it.
    range_error,
};

// Converts `decimal` into the nearest value representable in the format
// described by `info`, using round-to-nearest, ties-to-even.
//
// Zero and values which round to zero produce a signed zero. There is no
// underflow error. Values which would round beyond the largest finite value
// produce ConversionStatus::range_error; in this case `bits` is set to the
// signed infinity.
//
// PRE: IsSupportedFormat(info)
// PRE: `decimal` is normalized, i.e. as produced by ScanDecimal.
ConversionStatus DecimalToBinary(Decimal const& decimal, FloatInfo const& info, uint64_t& bits);

// Convert the decimal representation 'digits * 10^exponent' into an IEEE
// double-precision number.
// If `nonzero_tail` is true, the digits are followed by more non-zero digits,
// i.e. the value is slightly larger than 'digits * 10^exponent'.
// Values too large for a double are converted to +Infinity.
//
// PRE: digits must contain only ASCII characters in the range '0'...'9'.
// PRE: num_digits >= 0
double DecimalToDouble(char const* digits, int num_digits, int exponent, bool nonzero_tail = false);

} // namespace numlit
