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

// Recognizes the special values
//
//      special := ["+"|"-"] ("inf" | "infinity" | "nan")
//
// The comparison is case-insensitive (ASCII only). The whole input
// [first, last) must match; "infinity2" or "nan(1)" are not special values.
//
// Returns true and stores the (signed) infinity or quiet NaN in `bits` if the
// input is a special value. Otherwise returns false and leaves `bits` alone.
bool ParseSpecial(char const* first, char const* last, FloatInfo const& info, uint64_t& bits);

} // namespace numlit
