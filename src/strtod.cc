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

#include "strtod.h"

#include "decimal.h"
#include "decimal_to_binary.h"
#include "digit_separators.h"
#include "special_value.h"

using numlit::ConversionStatus;
using numlit::Decimal;
using numlit::FloatInfo;
using numlit::ParseResult;
using numlit::ParseStatus;

ParseResult numlit::ParseFloat(char const* first, char const* last, FloatInfo const& info, uint64_t& bits)
{
    NUMLIT_ASSERT(IsSupportedFormat(info));
    NUMLIT_ASSERT(first <= last);

    if (ParseSpecial(first, last, info, bits))
        return {last, ParseStatus::ok};

    char const* const bad_separator = FindInvalidSeparator(first, last);
    if (bad_separator != last)
        return {bad_separator, ParseStatus::syntax_error};

    Decimal decimal;

    auto const scan = ScanDecimal(first, last, decimal);
    if (!scan)
        return {scan.next, ParseStatus::syntax_error};

    NUMLIT_ASSERT(scan.next == last);

    uint64_t result;
    auto const status = DecimalToBinary(decimal, info, result);

    // On range_error the result is the signed infinity.
    bits = result;

    return {last, (status == ConversionStatus::ok) ? ParseStatus::ok : ParseStatus::range_error};
}

ParseResult numlit::ParseDouble(char const* first, char const* last, double& value)
{
    uint64_t bits;

    auto const res = ParseFloat(first, last, kBinary64, bits);
    if (res.status != ParseStatus::syntax_error)
    {
        value = BitsToDouble(bits);
    }

    return res;
}

ParseResult numlit::ParseSingle(char const* first, char const* last, float& value)
{
    uint64_t bits;

    auto const res = ParseFloat(first, last, kBinary32, bits);
    if (res.status != ParseStatus::syntax_error)
    {
        value = BitsToSingle(bits);
    }

    return res;
}
