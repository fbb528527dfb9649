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

#include "decimal.h"

using numlit::ScanResult;
using numlit::ScanStatus;
using numlit::impl::IsDigit;
using numlit::impl::DigitValue;

// Skips a single digit separator, if the separator is followed by a digit.
// PRE: The character before `next` is a digit.
static inline char const* SkipSeparator(char const* next, char const* last)
{
    if (last - next >= 2 && next[0] == numlit::kDigitSeparator && IsDigit(next[1]))
        return next + 1;

    return next;
}

ScanResult numlit::ScanDecimal(char const* first, char const* last, Decimal& decimal)
{
    char const* curr = first;

    int     sign         = +1;
    int     num_digits   = 0;
    int64_t exponent     = 0;
    bool    nonzero_tail = false;
    bool    has_digits   = false;

    if (curr == last)
        return {curr, ScanStatus::syntax_error};

// [-+]

    if (*curr == '-')
    {
        sign = -1;
        ++curr;
    }
    else if (*curr == '+')
    {
        ++curr;
    }

// int

    while (curr != last && IsDigit(*curr))
    {
        has_digits = true;

        if (num_digits == 0 && *curr == '0')
        {
            // Leading zero. Not a significant digit.
        }
        else if (num_digits < kMaxSignificantDigits)
        {
            decimal.digits[num_digits++] = *curr;
        }
        else
        {
            // Drop the digit, but keep its place value.
            ++exponent;
            nonzero_tail = nonzero_tail || *curr != '0';
        }

        ++curr;
        curr = SkipSeparator(curr, last);
    }

// frac

    if (curr != last && *curr == '.')
    {
        ++curr;

        // There is a fractional part.
        // We don't store a '.', but adjust the exponent instead.
        while (curr != last && IsDigit(*curr))
        {
            has_digits = true;

            if (num_digits == 0 && *curr == '0')
            {
                // Number is of the form "0.000xxx".
                // Move this zero into the exponent.
                --exponent;
            }
            else if (num_digits < kMaxSignificantDigits)
            {
                decimal.digits[num_digits++] = *curr;
                --exponent;
            }
            else
            {
                nonzero_tail = nonzero_tail || *curr != '0';
            }

            ++curr;
            curr = SkipSeparator(curr, last);
        }
    }

    if (!has_digits)
    {
        // At least one digit must appear in either the integral or the fractional part.
        return {curr, ScanStatus::syntax_error};
    }

// exp

    if (curr != last && (*curr == 'e' || *curr == 'E'))
    {
        ++curr;

        bool const exp_is_neg = (curr != last && *curr == '-');
        if (curr != last && (*curr == '-' || *curr == '+'))
        {
            ++curr;
        }

        if (curr == last || !IsDigit(*curr))
        {
            return {curr, ScanStatus::syntax_error};
        }

        // Exponents larger than kMaxExplicitExponent are clamped.
        // But we must still scan all the digits if this happens to be the case.
        int64_t num = 0;
        while (curr != last && IsDigit(*curr))
        {
            if (num <= kMaxExplicitExponent)
                num = 10 * num + DigitValue(*curr);

            ++curr;
            curr = SkipSeparator(curr, last);
        }

        exponent += exp_is_neg ? -num : num;
    }

    if (curr != last)
    {
        // Trailing garbage.
        return {curr, ScanStatus::syntax_error};
    }

    // Move trailing zeros into the exponent.
    // If the input has been truncated, these zeros are followed by a non-zero
    // digit and must stay where they are.
    if (!nonzero_tail)
    {
        while (num_digits > 0 && decimal.digits[num_digits - 1] == '0')
        {
            --num_digits;
            ++exponent;
        }
    }

    if (num_digits == 0)
    {
        NUMLIT_ASSERT(!nonzero_tail);
        exponent = 0;
    }

    decimal.num_digits = num_digits;
    decimal.exponent   = exponent;
    decimal.sign       = sign;
    decimal.truncated  = nonzero_tail;

    return {curr, ScanStatus::ok};
}
