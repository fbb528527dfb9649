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

#include "special_value.h"

static inline bool IsLowerASCII(char ch)
{
    return 'a' <= ch && ch <= 'z';
}

static inline char ToLowerASCII(char ch)
{
    return static_cast<char>(static_cast<unsigned char>(ch) | 0x20);
}

// Returns whether [next, last) equals `lower_case_word`, ignoring case.
// Only ASCII letters are folded. Since `lower_case_word` consists of letters
// only, (ch | 0x20) matches if and only if ch is the same letter in either case.
static inline bool EqualsIgnoreCase(char const* next, char const* last, char const* lower_case_word)
{
    for ( ; next != last && *lower_case_word != '\0'; ++next, ++lower_case_word)
    {
        NUMLIT_ASSERT(IsLowerASCII(*lower_case_word));
        if (ToLowerASCII(*next) != *lower_case_word)
            return false;
    }

    return next == last && *lower_case_word == '\0';
}

bool numlit::ParseSpecial(char const* first, char const* last, FloatInfo const& info, uint64_t& bits)
{
    if (first == last)
        return false;

    bool const is_negative = (*first == '-');
    if (is_negative || *first == '+')
    {
        ++first;
    }

    uint64_t magnitude;
    if (EqualsIgnoreCase(first, last, "inf") || EqualsIgnoreCase(first, last, "infinity"))
    {
        magnitude = info.InfinityBits();
    }
    else if (EqualsIgnoreCase(first, last, "nan"))
    {
        // The sign of the literal is kept in the sign bit of the NaN.
        magnitude = info.QuietNaNBits();
    }
    else
    {
        return false;
    }

    bits = is_negative ? (magnitude | info.SignMask()) : magnitude;
    return true;
}
