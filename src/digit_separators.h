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

namespace numlit {

// Checks the placement of the digit separators ('_') in the literal
// [first, last).
//
// A separator is legal only if both its predecessor and its successor are
// decimal digits. Hence separators cannot appear first or last, next to a
// sign, a decimal point or an exponent marker, and they cannot be doubled.
//
// This is a structural scan of the whole literal. It does not know about the
// integral, fractional and exponent parts.
//
// Returns a pointer to the first illegal separator, or `last` if all
// separators are legal.
char const* FindInvalidSeparator(char const* first, char const* last);

inline bool HasValidSeparators(char const* first, char const* last)
{
    return FindInvalidSeparator(first, last) == last;
}

} // namespace numlit
