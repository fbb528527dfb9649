#include <catch2/catch.hpp>

#include "decimal.h"
#include "digit_separators.h"
#include "special_value.h"

#include <string>

//==================================================================================================
// ScanDecimal
//==================================================================================================

struct ScannedDecimal
{
    bool        ok = false;
    int         next = -1;
    std::string digits;
    int64_t     exponent = 0;
    int         sign = 0;
    bool        truncated = false;
};

static ScannedDecimal Scan(std::string const& str)
{
    numlit::Decimal decimal;

    auto const res = numlit::ScanDecimal(str.data(), str.data() + str.size(), decimal);

    ScannedDecimal r;
    r.ok   = static_cast<bool>(res);
    r.next = static_cast<int>(res.next - str.data());
    if (r.ok)
    {
        r.digits    = std::string(decimal.digits, decimal.digits + decimal.num_digits);
        r.exponent  = decimal.exponent;
        r.sign      = decimal.sign;
        r.truncated = decimal.truncated;
    }

    return r;
}

TEST_CASE("ScanDecimal - normalization")
{
    auto check = [](std::string const& input, std::string const& digits, int64_t exponent, int sign = +1)
    {
        auto const r = Scan(input);
        CHECK(r.ok);
        CHECK(r.next == static_cast<int>(input.size()));
        CHECK(r.digits == digits);
        CHECK(r.exponent == exponent);
        CHECK(r.sign == sign);
        CHECK(!r.truncated);
    };

    check("0", "", 0);
    check("-0", "", 0, -1);
    check("+0", "", 0);
    check("000.000e+123", "", 0);
    check("-0e-99999999999999999999999999", "", 0, -1);
    check("1", "1", 0);
    check("+1", "1", 0);
    check("-1", "1", 0, -1);
    check("00123", "123", 0);
    check("1230", "123", 1);
    check("123000e-3", "123", 0);
    check("1.5", "15", -1);
    check("1.50", "15", -1);
    check("0.015", "15", -3);
    check(".015", "15", -3);
    check("1.", "1", 0);
    check("10.", "1", 1);
    check("1.25e2", "125", 0);
    check("1.25E-2", "125", -4);
    check("100.001", "100001", -3);
    check("1_23.50_0_0e+1_2", "1235", 11);
    check("9_9_9", "999", 0);
}

TEST_CASE("ScanDecimal - huge exponents are clamped")
{
    auto const huge = Scan("1e" + std::string(50000, '9'));
    CHECK(huge.ok);
    CHECK(huge.digits == "1");
    CHECK(huge.exponent > 1000000000000000);

    auto const tiny = Scan("1e-" + std::string(50000, '9'));
    CHECK(tiny.ok);
    CHECK(tiny.digits == "1");
    CHECK(tiny.exponent < -1000000000000000);

    auto const zero = Scan("0e" + std::string(50000, '9'));
    CHECK(zero.ok);
    CHECK(zero.digits.empty());
    CHECK(zero.exponent == 0);

    auto const leading_zeros = Scan("1e" + std::string(50000, '0') + "7");
    CHECK(leading_zeros.ok);
    CHECK(leading_zeros.exponent == 7);
}

TEST_CASE("ScanDecimal - long mantissas")
{
    int const cap = numlit::kMaxSignificantDigits;

    // Zeros are never significant.
    auto const zeros = Scan("1" + std::string(10000, '0'));
    CHECK(zeros.ok);
    CHECK(zeros.digits == "1");
    CHECK(zeros.exponent == 10000);
    CHECK(!zeros.truncated);

    auto const frac_zeros = Scan("0." + std::string(10000, '0') + "1");
    CHECK(frac_zeros.ok);
    CHECK(frac_zeros.digits == "1");
    CHECK(frac_zeros.exponent == -10001);

    // Digits beyond the cap are tracked by the sticky flag.
    std::string const ones(cap, '1');

    auto const exact = Scan(ones + "000");
    CHECK(exact.ok);
    CHECK(exact.digits == ones);
    CHECK(exact.exponent == 3);
    CHECK(!exact.truncated);

    auto const sticky = Scan(ones + "001");
    CHECK(sticky.ok);
    CHECK(sticky.digits == ones);
    CHECK(sticky.exponent == 3);
    CHECK(sticky.truncated);

    auto const sticky_frac = Scan(ones + ".001");
    CHECK(sticky_frac.ok);
    CHECK(sticky_frac.digits == ones);
    CHECK(sticky_frac.exponent == 0);
    CHECK(sticky_frac.truncated);

    // Trailing zeros are kept if the input has been truncated.
    std::string const padded = "1" + std::string(cap - 1, '0');
    auto const tail = Scan(padded + "1");
    CHECK(tail.ok);
    CHECK(static_cast<int>(tail.digits.size()) == cap);
    CHECK(tail.exponent == 1);
    CHECK(tail.truncated);
}

TEST_CASE("ScanDecimal - syntax errors")
{
    auto check = [](std::string const& input, int next)
    {
        auto const r = Scan(input);
        CHECK(!r.ok);
        CHECK(r.next == next);
    };

    check("", 0);
    check("-", 1);
    check("+-1", 1);
    check(".", 1);
    check("e5", 0);
    check(".e5", 1);
    check("1e", 2);
    check("1e+", 3);
    check("1x", 1);
    check("1.2.3", 3);
    check("1e5.0", 3);
    check("inf", 0);
    // A separator is only skipped if it is followed by a digit.
    check("1__2", 1);
    check("1_", 1);
}

TEST_CASE("ScanDecimal - output is not modified on error")
{
    numlit::Decimal decimal;
    decimal.num_digits = 3;
    decimal.exponent = 7;

    std::string const input = "12x";
    auto const res = numlit::ScanDecimal(input.data(), input.data() + input.size(), decimal);
    CHECK(!res);
    CHECK(decimal.num_digits == 3);
    CHECK(decimal.exponent == 7);
}

//==================================================================================================
// FindInvalidSeparator
//==================================================================================================

TEST_CASE("FindInvalidSeparator")
{
    auto find = [](std::string const& input)
    {
        char const* first = input.data();
        char const* last  = input.data() + input.size();
        char const* pos   = numlit::FindInvalidSeparator(first, last);
        return (pos == last) ? -1 : static_cast<int>(pos - first);
    };

    CHECK(find("") == -1);
    CHECK(find("123") == -1);
    CHECK(find("1_2") == -1);
    CHECK(find("1_23.50_0_0e+1_2") == -1);
    CHECK(find("-1_000_000") == -1);

    CHECK(find("_") == 0);
    CHECK(find("_1") == 0);
    CHECK(find("1_") == 1);
    CHECK(find("1__23.5e+12") == 1);
    CHECK(find("123_.5e+12") == 3);
    CHECK(find("_123.5e+12") == 0);
    CHECK(find("123.5e+12_") == 9);
    CHECK(find("-_1") == 1);
    CHECK(find("1._5") == 2);
    CHECK(find("1e_5") == 2);
    CHECK(find("1_e5") == 1);
    CHECK(find("1e+_5") == 3);
    CHECK(find("1_2_") == 3);

    // Not grammar-aware.
    CHECK(find("x1_2x") == -1);

    CHECK(numlit::HasValidSeparators("1_2", "1_2" + 3));
    CHECK(!numlit::HasValidSeparators("1__2", "1__2" + 4));
}

//==================================================================================================
// ParseSpecial
//==================================================================================================

TEST_CASE("ParseSpecial")
{
    auto parse = [](std::string const& input, numlit::FloatInfo const& info, uint64_t& bits)
    {
        return numlit::ParseSpecial(input.data(), input.data() + input.size(), info, bits);
    };

    uint64_t bits = 0;

    CHECK(parse("inf", numlit::kBinary64, bits));
    CHECK(bits == 0x7FF0000000000000);
    CHECK(parse("INF", numlit::kBinary64, bits));
    CHECK(bits == 0x7FF0000000000000);
    CHECK(parse("+Infinity", numlit::kBinary64, bits));
    CHECK(bits == 0x7FF0000000000000);
    CHECK(parse("-INFINITY", numlit::kBinary64, bits));
    CHECK(bits == 0xFFF0000000000000);
    CHECK(parse("nan", numlit::kBinary64, bits));
    CHECK(bits == 0x7FF8000000000000);
    CHECK(parse("-NaN", numlit::kBinary64, bits));
    CHECK(bits == 0xFFF8000000000000);

    CHECK(parse("-inf", numlit::kBinary32, bits));
    CHECK(bits == 0xFF800000);
    CHECK(parse("NAN", numlit::kBinary32, bits));
    CHECK(bits == 0x7FC00000);
    CHECK(parse("Inf", numlit::kBinary16, bits));
    CHECK(bits == 0x7C00);
    CHECK(parse("-nan", numlit::kBinary16, bits));
    CHECK(bits == 0xFE00);
    CHECK(parse("infinity", numlit::kBFloat16, bits));
    CHECK(bits == 0x7F80);

    bits = 12345;
    CHECK(!parse("", numlit::kBinary64, bits));
    CHECK(!parse("-", numlit::kBinary64, bits));
    CHECK(!parse("in", numlit::kBinary64, bits));
    CHECK(!parse("infinit", numlit::kBinary64, bits));
    CHECK(!parse("infinity2", numlit::kBinary64, bits));
    CHECK(!parse("infinityinfinity", numlit::kBinary64, bits));
    CHECK(!parse("nan(1)", numlit::kBinary64, bits));
    CHECK(!parse("nana", numlit::kBinary64, bits));
    CHECK(!parse("--inf", numlit::kBinary64, bits));
    CHECK(!parse("+-nan", numlit::kBinary64, bits));
    CHECK(!parse(" inf", numlit::kBinary64, bits));
    CHECK(!parse("inf ", numlit::kBinary64, bits));
    CHECK(!parse("1", numlit::kBinary64, bits));
    CHECK(!parse("\xC9nf", numlit::kBinary64, bits));
    CHECK(bits == 12345);
}
