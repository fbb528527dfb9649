#include <catch2/catch.hpp>

#include "decimal_to_binary.h"
#include "float_info.h"
#include "strtod.h"

#include <cmath>
#include <cstdio>
#include <cstring>
#include <limits>
#include <string>

//==================================================================================================
// FloatInfo
//==================================================================================================

TEST_CASE("FloatInfo - binary64")
{
    constexpr auto info = numlit::kBinary64;

    CHECK(info.SignificandSize() == 53);
    CHECK(info.MinExponent() == -1074);
    CHECK(info.MaxExponent() == 971);
    CHECK(info.HiddenBit() == 0x0010000000000000);
    CHECK(info.SignificandMask() == 0x000FFFFFFFFFFFFF);
    CHECK(info.ExponentMask() == 0x7FF0000000000000);
    CHECK(info.SignMask() == 0x8000000000000000);
    CHECK(info.InfinityBits() == 0x7FF0000000000000);
    CHECK(info.QuietNaNBits() == 0x7FF8000000000000);
    CHECK(info.MaxFiniteBits() == 0x7FEFFFFFFFFFFFFF);
    CHECK(info.MaxDecimalPower() == 309);
    CHECK(info.MinDecimalPower() == -324);
}

TEST_CASE("FloatInfo - small formats")
{
    CHECK(numlit::kBinary32.MinExponent() == -149);
    CHECK(numlit::kBinary32.MaxExponent() == 104);
    CHECK(numlit::kBinary32.MaxFiniteBits() == 0x7F7FFFFF);
    CHECK(numlit::kBinary32.MaxDecimalPower() == 39);
    CHECK(numlit::kBinary32.MinDecimalPower() == -46);

    CHECK(numlit::kBinary16.MinExponent() == -24);
    CHECK(numlit::kBinary16.MaxExponent() == 5);
    CHECK(numlit::kBinary16.MaxFiniteBits() == 0x7BFF);
    CHECK(numlit::kBinary16.MaxDecimalPower() == 5);
    CHECK(numlit::kBinary16.MinDecimalPower() == -8);

    CHECK(numlit::kBFloat16.MinExponent() == -133);
    CHECK(numlit::kBFloat16.MaxExponent() == 120);
    CHECK(numlit::kBFloat16.MaxFiniteBits() == 0x7F7F);
    CHECK(numlit::kBFloat16.MaxDecimalPower() == 39);
    CHECK(numlit::kBFloat16.MinDecimalPower() == -41);

    CHECK(numlit::kBinary16 != numlit::kBFloat16);
    CHECK(numlit::kBinary32 == numlit::FloatInfo{23, 8, 127});

    CHECK(!numlit::IsSupportedFormat(numlit::FloatInfo{63, 11, 1023}));
    CHECK(!numlit::IsSupportedFormat(numlit::FloatInfo{52, 12, 2047}));
    CHECK(!numlit::IsSupportedFormat(numlit::FloatInfo{10, 1, 0}));
}

TEST_CASE("BinaryValue")
{
    using numlit::BinaryValue;

    CHECK(BinaryValue(numlit::kBinary16, 0x7C00).IsInf());
    CHECK(BinaryValue(numlit::kBinary16, 0x7E00).IsNaN());
    CHECK(BinaryValue(numlit::kBinary16, 0x8000).IsZero());
    CHECK(BinaryValue(numlit::kBinary16, 0x8000).SignBit());
    CHECK(BinaryValue(numlit::kBinary16, 0x7BFF).IsFinite());
    CHECK(BinaryValue(numlit::kBinary16, 0x7BFF).PhysicalExponent() == 30);
    CHECK(BinaryValue(numlit::kBinary16, 0x7BFF).PhysicalSignificand() == 0x3FF);

    // The successor of the largest finite value is infinity.
    CHECK(BinaryValue(numlit::kBinary16, 0x7BFF).NextValue().IsInf());
    CHECK(BinaryValue(numlit::kBinary32, 0x7F7FFFFF).NextValue().bits == 0x7F800000);
    CHECK(BinaryValue(numlit::kBinary32, 0x7F800000).NextValue().bits == 0x7F800000);
    CHECK(BinaryValue(numlit::kBinary32, 0x007FFFFF).NextValue().bits == 0x00800000);
}

//==================================================================================================
// ParseFloat
//==================================================================================================

static uint64_t Parse(std::string const& str, numlit::FloatInfo const& info, numlit::ParseStatus expected = numlit::ParseStatus::ok)
{
    uint64_t bits = 0;
    auto const res = numlit::ParseFloat(str.data(), str.data() + str.size(), info, bits);
    CHECK(res.status == expected);
    CHECK(res.next == str.data() + str.size());
    return bits;
}

TEST_CASE("ParseFloat - binary16")
{
    auto const info = numlit::kBinary16;

    CHECK(0x0000 == Parse("0", info));
    CHECK(0x8000 == Parse("-0", info));
    CHECK(0x3C00 == Parse("1", info));
    CHECK(0x2E66 == Parse("0.1", info));
    CHECK(0x4248 == Parse("3.140625", info));

    // Ties-to-even. Above 2048 the spacing is 2.
    CHECK(0x6800 == Parse("2049", info));
    CHECK(0x6802 == Parse("2051", info));
    CHECK(0x6801 == Parse("2049.0000000000000000000000000000000000000001", info));

    // Largest finite value.
    CHECK(0x7BFF == Parse("65504", info));
    CHECK(0x7BFF == Parse("65519.99", info));
    CHECK(0x7C00 == Parse("65520", info, numlit::ParseStatus::range_error));
    CHECK(0xFC00 == Parse("-65520", info, numlit::ParseStatus::range_error));
    CHECK(0x7C00 == Parse("1e5", info, numlit::ParseStatus::range_error));

    // Smallest normal and subnormal values.
    CHECK(0x0400 == Parse("6.103515625e-5", info));
    CHECK(0x0001 == Parse("5.9604645e-8", info));
    CHECK(0x0000 == Parse("2.98023223876953125e-8", info));
    CHECK(0x0001 == Parse("2.98023223876953126e-8", info));
    CHECK(0x8000 == Parse("-1e-9", info));

    CHECK(0x7C00 == Parse("inf", info));
    CHECK(0x7E00 == Parse("NaN", info));
}

TEST_CASE("ParseFloat - bfloat16")
{
    auto const info = numlit::kBFloat16;

    CHECK(0x3F80 == Parse("1", info));
    CHECK(0x3DCD == Parse("0.1", info));
    CHECK(0x4380 == Parse("257", info));
    CHECK(0x4382 == Parse("259", info));

    CHECK(0x7F7F == Parse("3.3895313892515355e38", info));
    CHECK(0x7F7F == Parse("339617752923046005526922703901628039167", info));
    CHECK(0x7F80 == Parse("339617752923046005526922703901628039168", info, numlit::ParseStatus::range_error));
    CHECK(0x7F80 == Parse("3.4e38", info, numlit::ParseStatus::range_error));

    CHECK(0x0001 == Parse("9.1835e-41", info));
    CHECK(0x0000 == Parse("1e-41", info));
}

TEST_CASE("ParseFloat - binary32")
{
    auto const info = numlit::kBinary32;

    CHECK(0x3F800000 == Parse("1", info));
    CHECK(0x3DCCCCCD == Parse("0.1", info));
    CHECK(0x501502F9 == Parse("1e10", info));
    CHECK(0x2EDBE6FF == Parse("1e-10", info));

    // Ties-to-even.
    CHECK(0x4B800000 == Parse("16777217", info));
    CHECK(0x4B800002 == Parse("16777219", info));
    CHECK(0x4B000000 == Parse("8388608.5", info));
    CHECK(0x4C000000 == Parse("33554431", info));

    CHECK(0x00800000 == Parse("1.17549435e-38", info));
    CHECK(0x00000001 == Parse("1.401298464324817e-45", info));
    CHECK(0x00000000 == Parse("7.006492321624085e-46", info));
    CHECK(0x00000001 == Parse("7.006492321624086e-46", info));

    CHECK(0x7F7FFFFF == Parse("3.4028234663852886e38", info));
    CHECK(0x7F7FFFFF == Parse("340282356779733661637539395458142568447", info));
    CHECK(0x7F800000 == Parse("340282356779733661637539395458142568448", info, numlit::ParseStatus::range_error));
    CHECK(0xFF800000 == Parse("-1e39", info, numlit::ParseStatus::range_error));
}

TEST_CASE("ParseSingle")
{
    auto parse = [](std::string const& str)
    {
        float value = 0;
        auto const res = numlit::ParseSingle(str.data(), str.data() + str.size(), value);
        CHECK(res.status == numlit::ParseStatus::ok);
        return value;
    };

    CHECK(0.1f == parse("0.1"));
    CHECK(3.14159274f == parse("3.14159265358979323846"));
    CHECK(std::numeric_limits<float>::max() == parse("3.4028234663852886e38"));
    CHECK(std::numeric_limits<float>::min() == parse("1.17549435e-38"));
    CHECK(std::numeric_limits<float>::denorm_min() == parse("1.4e-45"));
    CHECK(std::isinf(parse("-Infinity")));
    CHECK(std::isnan(parse("nan")));

    // Round trip.
    float f = std::numeric_limits<float>::denorm_min();
    for (int i = 0; i < 300; ++i)
    {
        char buf[64];
        int const len = std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(f));
        CHECK(f == parse(std::string(buf, buf + len)));
        f *= 1.5f;
        if (std::isinf(f))
            break;
    }

    float value = 1.0f;
    std::string const input = "1e39";
    auto const res = numlit::ParseSingle(input.data(), input.data() + input.size(), value);
    CHECK(res.status == numlit::ParseStatus::range_error);
    CHECK(std::isinf(value));
}

//==================================================================================================
// DecimalToDouble
//==================================================================================================

static uint64_t BitsFromFloat(double f)
{
    uint64_t u;
    std::memcpy(&u, &f, sizeof(uint64_t));
    return u;
}

static double DecimalToDouble(std::string const& digits, int exponent, bool nonzero_tail = false)
{
    return numlit::DecimalToDouble(digits.data(), static_cast<int>(digits.size()), exponent, nonzero_tail);
}

TEST_CASE("DecimalToDouble")
{
    CHECK(0.0 == DecimalToDouble("", 0));
    CHECK(0.0 == DecimalToDouble("0000", 100));
    CHECK(1.0 == DecimalToDouble("1", 0));
    CHECK(1.0 == DecimalToDouble("0001000", -3));
    CHECK(0.1 == DecimalToDouble("1", -1));
    CHECK(1.7976931348623157e308 == DecimalToDouble("17976931348623157", 292));
    CHECK(std::isinf(DecimalToDouble("17976931348623159", 292)));
    CHECK(std::isinf(DecimalToDouble("1", 400)));
    CHECK(0.0 == DecimalToDouble("1", -400));
    CHECK(5e-324 == DecimalToDouble("5", -324));
    CHECK(0.0 == DecimalToDouble("2", -324));

    // The tail breaks ties.
    CHECK(0x44B52D02C7E14AF6 == BitsFromFloat(DecimalToDouble("1", 23)));
    CHECK(0x44B52D02C7E14AF7 == BitsFromFloat(DecimalToDouble("1", 23, true)));
    CHECK(0x44B52D02C7E14AF7 == BitsFromFloat(DecimalToDouble("100000000000000000000000", 0, true)));
    CHECK(0x4340000000000000 == BitsFromFloat(DecimalToDouble("9007199254740993", 0)));
    CHECK(0x4340000000000001 == BitsFromFloat(DecimalToDouble("9007199254740993", 0, true)));
    CHECK(0x0000000000000000 == BitsFromFloat(DecimalToDouble("24703282292062327208828439643411068618252990130716238221279284125033775363510437593264991818081799618989828234772285886546332835517796989819938739800539093906315035659515570226392290858392449105184435931802849936536152500319370457678249219365623669863658480757001585769269903706311928279558551332927834338409351978015531246597263579574622766465272827220056374006485499977096599470454020828166226237857393450736339007967761930577506740176324673600968951340535537458516661134223766678604162159680461914467291840300530057530849048765391711386591646239524912623653881879636239373280423891018672348497668235089863388587925628302755995657524455507255189313690836254779186948667994968324049705821028513185451396213837722826145437693412532098591327667236328125", -1075)));
    CHECK(0x0000000000000001 == BitsFromFloat(DecimalToDouble("24703282292062327208828439643411068618252990130716238221279284125033775363510437593264991818081799618989828234772285886546332835517796989819938739800539093906315035659515570226392290858392449105184435931802849936536152500319370457678249219365623669863658480757001585769269903706311928279558551332927834338409351978015531246597263579574622766465272827220056374006485499977096599470454020828166226237857393450736339007967761930577506740176324673600968951340535537458516661134223766678604162159680461914467291840300530057530849048765391711386591646239524912623653881879636239373280423891018672348497668235089863388587925628302755995657524455507255189313690836254779186948667994968324049705821028513185451396213837722826145437693412532098591327667236328125", -1075, true)));

    // More digits than can be retained.
    std::string const digits = "9007199254740993" + std::string(2000, '0');
    CHECK(0x4340000000000000 == BitsFromFloat(DecimalToDouble(digits, -2000)));
    CHECK(0x4340000000000001 == BitsFromFloat(DecimalToDouble(digits + "1", -2001)));
}
