#include <catch2/catch.hpp>

#include "strtod.h"

#include <double-conversion/double-conversion.h>

#include <cstdint>
#include <cstring>
#include <random>
#include <string>

// Use the double-conversion library as a reference implementation.

static float StringToSingle(char const* str, char const* end)
{
    double_conversion::StringToDoubleConverter conv(0, 0.0, 0.0, "inf", "nan");

    int processed_characters_count = 0;
    return conv.StringToFloat(str, static_cast<int>(end - str), &processed_characters_count);
}

static double StringToDouble(char const* str, char const* end)
{
    double_conversion::StringToDoubleConverter conv(0, 0.0, 0.0, "inf", "nan");

    int processed_characters_count = 0;
    return conv.StringToDouble(str, static_cast<int>(end - str), &processed_characters_count);
}

template <typename Target, typename Source>
static Target ReinterpretBits(Source source)
{
    static_assert(sizeof(Target) == sizeof(Source), "size mismatch");

    Target target;
    std::memcpy(&target, &source, sizeof(Source));
    return target;
}

static std::string RandomDecimal(std::mt19937& rng, int max_digits, int min_exponent, int max_exponent)
{
    std::uniform_int_distribution<int> gen_len(1, max_digits);
    std::uniform_int_distribution<int> gen_digit(0, 9);
    std::uniform_int_distribution<int> gen_exp(min_exponent, max_exponent);

    std::string str;

    int const len = gen_len(rng);
    str.push_back(static_cast<char>('1' + gen_digit(rng) % 9));
    for (int i = 1; i < len; ++i)
    {
        str.push_back(static_cast<char>('0' + gen_digit(rng)));
    }

    str += 'e';
    str += std::to_string(gen_exp(rng));

    return str;
}

static void CheckDouble(std::string const& str)
{
    char const* first = str.data();
    char const* last  = str.data() + str.size();

    double value = 0;
    auto const res = numlit::ParseDouble(first, last, value);
    REQUIRE(res.status != numlit::ParseStatus::syntax_error);
    CHECK(res.next == last);

    double const expected = StringToDouble(first, last);

    INFO(str);
    CHECK(ReinterpretBits<uint64_t>(expected) == ReinterpretBits<uint64_t>(value));
}

static void CheckSingle(std::string const& str)
{
    char const* first = str.data();
    char const* last  = str.data() + str.size();

    float value = 0;
    auto const res = numlit::ParseSingle(first, last, value);
    REQUIRE(res.status != numlit::ParseStatus::syntax_error);
    CHECK(res.next == last);

    float const expected = StringToSingle(first, last);

    INFO(str);
    CHECK(ReinterpretBits<uint32_t>(expected) == ReinterpretBits<uint32_t>(value));
}

TEST_CASE("Oracle - random decimals binary64")
{
    std::mt19937 rng;

    for (int i = 0; i < 100000; ++i)
    {
        CheckDouble(RandomDecimal(rng, 20, -345, 310));
    }

    for (int i = 0; i < 10000; ++i)
    {
        CheckDouble(RandomDecimal(rng, 800, -1100, 310));
    }
}

TEST_CASE("Oracle - random decimals binary32")
{
    std::mt19937 rng;

    for (int i = 0; i < 100000; ++i)
    {
        CheckSingle(RandomDecimal(rng, 12, -55, 40));
    }
}

TEST_CASE("Oracle - shortest round trip")
{
    using double_conversion::DoubleToStringConverter;
    using double_conversion::StringBuilder;

    auto const& d2s = DoubleToStringConverter::EcmaScriptConverter();

    std::mt19937_64 rng;
    std::uniform_int_distribution<uint64_t> gen(0, (uint64_t{1} << 63) - (uint64_t{1} << 52) - 1); // finite, non-negative

    for (int i = 0; i < 100000; ++i)
    {
        double const value = ReinterpretBits<double>(gen(rng));

        char buf[128];
        StringBuilder builder(buf, sizeof(buf));
        REQUIRE(d2s.ToShortest(value, &builder));
        int const len = builder.position();
        builder.Finalize();

        double value2 = 0;
        auto const res = numlit::ParseDouble(buf, buf + len, value2);
        INFO(buf);
        CHECK(res.status == numlit::ParseStatus::ok);
        CHECK(ReinterpretBits<uint64_t>(value) == ReinterpretBits<uint64_t>(value2));
    }
}
