#include "benchmark/benchmark.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "strtod.h"

#define BENCH_NUMLIT()              1
#define BENCH_STD_STRTOD()          1
#ifndef NUMLIT_BENCH_DOUBLE_CONVERSION
#define NUMLIT_BENCH_DOUBLE_CONVERSION 0
#endif

static constexpr int NumFloats = 1 << 14;

#if BENCH_NUMLIT()
struct S2DNumlit
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        value_type flt = 0;
        auto const res = numlit::ParseDouble(str.data(), str.data() + str.size(), flt);
        if (res.status == numlit::ParseStatus::syntax_error)
            std::abort();
        return flt;
    }
};

struct S2FNumlit
{
    using value_type = float;

    value_type operator()(std::string const& str) const
    {
        value_type flt = 0;
        auto const res = numlit::ParseSingle(str.data(), str.data() + str.size(), flt);
        if (res.status == numlit::ParseStatus::syntax_error)
            std::abort();
        return flt;
    }
};
#endif

#if BENCH_STD_STRTOD()
struct S2DStdStrtod
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        value_type flt = std::strtod(str.c_str(), nullptr);
        return flt;
    }
};

struct S2FStdStrtof
{
    using value_type = float;

    value_type operator()(std::string const& str) const
    {
        value_type flt = std::strtof(str.c_str(), nullptr);
        return flt;
    }
};
#endif

#if NUMLIT_BENCH_DOUBLE_CONVERSION
#include "double-conversion/double-conversion.h"
struct S2DDoubleConversion
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2d.StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
    }
};
#endif

template <typename Converter>
static void BenchIt(benchmark::State& state, std::vector<std::string> const& numbers)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(numbers[index]) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(std::string const& name, std::vector<std::string> const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(name.c_str(), BenchIt<Converter>, numbers);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->ReportAggregatesOnly();
}

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        uint32_t const e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom bench_random;

static std::string Format(char const* format, double value)
{
    char buf[128];
    int const len = std::snprintf(buf, sizeof(buf), format, value);
    return std::string(buf, buf + len);
}

static void RegisterUniform_double(char const* name, double min, double max, char const* format = "%.17g")
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);

    std::generate(numbers.begin(), numbers.end(), [&] {
        return Format(format, gen(bench_random));
    });

    std::string const prefix = std::string(name) + " ";

#if BENCH_NUMLIT()
    RegisterBenchmarks<S2DNumlit          >(prefix + "numlit            ", numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2DStdStrtod       >(prefix + "std::strtod       ", numbers);
#endif
#if NUMLIT_BENCH_DOUBLE_CONVERSION
    RegisterBenchmarks<S2DDoubleConversion>(prefix + "double_conversion ", numbers);
#endif
}

static void RegisterUniform_float(char const* name, float min, float max)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_real_distribution<float> gen(min, max);

    std::generate(numbers.begin(), numbers.end(), [&] {
        return Format("%.9g", static_cast<double>(gen(bench_random)));
    });

    std::string const prefix = std::string(name) + " ";

#if BENCH_NUMLIT()
    RegisterBenchmarks<S2FNumlit   >(prefix + "numlit (single)   ", numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2FStdStrtof>(prefix + "std::strtof       ", numbers);
#endif
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", 0, 1);

    RegisterUniform_double("uniform [0,1]", 0.0, 1.0);
    RegisterUniform_double("uniform [1,2]", 1.0, 2.0);
    RegisterUniform_double("uniform [8,2^10]", 8.0, 1ll << 10);
    RegisterUniform_double("uniform [2^20,2^50]", 1ll << 20, 1ll << 50);
    RegisterUniform_double("uniform [0,max]", 0.0, std::numeric_limits<double>::max());
    RegisterUniform_double("short [0,1]", 0.0, 1.0, "%.6g");
    RegisterUniform_double("long [0,1]", 0.0, 1.0, "%.40e");

    RegisterUniform_float("uniform [0,1]", 0.0f, 1.0f);
    RegisterUniform_float("uniform [0,max]", 0.0f, std::numeric_limits<float>::max());

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
