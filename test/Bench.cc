#include "../src/Padder.h"

#include "benchmark/benchmark.h"

#include <fmt/format.h>

#include <string>
#include <vector>

//------------------------------------------------------------------------------
//
//------------------------------------------------------------------------------

static constexpr char const* kStr10    = "hej";
static constexpr char const* kStr100   = "bingbong";
static constexpr char const* kStr1000  = "Undercity is a cool capital...";
static constexpr char const* kStr10000 = "this is a very long string... xd";

#define TEST_FMT(NAME, STR, FORMAT, WIDTH) \
    static void test_fmt_##NAME(benchmark::State& state) \
    { \
        std::string const str = STR; \
        for (auto _ : state) \
            benchmark::DoNotOptimize(fmt::format(FORMAT, str, WIDTH)); \
    } \
    BENCHMARK(test_fmt_##NAME); \
    /**/

#define TEST_PAD(NAME, STR, WIDTH, ALIGN, SYMBOL) \
    static void test_pad_##NAME(benchmark::State& state) \
    { \
        std::string const str = STR; \
        for (auto _ : state) \
            benchmark::DoNotOptimize(padxx::pad(str, WIDTH, padxx::Alignment::ALIGN, padxx::Symbol::SYMBOL)); \
    } \
    BENCHMARK(test_pad_##NAME); \
    /**/

#define TEST_PUSH(NAME, STR, WIDTH, ALIGN, SYMBOL) \
    static void test_push_##NAME(benchmark::State& state) \
    { \
        std::string const str = STR; \
        std::vector<unsigned char> buf; \
        buf.reserve(WIDTH); \
        for (auto _ : state) \
        { \
            buf.clear(); \
            padxx::pad_and_push_to_buffer(str, WIDTH, padxx::Alignment::ALIGN, padxx::Symbol::SYMBOL, buf); \
            benchmark::DoNotOptimize(buf.data()); \
        } \
    } \
    BENCHMARK(test_push_##NAME); \
    /**/

TEST_FMT(ws_10_left,        kStr10,     "{:<{}}",   10);
TEST_FMT(ws_100_left,       kStr100,    "{:<{}}",   100);
TEST_FMT(ws_1000_left,      kStr1000,   "{:<{}}",   1000);
TEST_FMT(ws_10000_left,     kStr10000,  "{:<{}}",   10000);
TEST_FMT(hyphen_10_right,   kStr10,     "{:->{}}",  10);
TEST_FMT(hyphen_1000_right, kStr1000,   "{:->{}}",  1000);
TEST_FMT(ws_1000_center,    kStr1000,   "{:^{}}",   1000);

TEST_PAD(ws_10_left,        kStr10,     10,     left,   whitespace);
TEST_PAD(ws_100_left,       kStr100,    100,    left,   whitespace);
TEST_PAD(ws_1000_left,      kStr1000,   1000,   left,   whitespace);
TEST_PAD(ws_10000_left,     kStr10000,  10000,  left,   whitespace);
TEST_PAD(ws_10_right,       kStr10,     10,     right,  whitespace);
TEST_PAD(ws_10000_right,    kStr10000,  10000,  right,  whitespace);
TEST_PAD(hyphen_10_right,   kStr10,     10,     right,  hyphen);
TEST_PAD(hyphen_1000_right, kStr1000,   1000,   right,  hyphen);
TEST_PAD(ws_1000_center,    kStr1000,   1000,   center, whitespace);

TEST_PUSH(ws_10_center,     kStr10,     10,     center, whitespace);
TEST_PUSH(ws_100_center,    kStr100,    100,    center, whitespace);
TEST_PUSH(ws_1000_center,   kStr1000,   1000,   center, whitespace);
TEST_PUSH(ws_10000_center,  kStr10000,  10000,  center, whitespace);

int main(int argc, char* argv[])
{
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv))
        return 1;
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
