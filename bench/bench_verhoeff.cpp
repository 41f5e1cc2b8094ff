// bench/bench_verhoeff.cpp - Benchmarks for checksum generation and validation.

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include <verhoeff/verhoeff.hpp>
#include <verhoeff/util/random.hpp>

namespace {

constexpr std::size_t kCacheSize = 64;

std::vector<std::string> create_random_cache(std::mt19937_64& rng, std::size_t length) {
    std::vector<std::string> cache;
    cache.reserve(kCacheSize);
    for (std::size_t index = 0; index < kCacheSize; ++index) {
        cache.push_back(verhoeff::util::random_digit_string(rng, length));
    }
    return cache;
}

std::vector<std::string> with_checksums(std::vector<std::string> cache) {
    for (auto& entry : cache) {
        entry = verhoeff::append_checksum(entry);
    }
    return cache;
}

} // namespace

static void bench_calculate_checksum(benchmark::State& state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()));
    const auto cache = create_random_cache(rng, static_cast<std::size_t>(state.range(0)));
    std::size_t cursor = 0;
    for (auto _ : state) {
        const auto check = verhoeff::calculate_checksum(cache[cursor++ % kCacheSize]);
        benchmark::DoNotOptimize(check);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

static void bench_validate(benchmark::State& state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x10);
    const auto cache =
        with_checksums(create_random_cache(rng, static_cast<std::size_t>(state.range(0))));
    std::size_t cursor = 0;
    for (auto _ : state) {
        const bool valid = verhoeff::validate(cache[cursor++ % kCacheSize]);
        benchmark::DoNotOptimize(valid);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * (state.range(0) + 1));
}

static void bench_fold_parsed(benchmark::State& state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x20);
    const auto digits = verhoeff::io::parse_digits(
        verhoeff::util::random_digit_string(rng, static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        const auto folded = verhoeff::core::fold(digits, verhoeff::core::VALIDATION_OFFSET);
        benchmark::DoNotOptimize(folded);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}

static void bench_validate_identifier(benchmark::State& state) {
    std::mt19937_64 rng(0x5eedc0de + static_cast<int>(state.thread_index()) + 0x30);
    std::vector<std::string> identifiers;
    identifiers.reserve(kCacheSize);
    for (std::size_t index = 0; index < kCacheSize; ++index) {
        identifiers.push_back(verhoeff::make_identifier(
            verhoeff::util::random_digit_string(rng, verhoeff::IDENTIFIER_BODY_LENGTH)));
    }
    std::size_t cursor = 0;
    for (auto _ : state) {
        const bool valid = verhoeff::validate_identifier(identifiers[cursor++ % kCacheSize]);
        benchmark::DoNotOptimize(valid);
    }
}

BENCHMARK(bench_calculate_checksum)->RangeMultiplier(4)->Range(8, 8192);
BENCHMARK(bench_validate)->RangeMultiplier(4)->Range(8, 8192);
BENCHMARK(bench_fold_parsed)->RangeMultiplier(4)->Range(8, 8192);
BENCHMARK(bench_validate_identifier);
BENCHMARK(bench_validate_identifier)->Threads(4);

BENCHMARK_MAIN();
