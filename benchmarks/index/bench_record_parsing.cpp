/**
 * @file bench_record_parsing.cpp
 * @brief Benchmarks for parsing index result sets
 *
 * A live query hands the full result set to every notification, so the
 * parse cost grows with the container size.
 */

#include <benchmark/benchmark.h>

#include <kcenon/cloud_sync/core/item.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::cloud_sync::benchmark {

static void BM_ParseRecords_Valid(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto records = record_generator::generate(count, 0, 42);

    for (auto _ : state) {
        auto parsed = parse_records(records);
        ::benchmark::DoNotOptimize(parsed.items.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ParseRecords_Valid)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ParseRecords_WithInvalidEntries(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto records = record_generator::generate(count, 3, 42);

    std::size_t invalid = 0;
    for (auto _ : state) {
        auto parsed = parse_records(records);
        invalid = parsed.invalid_entries.size();
        ::benchmark::DoNotOptimize(parsed.items.data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["invalid"] = static_cast<double>(invalid);
}
BENCHMARK(BM_ParseRecords_WithInvalidEntries)->Arg(1000)->Arg(10000);

static void BM_RecordRoundTrip(::benchmark::State& state) {
    auto records = record_generator::generate(1, 0, 7);
    auto parsed = parse_record(records.front());
    if (!parsed) {
        state.SkipWithError("Generated record did not parse");
        return;
    }
    const auto value = parsed.value();

    for (auto _ : state) {
        auto record = to_record(value);
        auto reparsed = parse_record(record);
        ::benchmark::DoNotOptimize(reparsed);
    }
}
BENCHMARK(BM_RecordRoundTrip);

}  // namespace kcenon::cloud_sync::benchmark
