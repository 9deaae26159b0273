/**
 * @file bench_observer_registry.cpp
 * @brief Benchmarks for observer registration and the completion latch
 */

#include <benchmark/benchmark.h>

#include <kcenon/cloud_sync/registry/observer_registry.h>

#include <atomic>
#include <memory>
#include <vector>

namespace kcenon::cloud_sync::benchmark {

/**
 * @brief Register, claim and release one observer per iteration
 */
static void BM_Registry_RegisterClaimRelease(::benchmark::State& state) {
    observer_registry registry;

    for (auto _ : state) {
        auto token = registry.register_observer(operation_id::next(), nullptr);
        auto claimed = registry.try_claim(token);
        ::benchmark::DoNotOptimize(claimed);
        registry.release(token);
    }

    state.counters["released"] = static_cast<double>(registry.released_count());
}
BENCHMARK(BM_Registry_RegisterClaimRelease);

/**
 * @brief Release cost with many live entries
 */
static void BM_Registry_ReleaseUnderLoad(::benchmark::State& state) {
    const auto live = static_cast<std::size_t>(state.range(0));
    observer_registry registry;

    std::vector<observer_token> background;
    background.reserve(live);
    for (std::size_t i = 0; i < live; ++i) {
        background.push_back(registry.register_observer(operation_id::next(), nullptr));
    }

    for (auto _ : state) {
        auto token = registry.register_observer(operation_id::next(), nullptr);
        registry.release(token);
    }

    registry.release_all();
    state.counters["live_entries"] = static_cast<double>(live);
}
BENCHMARK(BM_Registry_ReleaseUnderLoad)->Arg(10)->Arg(1000)->Arg(100000);

/**
 * @brief Contended claims on a shared registry
 *
 * Every thread registers its own entry and races a second claim against
 * its first; only one claim per token may win.
 */
static void BM_Registry_ConcurrentClaim(::benchmark::State& state) {
    static std::shared_ptr<observer_registry> registry;
    if (state.thread_index() == 0) {
        registry = std::make_shared<observer_registry>();
    }

    int64_t wins = 0;
    for (auto _ : state) {
        auto token = registry->register_observer(operation_id::next(), nullptr);
        if (registry->try_claim(token)) {
            ++wins;
        }
        if (registry->try_claim(token)) {
            state.SkipWithError("Latch claimed twice");
            break;
        }
        registry->release(token);
    }

    state.counters["wins"] = ::benchmark::Counter(static_cast<double>(wins),
                                                  ::benchmark::Counter::kAvgThreads);
    if (state.thread_index() == 0) {
        registry.reset();
    }
}
BENCHMARK(BM_Registry_ConcurrentClaim)->Threads(1)->Threads(4)->Threads(8);

}  // namespace kcenon::cloud_sync::benchmark
