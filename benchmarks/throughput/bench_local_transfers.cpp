/**
 * @file bench_local_transfers.cpp
 * @brief End-to-end transfer benchmarks against a directory-backed container
 *
 * Measures the coordination overhead of a transfer (subscription, watchdog,
 * pool hops and completion) on top of the coordinated file operations.
 */

#include <benchmark/benchmark.h>

#include <kcenon/cloud_sync/cloud_sync.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <vector>

namespace kcenon::cloud_sync::benchmark {

namespace {

auto make_engine(const std::shared_ptr<backend::local_container>& container,
                 std::size_t workers) -> std::unique_ptr<sync_engine> {
    auto built = sync_engine::builder()
        .with_index(container)
        .with_access(container)
        .with_worker_count(workers)
        .build();
    if (!built) {
        return nullptr;
    }
    return std::make_unique<sync_engine>(std::move(built.value()));
}

auto make_container(const temp_container& dirs) -> std::shared_ptr<backend::local_container> {
    backend::local_container_config config;
    config.root = dirs.root();
    config.fetch_step_delay = std::chrono::milliseconds(0);
    return std::make_shared<backend::local_container>(std::move(config));
}

}  // namespace

/**
 * @brief Upload one file per iteration
 */
static void BM_Upload_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_container dirs;
    auto container = make_container(dirs);
    auto engine = make_engine(container, 2);
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }
    auto source = dirs.create_source("payload.bin", file_size, 42);

    for (auto _ : state) {
        auto uploaded = engine->upload(source, "Bench/payload.bin");
        if (!uploaded) {
            state.SkipWithError(uploaded.error().message.c_str());
            break;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(file_size));
}
BENCHMARK(BM_Upload_SingleFile)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Download of an already materialized item
 */
static void BM_Download_Materialized(::benchmark::State& state) {
    temp_container dirs;
    dirs.create_item("Bench/ready.bin", sizes::small_file, 42);
    auto container = make_container(dirs);
    auto engine = make_engine(container, 2);
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }

    for (auto _ : state) {
        auto downloaded = engine->download("Bench/ready.bin");
        if (!downloaded) {
            state.SkipWithError(downloaded.error().message.c_str());
            break;
        }
    }
}
BENCHMARK(BM_Download_Materialized)->Unit(::benchmark::kMicrosecond);

/**
 * @brief Many downloads started together, waited on as a batch
 */
static void BM_Download_Batch(::benchmark::State& state) {
    const auto batch = static_cast<int>(state.range(0));

    temp_container dirs;
    for (int i = 0; i < batch; ++i) {
        dirs.create_item("Batch/item" + std::to_string(i) + ".bin", sizes::small_file,
                         static_cast<uint32_t>(i + 1));
    }
    auto container = make_container(dirs);
    auto engine = make_engine(container, 4);
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }

    for (auto _ : state) {
        std::vector<transfer_handle> handles;
        handles.reserve(static_cast<std::size_t>(batch));
        for (int i = 0; i < batch; ++i) {
            auto handle = engine->start_download("Batch/item" + std::to_string(i) + ".bin");
            if (handle) {
                handles.push_back(handle.value());
            }
        }
        for (auto& handle : handles) {
            auto outcome = handle.wait();
            ::benchmark::DoNotOptimize(outcome);
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(batch) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Download_Batch)->Arg(8)->Arg(64)->Unit(::benchmark::kMillisecond);

/**
 * @brief One-shot listing of a container with many items
 */
static void BM_Gather_Listing(::benchmark::State& state) {
    const auto count = static_cast<int>(state.range(0));

    temp_container dirs;
    for (int i = 0; i < count; ++i) {
        dirs.create_item("List/dir" + std::to_string(i % 16) + "/f" + std::to_string(i), 16,
                         static_cast<uint32_t>(i + 1));
    }
    auto container = make_container(dirs);
    auto engine = make_engine(container, 2);
    if (!engine) {
        state.SkipWithError("Failed to create engine");
        return;
    }

    for (auto _ : state) {
        auto listed = engine->gather(gather_options{"List"});
        if (!listed) {
            state.SkipWithError(listed.error().message.c_str());
            break;
        }
        ::benchmark::DoNotOptimize(listed.value().items.data());
    }
}
BENCHMARK(BM_Gather_Listing)->Arg(100)->Arg(1000)->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::cloud_sync::benchmark
