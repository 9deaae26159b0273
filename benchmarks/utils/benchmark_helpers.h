/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_CLOUD_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_CLOUD_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <kcenon/cloud_sync/core/item.h>

namespace kcenon::cloud_sync::benchmark {

/**
 * @brief Generates index records the way a busy container reports them
 */
class record_generator {
public:
    /**
     * @brief Generate records under `root`
     * @param count Number of records
     * @param invalid_every Every n-th record lacks its path (0 for none)
     * @param seed Random seed (0 for random)
     */
    static auto generate(std::size_t count,
                         std::size_t invalid_every = 0,
                         uint32_t seed = 0,
                         const std::string& root = "bench") -> std::vector<metadata_record>;
};

/**
 * @brief Helper class for managing a temporary container tree
 */
class temp_container {
public:
    temp_container();
    ~temp_container();

    // Non-copyable
    temp_container(const temp_container&) = delete;
    auto operator=(const temp_container&) -> temp_container& = delete;

    /**
     * @brief Directory used as the container root
     */
    [[nodiscard]] auto root() const -> const std::filesystem::path&;

    /**
     * @brief Directory holding upload sources, outside the container
     */
    [[nodiscard]] auto sources() const -> const std::filesystem::path&;

    /**
     * @brief Create a source file with random data
     */
    auto create_source(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create a materialized item inside the container
     */
    auto create_item(const std::string& relative, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

private:
    std::filesystem::path base_dir_;
    std::filesystem::path root_;
    std::filesystem::path sources_;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 4 * KB;
constexpr std::size_t medium_file = 256 * KB;
constexpr std::size_t large_file = 4 * MB;
}  // namespace sizes

}  // namespace kcenon::cloud_sync::benchmark

#endif  // KCENON_CLOUD_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
