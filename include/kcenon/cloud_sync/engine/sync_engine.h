/**
 * @file sync_engine.h
 * @brief Sync coordination engine
 */

#ifndef KCENON_CLOUD_SYNC_ENGINE_SYNC_ENGINE_H
#define KCENON_CLOUD_SYNC_ENGINE_SYNC_ENGINE_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/cloud_sync/coordination/coordinated_access.h"
#include "kcenon/cloud_sync/core/item.h"
#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/engine/engine_types.h"
#include "kcenon/cloud_sync/gather/gather_operation.h"
#include "kcenon/cloud_sync/index/metadata_index.h"
#include "kcenon/cloud_sync/transfer/transfer_handle.h"
#include "kcenon/cloud_sync/transfer/transfer_types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Sync coordination engine
 *
 * Presents single-result operations over the asynchronous sync lifecycle of
 * a remotely synchronized container.
 *
 * @code
 * auto engine_result = sync_engine::builder()
 *     .with_index(index)
 *     .with_access(access)
 *     .with_idle_interval(std::chrono::seconds(30))
 *     .build();
 *
 * if (engine_result.has_value()) {
 *     auto& engine = engine_result.value();
 *     auto downloaded = engine.download("Documents/report.pdf",
 *         [](const transfer_progress_event& event) { ... });
 * }
 * @endcode
 */
class sync_engine {
public:
    /**
     * @brief Builder for sync_engine
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the metadata notification source (required)
         */
        auto with_index(std::shared_ptr<metadata_index> index) -> builder&;

        /**
         * @brief Set the coordinated-access primitive (required)
         */
        auto with_access(std::shared_ptr<coordinated_access> access) -> builder&;

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(const engine_config& config) -> builder&;

        /**
         * @brief Set the idle watchdog interval
         * @param interval Interval without progress before a retry (default: 60s)
         * @return Reference to builder for chaining
         */
        auto with_idle_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Set the retry policy for stalled transfers
         * @param policy Attempt bound and backoff curve
         * @return Reference to builder for chaining
         */
        auto with_retry_policy(const retry_policy& policy) -> builder&;

        /**
         * @brief Set the worker pool size
         * @param count Number of workers (default: hardware concurrency)
         * @return Reference to builder for chaining
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Set the bound of targeted metadata lookups
         * @param timeout Lookup timeout (default: 30s)
         * @return Reference to builder for chaining
         */
        auto with_metadata_query_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Set the delay after which a slow lookup is logged
         * @param warning_after Warning threshold (default: 10s)
         * @return Reference to builder for chaining
         */
        auto with_metadata_query_warning(std::chrono::milliseconds warning_after) -> builder&;

        /**
         * @brief Set the log level, output format and path masking
         * @param settings Logger settings
         * @return Reference to builder for chaining
         */
        auto with_logging(const log_settings& settings) -> builder&;

        /**
         * @brief Build the engine instance
         * @return Result containing the engine or config_invalid
         */
        [[nodiscard]] auto build() -> result<sync_engine>;

    private:
        engine_config config_;
        std::shared_ptr<metadata_index> index_;
        std::shared_ptr<coordinated_access> access_;
    };

    // Non-copyable, movable
    sync_engine(const sync_engine&) = delete;
    auto operator=(const sync_engine&) -> sync_engine& = delete;
    sync_engine(sync_engine&&) noexcept;
    auto operator=(sync_engine&&) noexcept -> sync_engine&;

    /**
     * @brief Cancel running transfers and stop the worker pool
     */
    ~sync_engine();

    // Transfers
    /**
     * @brief Download an item and wait for the result
     * @param path Container-relative item path
     * @param on_progress Optional event sink (progress, then done or error)
     * @return true when the bytes are readable locally
     */
    [[nodiscard]] auto download(const std::string& path,
                                progress_callback on_progress = nullptr)
        -> result<bool>;

    /**
     * @brief Start a download and return its handle
     */
    [[nodiscard]] auto start_download(const std::string& path,
                                      download_options options = {})
        -> result<transfer_handle>;

    /**
     * @brief Upload a local file, replacing the item at cloud_path
     */
    [[nodiscard]] auto upload(const std::filesystem::path& local_source,
                              const std::string& cloud_path,
                              progress_callback on_progress = nullptr)
        -> result<void>;

    /**
     * @brief Start an upload and return its handle
     */
    [[nodiscard]] auto start_upload(const std::filesystem::path& local_source,
                                    const std::string& cloud_path,
                                    upload_options options = {})
        -> result<transfer_handle>;

    // Listing
    /**
     * @brief List container contents
     *
     * With on_update the listing stays live until the returned session is
     * canceled.
     */
    [[nodiscard]] auto gather(const gather_options& options = {},
                              gather_update_callback on_update = nullptr)
        -> result<gather_result>;

    // Structural operations
    /**
     * @brief Delete an item after resolving it through the index
     */
    [[nodiscard]] auto remove(const std::string& path) -> result<void>;

    /**
     * @brief Move an item to a new path
     */
    [[nodiscard]] auto move(const std::string& from, const std::string& to) -> result<void>;

    /**
     * @brief Copy an item to a new path
     */
    [[nodiscard]] auto copy(const std::string& from, const std::string& to) -> result<void>;

    /**
     * @brief Rename an item within its directory
     * @param new_name Single path component
     */
    [[nodiscard]] auto rename(const std::string& path, const std::string& new_name)
        -> result<void>;

    // Queries
    /**
     * @brief Check whether the item is readable locally
     *
     * false does not imply that the item is absent remotely.
     */
    [[nodiscard]] auto exists(const std::string& path) -> result<bool>;

    /**
     * @brief Resolve one item through a targeted metadata query
     * @return The item, or std::nullopt if the index does not know it
     */
    [[nodiscard]] auto get_metadata(const std::string& path) -> result<std::optional<item>>;

    /**
     * @brief Check whether the container is reachable
     */
    [[nodiscard]] auto is_available() const -> bool;

    /**
     * @brief Local directory backing the container
     *
     * Joined with an item path it gives the location of the item's local
     * copy once a download has completed.
     * @return The directory, or container_unavailable if the container is
     *         unreachable or has no local directory
     */
    [[nodiscard]] auto container_path() const -> result<std::filesystem::path>;

    // Statistics
    [[nodiscard]] auto get_statistics() const -> engine_statistics;

    [[nodiscard]] auto config() const -> const engine_config&;

private:
    sync_engine(engine_config config,
                std::shared_ptr<metadata_index> index,
                std::shared_ptr<coordinated_access> access);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_ENGINE_SYNC_ENGINE_H
