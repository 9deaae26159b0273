/**
 * @file local_container.h
 * @brief Directory-backed container implementing the index and access primitives
 */

#ifndef KCENON_CLOUD_SYNC_BACKEND_LOCAL_CONTAINER_H
#define KCENON_CLOUD_SYNC_BACKEND_LOCAL_CONTAINER_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kcenon/cloud_sync/coordination/coordinated_access.h"
#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/index/metadata_index.h"

namespace kcenon::cloud_sync::backend {

/**
 * @brief Local container configuration
 */
struct local_container_config {
    std::filesystem::path root;                        ///< Materialized container contents
    std::string remote_dir = ".remote";                ///< Remote-only staging area under root
    std::chrono::milliseconds poll_interval{0};        ///< 0 disables polling; use refresh()
    std::chrono::milliseconds fetch_step_delay{20};    ///< Delay between fetch progress steps
    std::chrono::milliseconds lock_timeout{5000};      ///< Bound of flock() acquisition
};

/**
 * @brief Container backed by a local directory
 *
 * Items under root are current. Items under root/remote_dir exist only
 * remotely; request_fetch() moves them into root in steps, reporting
 * percent_downloaded on the way. Entries whose name starts with '.' are
 * never listed.
 *
 * Notifications are delivered on one internal thread. Every query receives
 * its gathering_complete result, then an update whenever refresh() runs,
 * a fetch step completes, a coordinated mutation succeeds or the poll
 * interval elapses.
 *
 * Coordinated access takes flock(2) locks on the target (shared for reads,
 * exclusive for writes) or on a hidden sibling lock file for replacements.
 */
class local_container : public metadata_index,
                        public coordinated_access {
public:
    explicit local_container(local_container_config config);
    ~local_container() override;

    local_container(const local_container&) = delete;
    auto operator=(const local_container&) -> local_container& = delete;

    // metadata_index
    [[nodiscard]] auto start_query(const index_query& query, query_callback callback)
        -> result<query_token> override;
    void stop_query(query_token token) override;
    [[nodiscard]] auto snapshot(const index_query& query)
        -> result<std::vector<metadata_record>> override;

    // coordinated_access
    [[nodiscard]] auto coordinated_open(const std::string& path, access_mode mode)
        -> std::optional<native_failure> override;
    [[nodiscard]] auto coordinated_write(const std::string& cloud_path,
                                         const std::filesystem::path& local_source)
        -> std::optional<native_failure> override;
    [[nodiscard]] auto coordinated_remove(const std::string& path)
        -> std::optional<native_failure> override;
    [[nodiscard]] auto coordinated_move(const std::string& from, const std::string& to)
        -> std::optional<native_failure> override;
    [[nodiscard]] auto coordinated_copy(const std::string& from, const std::string& to)
        -> std::optional<native_failure> override;
    [[nodiscard]] auto request_fetch(const std::string& path)
        -> std::optional<native_failure> override;
    [[nodiscard]] auto local_exists(const std::string& path) -> bool override;
    [[nodiscard]] auto container_available() -> bool override;
    [[nodiscard]] auto container_path() -> std::optional<std::filesystem::path> override;

    /**
     * @brief Push an update to every running query
     */
    void refresh();

    /**
     * @brief Place a remote-only item in the staging area
     */
    [[nodiscard]] auto stage_remote(const std::string& path, const std::string& content)
        -> std::optional<native_failure>;

    /**
     * @brief Simulate signing out of or back into the container
     */
    void set_available(bool available);

    /**
     * @brief Queries started and not yet stopped
     */
    [[nodiscard]] auto active_queries() const -> std::size_t;

    [[nodiscard]] auto root() const -> const std::filesystem::path&;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

/**
 * @brief Map an errno value to a native failure
 */
[[nodiscard]] auto failure_from_errno(int err, const std::string& what) -> native_failure;

}  // namespace kcenon::cloud_sync::backend

#endif  // KCENON_CLOUD_SYNC_BACKEND_LOCAL_CONTAINER_H
