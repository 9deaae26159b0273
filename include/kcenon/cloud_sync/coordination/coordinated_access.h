/**
 * @file coordinated_access.h
 * @brief Interface of the coordinated file-access primitive
 */

#ifndef KCENON_CLOUD_SYNC_COORDINATION_COORDINATED_ACCESS_H
#define KCENON_CLOUD_SYNC_COORDINATION_COORDINATED_ACCESS_H

#include <filesystem>
#include <optional>
#include <string>

#include "kcenon/cloud_sync/core/types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Access mode for a coordinated open
 */
enum class access_mode {
    read,
    write
};

/**
 * @brief Exclusive, conflict-safe access to container items
 *
 * The engine calls these primitives but does not implement platform file
 * locking. Every call may block; the engine only calls them from its worker
 * pool. Each returns std::nullopt on success or the native failure, whose
 * cause must be native_cause::no_such_file when the item does not exist.
 *
 * Paths are container-relative.
 */
class coordinated_access {
public:
    virtual ~coordinated_access() = default;

    /**
     * @brief Open the item under coordination and close it again
     *
     * For downloads this proves the bytes are locally readable.
     */
    [[nodiscard]] virtual auto coordinated_open(const std::string& path, access_mode mode)
        -> std::optional<native_failure> = 0;

    /**
     * @brief Replace the item at cloud_path with the content of local_source
     */
    [[nodiscard]] virtual auto coordinated_write(const std::string& cloud_path,
                                                 const std::filesystem::path& local_source)
        -> std::optional<native_failure> = 0;

    [[nodiscard]] virtual auto coordinated_remove(const std::string& path)
        -> std::optional<native_failure> = 0;

    [[nodiscard]] virtual auto coordinated_move(const std::string& from, const std::string& to)
        -> std::optional<native_failure> = 0;

    [[nodiscard]] virtual auto coordinated_copy(const std::string& from, const std::string& to)
        -> std::optional<native_failure> = 0;

    /**
     * @brief Ask the container to start fetching a remote item
     */
    [[nodiscard]] virtual auto request_fetch(const std::string& path)
        -> std::optional<native_failure> = 0;

    /**
     * @brief Local presence only; false never implies remote absence
     */
    [[nodiscard]] virtual auto local_exists(const std::string& path) -> bool = 0;

    /**
     * @brief Container reachable and signed in
     */
    [[nodiscard]] virtual auto container_available() -> bool = 0;

    /**
     * @brief Local directory backing the container, if it has one
     *
     * Item paths are relative to it.
     */
    [[nodiscard]] virtual auto container_path() -> std::optional<std::filesystem::path> = 0;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_COORDINATION_COORDINATED_ACCESS_H
