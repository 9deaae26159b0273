/**
 * @file item.h
 * @brief Item metadata model and index record parsing
 */

#ifndef KCENON_CLOUD_SYNC_CORE_ITEM_H
#define KCENON_CLOUD_SYNC_CORE_ITEM_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "kcenon/cloud_sync/core/types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Local download status of an item
 *
 * Only `current` guarantees that the local copy matches the latest remote
 * version known to this device.
 */
enum class download_status {
    not_downloaded,
    downloaded,
    current
};

[[nodiscard]] constexpr auto to_string(download_status status) noexcept -> const char* {
    switch (status) {
        case download_status::not_downloaded: return "not_downloaded";
        case download_status::downloaded: return "downloaded";
        case download_status::current: return "current";
        default: return "unknown";
    }
}

[[nodiscard]] auto download_status_from_string(std::string_view value)
    -> std::optional<download_status>;

/**
 * @brief One value of a raw index record
 */
using metadata_value = std::variant<std::monostate, bool, int64_t, double, std::string>;

/**
 * @brief Raw index record, keyed by the names in record_key
 */
using metadata_record = std::unordered_map<std::string, metadata_value>;

/**
 * @brief Keys of a raw index record
 *
 * Timestamps are seconds since the Unix epoch (integer or fractional).
 * Transfer errors are strings of the form "<native_cause>: <description>".
 */
struct record_key {
    static constexpr const char* path = "path";
    static constexpr const char* is_directory = "is_directory";
    static constexpr const char* size_bytes = "size_bytes";
    static constexpr const char* created_at = "created_at";
    static constexpr const char* modified_at = "modified_at";
    static constexpr const char* status = "download_status";
    static constexpr const char* is_downloading = "is_downloading";
    static constexpr const char* is_uploading = "is_uploading";
    static constexpr const char* is_uploaded = "is_uploaded";
    static constexpr const char* has_unresolved_conflicts = "has_unresolved_conflicts";
    static constexpr const char* percent_downloaded = "percent_downloaded";
    static constexpr const char* percent_uploaded = "percent_uploaded";
    static constexpr const char* download_error = "download_error";
    static constexpr const char* upload_error = "upload_error";
};

/**
 * @brief One file or directory entry as known to the metadata index
 *
 * `path` is the only stable identity; every other field is an advisory
 * snapshot and never proof of existence or absence.
 */
struct item {
    std::string path;
    bool is_directory = false;
    std::optional<uint64_t> size_bytes;
    std::optional<std::chrono::system_clock::time_point> created_at;
    std::optional<std::chrono::system_clock::time_point> modified_at;
    std::optional<download_status> status;
    bool is_downloading = false;
    bool is_uploading = false;
    bool is_uploaded = false;
    bool has_unresolved_conflicts = false;
    std::optional<double> percent_downloaded;
    std::optional<double> percent_uploaded;
    std::optional<native_failure> download_error;
    std::optional<native_failure> upload_error;

    [[nodiscard]] auto is_current() const -> bool {
        return status && *status == download_status::current;
    }

    /**
     * @brief Upload finished according to the index flags
     */
    [[nodiscard]] auto is_upload_settled() const -> bool {
        return is_uploaded && !is_uploading;
    }
};

/**
 * @brief Index record that failed to parse
 */
struct invalid_entry {
    std::string description;
    std::size_t index = 0;      ///< Position of the record in the batch
    metadata_record raw;
};

/**
 * @brief Result of parsing a batch of records
 */
struct parsed_records {
    std::vector<item> items;
    std::vector<invalid_entry> invalid_entries;
};

/**
 * @brief Parse one raw record
 * @return The item, or an invalid_argument error describing the first bad field
 */
[[nodiscard]] auto parse_record(const metadata_record& record) -> result<item>;

/**
 * @brief Parse a batch; malformed records go to the invalid list, never abort
 */
[[nodiscard]] auto parse_records(const std::vector<metadata_record>& records) -> parsed_records;

/**
 * @brief Encode an item as a raw record (used by backends and tests)
 */
[[nodiscard]] auto to_record(const item& value) -> metadata_record;

/**
 * @brief Parse "<cause>: <description>" into a native failure
 */
[[nodiscard]] auto parse_native_failure(std::string_view text) -> native_failure;

/**
 * @brief Inverse of parse_native_failure
 */
[[nodiscard]] auto format_native_failure(const native_failure& failure) -> std::string;

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_CORE_ITEM_H
