/**
 * @file metadata_index.h
 * @brief Interface of the external metadata notification source
 */

#ifndef KCENON_CLOUD_SYNC_INDEX_METADATA_INDEX_H
#define KCENON_CLOUD_SYNC_INDEX_METADATA_INDEX_H

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "kcenon/cloud_sync/core/item.h"
#include "kcenon/cloud_sync/core/types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Filter for an index query
 */
struct index_query {
    enum class kind {
        exact,   ///< Only the item at `path`
        prefix   ///< Every item under `path` ("" is the container root)
    };

    kind mode = kind::prefix;
    std::string path;

    [[nodiscard]] static auto exact(std::string item_path) -> index_query {
        return index_query{kind::exact, std::move(item_path)};
    }

    [[nodiscard]] static auto prefix(std::string root) -> index_query {
        return index_query{kind::prefix, std::move(root)};
    }

    /**
     * @brief Check whether an item path is selected by this query
     */
    [[nodiscard]] auto matches(const std::string& item_path) const -> bool {
        if (mode == kind::exact) {
            return item_path == path;
        }
        if (path.empty()) {
            return true;
        }
        if (item_path.size() <= path.size() || item_path.compare(0, path.size(), path) != 0) {
            return item_path == path;
        }
        return path.back() == '/' || item_path[path.size()] == '/';
    }
};

/**
 * @brief Kind of notification delivered by a running query
 */
enum class index_event {
    gathering_complete,  ///< Initial result set; delivered once per query
    update               ///< Subsequent change; zero or more times
};

[[nodiscard]] constexpr auto to_string(index_event event) noexcept -> const char* {
    switch (event) {
        case index_event::gathering_complete: return "gathering_complete";
        case index_event::update: return "update";
        default: return "unknown";
    }
}

/**
 * @brief Metadata notification source consumed by the engine
 *
 * Implementations deliver callbacks on their own thread(s). Every started
 * query must be matched by exactly one stop_query(); after stop_query()
 * returns the implementation must not start new callback invocations for
 * that token. A callback in flight on another thread may still be running.
 */
class metadata_index {
public:
    using query_token = uint64_t;

    /**
     * @brief Callback receiving the full current result set of the query
     */
    using query_callback =
        std::function<void(index_event, const std::vector<metadata_record>&)>;

    virtual ~metadata_index() = default;

    /**
     * @brief Start a live query
     * @return Token for stop_query(), or the native failure
     */
    [[nodiscard]] virtual auto start_query(const index_query& query, query_callback callback)
        -> result<query_token> = 0;

    /**
     * @brief Stop a live query; unknown tokens are ignored
     */
    virtual void stop_query(query_token token) = 0;

    /**
     * @brief One-shot pull of the current records; may be stale or partial
     */
    [[nodiscard]] virtual auto snapshot(const index_query& query)
        -> result<std::vector<metadata_record>> = 0;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_INDEX_METADATA_INDEX_H
