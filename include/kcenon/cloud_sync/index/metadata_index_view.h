/**
 * @file metadata_index_view.h
 * @brief Parsed, subscription-owning view over the metadata index
 */

#ifndef KCENON_CLOUD_SYNC_INDEX_METADATA_INDEX_VIEW_H
#define KCENON_CLOUD_SYNC_INDEX_METADATA_INDEX_VIEW_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/cloud_sync/core/item.h"
#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/index/metadata_index.h"

namespace kcenon::cloud_sync {

/**
 * @brief Parsed result set of a query
 */
using index_snapshot = parsed_records;

/**
 * @brief Owned handle to one running index query
 *
 * Exactly one stop_query() is issued on the underlying index per
 * subscription, either by stop() or by the destructor.
 */
class index_subscription {
public:
    using listener = std::function<void(index_event, const index_snapshot&)>;

    ~index_subscription();

    index_subscription(const index_subscription&) = delete;
    auto operator=(const index_subscription&) -> index_subscription& = delete;

    /**
     * @brief Stop the query
     *
     * Idempotent. On return no listener invocation is in flight on another
     * thread and none will start. A listener may stop its own subscription.
     */
    void stop();

    [[nodiscard]] auto is_active() const -> bool;

    [[nodiscard]] auto query() const -> const index_query&;

    /**
     * @brief Number of listener invocations delivered so far
     */
    [[nodiscard]] auto delivered_count() const -> std::size_t;

private:
    friend class metadata_index_view;

    struct state;
    explicit index_subscription(std::shared_ptr<state> s);

    std::shared_ptr<state> state_;
};

/**
 * @brief Live queryable snapshot of known items
 *
 * Wraps an external metadata_index, parses raw records into items and hands
 * out owned subscriptions.
 */
class metadata_index_view {
public:
    explicit metadata_index_view(std::shared_ptr<metadata_index> index);
    ~metadata_index_view();

    metadata_index_view(const metadata_index_view&) = delete;
    auto operator=(const metadata_index_view&) -> metadata_index_view& = delete;

    /**
     * @brief Pull the current result set; may be stale or partial
     */
    [[nodiscard]] auto snapshot(const index_query& query) -> result<index_snapshot>;

    /**
     * @brief Start a live query delivering parsed result sets
     *
     * One gathering_complete event is followed by zero or more updates.
     */
    [[nodiscard]] auto subscribe(const index_query& query, index_subscription::listener listener)
        -> result<std::unique_ptr<index_subscription>>;

    /**
     * @brief Resolve one item through a one-shot exact query
     *
     * Completes on the gathering_complete event. Logs a warning once
     * `warning_after` has elapsed and fails with error_code::timeout after
     * `timeout`. The query is stopped exactly once on every path.
     *
     * @return The item, or std::nullopt if the index does not know it
     */
    [[nodiscard]] auto lookup(const std::string& path,
                              std::chrono::milliseconds timeout,
                              std::chrono::milliseconds warning_after)
        -> result<std::optional<item>>;

    /**
     * @brief Queries started and not yet stopped through this view
     */
    [[nodiscard]] auto active_subscriptions() const -> std::size_t;

private:
    friend class index_subscription;

    struct counters;

    std::shared_ptr<metadata_index> index_;
    std::shared_ptr<counters> counters_;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_INDEX_METADATA_INDEX_VIEW_H
