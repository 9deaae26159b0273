/**
 * @file metadata_index_view.cpp
 * @brief Implementation of the parsed index view and owned subscriptions
 */

#include "kcenon/cloud_sync/index/metadata_index_view.h"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "kcenon/cloud_sync/core/error_classifier.h"
#include "kcenon/cloud_sync/core/logging.h"

namespace kcenon::cloud_sync {

struct metadata_index_view::counters {
    std::atomic<std::size_t> active{0};
};

struct index_subscription::state {
    std::shared_ptr<metadata_index> index;
    std::shared_ptr<metadata_index_view::counters> view_counters;
    index_query query;
    listener on_event;

    mutable std::mutex mutex;
    std::condition_variable idle_cv;
    std::vector<std::thread::id> dispatching;
    metadata_index::query_token token{0};
    bool started{false};
    bool stopped{false};
    std::atomic<std::size_t> delivered{0};

    void dispatch(index_event event, const std::vector<metadata_record>& records) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopped) {
                return;
            }
            dispatching.push_back(std::this_thread::get_id());
        }

        auto parsed = parse_records(records);
        if (!parsed.invalid_entries.empty()) {
            CS_LOG_DEBUG(log_category::index,
                         std::to_string(parsed.invalid_entries.size()) +
                             " invalid record(s) for query '" + query.path + "'");
        }
        delivered.fetch_add(1, std::memory_order_relaxed);
        on_event(event, parsed);

        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = std::find(dispatching.begin(), dispatching.end(),
                                std::this_thread::get_id());
            if (it != dispatching.end()) {
                dispatching.erase(it);
            }
        }
        idle_cv.notify_all();
    }
};

// ============================================================================
// index_subscription
// ============================================================================

index_subscription::index_subscription(std::shared_ptr<state> s)
    : state_(std::move(s)) {}

index_subscription::~index_subscription() {
    stop();
}

void index_subscription::stop() {
    metadata_index::query_token token = 0;
    bool owns_query = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->stopped) {
            return;
        }
        state_->stopped = true;
        token = state_->token;
        owns_query = state_->started;
    }

    if (owns_query) {
        state_->index->stop_query(token);
        state_->view_counters->active.fetch_sub(1, std::memory_order_relaxed);
    }

    auto self = std::this_thread::get_id();
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->idle_cv.wait(lock, [this, self] {
        return std::all_of(state_->dispatching.begin(), state_->dispatching.end(),
                           [self](const std::thread::id& id) { return id == self; });
    });
}

auto index_subscription::is_active() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->started && !state_->stopped;
}

auto index_subscription::query() const -> const index_query& {
    return state_->query;
}

auto index_subscription::delivered_count() const -> std::size_t {
    return state_->delivered.load(std::memory_order_relaxed);
}

// ============================================================================
// metadata_index_view
// ============================================================================

metadata_index_view::metadata_index_view(std::shared_ptr<metadata_index> index)
    : index_(std::move(index))
    , counters_(std::make_shared<counters>()) {}

metadata_index_view::~metadata_index_view() = default;

auto metadata_index_view::snapshot(const index_query& query) -> result<index_snapshot> {
    auto records = index_->snapshot(query);
    if (!records) {
        return unexpected{records.error()};
    }
    return parse_records(records.value());
}

auto metadata_index_view::subscribe(const index_query& query,
                                    index_subscription::listener listener)
    -> result<std::unique_ptr<index_subscription>> {
    auto s = std::make_shared<index_subscription::state>();
    s->index = index_;
    s->view_counters = counters_;
    s->query = query;
    s->on_event = std::move(listener);

    // The index may deliver before start_query() returns
    std::weak_ptr<index_subscription::state> weak = s;
    auto started = index_->start_query(
        query, [weak](index_event event, const std::vector<metadata_record>& records) {
            if (auto locked = weak.lock()) {
                locked->dispatch(event, records);
            }
        });

    if (!started) {
        CS_LOG_WARN(log_category::index,
                    "Failed to start query for '" + query.path + "': " +
                        started.error().message);
        return unexpected{started.error()};
    }

    bool stop_now = false;
    {
        std::lock_guard<std::mutex> lock(s->mutex);
        s->token = started.value();
        s->started = true;
        stop_now = s->stopped;
    }
    counters_->active.fetch_add(1, std::memory_order_relaxed);

    // A listener that stopped the subscription during start_query() never
    // saw a token; finish the stop here so the query is not leaked.
    if (stop_now) {
        index_->stop_query(started.value());
        counters_->active.fetch_sub(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(s->mutex);
            s->started = false;
        }
    }

    return std::unique_ptr<index_subscription>(new index_subscription(std::move(s)));
}

auto metadata_index_view::lookup(const std::string& path,
                                 std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds warning_after)
    -> result<std::optional<item>> {
    struct waiter {
        std::mutex mutex;
        std::condition_variable cv;
        bool completed{false};
        std::optional<item> found;
    };
    auto shared = std::make_shared<waiter>();

    auto subscription = subscribe(
        index_query::exact(path),
        [shared, path](index_event event, const index_snapshot& snapshot) {
            if (event != index_event::gathering_complete) {
                return;
            }
            std::lock_guard<std::mutex> lock(shared->mutex);
            if (shared->completed) {
                return;
            }
            for (const auto& candidate : snapshot.items) {
                if (candidate.path == path) {
                    shared->found = candidate;
                    break;
                }
            }
            shared->completed = true;
            shared->cv.notify_all();
        });

    if (!subscription) {
        return unexpected{subscription.error()};
    }

    auto started_at = std::chrono::steady_clock::now();
    bool completed = false;
    std::optional<item> found;
    {
        std::unique_lock<std::mutex> lock(shared->mutex);
        auto done = [&shared] { return shared->completed; };

        if (warning_after < timeout &&
            !shared->cv.wait_until(lock, started_at + warning_after, done)) {
            lock.unlock();
            sync_log_context ctx;
            ctx.path = path;
            ctx.operation = "lookup";
            ctx.duration_ms = static_cast<uint64_t>(warning_after.count());
            CS_LOG_WARN_CTX(log_category::index, "Metadata query is slow", ctx);
            lock.lock();
        }

        completed = shared->cv.wait_until(lock, started_at + timeout, done);
        found = shared->found;
    }

    subscription.value()->stop();

    if (!completed) {
        return unexpected{make_timeout_error("metadata query for '" + path + "'", timeout)};
    }
    return found;
}

auto metadata_index_view::active_subscriptions() const -> std::size_t {
    return counters_->active.load(std::memory_order_relaxed);
}

}  // namespace kcenon::cloud_sync
