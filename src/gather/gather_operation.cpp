/**
 * @file gather_operation.cpp
 * @brief Implementation of the listing operation
 */

#include "kcenon/cloud_sync/gather/gather_operation.h"

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "kcenon/cloud_sync/core/error_classifier.h"
#include "kcenon/cloud_sync/core/logging.h"

namespace kcenon::cloud_sync {

struct gather_session::state {
    operation_id id;
    std::shared_ptr<observer_registry> registry;
    observer_token token{0};
    gather_update_callback on_update;

    std::mutex mutex;
    std::condition_variable cv;
    bool initial_ready{false};
    index_snapshot initial;

    std::atomic<bool> canceled{false};
    std::atomic<std::size_t> updates{0};

    void on_event(index_event event, const index_snapshot& snapshot) {
        if (canceled.load(std::memory_order_acquire)) {
            return;
        }

        bool first = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!initial_ready) {
                // Updates racing ahead of the initial result still count as it
                initial = snapshot;
                initial_ready = true;
                first = true;
            }
        }
        // The first snapshot is the initial result, whichever event carried it
        if (first) {
            cv.notify_all();
            return;
        }

        if (on_update && event == index_event::update) {
            updates.fetch_add(1, std::memory_order_relaxed);
            on_update(snapshot.items, snapshot.invalid_entries);
        }
    }

    void release() {
        if (canceled.exchange(true)) {
            return;
        }
        registry->release(token);
    }
};

// ============================================================================
// gather_session
// ============================================================================

gather_session::gather_session(std::shared_ptr<state> s)
    : state_(std::move(s)) {}

gather_session::~gather_session() {
    cancel();
}

void gather_session::cancel() {
    if (state_->canceled.load()) {
        return;
    }
    state_->release();
    CS_LOG_DEBUG(log_category::gather,
                 "Live gather " + std::to_string(state_->id.value) + " canceled");
}

auto gather_session::is_active() const -> bool {
    return !state_->canceled.load();
}

auto gather_session::update_count() const -> std::size_t {
    return state_->updates.load(std::memory_order_relaxed);
}

auto gather_session::id() const noexcept -> operation_id {
    return state_->id;
}

// ============================================================================
// gather_operation
// ============================================================================

auto gather_operation::run(const transfer_context& context,
                           const gather_options& options,
                           gather_update_callback on_update,
                           std::chrono::milliseconds timeout,
                           std::chrono::milliseconds warning_after)
    -> result<gather_result> {
    auto s = std::make_shared<gather_session::state>();
    s->id = operation_id::next();
    s->registry = context.registry;
    s->on_update = std::move(on_update);
    const bool live = static_cast<bool>(s->on_update);

    sync_log_context ctx;
    ctx.operation_id = std::to_string(s->id.value);
    ctx.path = options.root;
    ctx.operation = live ? "gather_live" : "gather";

    s->token = context.registry->register_observer(s->id, nullptr);

    std::weak_ptr<gather_session::state> weak = s;
    auto subscription = context.view->subscribe(
        index_query::prefix(options.root),
        [weak](index_event event, const index_snapshot& snapshot) {
            if (auto locked = weak.lock()) {
                locked->on_event(event, snapshot);
            }
        });

    if (!subscription) {
        s->release();
        return unexpected{subscription.error()};
    }
    if (auto bound = context.registry->rebind(s->token, std::move(subscription.value())); !bound) {
        s->release();
        return unexpected{bound.error()};
    }

    auto started_at = std::chrono::steady_clock::now();
    bool ready = false;
    index_snapshot initial;
    {
        std::unique_lock<std::mutex> lock(s->mutex);
        auto has_initial = [&s] { return s->initial_ready; };

        if (warning_after < timeout &&
            !s->cv.wait_until(lock, started_at + warning_after, has_initial)) {
            lock.unlock();
            ctx.duration_ms = static_cast<uint64_t>(warning_after.count());
            CS_LOG_WARN_CTX(log_category::gather, "Gather is slow", ctx);
            lock.lock();
        }

        ready = s->cv.wait_until(lock, started_at + timeout, has_initial);
        if (ready) {
            initial = s->initial;
        }
    }

    if (!ready) {
        s->release();
        ctx.duration_ms = static_cast<uint64_t>(timeout.count());
        CS_LOG_ERROR_CTX(log_category::gather, "Gather timed out", ctx);
        return unexpected{make_timeout_error("gather of '" + options.root + "'", timeout)};
    }

    gather_result out;
    out.items = std::move(initial.items);
    out.invalid_entries = std::move(initial.invalid_entries);

    ctx.item_count = out.items.size();
    if (!out.invalid_entries.empty()) {
        ctx.error_message = std::to_string(out.invalid_entries.size()) + " invalid entries";
    }
    CS_LOG_INFO_CTX(log_category::gather, "Gather completed", ctx);

    if (live) {
        out.session = std::shared_ptr<gather_session>(new gather_session(std::move(s)));
    } else {
        s->release();
    }
    return out;
}

}  // namespace kcenon::cloud_sync
