/**
 * @file transfer_operation.cpp
 * @brief Implementation of the common transfer lifecycle
 */

#include "kcenon/cloud_sync/transfer/transfer_operation.h"

#include <algorithm>
#include <cmath>
#include <exception>

namespace kcenon::cloud_sync {

transfer_operation::transfer_operation(transfer_kind kind,
                                       std::string path,
                                       transfer_config config,
                                       progress_callback on_event,
                                       std::shared_ptr<transfer_context> context)
    : id_(operation_id::next())
    , kind_(kind)
    , path_(std::move(path))
    , config_(std::move(config))
    , context_(std::move(context))
    , channel_(std::move(on_event))
    , started_at_(std::chrono::steady_clock::now())
    , rng_(std::random_device{}()) {}

transfer_operation::~transfer_operation() = default;

auto transfer_operation::begin() -> result<void> {
    if (!context_->pool->is_running()) {
        return unexpected{error{error_code::not_initialized, "worker pool is not running"}};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_valid_transition(state_, transfer_state::active)) {
            return unexpected{error{error_code::internal_error,
                                    std::string("cannot start from state ") + to_string(state_)}};
        }
        state_ = transfer_state::active;
    }

    token_ = context_->registry->register_observer(id_, nullptr);

    std::weak_ptr<transfer_operation> weak = weak_from_this();
    watchdog_ = std::make_unique<idle_watchdog>(
        context_->timers, config_.idle_interval, [weak] {
            if (auto self = weak.lock()) {
                self->on_watchdog_expired();
            }
        });
    watchdog_->start();

    context_->counters->active.fetch_add(1, std::memory_order_relaxed);

    auto ctx = log_context();
    CS_LOG_INFO_CTX(log_category::transfer,
                    kind_ == transfer_kind::download ? "Download started" : "Upload started",
                    ctx);

    const char* stage = kind_ == transfer_kind::download ? adapters::pool_stage::coordinated_open
                                                         : adapters::pool_stage::coordinated_write;
    submit(stage, [](transfer_operation& op) { op.start_attempt(1); });
    return {};
}

auto transfer_operation::cancel() -> result<void> {
    if (!context_->registry->try_claim(token_)) {
        return unexpected{error{error_code::already_completed}};
    }
    complete(transfer_state::canceled, std::nullopt, false);
    return {};
}

auto transfer_operation::wait() -> result<transfer_result_info> {
    std::unique_lock<std::mutex> lock(mutex_);
    state_cv_.wait(lock, [this] { return is_terminal_state(state_); });
    return collect_locked();
}

auto transfer_operation::wait_for(std::chrono::milliseconds timeout)
    -> result<transfer_result_info> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!state_cv_.wait_for(lock, timeout, [this] { return is_terminal_state(state_); })) {
        return unexpected{error{error_code::wait_timeout}};
    }
    return collect_locked();
}

auto transfer_operation::state() const -> transfer_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto transfer_operation::attempt() const -> uint32_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempt_;
}

auto transfer_operation::last_progress_at() const -> idle_watchdog::clock::time_point {
    if (!watchdog_) {
        return started_at_;
    }
    return watchdog_->last_progress_at();
}

void transfer_operation::set_finished_callback(finished_callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_finished_ = std::move(callback);
}

auto transfer_operation::subscribe() -> result<void> {
    std::weak_ptr<transfer_operation> weak = weak_from_this();
    auto subscription = context_->view->subscribe(
        index_query::exact(path_),
        [weak](index_event event, const index_snapshot& snapshot) {
            auto self = weak.lock();
            if (!self || self->is_finished()) {
                return;
            }
            self->on_index_event(event, snapshot);
        });

    if (!subscription) {
        return unexpected{subscription.error()};
    }
    return context_->registry->rebind(token_, std::move(subscription.value()));
}

void transfer_operation::report_progress(double percent) {
    if (is_finished()) {
        return;
    }
    if (!std::isfinite(percent)) {
        return;
    }
    percent = std::clamp(percent, 0.0, 100.0);

    auto last = channel_.last_percent();
    if (last && percent <= *last) {
        return;
    }
    if (channel_.push(transfer_progress_event::progress(percent))) {
        watchdog_->touch();
    }
}

void transfer_operation::note_activity() {
    if (!is_finished()) {
        watchdog_->touch();
    }
}

void transfer_operation::hold_watchdog() {
    if (!is_finished()) {
        watchdog_->suspend();
    }
}

void transfer_operation::release_watchdog() {
    if (!is_finished() && !retry_pending_.load()) {
        watchdog_->resume();
    }
}

void transfer_operation::finish_success(bool local_available) {
    finish(transfer_state::done, std::nullopt, local_available);
}

void transfer_operation::finish_error(error err) {
    finish(transfer_state::error, std::move(err), false);
}

void transfer_operation::retry_or_fail(error err) {
    if (is_finished()) {
        return;
    }
    uint32_t current = attempt();
    if (is_retryable(err.code) && current < config_.retry.max_attempts) {
        schedule_retry(err);
        return;
    }
    finish_error(std::move(err));
}

void transfer_operation::submit(const char* stage,
                                std::function<void(transfer_operation&)> work) {
    std::weak_ptr<transfer_operation> weak = weak_from_this();
    auto task = [weak, work = std::move(work)]() {
        auto self = weak.lock();
        if (!self || self->is_finished()) {
            return;
        }
        try {
            work(*self);
        } catch (const std::exception& e) {
            self->finish_error(error{error_code::internal_error, e.what()});
        }
    };
    // Completion is reported through the operation, not the future
    (void)context_->pool->submit_to_stage(std::move(task), stage);
}

auto transfer_operation::log_context() const -> sync_log_context {
    sync_log_context ctx;
    ctx.operation_id = std::to_string(id_.value);
    ctx.path = path_;
    ctx.operation = to_string(kind_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx.attempt = attempt_;
    }
    ctx.max_attempts = config_.retry.max_attempts;
    return ctx;
}

void transfer_operation::on_watchdog_expired() {
    if (is_finished()) {
        return;
    }

    uint32_t current = attempt();
    if (current < config_.retry.max_attempts) {
        schedule_retry(make_timeout_error(std::string(to_string(kind_)) + " of '" + path_ + "'",
                                          config_.idle_interval, current));
        return;
    }
    finish_error(make_timeout_error(std::string(to_string(kind_)) + " of '" + path_ + "'",
                                    config_.idle_interval, current));
}

void transfer_operation::schedule_retry(const error& reason) {
    if (retry_pending_.exchange(true)) {
        return;
    }
    watchdog_->suspend();

    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delay = config_.retry.delay_for_attempt(attempt_, rng_);
    }
    context_->counters->retries.fetch_add(1, std::memory_order_relaxed);

    auto ctx = log_context();
    ctx.duration_ms = static_cast<uint64_t>(delay.count());
    ctx.error_code = std::string(to_string(reason.code));
    ctx.error_message = reason.message;
    CS_LOG_WARN_CTX(log_category::transfer, "Retrying stalled transfer", ctx);

    std::weak_ptr<transfer_operation> weak = weak_from_this();
    auto timer = context_->timers->schedule(delay, [weak] {
        if (auto self = weak.lock()) {
            self->submit(adapters::pool_stage::retry,
                         [](transfer_operation& op) { op.run_retry(); });
        }
    });
    if (timer == 0) {
        finish_error(reason);
    }
}

void transfer_operation::run_retry() {
    uint32_t next = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next = ++attempt_;
    }
    retry_pending_.store(false);
    watchdog_->resume();
    start_attempt(next);
}

void transfer_operation::finish(transfer_state final_state,
                                std::optional<error> err,
                                bool local_available) {
    if (!context_->registry->try_claim(token_)) {
        return;
    }
    complete(final_state, std::move(err), local_available);
}

void transfer_operation::complete(transfer_state final_state,
                                  std::optional<error> err,
                                  bool local_available) {
    finished_.store(true, std::memory_order_release);

    context_->registry->release(token_);
    if (watchdog_) {
        watchdog_->stop();
    }

    switch (final_state) {
        case transfer_state::done: {
            auto last = channel_.last_percent();
            if (!last || *last < 100.0) {
                channel_.push(transfer_progress_event::progress(100.0));
            }
            channel_.push(transfer_progress_event::done());
            break;
        }
        case transfer_state::error:
            channel_.push(transfer_progress_event::failed(err ? *err : error{error_code::internal_error}));
            break;
        default:
            channel_.close();
            break;
    }

    // Counters settle before waiters wake
    auto& counters = *context_->counters;
    counters.active.fetch_sub(1, std::memory_order_relaxed);
    switch (final_state) {
        case transfer_state::done:
            if (kind_ == transfer_kind::download) {
                counters.completed_downloads.fetch_add(1, std::memory_order_relaxed);
            } else {
                counters.completed_uploads.fetch_add(1, std::memory_order_relaxed);
            }
            break;
        case transfer_state::error:
            counters.failed.fetch_add(1, std::memory_order_relaxed);
            if (err && err->code == error_code::timeout) {
                counters.timeouts.fetch_add(1, std::memory_order_relaxed);
            }
            break;
        default:
            counters.canceled.fetch_add(1, std::memory_order_relaxed);
            break;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
    auto ctx = log_context();
    ctx.duration_ms = static_cast<uint64_t>(elapsed.count());

    finished_callback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = final_state;
        error_ = err;
        local_available_ = local_available;
        elapsed_ = elapsed;
        callback = on_finished_;
    }
    state_cv_.notify_all();

    switch (final_state) {
        case transfer_state::done:
            CS_LOG_INFO_CTX(log_category::transfer, "Transfer finished", ctx);
            break;
        case transfer_state::error:
            if (err) {
                ctx.error_code = std::string(to_string(err->code));
                ctx.error_message = err->message;
            }
            CS_LOG_ERROR_CTX(log_category::transfer, "Transfer failed", ctx);
            break;
        default:
            CS_LOG_INFO_CTX(log_category::transfer, "Transfer canceled", ctx);
            break;
    }

    if (callback) {
        callback(id_);
    }
}

auto transfer_operation::collect_locked() const -> result<transfer_result_info> {
    switch (state_) {
        case transfer_state::done: {
            transfer_result_info info;
            info.path = path_;
            info.local_available = local_available_;
            info.attempts = attempt_;
            info.elapsed = elapsed_;
            return info;
        }
        case transfer_state::canceled:
            return unexpected{error{error_code::canceled}};
        default:
            return unexpected{error_ ? *error_ : error{error_code::internal_error}};
    }
}

}  // namespace kcenon::cloud_sync
