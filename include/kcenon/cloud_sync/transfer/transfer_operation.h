/**
 * @file transfer_operation.h
 * @brief Common lifecycle of download and upload operations
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_OPERATION_H
#define KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_OPERATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "kcenon/cloud_sync/core/error_classifier.h"
#include "kcenon/cloud_sync/core/logging.h"
#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/registry/observer_registry.h"
#include "kcenon/cloud_sync/transfer/idle_watchdog.h"
#include "kcenon/cloud_sync/transfer/progress_channel.h"
#include "kcenon/cloud_sync/transfer/transfer_context.h"
#include "kcenon/cloud_sync/transfer/transfer_types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Bounded asynchronous task driving one item to a terminal state
 *
 * Several sources race to end a transfer: index notifications, coordinated
 * I/O completing on the worker pool, the idle watchdog and the caller
 * canceling. All of them go through the registry latch of the operation's
 * token; only the winner tears down and delivers a result.
 *
 * Teardown order on every path:
 * 1. claim the latch
 * 2. release the registry entry (stops the index subscription)
 * 3. stop the watchdog
 * 4. emit the terminal event and close the stream
 * 5. publish the state to waiters
 *
 * No operation lock is held across a coordinated call or a subscription
 * stop.
 */
class transfer_operation : public std::enable_shared_from_this<transfer_operation> {
public:
    using finished_callback = std::function<void(operation_id)>;

    virtual ~transfer_operation();

    transfer_operation(const transfer_operation&) = delete;
    auto operator=(const transfer_operation&) -> transfer_operation& = delete;

    /**
     * @brief Register with the registry, arm the watchdog and start attempt 1
     */
    [[nodiscard]] auto begin() -> result<void>;

    /**
     * @brief Cancel a running transfer
     *
     * On success the subscription and watchdog are released before this
     * returns and the stream closes without a terminal element.
     * Fails with already_completed once a terminal state was reached.
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Block until the transfer reaches a terminal state
     */
    [[nodiscard]] auto wait() -> result<transfer_result_info>;

    /**
     * @brief Wait with a bound; fails with wait_timeout when it expires
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> result<transfer_result_info>;

    [[nodiscard]] auto id() const noexcept -> operation_id { return id_; }
    [[nodiscard]] auto path() const -> const std::string& { return path_; }
    [[nodiscard]] auto kind() const noexcept -> transfer_kind { return kind_; }
    [[nodiscard]] auto state() const -> transfer_state;
    [[nodiscard]] auto attempt() const -> uint32_t;
    [[nodiscard]] auto last_progress_at() const -> idle_watchdog::clock::time_point;
    [[nodiscard]] auto events() -> progress_channel& { return channel_; }

    /**
     * @brief Hook invoked once after the terminal state is published
     */
    void set_finished_callback(finished_callback callback);

protected:
    transfer_operation(transfer_kind kind,
                       std::string path,
                       transfer_config config,
                       progress_callback on_event,
                       std::shared_ptr<transfer_context> context);

    /**
     * @brief Issue the work of one attempt; runs on the worker pool
     */
    virtual void start_attempt(uint32_t attempt) = 0;

    /**
     * @brief Handle one parsed index notification for the target path
     */
    virtual void on_index_event(index_event event, const index_snapshot& snapshot) = 0;

    [[nodiscard]] virtual auto intent() const noexcept -> access_intent = 0;

    /**
     * @brief Subscribe to the target path and attach it to the registry entry
     */
    auto subscribe() -> result<void>;

    /**
     * @brief Forward a progress percentage; lower values are dropped
     */
    void report_progress(double percent);

    /**
     * @brief Record a status transition for the watchdog
     */
    void note_activity();

    /**
     * @brief Stop idle accounting while blocking work for this operation runs
     */
    void hold_watchdog();

    /**
     * @brief Restart idle accounting after hold_watchdog(), unless a retry
     *        is already pending
     */
    void release_watchdog();

    void finish_success(bool local_available);
    void finish_error(error err);

    /**
     * @brief Retry a transient failure if attempts remain, otherwise finish
     */
    void retry_or_fail(error err);

    /**
     * @brief Run work on the worker pool while the operation is alive
     */
    void submit(const char* stage, std::function<void(transfer_operation&)> work);

    [[nodiscard]] auto is_finished() const noexcept -> bool {
        return finished_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto context() const -> const transfer_context& { return *context_; }
    [[nodiscard]] auto config() const -> const transfer_config& { return config_; }
    [[nodiscard]] auto log_context() const -> sync_log_context;

private:
    void on_watchdog_expired();
    void schedule_retry(const error& reason);
    void run_retry();
    void finish(transfer_state final_state, std::optional<error> err, bool local_available);
    void complete(transfer_state final_state, std::optional<error> err, bool local_available);
    [[nodiscard]] auto collect_locked() const -> result<transfer_result_info>;

    const operation_id id_;
    const transfer_kind kind_;
    const std::string path_;
    const transfer_config config_;
    std::shared_ptr<transfer_context> context_;

    progress_channel channel_;
    std::unique_ptr<idle_watchdog> watchdog_;
    observer_token token_{0};

    std::atomic<bool> finished_{false};
    std::atomic<bool> retry_pending_{false};

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    transfer_state state_{transfer_state::pending};
    uint32_t attempt_{1};
    std::optional<error> error_;
    bool local_available_{false};
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::milliseconds elapsed_{0};
    std::mt19937_64 rng_;
    finished_callback on_finished_;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_OPERATION_H
