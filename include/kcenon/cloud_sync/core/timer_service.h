/**
 * @file timer_service.h
 * @brief Shared deadline timer for watchdogs, backoff and query timeouts
 */

#ifndef KCENON_CLOUD_SYNC_CORE_TIMER_SERVICE_H
#define KCENON_CLOUD_SYNC_CORE_TIMER_SERVICE_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::cloud_sync {

/**
 * @brief Single-threaded one-shot timer queue
 *
 * Callbacks run on the timer thread and must stay short; anything that
 * blocks belongs on the task pool. One instance is shared by every
 * operation of an engine.
 *
 * @code
 * timer_service timers;
 * auto id = timers.schedule(std::chrono::seconds(30), [] { on_timeout(); });
 * // ...
 * timers.cancel(id);
 * @endcode
 */
class timer_service {
public:
    using timer_id = uint64_t;
    using clock = std::chrono::steady_clock;

    timer_service();
    ~timer_service();

    timer_service(const timer_service&) = delete;
    auto operator=(const timer_service&) -> timer_service& = delete;

    /**
     * @brief Schedule a callback after a delay
     * @return Identifier for cancel(); 0 when the service is shut down
     */
    auto schedule(clock::duration delay, std::function<void()> callback) -> timer_id;

    /**
     * @brief Cancel a scheduled callback
     *
     * If the callback is running on another thread, waits for it to return.
     * Called from the timer thread itself (from inside a callback) it never
     * waits.
     *
     * @return true if the callback was removed before it started
     */
    auto cancel(timer_id id) -> bool;

    /**
     * @brief Remove a pending callback without waiting for a running one
     * @return true if the callback was removed before it started
     */
    auto discard(timer_id id) -> bool;

    /**
     * @brief Drop all pending timers and join the timer thread
     */
    void shutdown();

    [[nodiscard]] auto pending() const -> std::size_t;

    [[nodiscard]] auto is_timer_thread() const -> bool;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_CORE_TIMER_SERVICE_H
