/**
 * @file progress_channel.h
 * @brief Typed transfer event stream with a defined closing element
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_PROGRESS_CHANNEL_H
#define KCENON_CLOUD_SYNC_TRANSFER_PROGRESS_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "kcenon/cloud_sync/transfer/transfer_types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Event stream of one transfer
 *
 * Guarantees, whatever the number of producing threads:
 * - progress percentages are non-decreasing; lower values are dropped;
 * - at most one terminal element (done or error) is accepted;
 * - nothing is accepted after the terminal element or after close().
 *
 * Events can be consumed by the callback sink given at construction, by
 * blocking receive(), or by polling with try_receive(). The sink runs on the
 * producing thread, in stream order.
 *
 * @code
 * progress_channel channel;
 * while (auto event = channel.receive()) {
 *     if (event->type == progress_event_type::progress) {
 *         show(*event->percent);
 *     }
 * }
 * @endcode
 */
class progress_channel {
public:
    explicit progress_channel(progress_callback sink = nullptr);

    progress_channel(const progress_channel&) = delete;
    auto operator=(const progress_channel&) -> progress_channel& = delete;

    /**
     * @brief Offer an event
     * @return false if the event was dropped
     */
    auto push(transfer_progress_event event) -> bool;

    /**
     * @brief Close without a terminal element (cancellation)
     */
    void close();

    /**
     * @brief Block until an event is available or the stream has ended
     * @return std::nullopt once closed and drained
     */
    [[nodiscard]] auto receive() -> std::optional<transfer_progress_event>;

    [[nodiscard]] auto receive_for(std::chrono::milliseconds timeout)
        -> std::optional<transfer_progress_event>;

    [[nodiscard]] auto try_receive() -> std::optional<transfer_progress_event>;

    [[nodiscard]] auto is_closed() const -> bool;

    [[nodiscard]] auto has_terminal() const -> bool;

    [[nodiscard]] auto last_percent() const -> std::optional<double>;

    /**
     * @brief Number of events accepted so far
     */
    [[nodiscard]] auto accepted_count() const -> std::size_t;

private:
    progress_callback sink_;

    // Held across acceptance and sink delivery to keep the sink in order;
    // recursive so a sink may push or close.
    std::recursive_mutex delivery_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<transfer_progress_event> queue_;
    std::optional<double> last_percent_;
    std::size_t accepted_{0};
    bool closed_{false};
    bool terminal_{false};
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_PROGRESS_CHANNEL_H
