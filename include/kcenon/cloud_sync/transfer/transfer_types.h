/**
 * @file transfer_types.h
 * @brief Transfer-related type definitions for cloud_sync
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_TYPES_H
#define KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_TYPES_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>

#include "kcenon/cloud_sync/core/types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Lifecycle state of a transfer
 */
enum class transfer_state {
    pending,   ///< Created, nothing requested yet
    active,    ///< Fetch or write issued, waiting for the index
    done,      ///< Terminal: succeeded
    error,     ///< Terminal: failed
    canceled   ///< Terminal: canceled by the caller
};

[[nodiscard]] constexpr auto to_string(transfer_state state) noexcept -> const char* {
    switch (state) {
        case transfer_state::pending: return "pending";
        case transfer_state::active: return "active";
        case transfer_state::done: return "done";
        case transfer_state::error: return "error";
        case transfer_state::canceled: return "canceled";
        default: return "unknown";
    }
}

/**
 * @brief Check if state is terminal (final)
 */
[[nodiscard]] constexpr auto is_terminal_state(transfer_state state) noexcept -> bool {
    return state == transfer_state::done ||
           state == transfer_state::error ||
           state == transfer_state::canceled;
}

/**
 * @brief Check if state transition is valid
 *
 * Valid transitions:
 * - pending -> active, error, canceled
 * - active  -> done, error, canceled
 * - terminal states accept nothing
 */
[[nodiscard]] constexpr auto is_valid_transition(transfer_state from, transfer_state to) noexcept
    -> bool {
    switch (from) {
        case transfer_state::pending:
            return to == transfer_state::active ||
                   to == transfer_state::error ||
                   to == transfer_state::canceled;
        case transfer_state::active:
            return to == transfer_state::done ||
                   to == transfer_state::error ||
                   to == transfer_state::canceled;
        default:
            return false;
    }
}

/**
 * @brief Direction of a transfer
 */
enum class transfer_kind {
    download,
    upload
};

[[nodiscard]] constexpr auto to_string(transfer_kind kind) noexcept -> const char* {
    switch (kind) {
        case transfer_kind::download: return "download";
        case transfer_kind::upload: return "upload";
        default: return "unknown";
    }
}

/**
 * @brief Element type of a transfer event stream
 */
enum class progress_event_type {
    progress,  ///< Fractional progress in percent
    done,      ///< Terminal: succeeded
    error      ///< Terminal: failed, error attached
};

/**
 * @brief One element of a transfer event stream
 *
 * A stream carries zero or more progress elements followed by at most one
 * terminal element (done or error).
 */
struct transfer_progress_event {
    progress_event_type type = progress_event_type::progress;
    std::optional<double> percent;
    std::optional<struct error> failure;

    [[nodiscard]] static auto progress(double value) -> transfer_progress_event {
        return transfer_progress_event{progress_event_type::progress, value, std::nullopt};
    }

    [[nodiscard]] static auto done() -> transfer_progress_event {
        return transfer_progress_event{progress_event_type::done, std::nullopt, std::nullopt};
    }

    [[nodiscard]] static auto failed(struct error err) -> transfer_progress_event {
        return transfer_progress_event{progress_event_type::error, std::nullopt, std::move(err)};
    }

    [[nodiscard]] auto is_terminal() const noexcept -> bool {
        return type != progress_event_type::progress;
    }
};

/**
 * @brief Callback receiving transfer events
 */
using progress_callback = std::function<void(const transfer_progress_event&)>;

/**
 * @brief Retry policy for stalled transfers
 *
 * Exponential backoff with proportional jitter:
 * delay(n) = min(initial_delay * multiplier^(n-1), max_delay) * (1 +- jitter)
 */
struct retry_policy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;
    double jitter = 0.2;

    /**
     * @brief Delay before the given retry attempt (1-based)
     */
    [[nodiscard]] auto delay_for_attempt(uint32_t attempt, std::mt19937_64& rng) const
        -> std::chrono::milliseconds {
        double base = static_cast<double>(initial_delay.count());
        for (uint32_t i = 1; i < attempt; ++i) {
            base *= backoff_multiplier;
            if (base >= static_cast<double>(max_delay.count())) {
                break;
            }
        }
        base = std::min(base, static_cast<double>(max_delay.count()));

        if (jitter > 0.0) {
            std::uniform_real_distribution<double> spread(-jitter, jitter);
            base *= 1.0 + spread(rng);
        }
        return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, base)));
    }
};

/**
 * @brief Per-transfer behaviour
 */
struct transfer_config {
    std::chrono::milliseconds idle_interval{60000};
    retry_policy retry;
};

/**
 * @brief Download options
 */
struct download_options {
    std::optional<transfer_config> transfer;  ///< Overrides the engine default
    progress_callback on_event;               ///< Optional event sink
};

/**
 * @brief Upload options
 */
struct upload_options {
    std::optional<transfer_config> transfer;  ///< Overrides the engine default
    progress_callback on_event;               ///< Optional event sink
};

/**
 * @brief Result of a completed transfer
 */
struct transfer_result_info {
    std::string path;                         ///< Container-relative item path
    bool local_available = false;             ///< Bytes readable locally (downloads)
    uint32_t attempts = 1;                    ///< Attempts used, including the first
    std::chrono::milliseconds elapsed{0};     ///< Total time taken
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_TYPES_H
