/**
 * @file transfer_handle.h
 * @brief Caller-side handle of a running transfer
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_HANDLE_H
#define KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_HANDLE_H

#include <chrono>
#include <memory>
#include <string>

#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/transfer/progress_channel.h"
#include "kcenon/cloud_sync/transfer/transfer_types.h"

namespace kcenon::cloud_sync {

class transfer_operation;

/**
 * @brief Transfer handle for tracking and controlling a transfer
 *
 * @code
 * auto handle = engine.start_download("Documents/report.pdf");
 * if (handle.has_value()) {
 *     while (auto event = handle.value().events().receive()) {
 *         // progress, then done or error
 *     }
 *     auto result = handle.value().wait();
 * }
 * @endcode
 */
class transfer_handle {
public:
    /**
     * @brief Default constructor (invalid handle)
     */
    transfer_handle();

    explicit transfer_handle(std::shared_ptr<transfer_operation> operation);

    transfer_handle(const transfer_handle&) = default;
    transfer_handle(transfer_handle&&) noexcept = default;
    auto operator=(const transfer_handle&) -> transfer_handle& = default;
    auto operator=(transfer_handle&&) noexcept -> transfer_handle& = default;

    [[nodiscard]] auto get_id() const noexcept -> operation_id;

    [[nodiscard]] auto is_valid() const noexcept -> bool;

    [[nodiscard]] auto path() const -> std::string;

    [[nodiscard]] auto kind() const -> transfer_kind;

    [[nodiscard]] auto get_state() const -> transfer_state;

    /**
     * @brief Current attempt number, starting at 1
     */
    [[nodiscard]] auto attempt() const -> uint32_t;

    /**
     * @brief Time of the last forward progress seen by the idle watchdog
     */
    [[nodiscard]] auto last_progress_at() const -> std::chrono::steady_clock::time_point;

    /**
     * @brief Event stream of the transfer
     * @note Must not be called on an invalid handle
     */
    [[nodiscard]] auto events() const -> progress_channel&;

    /**
     * @brief Cancel the transfer
     *
     * The subscription is released before this returns; the stream closes
     * without a terminal element and wait() reports canceled.
     */
    [[nodiscard]] auto cancel() -> result<void>;

    /**
     * @brief Block until the transfer completes, fails or is canceled
     */
    [[nodiscard]] auto wait() -> result<transfer_result_info>;

    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout)
        -> result<transfer_result_info>;

private:
    std::shared_ptr<transfer_operation> operation_;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_HANDLE_H
