/**
 * @file transfer_handle.cpp
 * @brief Implementation of transfer_handle
 */

#include "kcenon/cloud_sync/transfer/transfer_handle.h"

#include "kcenon/cloud_sync/transfer/transfer_operation.h"

namespace kcenon::cloud_sync {

transfer_handle::transfer_handle() = default;

transfer_handle::transfer_handle(std::shared_ptr<transfer_operation> operation)
    : operation_(std::move(operation)) {}

auto transfer_handle::get_id() const noexcept -> operation_id {
    return operation_ ? operation_->id() : operation_id{};
}

auto transfer_handle::is_valid() const noexcept -> bool {
    return operation_ != nullptr;
}

auto transfer_handle::path() const -> std::string {
    return operation_ ? operation_->path() : std::string{};
}

auto transfer_handle::kind() const -> transfer_kind {
    return operation_ ? operation_->kind() : transfer_kind::download;
}

auto transfer_handle::get_state() const -> transfer_state {
    return operation_ ? operation_->state() : transfer_state::error;
}

auto transfer_handle::attempt() const -> uint32_t {
    return operation_ ? operation_->attempt() : 0;
}

auto transfer_handle::last_progress_at() const -> std::chrono::steady_clock::time_point {
    return operation_ ? operation_->last_progress_at() : std::chrono::steady_clock::time_point{};
}

auto transfer_handle::events() const -> progress_channel& {
    return operation_->events();
}

auto transfer_handle::cancel() -> result<void> {
    if (!operation_) {
        return unexpected{error{error_code::transfer_not_found}};
    }
    return operation_->cancel();
}

auto transfer_handle::wait() -> result<transfer_result_info> {
    if (!operation_) {
        return unexpected{error{error_code::transfer_not_found}};
    }
    return operation_->wait();
}

auto transfer_handle::wait_for(std::chrono::milliseconds timeout)
    -> result<transfer_result_info> {
    if (!operation_) {
        return unexpected{error{error_code::transfer_not_found}};
    }
    return operation_->wait_for(timeout);
}

}  // namespace kcenon::cloud_sync
