/**
 * @file error_codes.h
 * @brief Error codes for cloud_sync (-800 to -899 range)
 * @version 0.1.0
 *
 * This file defines all error codes used by the sync coordination engine.
 * Error codes follow the range -800 to -899 as per ecosystem convention.
 */

#ifndef KCENON_CLOUD_SYNC_CORE_ERROR_CODES_H
#define KCENON_CLOUD_SYNC_CORE_ERROR_CODES_H

#include <cstdint>
#include <string_view>

namespace kcenon::cloud_sync {

/**
 * @brief Error codes for sync operations (-800 to -899)
 *
 * Error code ranges:
 * - -800 to -819: Sync taxonomy (what callers of an operation observe)
 * - -820 to -839: Engine errors (handle misuse, configuration, waits)
 */
enum class error_code : int32_t {
    success = 0,

    // Sync taxonomy (-800 to -819)
    not_found = -800,
    not_found_on_read = -801,
    not_found_on_write = -802,
    timeout = -803,
    container_unavailable = -804,
    native_failure = -805,
    invalid_argument = -806,
    canceled = -807,

    // Engine errors (-820 to -839)
    not_initialized = -820,
    config_invalid = -821,
    transfer_not_found = -822,
    already_completed = -823,
    wait_timeout = -824,
    internal_error = -825,
};

/**
 * @brief Convert error_code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) noexcept
    -> std::string_view {
    switch (code) {
        case error_code::success:
            return "success";

        // Sync taxonomy
        case error_code::not_found:
            return "item not found";
        case error_code::not_found_on_read:
            return "item not found on coordinated read";
        case error_code::not_found_on_write:
            return "item not found on coordinated write";
        case error_code::timeout:
            return "no progress within idle interval";
        case error_code::container_unavailable:
            return "container unavailable";
        case error_code::native_failure:
            return "native backend failure";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::canceled:
            return "operation canceled";

        // Engine errors
        case error_code::not_initialized:
            return "not initialized";
        case error_code::config_invalid:
            return "invalid configuration";
        case error_code::transfer_not_found:
            return "transfer not found";
        case error_code::already_completed:
            return "transfer already completed";
        case error_code::wait_timeout:
            return "wait timed out";
        case error_code::internal_error:
            return "internal error";

        default:
            return "unknown error";
    }
}

/**
 * @brief Get error message for a numeric error code
 */
[[nodiscard]] inline auto error_message(int32_t code) noexcept
    -> std::string_view {
    return to_string(static_cast<error_code>(code));
}

/**
 * @brief Check if error code is in the sync taxonomy range
 */
[[nodiscard]] constexpr auto is_sync_error(int32_t code) noexcept -> bool {
    return code <= -800 && code >= -819;
}

/**
 * @brief Check if error code is in the engine error range
 */
[[nodiscard]] constexpr auto is_engine_error(int32_t code) noexcept -> bool {
    return code <= -820 && code >= -839;
}

/**
 * @brief Check if the code reports an absent item, whatever the access intent
 */
[[nodiscard]] constexpr auto is_not_found(error_code code) noexcept -> bool {
    return code == error_code::not_found ||
           code == error_code::not_found_on_read ||
           code == error_code::not_found_on_write;
}

/**
 * @brief Check if the error is transient and may be retried by a transfer
 *
 * Absence, bad arguments and an unreachable container are never retried.
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    switch (code) {
        case error_code::timeout:
        case error_code::native_failure:
            return true;
        default:
            return false;
    }
}

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_CORE_ERROR_CODES_H
