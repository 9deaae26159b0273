/**
 * @file types.h
 * @brief Core type definitions for cloud_sync
 */

#ifndef KCENON_CLOUD_SYNC_CORE_TYPES_H
#define KCENON_CLOUD_SYNC_CORE_TYPES_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "kcenon/cloud_sync/core/error_codes.h"

namespace kcenon::cloud_sync {

/**
 * @brief Cause reported by the backend for a failed native call
 *
 * Only no_such_file needs to be distinguishable for correctness; the other
 * causes let the classifier separate container problems from plain failures.
 */
enum class native_cause {
    no_such_file,
    permission_denied,
    container_unavailable,
    network_unavailable,
    invalid_argument,
    busy,
    other
};

/**
 * @brief Convert native_cause to string
 */
[[nodiscard]] constexpr auto to_string(native_cause cause) noexcept -> const char* {
    switch (cause) {
        case native_cause::no_such_file: return "no_such_file";
        case native_cause::permission_denied: return "permission_denied";
        case native_cause::container_unavailable: return "container_unavailable";
        case native_cause::network_unavailable: return "network_unavailable";
        case native_cause::invalid_argument: return "invalid_argument";
        case native_cause::busy: return "busy";
        case native_cause::other: return "other";
        default: return "unknown";
    }
}

/**
 * @brief Raw failure as reported by the coordinated-access primitive or the index
 *
 * This shape never leaves the engine on its own; it travels only as the
 * attached cause of a classified error.
 */
struct native_failure {
    native_cause cause = native_cause::other;
    std::string domain;        ///< Backend error domain (e.g. "posix")
    int32_t code = 0;          ///< Backend error number within the domain
    std::string description;   ///< Human readable backend message

    native_failure() = default;
    native_failure(native_cause c, std::string desc)
        : cause(c), description(std::move(desc)) {}
    native_failure(native_cause c, std::string dom, int32_t num, std::string desc)
        : cause(c), domain(std::move(dom)), code(num), description(std::move(desc)) {}

    [[nodiscard]] auto to_string() const -> std::string {
        std::string out = cloud_sync::to_string(cause);
        if (!domain.empty()) {
            out += " (" + domain + ":" + std::to_string(code) + ")";
        }
        if (!description.empty()) {
            out += ": " + description;
        }
        return out;
    }
};

/**
 * @brief Error type with code, message and optional native cause
 */
struct error {
    error_code code;
    std::string message;
    std::optional<native_failure> cause;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, native_failure native)
        : code(c), message(std::move(msg)), cause(std::move(native)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Unique identifier for one engine operation
 *
 * Used as the Observer Registry key; never reused within a process.
 */
struct operation_id {
    uint64_t value;

    operation_id() : value(0) {}
    explicit operation_id(uint64_t v) : value(v) {}

    [[nodiscard]] auto is_valid() const noexcept -> bool { return value != 0; }

    [[nodiscard]] auto operator==(const operation_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const operation_id& other) const -> bool {
        return value < other.value;
    }

    /**
     * @brief Allocate the next process-wide identifier
     */
    [[nodiscard]] static auto next() -> operation_id;
};

}  // namespace kcenon::cloud_sync

// Hash support for operation_id
template <>
struct std::hash<kcenon::cloud_sync::operation_id> {
    auto operator()(const kcenon::cloud_sync::operation_id& id) const noexcept -> std::size_t {
        return std::hash<uint64_t>{}(id.value);
    }
};

#endif  // KCENON_CLOUD_SYNC_CORE_TYPES_H
