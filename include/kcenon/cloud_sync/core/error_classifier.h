/**
 * @file error_classifier.h
 * @brief Mapping of raw backend failures onto the stable error taxonomy
 */

#ifndef KCENON_CLOUD_SYNC_CORE_ERROR_CLASSIFIER_H
#define KCENON_CLOUD_SYNC_CORE_ERROR_CLASSIFIER_H

#include <chrono>
#include <string>
#include <string_view>

#include "kcenon/cloud_sync/core/types.h"

namespace kcenon::cloud_sync {

/**
 * @brief What the failing call was trying to do
 *
 * The same "no such file" cause means different things depending on whether
 * the engine was reading, writing, listing or mutating.
 */
enum class access_intent {
    read,     ///< Coordinated open for reading (download)
    write,    ///< Coordinated write (upload)
    neutral,  ///< Listing and lookup
    mutate    ///< Structural operations (remove, move, copy)
};

[[nodiscard]] constexpr auto to_string(access_intent intent) noexcept -> const char* {
    switch (intent) {
        case access_intent::read: return "read";
        case access_intent::write: return "write";
        case access_intent::neutral: return "neutral";
        case access_intent::mutate: return "mutate";
        default: return "unknown";
    }
}

/**
 * @brief Classify a native failure into the error taxonomy
 *
 * Classification happens exactly once, where the raw failure enters the
 * engine. The native failure is always attached as the error cause.
 *
 * | cause                                   | read | write | neutral | mutate |
 * |-----------------------------------------|------|-------|---------|--------|
 * | no_such_file                            | not_found_on_read | not_found_on_write | not_found | native_failure |
 * | permission / container / network       | container_unavailable (all intents) ||||
 * | invalid_argument                        | invalid_argument | invalid_argument | invalid_argument | native_failure |
 * | busy / other                            | native_failure (all intents) ||||
 */
[[nodiscard]] auto classify(const native_failure& failure, access_intent intent) -> error;

/**
 * @brief Build the error for an exhausted idle watchdog or a query timeout
 *
 * Always produces error_code::timeout, never native_failure.
 */
[[nodiscard]] auto make_timeout_error(std::string_view what,
                                      std::chrono::milliseconds waited,
                                      uint32_t attempts = 1) -> error;

/**
 * @brief Build an invalid_argument error for a rejected path or parameter
 */
[[nodiscard]] auto make_invalid_argument(std::string_view what) -> error;

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_CORE_ERROR_CLASSIFIER_H
