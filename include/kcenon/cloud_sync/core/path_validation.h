/**
 * @file path_validation.h
 * @brief Validation of container-relative paths
 */

#ifndef KCENON_CLOUD_SYNC_CORE_PATH_VALIDATION_H
#define KCENON_CLOUD_SYNC_CORE_PATH_VALIDATION_H

#include <cstddef>
#include <string>
#include <string_view>

#include "kcenon/cloud_sync/core/types.h"

namespace kcenon::cloud_sync {

/// Longest accepted path component, in bytes
inline constexpr std::size_t max_component_length = 255;

/**
 * @brief Validate a single path component (file or directory name)
 *
 * A component is non-empty, at most 255 bytes, contains neither ':' nor '/',
 * and does not start with '.'.
 */
[[nodiscard]] auto validate_component(std::string_view name) -> result<void>;

/**
 * @brief Validate a container-relative path
 *
 * The path is split on '/' and every component must pass
 * validate_component(). Leading, trailing and doubled separators therefore
 * fail as empty components.
 */
[[nodiscard]] auto validate_relative_path(std::string_view path) -> result<void>;

/**
 * @brief Directory part of a relative path ("" for a top-level item)
 */
[[nodiscard]] auto parent_path(std::string_view path) -> std::string;

/**
 * @brief Last component of a relative path
 */
[[nodiscard]] auto last_component(std::string_view path) -> std::string;

/**
 * @brief Join a directory and a name with a single separator
 */
[[nodiscard]] auto join_path(std::string_view directory, std::string_view name) -> std::string;

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_CORE_PATH_VALIDATION_H
