/**
 * @file cloud_sync.h
 * @brief Main header for the cloud_sync library
 * @version 0.1.0
 *
 * Include this header to access the sync engine, its transfer handles
 * and the directory-backed container.
 *
 * @code
 * #include <kcenon/cloud_sync/cloud_sync.h>
 *
 * using namespace kcenon::cloud_sync;
 *
 * auto container = std::make_shared<backend::local_container>(
 *     backend::local_container_config{"/path/to/container"});
 *
 * auto engine = sync_engine::builder()
 *     .with_index(container)
 *     .with_access(container)
 *     .build();
 * @endcode
 */

#ifndef KCENON_CLOUD_SYNC_CLOUD_SYNC_H
#define KCENON_CLOUD_SYNC_CLOUD_SYNC_H

#include <string>

// Core types
#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/core/item.h"

// Engine
#include "kcenon/cloud_sync/engine/engine_types.h"
#include "kcenon/cloud_sync/engine/sync_engine.h"

// Backend
#include "kcenon/cloud_sync/backend/local_container.h"

namespace kcenon::cloud_sync {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_CLOUD_SYNC_H
