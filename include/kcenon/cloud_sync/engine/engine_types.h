/**
 * @file engine_types.h
 * @brief Engine configuration and statistics types
 */

#ifndef KCENON_CLOUD_SYNC_ENGINE_ENGINE_TYPES_H
#define KCENON_CLOUD_SYNC_ENGINE_ENGINE_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "kcenon/cloud_sync/core/logging.h"
#include "kcenon/cloud_sync/transfer/transfer_types.h"

namespace kcenon::cloud_sync {

/**
 * @brief Engine configuration
 */
struct engine_config {
    transfer_config transfer;                                ///< Default per-transfer behaviour
    std::chrono::milliseconds metadata_query_timeout{30000}; ///< Bound of one-shot lookups
    std::chrono::milliseconds metadata_query_warning{10000}; ///< Slow-query warning threshold
    std::size_t worker_count = 0;                            ///< 0 = hardware concurrency
    std::string pool_name = "cloud_sync_pool";
    log_settings logging;                                    ///< Applied to the process logger
};

/**
 * @brief Engine statistics
 */
struct engine_statistics {
    uint64_t completed_downloads = 0;
    uint64_t completed_uploads = 0;
    uint64_t failed_transfers = 0;
    uint64_t timed_out_transfers = 0;
    uint64_t canceled_transfers = 0;
    uint64_t retries = 0;
    std::size_t active_transfers = 0;
    std::size_t active_subscriptions = 0;    ///< Index queries currently running
    std::size_t registered_observers = 0;    ///< Registry entries ever created
    std::size_t released_observers = 0;      ///< Registry entries torn down
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_ENGINE_ENGINE_TYPES_H
