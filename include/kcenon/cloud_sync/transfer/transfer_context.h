/**
 * @file transfer_context.h
 * @brief Collaborators shared by every operation of one engine
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_CONTEXT_H
#define KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_CONTEXT_H

#include <atomic>
#include <cstdint>
#include <memory>

#include "kcenon/cloud_sync/adapters/task_pool_adapter.h"
#include "kcenon/cloud_sync/coordination/coordinated_access.h"
#include "kcenon/cloud_sync/core/timer_service.h"
#include "kcenon/cloud_sync/index/metadata_index_view.h"
#include "kcenon/cloud_sync/registry/observer_registry.h"

namespace kcenon::cloud_sync {

/**
 * @brief Engine-wide operation counters
 */
struct transfer_counters {
    std::atomic<uint64_t> active{0};
    std::atomic<uint64_t> completed_downloads{0};
    std::atomic<uint64_t> completed_uploads{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> canceled{0};
};

/**
 * @brief Shared collaborators
 *
 * Operations keep the context alive, so a transfer handle stays usable
 * after its engine is destroyed.
 */
struct transfer_context {
    std::shared_ptr<metadata_index_view> view;
    std::shared_ptr<coordinated_access> access;
    std::shared_ptr<observer_registry> registry;
    std::shared_ptr<adapters::task_pool_interface> pool;
    std::shared_ptr<timer_service> timers;
    std::shared_ptr<transfer_counters> counters;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_TRANSFER_CONTEXT_H
