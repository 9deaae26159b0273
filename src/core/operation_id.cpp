/**
 * @file operation_id.cpp
 * @brief Implementation of operation_id generation
 */

#include "kcenon/cloud_sync/core/types.h"

#include <atomic>

namespace kcenon::cloud_sync {

auto operation_id::next() -> operation_id {
    static std::atomic<uint64_t> counter{0};
    return operation_id{counter.fetch_add(1, std::memory_order_relaxed) + 1};
}

}  // namespace kcenon::cloud_sync
