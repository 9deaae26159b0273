/**
 * @file observer_registry.h
 * @brief Ownership of live index subscriptions per operation
 */

#ifndef KCENON_CLOUD_SYNC_REGISTRY_OBSERVER_REGISTRY_H
#define KCENON_CLOUD_SYNC_REGISTRY_OBSERVER_REGISTRY_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/index/metadata_index_view.h"

namespace kcenon::cloud_sync {

/**
 * @brief Key of one registry entry
 */
using observer_token = uint64_t;

/**
 * @brief Tracks the subscription of every running operation
 *
 * Each entry carries a one-shot latch. The first try_claim() on a token
 * wins; every later claim, from any thread, loses. Whoever wins is the only
 * party allowed to deliver a terminal result, and releases the entry before
 * doing so.
 *
 * Every subscription handed to the registry is stopped exactly once: on
 * rebind (the replaced one), on release, or when the registry is destroyed.
 *
 * @note Thread-safe. Subscriptions are stopped outside the registry lock,
 *       so a listener may call back into the registry.
 */
class observer_registry {
public:
    observer_registry();
    ~observer_registry();

    observer_registry(const observer_registry&) = delete;
    auto operator=(const observer_registry&) -> observer_registry& = delete;

    /**
     * @brief Register an operation and its subscription
     * @param id Owning operation
     * @param subscription May be null when the operation subscribes later
     */
    [[nodiscard]] auto register_observer(operation_id id,
                                         std::unique_ptr<index_subscription> subscription)
        -> observer_token;

    /**
     * @brief Swap in the subscription of a new attempt; the old one is stopped
     *
     * Fails with transfer_not_found for unknown or released tokens and with
     * already_completed once the latch is claimed. On failure the passed
     * subscription is stopped.
     */
    auto rebind(observer_token token, std::unique_ptr<index_subscription> subscription)
        -> result<void>;

    /**
     * @brief Stop the subscription and drop the entry
     *
     * Idempotent; unknown tokens are a no-op. Returns once the subscription
     * has no listener in flight on another thread.
     */
    void release(observer_token token);

    /**
     * @brief Claim the one-shot latch of a token
     * @return true for the first caller only; false for unknown tokens
     */
    [[nodiscard]] auto try_claim(observer_token token) -> bool;

    [[nodiscard]] auto is_claimed(observer_token token) const -> bool;

    [[nodiscard]] auto operation_for(observer_token token) const -> std::optional<operation_id>;

    /**
     * @brief Release every remaining entry
     */
    void release_all();

    [[nodiscard]] auto registered_count() const -> std::size_t;
    [[nodiscard]] auto released_count() const -> std::size_t;
    [[nodiscard]] auto active_count() const -> std::size_t;

    /**
     * @brief Subscriptions handed in (register and rebind) and stopped so far
     */
    [[nodiscard]] auto subscriptions_attached() const -> std::size_t;
    [[nodiscard]] auto subscriptions_stopped() const -> std::size_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_REGISTRY_OBSERVER_REGISTRY_H
