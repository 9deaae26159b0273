/**
 * @file gather_operation.h
 * @brief Listing of container contents, optionally live
 */

#ifndef KCENON_CLOUD_SYNC_GATHER_GATHER_OPERATION_H
#define KCENON_CLOUD_SYNC_GATHER_GATHER_OPERATION_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/cloud_sync/core/item.h"
#include "kcenon/cloud_sync/core/types.h"
#include "kcenon/cloud_sync/transfer/transfer_context.h"

namespace kcenon::cloud_sync {

/**
 * @brief Listing options
 */
struct gather_options {
    std::string root;  ///< Directory to list; empty for the container root
};

/**
 * @brief Callback receiving every refreshed listing of a live gather
 */
using gather_update_callback =
    std::function<void(const std::vector<item>&, const std::vector<invalid_entry>&)>;

/**
 * @brief Live listing kept open after the initial result
 *
 * Destroying the session cancels it.
 */
class gather_session {
public:
    ~gather_session();

    gather_session(const gather_session&) = delete;
    auto operator=(const gather_session&) -> gather_session& = delete;

    /**
     * @brief Stop the listing
     *
     * Idempotent. The subscription is released before this returns and no
     * update callback starts afterwards.
     */
    void cancel();

    [[nodiscard]] auto is_active() const -> bool;

    /**
     * @brief Update callbacks delivered so far
     */
    [[nodiscard]] auto update_count() const -> std::size_t;

    [[nodiscard]] auto id() const noexcept -> operation_id;

private:
    friend class gather_operation;

    struct state;
    explicit gather_session(std::shared_ptr<state> s);

    std::shared_ptr<state> state_;
};

/**
 * @brief Result of a gather
 *
 * Malformed index records never abort the listing; they are reported in
 * invalid_entries with their position and a description.
 */
struct gather_result {
    std::vector<item> items;
    std::vector<invalid_entry> invalid_entries;
    std::shared_ptr<gather_session> session;  ///< Set only for live gathers
};

/**
 * @brief Runs a listing through the metadata index view
 */
class gather_operation {
public:
    /**
     * @brief List the container
     *
     * The initial result comes from the gathering_complete notification and
     * is bounded by `timeout`; a warning is logged after `warning_after`.
     * With `on_update` the query stays open and every update re-emits the
     * full listing until the returned session is canceled.
     */
    [[nodiscard]] static auto run(const transfer_context& context,
                                  const gather_options& options,
                                  gather_update_callback on_update,
                                  std::chrono::milliseconds timeout,
                                  std::chrono::milliseconds warning_after)
        -> result<gather_result>;
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_GATHER_GATHER_OPERATION_H
