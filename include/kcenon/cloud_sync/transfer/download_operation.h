/**
 * @file download_operation.h
 * @brief Drives one remote item to a locally readable state
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_DOWNLOAD_OPERATION_H
#define KCENON_CLOUD_SYNC_TRANSFER_DOWNLOAD_OPERATION_H

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/cloud_sync/transfer/transfer_operation.h"

namespace kcenon::cloud_sync {

/**
 * @brief Download of one item
 *
 * Each attempt asks the container to fetch the item and subscribes to the
 * index for its path. Whenever the index reports the item as current, a
 * coordinated open for reading is scheduled on the worker pool; its success
 * ends the transfer. "Current" and "open succeeded" are independent signals:
 * an open reporting no-such-file after a current status still ends the
 * transfer with not_found_on_read.
 *
 * An empty initial result does not end the transfer, since the index is
 * never proof of absence. One coordinated open disambiguates it; anything
 * but success or no-such-file keeps the transfer waiting for the index.
 */
class download_operation : public transfer_operation {
public:
    [[nodiscard]] static auto create(std::string path,
                                     transfer_config config,
                                     progress_callback on_event,
                                     std::shared_ptr<transfer_context> context)
        -> std::shared_ptr<download_operation>;

protected:
    download_operation(std::string path,
                       transfer_config config,
                       progress_callback on_event,
                       std::shared_ptr<transfer_context> context);

    void start_attempt(uint32_t attempt) override;
    void on_index_event(index_event event, const index_snapshot& snapshot) override;
    [[nodiscard]] auto intent() const noexcept -> access_intent override {
        return access_intent::read;
    }

private:
    enum class open_reason {
        current,       ///< Index reported the item as current
        disambiguate   ///< Index returned nothing for the path
    };

    void schedule_open(open_reason reason);
    void run_open(open_reason reason);
    void observe_transition(const item& current);

    std::atomic<bool> open_in_flight_{false};
    std::atomic<bool> disambiguated_{false};
    std::atomic<bool> current_seen_{false};

    std::mutex observed_mutex_;
    std::optional<download_status> last_status_;
    bool last_downloading_{false};
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_DOWNLOAD_OPERATION_H
