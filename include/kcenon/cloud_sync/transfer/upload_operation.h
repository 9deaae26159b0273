/**
 * @file upload_operation.h
 * @brief Places a local file into the container and follows its upload
 */

#ifndef KCENON_CLOUD_SYNC_TRANSFER_UPLOAD_OPERATION_H
#define KCENON_CLOUD_SYNC_TRANSFER_UPLOAD_OPERATION_H

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

#include "kcenon/cloud_sync/transfer/transfer_operation.h"

namespace kcenon::cloud_sync {

/**
 * @brief Upload of one local file to a container path
 *
 * Each attempt subscribes to the index for the target path, then issues the
 * coordinated write unless a previous attempt already succeeded. Either the
 * write succeeding or the index reporting the item uploaded and no longer
 * uploading ends the transfer, whichever comes first. Upload flags are only
 * trusted from update notifications seen after the write was issued, since
 * the initial result may describe the previous version of the item.
 *
 * The idle watchdog is held while the coordinated write blocks, so a slow
 * write is never counted as a stall. A transient write failure keeps the
 * transfer waiting; the next retry re-issues the write. At most one write
 * per operation is in flight at a time.
 */
class upload_operation : public transfer_operation {
public:
    [[nodiscard]] static auto create(std::filesystem::path local_source,
                                     std::string cloud_path,
                                     transfer_config config,
                                     progress_callback on_event,
                                     std::shared_ptr<transfer_context> context)
        -> std::shared_ptr<upload_operation>;

    [[nodiscard]] auto local_source() const -> const std::filesystem::path& {
        return local_source_;
    }

protected:
    upload_operation(std::filesystem::path local_source,
                     std::string cloud_path,
                     transfer_config config,
                     progress_callback on_event,
                     std::shared_ptr<transfer_context> context);

    void start_attempt(uint32_t attempt) override;
    void on_index_event(index_event event, const index_snapshot& snapshot) override;
    [[nodiscard]] auto intent() const noexcept -> access_intent override {
        return access_intent::write;
    }

private:
    void run_write();

    const std::filesystem::path local_source_;
    std::atomic<bool> write_issued_{false};
    std::atomic<bool> write_succeeded_{false};
    std::atomic<bool> write_in_flight_{false};
};

}  // namespace kcenon::cloud_sync

#endif  // KCENON_CLOUD_SYNC_TRANSFER_UPLOAD_OPERATION_H
