/**
 * @file upload_operation.cpp
 * @brief Implementation of the upload operation
 */

#include "kcenon/cloud_sync/transfer/upload_operation.h"

namespace kcenon::cloud_sync {

auto upload_operation::create(std::filesystem::path local_source,
                              std::string cloud_path,
                              transfer_config config,
                              progress_callback on_event,
                              std::shared_ptr<transfer_context> context)
    -> std::shared_ptr<upload_operation> {
    return std::shared_ptr<upload_operation>(new upload_operation(
        std::move(local_source), std::move(cloud_path), std::move(config),
        std::move(on_event), std::move(context)));
}

upload_operation::upload_operation(std::filesystem::path local_source,
                                   std::string cloud_path,
                                   transfer_config config,
                                   progress_callback on_event,
                                   std::shared_ptr<transfer_context> context)
    : transfer_operation(transfer_kind::upload, std::move(cloud_path), std::move(config),
                         std::move(on_event), std::move(context))
    , local_source_(std::move(local_source)) {}

void upload_operation::start_attempt([[maybe_unused]] uint32_t attempt) {
    if (auto subscribed = subscribe(); !subscribed) {
        if (!is_finished()) {
            retry_or_fail(subscribed.error());
        }
        return;
    }

    // A write still running from an earlier attempt is not re-issued
    if (write_in_flight_.load()) {
        hold_watchdog();
        return;
    }
    if (!write_succeeded_.load()) {
        run_write();
    }
}

void upload_operation::run_write() {
    write_issued_.store(true);
    write_in_flight_.store(true);
    hold_watchdog();

    auto failure = context().access->coordinated_write(path(), local_source_);
    write_in_flight_.store(false);
    if (!failure) {
        write_succeeded_.store(true);
        finish_success(true);
        return;
    }

    auto err = classify(*failure, intent());
    if (is_retryable(err.code)) {
        auto ctx = log_context();
        ctx.error_code = std::string(to_string(err.code));
        ctx.error_message = err.message;
        CS_LOG_WARN_CTX(log_category::transfer,
                        "Coordinated write failed, waiting for retry", ctx);
        release_watchdog();
        return;
    }
    finish_error(std::move(err));
}

void upload_operation::on_index_event(index_event event, const index_snapshot& snapshot) {
    for (const auto& current : snapshot.items) {
        if (current.path != path()) {
            continue;
        }

        if (current.upload_error) {
            retry_or_fail(classify(*current.upload_error, intent()));
            return;
        }

        if (current.percent_uploaded) {
            report_progress(*current.percent_uploaded);
        }

        if (event == index_event::update && write_issued_.load() &&
            current.is_upload_settled()) {
            finish_success(true);
        }
        return;
    }
}

}  // namespace kcenon::cloud_sync
