/**
 * @file download_operation.cpp
 * @brief Implementation of the download operation
 */

#include "kcenon/cloud_sync/transfer/download_operation.h"

namespace kcenon::cloud_sync {

namespace {

auto find_item(const index_snapshot& snapshot, const std::string& path) -> const item* {
    for (const auto& candidate : snapshot.items) {
        if (candidate.path == path) {
            return &candidate;
        }
    }
    return nullptr;
}

}  // namespace

auto download_operation::create(std::string path,
                                transfer_config config,
                                progress_callback on_event,
                                std::shared_ptr<transfer_context> context)
    -> std::shared_ptr<download_operation> {
    return std::shared_ptr<download_operation>(new download_operation(
        std::move(path), std::move(config), std::move(on_event), std::move(context)));
}

download_operation::download_operation(std::string path,
                                       transfer_config config,
                                       progress_callback on_event,
                                       std::shared_ptr<transfer_context> context)
    : transfer_operation(transfer_kind::download, std::move(path), std::move(config),
                         std::move(on_event), std::move(context)) {}

void download_operation::start_attempt(uint32_t attempt) {
    if (attempt > 1) {
        // A new attempt may disambiguate an empty result again
        disambiguated_.store(false);
    }

    if (auto failure = context().access->request_fetch(path())) {
        auto err = classify(*failure, intent());
        auto ctx = log_context();
        ctx.error_code = std::string(to_string(err.code));
        ctx.error_message = err.message;
        CS_LOG_WARN_CTX(log_category::transfer, "Fetch request failed", ctx);
        retry_or_fail(std::move(err));
        return;
    }

    if (auto subscribed = subscribe(); !subscribed) {
        if (!is_finished()) {
            retry_or_fail(subscribed.error());
        }
    }
}

void download_operation::on_index_event(index_event event, const index_snapshot& snapshot) {
    const item* current = find_item(snapshot, path());
    if (!current) {
        if (event == index_event::gathering_complete && !disambiguated_.exchange(true)) {
            schedule_open(open_reason::disambiguate);
        }
        return;
    }

    observe_transition(*current);

    if (current->download_error) {
        retry_or_fail(classify(*current->download_error, intent()));
        return;
    }

    if (current->percent_downloaded) {
        report_progress(*current->percent_downloaded);
    }

    if (current->is_current()) {
        schedule_open(open_reason::current);
    }
}

void download_operation::observe_transition(const item& current) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(observed_mutex_);
        if (current.status != last_status_ || current.is_downloading != last_downloading_) {
            last_status_ = current.status;
            last_downloading_ = current.is_downloading;
            changed = true;
        }
    }
    if (changed) {
        note_activity();
    }
}

void download_operation::schedule_open(open_reason reason) {
    if (reason == open_reason::current) {
        current_seen_.store(true);
    }
    if (open_in_flight_.exchange(true)) {
        return;
    }
    submit(adapters::pool_stage::coordinated_open, [reason](transfer_operation& op) {
        static_cast<download_operation&>(op).run_open(reason);
    });
}

void download_operation::run_open(open_reason reason) {
    auto failure = context().access->coordinated_open(path(), access_mode::read);
    open_in_flight_.store(false);

    if (!failure) {
        finish_success(true);
        return;
    }

    auto err = classify(*failure, intent());
    if (reason == open_reason::disambiguate && err.code != error_code::not_found_on_read) {
        // Not readable yet; keep waiting for the index
        CS_LOG_DEBUG(log_category::transfer,
                     "Item not yet readable, waiting for index: " + failure->to_string());
        if (current_seen_.load()) {
            schedule_open(open_reason::current);
        }
        return;
    }
    finish_error(std::move(err));
}

}  // namespace kcenon::cloud_sync
