/**
 * @file sync_engine.cpp
 * @brief Sync coordination engine implementation
 */

#include "kcenon/cloud_sync/engine/sync_engine.h"

#include <mutex>
#include <unordered_map>
#include <vector>

#include "kcenon/cloud_sync/adapters/task_pool_adapter.h"
#include "kcenon/cloud_sync/core/error_classifier.h"
#include "kcenon/cloud_sync/core/logging.h"
#include "kcenon/cloud_sync/core/path_validation.h"
#include "kcenon/cloud_sync/core/timer_service.h"
#include "kcenon/cloud_sync/index/metadata_index_view.h"
#include "kcenon/cloud_sync/registry/observer_registry.h"
#include "kcenon/cloud_sync/transfer/download_operation.h"
#include "kcenon/cloud_sync/transfer/transfer_context.h"
#include "kcenon/cloud_sync/transfer/upload_operation.h"

namespace kcenon::cloud_sync {

namespace {

/**
 * @brief Running transfers, shared with their finished callbacks
 */
struct operation_table {
    std::mutex mutex;
    std::unordered_map<operation_id, std::shared_ptr<transfer_operation>> operations;

    void add(const std::shared_ptr<transfer_operation>& op) {
        std::lock_guard<std::mutex> lock(mutex);
        operations.emplace(op->id(), op);
    }

    void remove(operation_id id) {
        std::shared_ptr<transfer_operation> removed;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = operations.find(id);
            if (it == operations.end()) {
                return;
            }
            removed = std::move(it->second);
            operations.erase(it);
        }
        // removed is released outside the lock
    }

    auto take_all() -> std::vector<std::shared_ptr<transfer_operation>> {
        std::vector<std::shared_ptr<transfer_operation>> out;
        std::lock_guard<std::mutex> lock(mutex);
        out.reserve(operations.size());
        for (auto& [id, op] : operations) {
            out.push_back(std::move(op));
        }
        operations.clear();
        return out;
    }
};

auto structural_context(const char* operation, const std::string& path) -> sync_log_context {
    sync_log_context ctx;
    ctx.operation_id = std::to_string(operation_id::next().value);
    ctx.path = path;
    ctx.operation = operation;
    return ctx;
}

}  // namespace

struct sync_engine::impl {
    engine_config config;
    std::shared_ptr<metadata_index> index;
    std::shared_ptr<transfer_context> context;
    std::shared_ptr<operation_table> operations;

    impl(engine_config cfg,
         std::shared_ptr<metadata_index> idx,
         std::shared_ptr<coordinated_access> access)
        : config(std::move(cfg))
        , index(std::move(idx))
        , context(std::make_shared<transfer_context>())
        , operations(std::make_shared<operation_table>()) {
        context->view = std::make_shared<metadata_index_view>(index);
        context->access = std::move(access);
        context->registry = std::make_shared<observer_registry>();
        context->pool = adapters::task_pool_factory::create(config.worker_count, config.pool_name);
        context->timers = std::make_shared<timer_service>();
        context->counters = std::make_shared<transfer_counters>();
    }

    auto ensure_available() const -> result<void> {
        if (!context->access->container_available()) {
            return unexpected{error{error_code::container_unavailable,
                                    "container is not reachable"}};
        }
        return {};
    }

    /**
     * @brief Track the operation, then start it
     */
    auto launch(const std::shared_ptr<transfer_operation>& op) -> result<transfer_handle> {
        operations->add(op);

        std::weak_ptr<operation_table> table = operations;
        op->set_finished_callback([table](operation_id id) {
            if (auto locked = table.lock()) {
                locked->remove(id);
            }
        });

        if (auto started = op->begin(); !started) {
            operations->remove(op->id());
            return unexpected{started.error()};
        }
        return transfer_handle{op};
    }

    /**
     * @brief Resolve the source of a structural operation
     */
    auto resolve(const std::string& path, sync_log_context& ctx) -> result<void> {
        auto found = context->view->lookup(path, config.metadata_query_timeout,
                                           config.metadata_query_warning);
        if (!found) {
            ctx.error_code = std::string(to_string(found.error().code));
            ctx.error_message = found.error().message;
            CS_LOG_ERROR_CTX(log_category::structural, "Source lookup failed", ctx);
            return unexpected{found.error()};
        }
        if (!found.value()) {
            CS_LOG_WARN_CTX(log_category::structural, "Source not found", ctx);
            return unexpected{error{error_code::not_found, "no item at '" + path + "'"}};
        }
        return {};
    }

    auto mutate(const std::optional<native_failure>& failure, sync_log_context& ctx)
        -> result<void> {
        if (failure) {
            auto err = classify(*failure, access_intent::mutate);
            ctx.error_code = std::string(to_string(err.code));
            ctx.error_message = err.message;
            CS_LOG_ERROR_CTX(log_category::structural, "Structural operation failed", ctx);
            return unexpected{std::move(err)};
        }
        CS_LOG_INFO_CTX(log_category::structural, "Structural operation completed", ctx);
        return {};
    }

    void shutdown() {
        for (auto& op : operations->take_all()) {
            if (auto canceled = op->cancel(); !canceled) {
                CS_LOG_DEBUG(log_category::engine,
                             "Transfer " + std::to_string(op->id().value) +
                                 " finished before shutdown");
            }
        }
        context->pool->shutdown();
        context->timers->shutdown();
        context->registry->release_all();
        CS_LOG_INFO(log_category::engine, "Engine stopped");
    }
};

// ============================================================================
// Builder
// ============================================================================

sync_engine::builder::builder() = default;

auto sync_engine::builder::with_index(std::shared_ptr<metadata_index> index) -> builder& {
    index_ = std::move(index);
    return *this;
}

auto sync_engine::builder::with_access(std::shared_ptr<coordinated_access> access) -> builder& {
    access_ = std::move(access);
    return *this;
}

auto sync_engine::builder::with_config(const engine_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto sync_engine::builder::with_idle_interval(std::chrono::milliseconds interval) -> builder& {
    config_.transfer.idle_interval = interval;
    return *this;
}

auto sync_engine::builder::with_retry_policy(const retry_policy& policy) -> builder& {
    config_.transfer.retry = policy;
    return *this;
}

auto sync_engine::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto sync_engine::builder::with_metadata_query_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.metadata_query_timeout = timeout;
    return *this;
}

auto sync_engine::builder::with_metadata_query_warning(std::chrono::milliseconds warning_after)
    -> builder& {
    config_.metadata_query_warning = warning_after;
    return *this;
}

auto sync_engine::builder::with_logging(const log_settings& settings) -> builder& {
    config_.logging = settings;
    return *this;
}

auto sync_engine::builder::build() -> result<sync_engine> {
    if (!index_) {
        return unexpected{error{error_code::config_invalid, "A metadata index is required"}};
    }
    if (!access_) {
        return unexpected{error{error_code::config_invalid,
                                "A coordinated access primitive is required"}};
    }

    const auto& transfer = config_.transfer;
    if (transfer.idle_interval.count() <= 0) {
        return unexpected{error{error_code::config_invalid, "Idle interval must be positive"}};
    }
    if (transfer.retry.max_attempts < 1) {
        return unexpected{error{error_code::config_invalid, "At least one attempt is required"}};
    }
    if (transfer.retry.backoff_multiplier < 1.0) {
        return unexpected{error{error_code::config_invalid,
                                "Backoff multiplier must be at least 1.0"}};
    }
    if (transfer.retry.jitter < 0.0 || transfer.retry.jitter > 1.0) {
        return unexpected{error{error_code::config_invalid, "Jitter must be within [0, 1]"}};
    }
    if (transfer.retry.initial_delay.count() < 0 ||
        transfer.retry.max_delay < transfer.retry.initial_delay) {
        return unexpected{error{error_code::config_invalid,
                                "Retry delays must satisfy 0 <= initial <= max"}};
    }
    if (config_.metadata_query_timeout.count() <= 0) {
        return unexpected{error{error_code::config_invalid,
                                "Metadata query timeout must be positive"}};
    }

    return sync_engine{std::move(config_), std::move(index_), std::move(access_)};
}

// ============================================================================
// sync_engine
// ============================================================================

sync_engine::sync_engine(engine_config config,
                         std::shared_ptr<metadata_index> index,
                         std::shared_ptr<coordinated_access> access)
    : impl_(std::make_unique<impl>(std::move(config), std::move(index), std::move(access))) {
    get_logger().configure(impl_->config.logging);
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    CS_LOG_INFO(log_category::engine,
                "Engine started with " + std::to_string(impl_->context->pool->worker_count()) +
                    " workers");
}

sync_engine::sync_engine(sync_engine&&) noexcept = default;
auto sync_engine::operator=(sync_engine&&) noexcept -> sync_engine& = default;

sync_engine::~sync_engine() {
    if (impl_) {
        impl_->shutdown();
    }
}

auto sync_engine::download(const std::string& path, progress_callback on_progress)
    -> result<bool> {
    download_options options;
    options.on_event = std::move(on_progress);

    auto handle = start_download(path, std::move(options));
    if (!handle) {
        return unexpected{handle.error()};
    }

    auto outcome = handle.value().wait();
    if (!outcome) {
        return unexpected{outcome.error()};
    }
    return outcome.value().local_available;
}

auto sync_engine::start_download(const std::string& path, download_options options)
    -> result<transfer_handle> {
    if (auto valid = validate_relative_path(path); !valid) {
        return unexpected{valid.error()};
    }
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }

    auto op = download_operation::create(
        path, options.transfer.value_or(impl_->config.transfer), std::move(options.on_event),
        impl_->context);
    return impl_->launch(op);
}

auto sync_engine::upload(const std::filesystem::path& local_source,
                         const std::string& cloud_path,
                         progress_callback on_progress) -> result<void> {
    upload_options options;
    options.on_event = std::move(on_progress);

    auto handle = start_upload(local_source, cloud_path, std::move(options));
    if (!handle) {
        return unexpected{handle.error()};
    }

    auto outcome = handle.value().wait();
    if (!outcome) {
        return unexpected{outcome.error()};
    }
    return {};
}

auto sync_engine::start_upload(const std::filesystem::path& local_source,
                               const std::string& cloud_path,
                               upload_options options) -> result<transfer_handle> {
    if (auto valid = validate_relative_path(cloud_path); !valid) {
        return unexpected{valid.error()};
    }
    if (local_source.empty()) {
        return unexpected{make_invalid_argument("local source path is empty")};
    }
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }

    auto op = upload_operation::create(
        local_source, cloud_path, options.transfer.value_or(impl_->config.transfer),
        std::move(options.on_event), impl_->context);
    return impl_->launch(op);
}

auto sync_engine::gather(const gather_options& options, gather_update_callback on_update)
    -> result<gather_result> {
    if (!options.root.empty()) {
        if (auto valid = validate_relative_path(options.root); !valid) {
            return unexpected{valid.error()};
        }
    }
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }

    return gather_operation::run(*impl_->context, options, std::move(on_update),
                                 impl_->config.metadata_query_timeout,
                                 impl_->config.metadata_query_warning);
}

auto sync_engine::remove(const std::string& path) -> result<void> {
    if (auto valid = validate_relative_path(path); !valid) {
        return unexpected{valid.error()};
    }
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }

    auto ctx = structural_context("remove", path);
    if (auto resolved = impl_->resolve(path, ctx); !resolved) {
        return resolved;
    }
    return impl_->mutate(impl_->context->access->coordinated_remove(path), ctx);
}

auto sync_engine::move(const std::string& from, const std::string& to) -> result<void> {
    if (auto valid = validate_relative_path(from); !valid) {
        return unexpected{valid.error()};
    }
    if (auto valid = validate_relative_path(to); !valid) {
        return unexpected{valid.error()};
    }
    if (from == to) {
        return unexpected{make_invalid_argument("source and destination are the same")};
    }
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }

    auto ctx = structural_context("move", from);
    if (auto resolved = impl_->resolve(from, ctx); !resolved) {
        return resolved;
    }
    return impl_->mutate(impl_->context->access->coordinated_move(from, to), ctx);
}

auto sync_engine::copy(const std::string& from, const std::string& to) -> result<void> {
    if (auto valid = validate_relative_path(from); !valid) {
        return unexpected{valid.error()};
    }
    if (auto valid = validate_relative_path(to); !valid) {
        return unexpected{valid.error()};
    }
    if (from == to) {
        return unexpected{make_invalid_argument("source and destination are the same")};
    }
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }

    auto ctx = structural_context("copy", from);
    if (auto resolved = impl_->resolve(from, ctx); !resolved) {
        return resolved;
    }
    return impl_->mutate(impl_->context->access->coordinated_copy(from, to), ctx);
}

auto sync_engine::rename(const std::string& path, const std::string& new_name)
    -> result<void> {
    if (auto valid = validate_component(new_name); !valid) {
        return unexpected{valid.error()};
    }
    if (auto valid = validate_relative_path(path); !valid) {
        return unexpected{valid.error()};
    }
    return move(path, join_path(parent_path(path), new_name));
}

auto sync_engine::exists(const std::string& path) -> result<bool> {
    if (auto valid = validate_relative_path(path); !valid) {
        return unexpected{valid.error()};
    }
    return impl_->context->access->local_exists(path);
}

auto sync_engine::get_metadata(const std::string& path) -> result<std::optional<item>> {
    if (auto valid = validate_relative_path(path); !valid) {
        return unexpected{valid.error()};
    }
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }
    return impl_->context->view->lookup(path, impl_->config.metadata_query_timeout,
                                        impl_->config.metadata_query_warning);
}

auto sync_engine::is_available() const -> bool {
    return impl_->context->access->container_available();
}

auto sync_engine::container_path() const -> result<std::filesystem::path> {
    if (auto available = impl_->ensure_available(); !available) {
        return unexpected{available.error()};
    }
    auto path = impl_->context->access->container_path();
    if (!path) {
        return unexpected{error{error_code::container_unavailable,
                                "container has no local directory"}};
    }
    return *path;
}

auto sync_engine::get_statistics() const -> engine_statistics {
    const auto& counters = *impl_->context->counters;
    const auto& registry = *impl_->context->registry;

    engine_statistics stats;
    stats.completed_downloads = counters.completed_downloads.load();
    stats.completed_uploads = counters.completed_uploads.load();
    stats.failed_transfers = counters.failed.load();
    stats.timed_out_transfers = counters.timeouts.load();
    stats.canceled_transfers = counters.canceled.load();
    stats.retries = counters.retries.load();
    stats.active_transfers = static_cast<std::size_t>(counters.active.load());
    stats.active_subscriptions = impl_->context->view->active_subscriptions();
    stats.registered_observers = registry.registered_count();
    stats.released_observers = registry.released_count();
    return stats;
}

auto sync_engine::config() const -> const engine_config& {
    return impl_->config;
}

}  // namespace kcenon::cloud_sync
