/**
 * @file observer_registry.cpp
 * @brief Implementation of the observer registry
 */

#include "kcenon/cloud_sync/registry/observer_registry.h"

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "kcenon/cloud_sync/core/logging.h"

namespace kcenon::cloud_sync {

namespace {

struct entry {
    operation_id owner;
    std::unique_ptr<index_subscription> subscription;
    std::atomic<bool> claimed{false};
};

}  // namespace

struct observer_registry::impl {
    mutable std::mutex mutex;
    std::unordered_map<observer_token, std::shared_ptr<entry>> entries;
    observer_token next_token{1};

    std::atomic<std::size_t> registered{0};
    std::atomic<std::size_t> released{0};
    std::atomic<std::size_t> attached{0};
    std::atomic<std::size_t> stopped{0};

    auto find(observer_token token) const -> std::shared_ptr<entry> {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = entries.find(token);
        return it != entries.end() ? it->second : nullptr;
    }

    void stop(std::unique_ptr<index_subscription> subscription) {
        if (subscription) {
            subscription->stop();
            stopped.fetch_add(1, std::memory_order_relaxed);
        }
    }
};

observer_registry::observer_registry()
    : impl_(std::make_unique<impl>()) {}

observer_registry::~observer_registry() {
    release_all();
}

auto observer_registry::register_observer(operation_id id,
                                          std::unique_ptr<index_subscription> subscription)
    -> observer_token {
    auto e = std::make_shared<entry>();
    e->owner = id;
    if (subscription) {
        impl_->attached.fetch_add(1, std::memory_order_relaxed);
    }
    e->subscription = std::move(subscription);

    observer_token token = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        token = impl_->next_token++;
        impl_->entries.emplace(token, std::move(e));
    }
    impl_->registered.fetch_add(1, std::memory_order_relaxed);

    CS_LOG_TRACE(log_category::registry,
                 "Registered token " + std::to_string(token) + " for operation " +
                     std::to_string(id.value));
    return token;
}

auto observer_registry::rebind(observer_token token,
                               std::unique_ptr<index_subscription> subscription)
    -> result<void> {
    if (subscription) {
        impl_->attached.fetch_add(1, std::memory_order_relaxed);
    }

    std::unique_ptr<index_subscription> previous;
    std::optional<error_code> failure;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->entries.find(token);
        if (it == impl_->entries.end()) {
            failure = error_code::transfer_not_found;
        } else if (it->second->claimed.load(std::memory_order_acquire)) {
            failure = error_code::already_completed;
        } else {
            previous = std::move(it->second->subscription);
            it->second->subscription = std::move(subscription);
        }
    }

    if (failure) {
        impl_->stop(std::move(subscription));
        return unexpected{error{*failure}};
    }

    impl_->stop(std::move(previous));
    return {};
}

void observer_registry::release(observer_token token) {
    std::shared_ptr<entry> removed;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->entries.find(token);
        if (it == impl_->entries.end()) {
            return;
        }
        removed = std::move(it->second);
        impl_->entries.erase(it);
    }

    impl_->stop(std::move(removed->subscription));
    impl_->released.fetch_add(1, std::memory_order_relaxed);

    CS_LOG_TRACE(log_category::registry,
                 "Released token " + std::to_string(token) + " for operation " +
                     std::to_string(removed->owner.value));
}

auto observer_registry::try_claim(observer_token token) -> bool {
    auto e = impl_->find(token);
    if (!e) {
        return false;
    }
    bool expected = false;
    return e->claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

auto observer_registry::is_claimed(observer_token token) const -> bool {
    auto e = impl_->find(token);
    return e && e->claimed.load(std::memory_order_acquire);
}

auto observer_registry::operation_for(observer_token token) const
    -> std::optional<operation_id> {
    auto e = impl_->find(token);
    if (!e) {
        return std::nullopt;
    }
    return e->owner;
}

void observer_registry::release_all() {
    std::vector<observer_token> tokens;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        tokens.reserve(impl_->entries.size());
        for (const auto& [token, e] : impl_->entries) {
            tokens.push_back(token);
        }
    }
    for (auto token : tokens) {
        release(token);
    }
}

auto observer_registry::registered_count() const -> std::size_t {
    return impl_->registered.load(std::memory_order_relaxed);
}

auto observer_registry::released_count() const -> std::size_t {
    return impl_->released.load(std::memory_order_relaxed);
}

auto observer_registry::active_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entries.size();
}

auto observer_registry::subscriptions_attached() const -> std::size_t {
    return impl_->attached.load(std::memory_order_relaxed);
}

auto observer_registry::subscriptions_stopped() const -> std::size_t {
    return impl_->stopped.load(std::memory_order_relaxed);
}

}  // namespace kcenon::cloud_sync
