/**
 * @file timer_service.cpp
 * @brief Implementation of the shared deadline timer
 */

#include "kcenon/cloud_sync/core/timer_service.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace kcenon::cloud_sync {

struct timer_service::impl {
    struct entry {
        clock::time_point deadline;
        std::function<void()> callback;
    };

    mutable std::mutex mutex;
    std::condition_variable wake_cv;
    std::condition_variable done_cv;
    std::multimap<clock::time_point, timer_id> deadlines;
    std::unordered_map<timer_id, entry> entries;
    timer_id next_id{1};
    timer_id running_id{0};
    bool stopping{false};
    std::thread worker;

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            if (deadlines.empty()) {
                wake_cv.wait(lock);
                continue;
            }

            auto first = deadlines.begin();
            if (clock::now() < first->first) {
                wake_cv.wait_until(lock, first->first);
                continue;
            }

            auto id = first->second;
            deadlines.erase(first);
            auto it = entries.find(id);
            if (it == entries.end()) {
                continue;
            }
            auto callback = std::move(it->second.callback);
            entries.erase(it);

            running_id = id;
            lock.unlock();
            callback();
            lock.lock();
            running_id = 0;
            done_cv.notify_all();
        }
    }

    void erase_deadline(timer_id id, clock::time_point deadline) {
        auto range = deadlines.equal_range(deadline);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == id) {
                deadlines.erase(it);
                return;
            }
        }
    }
};

timer_service::timer_service()
    : impl_(std::make_shared<impl>()) {
    impl_->worker = std::thread([p = impl_] { p->run(); });
}

timer_service::~timer_service() {
    shutdown();
}

auto timer_service::schedule(clock::duration delay, std::function<void()> callback)
    -> timer_id {
    timer_id id = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) {
            return 0;
        }
        id = impl_->next_id++;
        auto deadline = clock::now() + delay;
        impl_->entries.emplace(id, impl::entry{deadline, std::move(callback)});
        impl_->deadlines.emplace(deadline, id);
    }
    impl_->wake_cv.notify_one();
    return id;
}

auto timer_service::cancel(timer_id id) -> bool {
    if (id == 0) {
        return false;
    }

    std::unique_lock<std::mutex> lock(impl_->mutex);
    auto it = impl_->entries.find(id);
    if (it != impl_->entries.end()) {
        impl_->erase_deadline(id, it->second.deadline);
        impl_->entries.erase(it);
        return true;
    }

    if (std::this_thread::get_id() != impl_->worker.get_id()) {
        impl_->done_cv.wait(lock, [this, id] { return impl_->running_id != id; });
    }
    return false;
}

auto timer_service::discard(timer_id id) -> bool {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->entries.find(id);
    if (it == impl_->entries.end()) {
        return false;
    }
    impl_->erase_deadline(id, it->second.deadline);
    impl_->entries.erase(it);
    return true;
}

void timer_service::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) {
            return;
        }
        impl_->stopping = true;
        impl_->deadlines.clear();
        impl_->entries.clear();
    }
    impl_->wake_cv.notify_all();

    if (!impl_->worker.joinable()) {
        return;
    }
    // The last owner may be released from inside a timer callback
    if (impl_->worker.get_id() == std::this_thread::get_id()) {
        impl_->worker.detach();
    } else {
        impl_->worker.join();
    }
}

auto timer_service::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entries.size();
}

auto timer_service::is_timer_thread() const -> bool {
    return impl_->worker.get_id() == std::this_thread::get_id();
}

}  // namespace kcenon::cloud_sync
