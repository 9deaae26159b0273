/**
 * @file fake_access.h
 * @brief Scripted coordinated-access primitive for tests
 */

#ifndef KCENON_CLOUD_SYNC_TEST_FAKE_ACCESS_H
#define KCENON_CLOUD_SYNC_TEST_FAKE_ACCESS_H

#include <kcenon/cloud_sync/coordination/coordinated_access.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace kcenon::cloud_sync::test {

/**
 * @brief Coordinated access whose outcomes are set by the test
 *
 * Every primitive succeeds unless a hook is installed. Hooks run on the
 * calling thread (the engine's worker pool for opens and writes).
 */
class fake_access : public coordinated_access {
public:
    using path_hook = std::function<std::optional<native_failure>(const std::string&)>;
    using pair_hook =
        std::function<std::optional<native_failure>(const std::string&, const std::string&)>;

    auto coordinated_open(const std::string& path, access_mode mode)
        -> std::optional<native_failure> override {
        opens_.fetch_add(1);
        last_mode_.store(mode);
        return call(open_hook_, path);
    }

    auto coordinated_write(const std::string& cloud_path,
                           const std::filesystem::path& local_source)
        -> std::optional<native_failure> override {
        writes_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_source_ = local_source;
        }
        return call(write_hook_, cloud_path);
    }

    auto coordinated_remove(const std::string& path) -> std::optional<native_failure> override {
        removes_.fetch_add(1);
        return call(remove_hook_, path);
    }

    auto coordinated_move(const std::string& from, const std::string& to)
        -> std::optional<native_failure> override {
        moves_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_destination_ = to;
        }
        return call(move_hook_, from, to);
    }

    auto coordinated_copy(const std::string& from, const std::string& to)
        -> std::optional<native_failure> override {
        copies_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_destination_ = to;
        }
        return call(copy_hook_, from, to);
    }

    auto request_fetch(const std::string& path) -> std::optional<native_failure> override {
        fetches_.fetch_add(1);
        return call(fetch_hook_, path);
    }

    auto local_exists(const std::string& path) -> bool override {
        std::lock_guard<std::mutex> lock(mutex_);
        return local_.count(path) != 0;
    }

    auto container_available() -> bool override {
        return available_.load();
    }

    auto container_path() -> std::optional<std::filesystem::path> override {
        std::lock_guard<std::mutex> lock(mutex_);
        return container_path_;
    }

    // Scripting
    void on_open(path_hook hook) { set(open_hook_, std::move(hook)); }
    void on_write(path_hook hook) { set(write_hook_, std::move(hook)); }
    void on_remove(path_hook hook) { set(remove_hook_, std::move(hook)); }
    void on_fetch(path_hook hook) { set(fetch_hook_, std::move(hook)); }
    void on_move(pair_hook hook) { set(move_hook_, std::move(hook)); }
    void on_copy(pair_hook hook) { set(copy_hook_, std::move(hook)); }

    void set_local(const std::string& path, bool present) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (present) {
            local_.insert(path);
        } else {
            local_.erase(path);
        }
    }

    void set_available(bool available) { available_.store(available); }

    void set_container_path(std::optional<std::filesystem::path> path) {
        std::lock_guard<std::mutex> lock(mutex_);
        container_path_ = std::move(path);
    }

    [[nodiscard]] auto opens() const -> std::size_t { return opens_.load(); }
    [[nodiscard]] auto writes() const -> std::size_t { return writes_.load(); }
    [[nodiscard]] auto removes() const -> std::size_t { return removes_.load(); }
    [[nodiscard]] auto moves() const -> std::size_t { return moves_.load(); }
    [[nodiscard]] auto copies() const -> std::size_t { return copies_.load(); }
    [[nodiscard]] auto fetches() const -> std::size_t { return fetches_.load(); }
    [[nodiscard]] auto last_mode() const -> access_mode { return last_mode_.load(); }

    [[nodiscard]] auto last_destination() const -> std::string {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_destination_;
    }

    [[nodiscard]] auto last_source() const -> std::filesystem::path {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_source_;
    }

private:
    template <typename Hook>
    void set(Hook& slot, Hook hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot = std::move(hook);
    }

    template <typename Hook, typename... Args>
    auto call(const Hook& slot, const Args&... args) -> std::optional<native_failure> {
        Hook hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = slot;
        }
        if (!hook) {
            return std::nullopt;
        }
        return hook(args...);
    }

    mutable std::mutex mutex_;
    path_hook open_hook_;
    path_hook write_hook_;
    path_hook remove_hook_;
    path_hook fetch_hook_;
    pair_hook move_hook_;
    pair_hook copy_hook_;
    std::set<std::string> local_;
    std::string last_destination_;
    std::filesystem::path last_source_;
    std::optional<std::filesystem::path> container_path_{"/containers/iCloud.test"};

    std::atomic<bool> available_{true};
    std::atomic<access_mode> last_mode_{access_mode::read};
    std::atomic<std::size_t> opens_{0};
    std::atomic<std::size_t> writes_{0};
    std::atomic<std::size_t> removes_{0};
    std::atomic<std::size_t> moves_{0};
    std::atomic<std::size_t> copies_{0};
    std::atomic<std::size_t> fetches_{0};
};

/**
 * @brief Native failure reporting a missing item
 */
inline auto no_such_file(const std::string& what = "missing") -> native_failure {
    return native_failure{native_cause::no_such_file, "posix", 2, what};
}

}  // namespace kcenon::cloud_sync::test

#endif  // KCENON_CLOUD_SYNC_TEST_FAKE_ACCESS_H
