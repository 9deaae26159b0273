/**
 * @file local_container.cpp
 * @brief Directory-backed container implementation
 */

#include "kcenon/cloud_sync/backend/local_container.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "kcenon/cloud_sync/core/item.h"
#include "kcenon/cloud_sync/core/logging.h"
#include "kcenon/cloud_sync/core/timer_service.h"

namespace kcenon::cloud_sync::backend {

namespace fs = std::filesystem;

auto failure_from_errno(int err, const std::string& what) -> native_failure {
    native_cause cause = native_cause::other;
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            cause = native_cause::no_such_file;
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            cause = native_cause::permission_denied;
            break;
        case ENETUNREACH:
        case ENETDOWN:
        case ETIMEDOUT:
            cause = native_cause::network_unavailable;
            break;
        case EINVAL:
        case ENAMETOOLONG:
            cause = native_cause::invalid_argument;
            break;
        case EBUSY:
        case EWOULDBLOCK:
            cause = native_cause::busy;
            break;
        default:
            break;
    }
    return native_failure{cause, "posix", err, what + ": " + std::strerror(err)};
}

namespace {

auto failure_from(const std::error_code& ec, const std::string& what) -> native_failure {
    return failure_from_errno(ec.value(), what);
}

/**
 * @brief Open descriptor holding a flock(2) lock; unlocks on destruction
 */
struct posix_lock {
    int fd = -1;

    posix_lock() = default;
    posix_lock(const posix_lock&) = delete;
    auto operator=(const posix_lock&) -> posix_lock& = delete;

    ~posix_lock() {
        if (fd >= 0) {
            ::flock(fd, LOCK_UN);
            ::close(fd);
        }
    }
};

/**
 * @brief Open `target` and lock it, retrying until `timeout`
 */
auto acquire_lock(const fs::path& target, int open_flags, int operation,
                  std::chrono::milliseconds timeout, posix_lock& lock)
    -> std::optional<native_failure> {
    lock.fd = ::open(target.c_str(), open_flags | O_CLOEXEC, 0600);
    if (lock.fd < 0) {
        return failure_from_errno(errno, "open " + target.string());
    }

    auto until = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (::flock(lock.fd, operation | LOCK_NB) == 0) {
            return std::nullopt;
        }
        int e = errno;
        if (e != EWOULDBLOCK && e != EAGAIN) {
            return failure_from_errno(e, "flock " + target.string());
        }
        if (std::chrono::steady_clock::now() >= until) {
            return native_failure{native_cause::busy, "posix", e,
                                  "lock timed out on " + target.string()};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

auto sibling_lock_path(const fs::path& target) -> fs::path {
    return target.parent_path() / ("." + target.filename().string() + ".lock");
}

auto is_hidden(const fs::path& p) -> bool {
    auto name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

}  // namespace

struct local_container::impl : std::enable_shared_from_this<local_container::impl> {
    struct query_entry {
        index_query query;
        query_callback callback;
    };

    local_container_config config;
    fs::path remote_root;
    timer_service timers;

    std::recursive_mutex dispatch_mutex;

    mutable std::mutex state_mutex;
    std::map<query_token, query_entry> queries;
    query_token next_token{1};
    std::unordered_map<std::string, double> fetching;
    std::unordered_map<std::string, native_failure> fetch_errors;
    bool available{true};

    explicit impl(local_container_config cfg)
        : config(std::move(cfg))
        , remote_root(config.root / config.remote_dir) {}

    auto local_path(const std::string& path) const -> fs::path {
        return config.root / path;
    }

    auto staged_path(const std::string& path) const -> fs::path {
        return remote_root / path;
    }

    void post(std::function<void(impl&)> work,
              std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        std::weak_ptr<impl> weak = weak_from_this();
        timers.schedule(delay, [weak, work = std::move(work)] {
            if (auto self = weak.lock()) {
                work(*self);
            }
        });
    }

    void deliver(query_token token, index_event event) {
        std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex);

        query_entry entry;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            auto it = queries.find(token);
            if (it == queries.end()) {
                return;
            }
            entry = it->second;
        }

        entry.callback(event, collect(entry.query));
    }

    void broadcast() {
        std::vector<query_token> tokens;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            tokens.reserve(queries.size());
            for (const auto& [token, entry] : queries) {
                tokens.push_back(token);
            }
        }
        for (auto token : tokens) {
            deliver(token, index_event::update);
        }
    }

    void schedule_poll() {
        if (config.poll_interval.count() <= 0) {
            return;
        }
        post([](impl& self) {
            self.broadcast();
            self.schedule_poll();
        }, config.poll_interval);
    }

    auto describe(const fs::path& absolute, const std::string& relative, bool remote_only) const
        -> item {
        item out;
        out.path = relative;

        std::error_code ec;
        out.is_directory = fs::is_directory(absolute, ec);
        if (!out.is_directory) {
            auto size = fs::file_size(absolute, ec);
            if (!ec) {
                out.size_bytes = size;
            }
        }
        auto written = fs::last_write_time(absolute, ec);
        if (!ec) {
            out.modified_at = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(written));
        }

        if (remote_only) {
            out.status = download_status::not_downloaded;
            out.is_uploaded = true;
            std::lock_guard<std::mutex> lock(state_mutex);
            if (auto it = fetching.find(relative); it != fetching.end()) {
                out.is_downloading = true;
                out.percent_downloaded = it->second;
            }
            if (auto it = fetch_errors.find(relative); it != fetch_errors.end()) {
                out.download_error = it->second;
            }
        } else {
            out.status = download_status::current;
            out.is_uploaded = true;
            out.percent_downloaded = 100.0;
        }
        return out;
    }

    void scan(const fs::path& base, bool remote_only, const index_query& query,
              std::vector<metadata_record>& out) const {
        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            return;
        }

        fs::recursive_directory_iterator it(base, ec);
        if (ec) {
            CS_LOG_WARN(log_category::backend, "Cannot scan '" + base.string() + "': " + ec.message());
            return;
        }
        for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            if (is_hidden(it->path())) {
                if (it->is_directory(ec)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            auto relative = fs::relative(it->path(), base, ec).generic_string();
            if (ec || !query.matches(relative)) {
                continue;
            }
            // Materialized entries shadow their staged counterparts
            if (remote_only && fs::exists(local_path(relative), ec)) {
                continue;
            }
            out.push_back(to_record(describe(it->path(), relative, remote_only)));
        }
    }

    auto collect(const index_query& query) const -> std::vector<metadata_record> {
        std::vector<metadata_record> records;
        if (query.mode == index_query::kind::exact) {
            std::error_code ec;
            if (fs::exists(local_path(query.path), ec)) {
                records.push_back(to_record(describe(local_path(query.path), query.path, false)));
            } else if (fs::exists(staged_path(query.path), ec)) {
                records.push_back(to_record(describe(staged_path(query.path), query.path, true)));
            }
            return records;
        }

        scan(config.root, false, query, records);
        scan(remote_root, true, query, records);
        return records;
    }

    /**
     * @brief Advance a fetch by one step; the last step materializes the item
     */
    void fetch_step(const std::string& path, int step) {
        constexpr int steps = 2;
        if (step < steps) {
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                auto it = fetching.find(path);
                if (it == fetching.end()) {
                    return;
                }
                it->second = 100.0 * step / steps;
            }
            broadcast();
            post([path, step](impl& self) { self.fetch_step(path, step + 1); },
                 config.fetch_step_delay);
            return;
        }

        std::error_code ec;
        auto target = local_path(path);
        fs::create_directories(target.parent_path(), ec);
        if (!ec) {
            fs::rename(staged_path(path), target, ec);
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            fetching.erase(path);
            if (ec) {
                fetch_errors[path] = failure_from(ec, "fetch " + path);
            }
        }
        if (ec) {
            CS_LOG_ERROR(log_category::backend, "Fetch failed: " + ec.message());
        } else {
            CS_LOG_DEBUG(log_category::backend, "Fetched '" + path + "'");
        }
        broadcast();
    }

    /**
     * @brief Locate an item either in the container or in the staging area
     */
    auto locate(const std::string& path, bool& remote_only) const -> std::optional<fs::path> {
        std::error_code ec;
        if (fs::exists(local_path(path), ec)) {
            remote_only = false;
            return local_path(path);
        }
        if (fs::exists(staged_path(path), ec)) {
            remote_only = true;
            return staged_path(path);
        }
        return std::nullopt;
    }
};

// ============================================================================
// local_container
// ============================================================================

local_container::local_container(local_container_config config)
    : impl_(std::make_shared<impl>(std::move(config))) {
    std::error_code ec;
    fs::create_directories(impl_->remote_root, ec);
    if (ec) {
        CS_LOG_ERROR(log_category::backend,
                     "Cannot create staging area '" + impl_->remote_root.string() + "': " +
                         ec.message());
    }
    impl_->schedule_poll();
}

local_container::~local_container() {
    impl_->timers.shutdown();
    std::lock_guard<std::recursive_mutex> dispatch(impl_->dispatch_mutex);
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->queries.clear();
}

auto local_container::start_query(const index_query& query, query_callback callback)
    -> result<query_token> {
    query_token token = 0;
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (!impl_->available) {
            return unexpected{error{error_code::container_unavailable,
                                    "container is signed out"}};
        }
        token = impl_->next_token++;
        impl_->queries.emplace(token, impl::query_entry{query, std::move(callback)});
    }

    impl_->post([token](impl& self) { self.deliver(token, index_event::gathering_complete); });
    return token;
}

void local_container::stop_query(query_token token) {
    // Waits for a delivery in flight on the notification thread
    std::lock_guard<std::recursive_mutex> dispatch(impl_->dispatch_mutex);
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->queries.erase(token);
}

auto local_container::snapshot(const index_query& query)
    -> result<std::vector<metadata_record>> {
    if (!container_available()) {
        return unexpected{error{error_code::container_unavailable, "container is signed out"}};
    }
    return impl_->collect(query);
}

auto local_container::coordinated_open(const std::string& path, access_mode mode)
    -> std::optional<native_failure> {
    posix_lock lock;
    int flags = mode == access_mode::read ? O_RDONLY : O_RDWR;
    int operation = mode == access_mode::read ? LOCK_SH : LOCK_EX;
    return acquire_lock(impl_->local_path(path), flags, operation, impl_->config.lock_timeout,
                        lock);
}

auto local_container::coordinated_write(const std::string& cloud_path,
                                        const fs::path& local_source)
    -> std::optional<native_failure> {
    std::error_code ec;
    if (!fs::is_regular_file(local_source, ec)) {
        return failure_from_errno(ENOENT, "source " + local_source.string());
    }

    auto target = impl_->local_path(cloud_path);
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return failure_from(ec, "create " + target.parent_path().string());
    }

    posix_lock lock;
    if (auto failure = acquire_lock(sibling_lock_path(target), O_CREAT | O_RDWR, LOCK_EX,
                                    impl_->config.lock_timeout, lock)) {
        return failure;
    }

    auto temp = target.parent_path() / ("." + target.filename().string() + ".tmp");
    fs::copy_file(local_source, temp, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return failure_from(ec, "copy " + local_source.string());
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(temp, cleanup);
        return failure_from(ec, "replace " + target.string());
    }

    // The written item supersedes any remote-only copy
    fs::remove_all(impl_->staged_path(cloud_path), ec);

    impl_->post([](impl& self) { self.broadcast(); });
    return std::nullopt;
}

auto local_container::coordinated_remove(const std::string& path)
    -> std::optional<native_failure> {
    bool remote_only = false;
    auto source = impl_->locate(path, remote_only);
    if (!source) {
        return failure_from_errno(ENOENT, "remove " + path);
    }

    std::error_code ec;
    fs::remove_all(*source, ec);
    if (ec) {
        return failure_from(ec, "remove " + path);
    }

    impl_->post([](impl& self) { self.broadcast(); });
    return std::nullopt;
}

auto local_container::coordinated_move(const std::string& from, const std::string& to)
    -> std::optional<native_failure> {
    bool remote_only = false;
    auto source = impl_->locate(from, remote_only);
    if (!source) {
        return failure_from_errno(ENOENT, "move " + from);
    }

    auto target = remote_only ? impl_->staged_path(to) : impl_->local_path(to);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        return failure_from_errno(EEXIST, "move to " + to);
    }
    fs::create_directories(target.parent_path(), ec);
    if (!ec) {
        fs::rename(*source, target, ec);
    }
    if (ec) {
        return failure_from(ec, "move " + from);
    }

    impl_->post([](impl& self) { self.broadcast(); });
    return std::nullopt;
}

auto local_container::coordinated_copy(const std::string& from, const std::string& to)
    -> std::optional<native_failure> {
    bool remote_only = false;
    auto source = impl_->locate(from, remote_only);
    if (!source) {
        return failure_from_errno(ENOENT, "copy " + from);
    }

    auto target = remote_only ? impl_->staged_path(to) : impl_->local_path(to);
    std::error_code ec;
    if (fs::exists(target, ec)) {
        return failure_from_errno(EEXIST, "copy to " + to);
    }
    fs::create_directories(target.parent_path(), ec);
    if (!ec) {
        fs::copy(*source, target, fs::copy_options::recursive, ec);
    }
    if (ec) {
        return failure_from(ec, "copy " + from);
    }

    impl_->post([](impl& self) { self.broadcast(); });
    return std::nullopt;
}

auto local_container::request_fetch(const std::string& path)
    -> std::optional<native_failure> {
    if (!container_available()) {
        return native_failure{native_cause::container_unavailable, "container is signed out"};
    }

    bool remote_only = false;
    if (!impl_->locate(path, remote_only)) {
        return failure_from_errno(ENOENT, "fetch " + path);
    }
    if (!remote_only) {
        impl_->post([](impl& self) { self.broadcast(); });
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        impl_->fetch_errors.erase(path);
        if (!impl_->fetching.emplace(path, 0.0).second) {
            return std::nullopt;
        }
    }

    CS_LOG_DEBUG(log_category::backend, "Fetch requested for '" + path + "'");
    impl_->post([path](impl& self) { self.fetch_step(path, 1); },
                impl_->config.fetch_step_delay);
    return std::nullopt;
}

auto local_container::local_exists(const std::string& path) -> bool {
    std::error_code ec;
    return fs::exists(impl_->local_path(path), ec);
}

auto local_container::container_available() -> bool {
    {
        std::lock_guard<std::mutex> lock(impl_->state_mutex);
        if (!impl_->available) {
            return false;
        }
    }
    std::error_code ec;
    return fs::is_directory(impl_->config.root, ec);
}

auto local_container::container_path() -> std::optional<fs::path> {
    std::error_code ec;
    auto absolute = fs::absolute(impl_->config.root, ec);
    if (ec) {
        return impl_->config.root;
    }
    return absolute.lexically_normal();
}

void local_container::refresh() {
    impl_->post([](impl& self) { self.broadcast(); });
}

auto local_container::stage_remote(const std::string& path, const std::string& content)
    -> std::optional<native_failure> {
    auto target = impl_->staged_path(path);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return failure_from(ec, "stage " + path);
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return failure_from_errno(errno != 0 ? errno : EIO, "stage " + path);
    }
    out << content;
    if (!out.flush()) {
        return failure_from_errno(EIO, "stage " + path);
    }
    return std::nullopt;
}

void local_container::set_available(bool available) {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    impl_->available = available;
}

auto local_container::active_queries() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->queries.size();
}

auto local_container::root() const -> const fs::path& {
    return impl_->config.root;
}

}  // namespace kcenon::cloud_sync::backend
