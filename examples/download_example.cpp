/**
 * @file download_example.cpp
 * @brief Download an item from a directory-backed container
 *
 * This example demonstrates:
 * - Building an engine over a local container
 * - Staging a remote-only item and materializing it
 * - Watching progress events on the handle's channel
 * - Per-transfer idle and retry settings
 */

#include <kcenon/cloud_sync/cloud_sync.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

using namespace kcenon::cloud_sync;

void print_usage(const char* program) {
    std::cout << "Download Example - Cloud Sync" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <container_dir> <item_path>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --stage <content>       Stage the item as remote-only first" << std::endl;
    std::cout << "  --idle-ms <ms>          Idle interval before a retry (default: 60000)" << std::endl;
    std::cout << "  --attempts <n>          Attempts before giving up (default: 3)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " ./container Docs/report.pdf" << std::endl;
    std::cout << "  " << program << " --stage \"hello\" ./container Inbox/hello.txt" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string container_dir;
    std::string item_path;
    std::string staged_content;
    bool stage = false;
    transfer_config transfer;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--stage") {
            if (++i >= argc) {
                std::cerr << "Error: --stage requires an argument" << std::endl;
                return 1;
            }
            stage = true;
            staged_content = argv[i];
        } else if (arg == "--idle-ms") {
            if (++i >= argc) {
                std::cerr << "Error: --idle-ms requires an argument" << std::endl;
                return 1;
            }
            transfer.idle_interval = std::chrono::milliseconds(std::stoll(argv[i]));
        } else if (arg == "--attempts") {
            if (++i >= argc) {
                std::cerr << "Error: --attempts requires an argument" << std::endl;
                return 1;
            }
            transfer.retry.max_attempts = static_cast<uint32_t>(std::stoul(argv[i]));
        } else if (container_dir.empty()) {
            container_dir = arg;
        } else if (item_path.empty()) {
            item_path = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (container_dir.empty() || item_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto container = std::make_shared<backend::local_container>(
        backend::local_container_config{container_dir});

    if (stage) {
        if (auto failure = container->stage_remote(item_path, staged_content)) {
            std::cerr << "Failed to stage item: " << failure->to_string() << std::endl;
            return 1;
        }
        std::cout << "Staged remote-only item: " << item_path << std::endl;
    }

    auto engine_result = sync_engine::builder()
        .with_index(container)
        .with_access(container)
        .with_idle_interval(transfer.idle_interval)
        .with_retry_policy(transfer.retry)
        .build();

    if (!engine_result) {
        std::cerr << "Failed to create engine: " << engine_result.error().message << std::endl;
        return 1;
    }
    auto& engine = engine_result.value();

    auto handle = engine.start_download(item_path);
    if (!handle) {
        std::cerr << "Download rejected: " << handle.error().message << std::endl;
        return 1;
    }

    std::cout << "Downloading " << item_path << "..." << std::endl;
    while (auto event = handle.value().events().receive()) {
        if (event->type == progress_event_type::progress && event->percent) {
            std::cout << "\r  Progress: " << std::fixed << std::setprecision(1)
                      << *event->percent << "%" << std::flush;
        }
    }
    std::cout << std::endl;

    auto outcome = handle.value().wait();
    if (!outcome) {
        std::cerr << "Download failed: " << outcome.error().message
                  << " (" << to_string(outcome.error().code) << ")" << std::endl;
        return 1;
    }

    std::cout << "Download completed" << std::endl;
    std::cout << "  Local copy: " << (outcome.value().local_available ? "yes" : "no")
              << std::endl;
    if (auto root = engine.container_path()) {
        std::cout << "  Location: " << (root.value() / item_path).string() << std::endl;
    }
    std::cout << "  Attempts: " << outcome.value().attempts << std::endl;
    std::cout << "  Elapsed: " << outcome.value().elapsed.count() << " ms" << std::endl;

    auto stats = engine.get_statistics();
    std::cout << "  Retries: " << stats.retries << std::endl;
    return 0;
}
