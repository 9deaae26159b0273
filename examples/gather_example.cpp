/**
 * @file gather_example.cpp
 * @brief List a directory-backed container, optionally watching it
 *
 * This example demonstrates:
 * - One-shot listings with malformed records reported separately
 * - Live listings that keep delivering updates until canceled
 */

#include <kcenon/cloud_sync/cloud_sync.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace kcenon::cloud_sync;

namespace {

void print_items(const std::vector<item>& items) {
    for (const auto& value : items) {
        std::cout << "  " << (value.is_directory ? "[dir] " : "      ") << value.path;
        if (value.status) {
            std::cout << "  (" << to_string(*value.status) << ")";
        }
        if (value.is_downloading && value.percent_downloaded) {
            std::cout << "  " << *value.percent_downloaded << "%";
        }
        std::cout << std::endl;
    }
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Gather Example - Cloud Sync" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <container_dir> [root]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --watch <seconds>       Keep the listing open and print updates" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string container_dir;
    std::string root;
    int watch_seconds = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--watch") {
            if (++i >= argc) {
                std::cerr << "Error: --watch requires an argument" << std::endl;
                return 1;
            }
            watch_seconds = std::stoi(argv[i]);
        } else if (container_dir.empty()) {
            container_dir = arg;
        } else if (root.empty()) {
            root = arg;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (container_dir.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    backend::local_container_config config;
    config.root = container_dir;
    config.poll_interval = std::chrono::milliseconds(watch_seconds > 0 ? 1000 : 0);
    auto container = std::make_shared<backend::local_container>(std::move(config));

    auto engine_result = sync_engine::builder()
        .with_index(container)
        .with_access(container)
        .build();

    if (!engine_result) {
        std::cerr << "Failed to create engine: " << engine_result.error().message << std::endl;
        return 1;
    }
    auto& engine = engine_result.value();

    gather_update_callback on_update;
    if (watch_seconds > 0) {
        on_update = [](const std::vector<item>& items, const std::vector<invalid_entry>&) {
            std::cout << "Update: " << items.size() << " items" << std::endl;
            print_items(items);
        };
    }

    auto listed = engine.gather(gather_options{root}, on_update);
    if (!listed) {
        std::cerr << "Gather failed: " << listed.error().message << std::endl;
        return 1;
    }

    std::cout << "Listing of '" << (root.empty() ? "/" : root) << "': "
              << listed.value().items.size() << " items" << std::endl;
    print_items(listed.value().items);

    for (const auto& entry : listed.value().invalid_entries) {
        std::cerr << "  Skipped record #" << entry.index << ": " << entry.description
                  << std::endl;
    }

    if (listed.value().session) {
        std::this_thread::sleep_for(std::chrono::seconds(watch_seconds));
        listed.value().session->cancel();
        std::cout << "Received " << listed.value().session->update_count() << " updates"
                  << std::endl;
    }
    return 0;
}
