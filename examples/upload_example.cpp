/**
 * @file upload_example.cpp
 * @brief Upload a local file into a directory-backed container
 *
 * This example demonstrates:
 * - Coordinated writes through the engine
 * - Progress callbacks on the blocking API
 * - Reading the failure taxonomy on error
 */

#include <kcenon/cloud_sync/cloud_sync.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace kcenon::cloud_sync;

void print_usage(const char* program) {
    std::cout << "Upload Example - Cloud Sync" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " <container_dir> <local_file> <cloud_path>" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " ./container ./report.pdf Docs/report.pdf" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc != 4 || std::string(argv[1]) == "--help") {
        print_usage(argv[0]);
        return argc == 2 ? 0 : 1;
    }

    std::filesystem::path container_dir = argv[1];
    std::filesystem::path local_file = argv[2];
    std::string cloud_path = argv[3];

    auto container = std::make_shared<backend::local_container>(
        backend::local_container_config{container_dir});

    auto engine_result = sync_engine::builder()
        .with_index(container)
        .with_access(container)
        .build();

    if (!engine_result) {
        std::cerr << "Failed to create engine: " << engine_result.error().message << std::endl;
        return 1;
    }
    auto& engine = engine_result.value();

    if (!engine.is_available()) {
        std::cerr << "Container is not available: " << container_dir << std::endl;
        return 1;
    }

    std::cout << "Uploading " << local_file << " -> " << cloud_path << std::endl;
    auto uploaded = engine.upload(local_file, cloud_path, [](const transfer_progress_event& event) {
        if (event.type == progress_event_type::progress && event.percent) {
            std::cout << "  Progress: " << *event.percent << "%" << std::endl;
        }
    });

    if (!uploaded) {
        const auto& err = uploaded.error();
        std::cerr << "Upload failed: " << err.message << std::endl;
        switch (err.code) {
            case error_code::not_found_on_write:
                std::cerr << "  The source file does not exist" << std::endl;
                break;
            case error_code::container_unavailable:
                std::cerr << "  The container refused the write" << std::endl;
                break;
            case error_code::timeout:
                std::cerr << "  No progress was observed; try again later" << std::endl;
                break;
            default:
                if (err.cause) {
                    std::cerr << "  Cause: " << err.cause->to_string() << std::endl;
                }
                break;
        }
        return 1;
    }

    std::cout << "Upload completed" << std::endl;
    auto metadata = engine.get_metadata(cloud_path);
    if (metadata && metadata.value()) {
        std::cout << "  Size: " << metadata.value()->size_bytes.value_or(0) << " bytes"
                  << std::endl;
    }
    return 0;
}
