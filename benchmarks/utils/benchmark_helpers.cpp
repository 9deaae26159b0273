/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::cloud_sync::benchmark {

namespace {

void write_random(const std::filesystem::path& path, std::size_t size, uint32_t seed) {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    std::vector<char> data(size);
    for (auto& byte : data) {
        byte = static_cast<char>(dis(gen));
    }

    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

}  // namespace

// record_generator implementation

auto record_generator::generate(std::size_t count,
                                std::size_t invalid_every,
                                uint32_t seed,
                                const std::string& root) -> std::vector<metadata_record> {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<int64_t> size_dis(0, 64 * 1024 * 1024);
    std::uniform_real_distribution<double> percent_dis(0.0, 100.0);
    std::uniform_int_distribution<int> status_dis(0, 2);

    static const char* statuses[] = {"not_downloaded", "downloaded", "current"};

    std::vector<metadata_record> records;
    records.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        metadata_record record;
        if (invalid_every == 0 || (i + 1) % invalid_every != 0) {
            record[record_key::path] = root + "/dir" + std::to_string(i % 32) + "/file" +
                                       std::to_string(i) + ".bin";
        }
        record[record_key::is_directory] = false;
        record[record_key::size_bytes] = size_dis(gen);
        record[record_key::modified_at] = int64_t{1700000000} + static_cast<int64_t>(i);
        record[record_key::status] = std::string(statuses[status_dis(gen)]);
        record[record_key::is_downloading] = (i % 5) == 0;
        record[record_key::is_uploaded] = true;
        record[record_key::percent_downloaded] = percent_dis(gen);
        records.push_back(std::move(record));
    }
    return records;
}

// temp_container implementation

temp_container::temp_container() {
    base_dir_ = std::filesystem::temp_directory_path() /
                ("cloud_sync_benchmarks_" + std::to_string(std::random_device{}()));
    root_ = base_dir_ / "container";
    sources_ = base_dir_ / "sources";

    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    std::filesystem::create_directories(sources_, ec);
}

temp_container::~temp_container() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto temp_container::root() const -> const std::filesystem::path& {
    return root_;
}

auto temp_container::sources() const -> const std::filesystem::path& {
    return sources_;
}

auto temp_container::create_source(const std::string& name, std::size_t size, uint32_t seed)
    -> std::filesystem::path {
    auto path = sources_ / name;
    write_random(path, size, seed);
    return path;
}

auto temp_container::create_item(const std::string& relative, std::size_t size, uint32_t seed)
    -> std::filesystem::path {
    auto path = root_ / relative;
    write_random(path, size, seed);
    return path;
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace kcenon::cloud_sync::benchmark
