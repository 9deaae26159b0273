/**
 * @file item.cpp
 * @brief Index record parsing
 */

#include "kcenon/cloud_sync/core/item.h"

#include <cmath>

#include "kcenon/cloud_sync/core/logging.h"

namespace kcenon::cloud_sync {

namespace {

auto type_name(const metadata_value& value) -> const char* {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "bool";
        case 2: return "integer";
        case 3: return "double";
        case 4: return "string";
        default: return "unknown";
    }
}

auto wrong_type(const char* key, const char* expected, const metadata_value& value)
    -> unexpected {
    return unexpected{error{error_code::invalid_argument,
                            std::string(key) + " must be " + expected +
                                " (got: " + type_name(value) + ")"}};
}

// Absent keys and explicit nulls both read as "not provided"
auto find_value(const metadata_record& record, const char* key) -> const metadata_value* {
    auto it = record.find(key);
    if (it == record.end() || std::holds_alternative<std::monostate>(it->second)) {
        return nullptr;
    }
    return &it->second;
}

auto read_bool(const metadata_record& record, const char* key, bool& out)
    -> std::optional<unexpected> {
    const auto* value = find_value(record, key);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* b = std::get_if<bool>(value)) {
        out = *b;
        return std::nullopt;
    }
    return wrong_type(key, "a bool", *value);
}

auto read_number(const metadata_record& record, const char* key,
                 std::optional<double>& out) -> std::optional<unexpected> {
    const auto* value = find_value(record, key);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<int64_t>(value)) {
        out = static_cast<double>(*i);
        return std::nullopt;
    }
    if (const auto* d = std::get_if<double>(value)) {
        if (!std::isfinite(*d)) {
            return unexpected{error{error_code::invalid_argument,
                                    std::string(key) + " must be a finite number"}};
        }
        out = *d;
        return std::nullopt;
    }
    return wrong_type(key, "a number", *value);
}

// Keeps seconds * 1000 inside int64_t milliseconds
constexpr double max_timestamp_seconds = 9.0e15;

// Largest double that still converts to int64_t
constexpr double max_size_bytes = 9.2e18;

auto read_timestamp(const metadata_record& record, const char* key,
                    std::optional<std::chrono::system_clock::time_point>& out)
    -> std::optional<unexpected> {
    std::optional<double> seconds;
    if (auto err = read_number(record, key, seconds)) {
        return err;
    }
    if (seconds) {
        if (std::fabs(*seconds) > max_timestamp_seconds) {
            return unexpected{error{error_code::invalid_argument,
                                    std::string(key) + " is out of range"}};
        }
        auto ms = static_cast<int64_t>(std::llround(*seconds * 1000.0));
        out = std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
    }
    return std::nullopt;
}

auto read_failure(const metadata_record& record, const char* key,
                  std::optional<native_failure>& out) -> std::optional<unexpected> {
    const auto* value = find_value(record, key);
    if (!value) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        if (!s->empty()) {
            out = parse_native_failure(*s);
        }
        return std::nullopt;
    }
    return wrong_type(key, "a string", *value);
}

auto to_seconds(std::chrono::system_clock::time_point tp) -> double {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    return static_cast<double>(ms.count()) / 1000.0;
}

constexpr native_cause all_causes[] = {
    native_cause::no_such_file,
    native_cause::permission_denied,
    native_cause::container_unavailable,
    native_cause::network_unavailable,
    native_cause::invalid_argument,
    native_cause::busy,
    native_cause::other,
};

}  // namespace

auto download_status_from_string(std::string_view value) -> std::optional<download_status> {
    if (value == "not_downloaded") return download_status::not_downloaded;
    if (value == "downloaded") return download_status::downloaded;
    if (value == "current") return download_status::current;
    return std::nullopt;
}

auto parse_native_failure(std::string_view text) -> native_failure {
    auto colon = text.find(':');
    auto head = text.substr(0, colon);
    for (auto cause : all_causes) {
        if (head == to_string(cause)) {
            std::string_view rest;
            if (colon != std::string_view::npos) {
                rest = text.substr(colon + 1);
                while (!rest.empty() && rest.front() == ' ') {
                    rest.remove_prefix(1);
                }
            }
            return native_failure{cause, std::string(rest)};
        }
    }
    return native_failure{native_cause::other, std::string(text)};
}

auto format_native_failure(const native_failure& failure) -> std::string {
    std::string out = to_string(failure.cause);
    if (!failure.description.empty()) {
        out += ": " + failure.description;
    }
    return out;
}

auto parse_record(const metadata_record& record) -> result<item> {
    item parsed;

    const auto* path = find_value(record, record_key::path);
    if (!path) {
        return unexpected{error{error_code::invalid_argument,
                                "path is required and must be a string (got: null)"}};
    }
    const auto* path_str = std::get_if<std::string>(path);
    if (!path_str) {
        return wrong_type(record_key::path, "a string", *path);
    }
    parsed.path = *path_str;

    if (auto err = read_bool(record, record_key::is_directory, parsed.is_directory)) return *err;
    if (auto err = read_bool(record, record_key::is_downloading, parsed.is_downloading)) return *err;
    if (auto err = read_bool(record, record_key::is_uploading, parsed.is_uploading)) return *err;
    if (auto err = read_bool(record, record_key::is_uploaded, parsed.is_uploaded)) return *err;
    if (auto err = read_bool(record, record_key::has_unresolved_conflicts,
                             parsed.has_unresolved_conflicts)) {
        return *err;
    }

    std::optional<double> size;
    if (auto err = read_number(record, record_key::size_bytes, size)) return *err;
    if (size) {
        if (*size < 0) {
            return unexpected{error{error_code::invalid_argument,
                                    "size_bytes must be non-negative"}};
        }
        if (*size > max_size_bytes) {
            return unexpected{error{error_code::invalid_argument,
                                    "size_bytes is out of range"}};
        }
        parsed.size_bytes = static_cast<uint64_t>(std::llround(*size));
    }

    if (auto err = read_timestamp(record, record_key::created_at, parsed.created_at)) return *err;
    if (auto err = read_timestamp(record, record_key::modified_at, parsed.modified_at)) return *err;

    if (const auto* status = find_value(record, record_key::status)) {
        const auto* s = std::get_if<std::string>(status);
        if (!s) {
            return wrong_type(record_key::status, "a string", *status);
        }
        parsed.status = download_status_from_string(*s);
        if (!parsed.status) {
            CS_LOG_WARN(log_category::index,
                        "Unknown download status from index: " + *s);
        }
    }

    if (auto err = read_number(record, record_key::percent_downloaded,
                               parsed.percent_downloaded)) {
        return *err;
    }
    if (auto err = read_number(record, record_key::percent_uploaded,
                               parsed.percent_uploaded)) {
        return *err;
    }

    if (auto err = read_failure(record, record_key::download_error, parsed.download_error)) return *err;
    if (auto err = read_failure(record, record_key::upload_error, parsed.upload_error)) return *err;

    return parsed;
}

auto parse_records(const std::vector<metadata_record>& records) -> parsed_records {
    parsed_records out;
    out.items.reserve(records.size());

    for (std::size_t i = 0; i < records.size(); ++i) {
        auto parsed = parse_record(records[i]);
        if (parsed) {
            out.items.push_back(std::move(parsed.value()));
        } else {
            out.invalid_entries.push_back(
                invalid_entry{parsed.error().message, i, records[i]});
        }
    }

    return out;
}

auto to_record(const item& value) -> metadata_record {
    metadata_record record;
    record[record_key::path] = value.path;
    record[record_key::is_directory] = value.is_directory;
    record[record_key::is_downloading] = value.is_downloading;
    record[record_key::is_uploading] = value.is_uploading;
    record[record_key::is_uploaded] = value.is_uploaded;
    record[record_key::has_unresolved_conflicts] = value.has_unresolved_conflicts;

    if (value.size_bytes) {
        record[record_key::size_bytes] = static_cast<int64_t>(*value.size_bytes);
    }
    if (value.created_at) {
        record[record_key::created_at] = to_seconds(*value.created_at);
    }
    if (value.modified_at) {
        record[record_key::modified_at] = to_seconds(*value.modified_at);
    }
    if (value.status) {
        record[record_key::status] = std::string(to_string(*value.status));
    }
    if (value.percent_downloaded) {
        record[record_key::percent_downloaded] = *value.percent_downloaded;
    }
    if (value.percent_uploaded) {
        record[record_key::percent_uploaded] = *value.percent_uploaded;
    }
    if (value.download_error) {
        record[record_key::download_error] = format_native_failure(*value.download_error);
    }
    if (value.upload_error) {
        record[record_key::upload_error] = format_native_failure(*value.upload_error);
    }
    return record;
}

}  // namespace kcenon::cloud_sync
