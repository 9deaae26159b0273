/**
 * @file path_validation.cpp
 * @brief Implementation of container-relative path validation
 */

#include "kcenon/cloud_sync/core/path_validation.h"

#include "kcenon/cloud_sync/core/error_classifier.h"

namespace kcenon::cloud_sync {

auto validate_component(std::string_view name) -> result<void> {
    if (name.empty()) {
        return unexpected{make_invalid_argument("path component is empty")};
    }
    if (name.size() > max_component_length) {
        return unexpected{make_invalid_argument(
            "path component exceeds " + std::to_string(max_component_length) + " bytes")};
    }
    if (name.find(':') != std::string_view::npos ||
        name.find('/') != std::string_view::npos) {
        return unexpected{make_invalid_argument(
            "path component contains ':' or '/': " + std::string(name))};
    }
    if (name.front() == '.') {
        return unexpected{make_invalid_argument(
            "path component starts with '.': " + std::string(name))};
    }
    return {};
}

auto validate_relative_path(std::string_view path) -> result<void> {
    if (path.empty()) {
        return unexpected{make_invalid_argument("path is empty")};
    }

    std::size_t start = 0;
    for (;;) {
        auto sep = path.find('/', start);
        auto component = path.substr(start, sep == std::string_view::npos
                                                ? std::string_view::npos
                                                : sep - start);
        auto checked = validate_component(component);
        if (!checked) {
            return unexpected{error{error_code::invalid_argument,
                                    checked.error().message + " (in \"" +
                                        std::string(path) + "\")"}};
        }
        if (sep == std::string_view::npos) {
            break;
        }
        start = sep + 1;
    }
    return {};
}

auto parent_path(std::string_view path) -> std::string {
    auto sep = path.find_last_of('/');
    if (sep == std::string_view::npos) {
        return {};
    }
    return std::string(path.substr(0, sep));
}

auto last_component(std::string_view path) -> std::string {
    auto sep = path.find_last_of('/');
    if (sep == std::string_view::npos) {
        return std::string(path);
    }
    return std::string(path.substr(sep + 1));
}

auto join_path(std::string_view directory, std::string_view name) -> std::string {
    if (directory.empty()) {
        return std::string(name);
    }
    std::string out(directory);
    if (out.back() != '/') {
        out += '/';
    }
    out += name;
    return out;
}

}  // namespace kcenon::cloud_sync
