/**
 * @file error_classifier.cpp
 * @brief Implementation of failure classification
 */

#include "kcenon/cloud_sync/core/error_classifier.h"

namespace kcenon::cloud_sync {

namespace {

auto not_found_for(access_intent intent) -> error_code {
    switch (intent) {
        case access_intent::read: return error_code::not_found_on_read;
        case access_intent::write: return error_code::not_found_on_write;
        case access_intent::neutral: return error_code::not_found;
        case access_intent::mutate:
        default: return error_code::native_failure;
    }
}

auto code_for(const native_failure& failure, access_intent intent) -> error_code {
    switch (failure.cause) {
        case native_cause::no_such_file:
            return not_found_for(intent);

        case native_cause::permission_denied:
        case native_cause::container_unavailable:
        case native_cause::network_unavailable:
            return error_code::container_unavailable;

        case native_cause::invalid_argument:
            return intent == access_intent::mutate ? error_code::native_failure
                                                   : error_code::invalid_argument;

        case native_cause::busy:
        case native_cause::other:
        default:
            return error_code::native_failure;
    }
}

}  // namespace

auto classify(const native_failure& failure, access_intent intent) -> error {
    auto code = code_for(failure, intent);

    std::string message(to_string(code));
    if (!failure.description.empty()) {
        message += ": " + failure.description;
    }
    return error{code, std::move(message), failure};
}

auto make_timeout_error(std::string_view what,
                        std::chrono::milliseconds waited,
                        uint32_t attempts) -> error {
    std::string message(what);
    message += ": no progress after " + std::to_string(waited.count()) + "ms";
    if (attempts > 1) {
        message += " (" + std::to_string(attempts) + " attempts)";
    }
    return error{error_code::timeout, std::move(message)};
}

auto make_invalid_argument(std::string_view what) -> error {
    return error{error_code::invalid_argument, std::string(what)};
}

}  // namespace kcenon::cloud_sync
