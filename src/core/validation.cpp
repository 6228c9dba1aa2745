/**
 * @file validation.cpp
 * @brief Identifier validation rules.
 */

#include "core/validation.hpp"

#include <string>

namespace cloudlet {

namespace {

bool is_queue_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
        || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

}  // namespace

Result<void> validate_queue_name(std::string_view name) {
    if (name.empty()) {
        return Error::validation_failed("queue_name", "must not be empty");
    }
    if (name.size() > kMaxNameLength) {
        return Error::validation_failed("queue_name", "must be at most "
                                        + std::to_string(kMaxNameLength) + " characters");
    }
    for (char c : name) {
        if (!is_queue_char(c)) {
            return Error::validation_failed(
                "queue_name", "may only contain letters, digits, '_' and '-'");
        }
    }
    return Result<void>{};
}

Result<void> validate_identifier(std::string_view field, std::string_view value) {
    if (value.empty()) {
        return Error::validation_failed(std::string(field), "must not be empty");
    }
    if (value.size() > kMaxNameLength) {
        return Error::validation_failed(std::string(field), "must be at most "
                                        + std::to_string(kMaxNameLength) + " characters");
    }
    if (value.find('/') != std::string_view::npos || value.find('\\') != std::string_view::npos
        || value == "." || value == "..") {
        return Error::validation_failed(std::string(field), "must not contain path separators");
    }
    return Result<void>{};
}

Result<void> validate_function_name(std::string_view name) {
    if (name.empty()) {
        return Error::validation_failed("function_name", "must not be empty");
    }
    if (name.size() > kMaxNameLength) {
        return Error::validation_failed("function_name", "must be at most "
                                        + std::to_string(kMaxNameLength) + " characters");
    }
    return Result<void>{};
}

}  // namespace cloudlet
