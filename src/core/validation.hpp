/**
 * @file validation.hpp
 * @brief Input validation for identifiers crossing the administrative surface.
 */

#pragma once

#include "core/result.hpp"

#include <cstddef>
#include <string_view>

namespace cloudlet {

inline constexpr size_t kMaxNameLength = 256;

/// Queue names: 1..256 characters from [A-Za-z0-9_-].
Result<void> validate_queue_name(std::string_view name);

/// Blob and function ids: non-empty, at most 256 characters, no path separators.
Result<void> validate_identifier(std::string_view field, std::string_view value);

/// Function names: non-empty, at most 256 characters.
Result<void> validate_function_name(std::string_view name);

}  // namespace cloudlet
