/**
 * @file id.hpp
 * @brief Random identifier generation.
 */

#pragma once

#include <cstddef>
#include <string>

namespace cloudlet {

inline constexpr size_t kIdLength = 32;

/// 128 random bits as 32 lowercase hex characters.
[[nodiscard]] std::string generate_id();

}  // namespace cloudlet
