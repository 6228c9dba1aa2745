/**
 * @file function_abi.hpp
 * @brief C entry point signature for shared-library functions.
 *
 * A shared-library function exports:
 *
 *   extern "C" int my_entry(const uint8_t* input, size_t input_len,
 *                           uint8_t** output, size_t* output_len);
 *
 * The output buffer is allocated with malloc() by the function and released
 * by the caller. A non-zero return marks the invocation as failed; the output
 * is then treated as an error message.
 */

#pragma once

#include <cstddef>
#include <cstdint>

extern "C" {

using cloudlet_entry_fn = int (*)(const uint8_t* input, size_t input_len,
                                  uint8_t** output, size_t* output_len);

}
