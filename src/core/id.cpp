/**
 * @file id.cpp
 * @brief Identifier generation backed by a per-thread Mersenne Twister.
 */

#include "core/id.hpp"

#include <cstdint>
#include <random>

namespace cloudlet {

std::string generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static constexpr char kHex[] = "0123456789abcdef";

    std::string id;
    id.reserve(kIdLength);
    for (int half = 0; half < 2; ++half) {
        uint64_t bits = rng();
        for (int i = 0; i < 16; ++i) {
            id.push_back(kHex[bits & 0xF]);
            bits >>= 4;
        }
    }
    return id;
}

}  // namespace cloudlet
