/**
 * @file types.cpp
 * @brief Parsing and formatting helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cloudlet {

std::optional<OverflowPolicy> parse_overflow_policy(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "reject") return OverflowPolicy::Reject;
    if (lowered == "drop_oldest" || lowered == "dropoldest" || lowered == "drop-oldest") {
        return OverflowPolicy::DropOldest;
    }
    return std::nullopt;
}

std::string format_iso8601(Timestamp ts) {
    auto time_t_value = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds{1000};

    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

}  // namespace cloudlet
