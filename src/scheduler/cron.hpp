/**
 * @file cron.hpp
 * @brief Quartz-style cron expressions evaluated in UTC.
 *
 * Field order is seconds, minutes, hours, day-of-month, month, day-of-week
 * and an optional year. Exactly one of day-of-month and day-of-week must be
 * '?'. Each field accepts '*', single values, ranges (a-b), steps (x/n),
 * comma-separated lists and three-letter month/day names. Day-of-month also
 * accepts L and L-n; day-of-week accepts L (Saturday) and nL (last weekday n
 * of the month). Days of the week are numbered 1 (SUN) to 7 (SAT).
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <bitset>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cloudlet {

/// Earliest and latest year a schedule can fire in.
inline constexpr int kCronMinYear = 1970;
inline constexpr int kCronMaxYear = 2099;

/// Upper bound on next_occurrences() results.
inline constexpr size_t kMaxCronPreview = 50;

/**
 * @brief Convert a 5-field expression to the 6-field seconds-first form.
 *
 * "m h dom mon dow" becomes "0 m h dom mon ?". Expressions with any other
 * field count are returned with whitespace runs collapsed.
 */
[[nodiscard]] std::string normalize_cron(std::string_view expression);

class CronExpression {
public:
    /// Parse a 6- or 7-field expression. Fails with ValidationFailed on "cron".
    static Result<CronExpression> parse(std::string_view expression);

    /// normalize_cron() followed by parse().
    static Result<CronExpression> parse_schedule(std::string_view expression);

    /// Next fire time strictly after @p after, or nullopt past kCronMaxYear.
    [[nodiscard]] std::optional<Timestamp> next_after(Timestamp after) const;

    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }

private:
    CronExpression() = default;

    [[nodiscard]] bool matches_day(int year, unsigned month, unsigned day) const;

    std::string expression_;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_of_month_;                 ///< Indexed 1..31
    std::bitset<13> months_;                        ///< Indexed 1..12
    std::bitset<8> days_of_week_;                   ///< Indexed 1..7, SUN = 1
    std::bitset<kCronMaxYear - kCronMinYear + 1> years_;

    bool dom_unspecified_{false};
    bool dow_unspecified_{false};
    bool last_day_of_month_{false};
    unsigned last_day_offset_{0};                   ///< n in L-n
    unsigned last_weekday_{0};                      ///< n in nL, 0 when unused
};

/**
 * @brief Preview the next fire times of @p cron after @p from.
 *
 * @p count is clamped to 1..kMaxCronPreview. Fewer entries are returned when
 * the schedule runs out before kCronMaxYear.
 */
Result<std::vector<Timestamp>> next_occurrences(std::string_view cron,
                                                Timestamp from,
                                                size_t count);

}  // namespace cloudlet
