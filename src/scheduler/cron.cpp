/**
 * @file cron.cpp
 * @brief Cron parsing and next-fire computation on the std::chrono calendar.
 */

#include "scheduler/cron.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>

namespace cloudlet {

namespace {

constexpr std::array<std::string_view, 12> kMonthNames = {
    "JAN", "FEB", "MAR", "APR", "MAY", "JUN", "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
constexpr std::array<std::string_view, 7> kDayNames = {
    "SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

constexpr size_t kMaxSearchSteps = 2'000'000;

enum class NameSet : uint8_t { None, Months, Weekdays };

struct FieldRange {
    std::string_view name;
    int min;
    int max;
    NameSet names;
};

constexpr FieldRange kSeconds{"seconds", 0, 59, NameSet::None};
constexpr FieldRange kMinutes{"minutes", 0, 59, NameSet::None};
constexpr FieldRange kHours{"hours", 0, 23, NameSet::None};
constexpr FieldRange kDayOfMonth{"day-of-month", 1, 31, NameSet::None};
constexpr FieldRange kMonth{"month", 1, 12, NameSet::Months};
constexpr FieldRange kDayOfWeek{"day-of-week", 1, 7, NameSet::Weekdays};
constexpr FieldRange kYear{"year", kCronMinYear, kCronMaxYear, NameSet::None};

Error cron_error(std::string detail) {
    return Error::validation_failed("cron", "Invalid cron expression: " + detail);
}

std::vector<std::string_view> split(std::string_view text, char delimiter) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t end = text.find(delimiter, start);
        if (end == std::string_view::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

std::vector<std::string_view> split_whitespace(std::string_view text) {
    std::vector<std::string_view> parts;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i > start) parts.push_back(text.substr(start, i - start));
    }
    return parts;
}

std::optional<int> parse_number(std::string_view text) {
    if (text.empty()) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::optional<int> parse_value(std::string_view text, NameSet names) {
    if (auto number = parse_number(text)) return number;
    if (text.size() != 3 || names == NameSet::None) return std::nullopt;

    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (names == NameSet::Months) {
        for (size_t i = 0; i < kMonthNames.size(); ++i) {
            if (upper == kMonthNames[i]) return static_cast<int>(i) + 1;
        }
    } else {
        for (size_t i = 0; i < kDayNames.size(); ++i) {
            if (upper == kDayNames[i]) return static_cast<int>(i) + 1;
        }
    }
    return std::nullopt;
}

/// Parse a list field into @p bits, where bit (value - range.min + base) is set.
template <size_t N>
Result<void> parse_field(std::string_view field, const FieldRange& range,
                         std::bitset<N>& bits, int base) {
    auto fail = [&range, &field](const std::string& why) {
        return cron_error(std::string{range.name} + " field '" + std::string{field} + "' " + why);
    };

    for (auto item : split(field, ',')) {
        if (item.empty()) return fail("has an empty list entry");

        std::string_view body = item;
        int step = 1;
        bool has_step = false;
        if (auto slash = item.find('/'); slash != std::string_view::npos) {
            auto parsed_step = parse_number(item.substr(slash + 1));
            if (!parsed_step || *parsed_step < 1 || *parsed_step > range.max - range.min + 1) {
                return fail("has an invalid step");
            }
            step = *parsed_step;
            has_step = true;
            body = item.substr(0, slash);
        }

        int lo = range.min;
        int hi = range.max;
        if (body != "*") {
            auto dash = body.find('-', 1);
            if (dash != std::string_view::npos) {
                auto a = parse_value(body.substr(0, dash), range.names);
                auto b = parse_value(body.substr(dash + 1), range.names);
                if (!a || !b) return fail("has an invalid range");
                lo = *a;
                hi = *b;
            } else {
                auto v = parse_value(body, range.names);
                if (!v) return fail("has an invalid value");
                lo = *v;
                hi = has_step ? range.max : *v;
            }
        }
        if (lo < range.min || lo > range.max || hi < range.min || hi > range.max) {
            return fail("is out of range " + std::to_string(range.min) + "-"
                        + std::to_string(range.max));
        }

        // Ranges such as FRI-MON wrap around the end of the field.
        const int width = range.max - range.min + 1;
        const int span = ((hi - lo) % width + width) % width;
        for (int i = 0; i <= span; i += step) {
            int value = range.min + (lo - range.min + i) % width;
            bits.set(static_cast<size_t>(value - range.min + base));
        }
    }
    return Result<void>{};
}

unsigned last_day(int year, unsigned month) {
    using namespace std::chrono;
    year_month_day_last ymdl{std::chrono::year{year}, month_day_last{std::chrono::month{month}}};
    return static_cast<unsigned>(ymdl.day());
}

}  // namespace

// ─────────────────────────────────────────────
// Normalization
// ─────────────────────────────────────────────

std::string normalize_cron(std::string_view expression) {
    auto parts = split_whitespace(expression);
    if (parts.size() == 5) {
        return "0 " + std::string{parts[0]} + " " + std::string{parts[1]} + " "
             + std::string{parts[2]} + " " + std::string{parts[3]} + " ?";
    }

    std::string joined;
    for (auto part : parts) {
        if (!joined.empty()) joined += ' ';
        joined += part;
    }
    return joined;
}

// ─────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────

Result<CronExpression> CronExpression::parse(std::string_view expression) {
    auto fields = split_whitespace(expression);
    if (fields.size() != 6 && fields.size() != 7) {
        return cron_error("expected 6 or 7 fields, got " + std::to_string(fields.size()));
    }

    CronExpression cron;
    cron.expression_ = normalize_cron(expression);

    if (auto r = parse_field(fields[0], kSeconds, cron.seconds_, 0); !r) return r.error();
    if (auto r = parse_field(fields[1], kMinutes, cron.minutes_, 0); !r) return r.error();
    if (auto r = parse_field(fields[2], kHours, cron.hours_, 0); !r) return r.error();
    if (auto r = parse_field(fields[4], kMonth, cron.months_, 1); !r) return r.error();

    // Day of month
    std::string_view dom = fields[3];
    if (dom == "?") {
        cron.dom_unspecified_ = true;
    } else if (dom == "L") {
        cron.last_day_of_month_ = true;
    } else if (dom.size() > 2 && dom.substr(0, 2) == "L-") {
        auto offset = parse_number(dom.substr(2));
        if (!offset || *offset < 0 || *offset > 30) {
            return cron_error("day-of-month offset '" + std::string{dom} + "' is invalid");
        }
        cron.last_day_of_month_ = true;
        cron.last_day_offset_ = static_cast<unsigned>(*offset);
    } else if (auto r = parse_field(dom, kDayOfMonth, cron.days_of_month_, 1); !r) {
        return r.error();
    }

    // Day of week
    std::string_view dow = fields[5];
    if (dow == "?") {
        cron.dow_unspecified_ = true;
    } else if (dow == "L") {
        cron.days_of_week_.set(7);
    } else if (dow.size() > 1 && (dow.back() == 'L' || dow.back() == 'l')) {
        auto day = parse_value(dow.substr(0, dow.size() - 1), NameSet::Weekdays);
        if (!day || *day < 1 || *day > 7) {
            return cron_error("day-of-week field '" + std::string{dow} + "' is invalid");
        }
        cron.last_weekday_ = static_cast<unsigned>(*day);
    } else if (auto r = parse_field(dow, kDayOfWeek, cron.days_of_week_, 1); !r) {
        return r.error();
    }

    if (cron.dom_unspecified_ == cron.dow_unspecified_) {
        return cron_error("exactly one of day-of-month and day-of-week must be '?'");
    }

    if (fields.size() == 7) {
        if (auto r = parse_field(fields[6], kYear, cron.years_, 0); !r) return r.error();
    } else {
        cron.years_.set();
    }

    return cron;
}

Result<CronExpression> CronExpression::parse_schedule(std::string_view expression) {
    if (split_whitespace(expression).empty()) {
        return Error::validation_failed("cron", "Cron expression cannot be empty");
    }
    return parse(normalize_cron(expression));
}

// ─────────────────────────────────────────────
// Evaluation
// ─────────────────────────────────────────────

bool CronExpression::matches_day(int year, unsigned month, unsigned day) const {
    if (!dom_unspecified_) {
        if (last_day_of_month_) {
            unsigned last = last_day(year, month);
            return last > last_day_offset_ && day == last - last_day_offset_;
        }
        return days_of_month_.test(day);
    }

    using namespace std::chrono;
    weekday wd{sys_days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}}};
    unsigned quartz_day = wd.c_encoding() + 1;
    if (last_weekday_ != 0) {
        return quartz_day == last_weekday_ && day + 7 > last_day(year, month);
    }
    return days_of_week_.test(quartz_day);
}

std::optional<Timestamp> CronExpression::next_after(Timestamp after) const {
    using namespace std::chrono;

    sys_seconds current = floor<seconds>(after) + seconds{1};
    for (size_t step = 0; step < kMaxSearchSteps; ++step) {
        auto day_start = floor<days>(current);
        year_month_day ymd{day_start};
        int y = static_cast<int>(ymd.year());

        if (y > kCronMaxYear) return std::nullopt;
        if (y < kCronMinYear) {
            current = sys_days{std::chrono::year{kCronMinYear} / January / 1};
            continue;
        }
        if (!years_.test(static_cast<size_t>(y - kCronMinYear))) {
            current = sys_days{std::chrono::year{y + 1} / January / 1};
            continue;
        }

        unsigned m = static_cast<unsigned>(ymd.month());
        if (!months_.test(m)) {
            year_month next = ymd.year() / ymd.month() + months{1};
            current = sys_days{next / 1};
            continue;
        }

        if (!matches_day(y, m, static_cast<unsigned>(ymd.day()))) {
            current = day_start + days{1};
            continue;
        }

        hh_mm_ss hms{current - day_start};
        auto h = static_cast<size_t>(hms.hours().count());
        if (!hours_.test(h)) {
            current = day_start + hours{h + 1};
            continue;
        }

        auto mi = static_cast<size_t>(hms.minutes().count());
        if (!minutes_.test(mi)) {
            current = day_start + hours{h} + minutes{mi + 1};
            continue;
        }

        auto s = static_cast<size_t>(hms.seconds().count());
        if (!seconds_.test(s)) {
            current += seconds{1};
            continue;
        }

        return time_point_cast<Timestamp::duration>(current);
    }
    return std::nullopt;
}

Result<std::vector<Timestamp>> next_occurrences(std::string_view cron,
                                                Timestamp from,
                                                size_t count) {
    auto parsed = CronExpression::parse_schedule(cron);
    if (!parsed) return parsed.error();

    count = std::clamp<size_t>(count, 1, kMaxCronPreview);
    std::vector<Timestamp> out;
    out.reserve(count);

    Timestamp cursor = from;
    while (out.size() < count) {
        auto next = parsed->next_after(cursor);
        if (!next) break;
        out.push_back(*next);
        cursor = *next;
    }
    return out;
}

}  // namespace cloudlet
