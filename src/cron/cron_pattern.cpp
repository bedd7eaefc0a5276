/**
 * @file cron_pattern.cpp
 * @brief Cron field parsing and calendar search.
 * @author Dimitris Kafetzis
 *
 * Search strategy for floor/ceil: walk calendar days from t towards the
 * horizon, skipping whole months whose month bit is clear. On the first day
 * whose day-of-month and day-of-week both match, scan hours and minutes
 * (bounded by t's time of day on the starting day).
 *
 * Complexity: O(D × 1440) worst case, D = days scanned; in practice the
 * month skip keeps D small even for leap-day patterns.
 */

#include "cron/cron_pattern.hpp"

#include "core/time_format.hpp"

#include <array>
#include <charconv>
#include <vector>

namespace slot_reserver {

namespace {

using namespace std::chrono_literals;

constexpr std::chrono::minutes kMinutesPerDay{24 * 60};

// Calendar range that year_month_day can represent.
constexpr MinutePoint kEarliestSupported =
    std::chrono::sys_days{std::chrono::year{-32000} / 1 / 1};
constexpr MinutePoint kLatestSupported =
    std::chrono::sys_days{std::chrono::year{32000} / 1 / 1};

struct FieldSpec {
    std::string_view name;
    int min;
    int max;
    int hash_max;   ///< upper end of a stepped `H` range
};

// `H` in day-of-month stops at 28 so it exists in every month.
constexpr std::array<FieldSpec, 5> kFieldSpecs{{
    {"minute", 0, 59, 59},
    {"hour", 0, 23, 23},
    {"day-of-month", 1, 31, 28},
    {"month", 1, 12, 12},
    {"day-of-week", 0, 7, 7},
}};

struct Macro {
    std::string_view name;
    std::string_view expansion;
};

constexpr std::array<Macro, 7> kMacros{{
    {"@yearly", "H H H H *"},
    {"@annually", "H H H H *"},
    {"@monthly", "H H H * *"},
    {"@weekly", "H H * * H"},
    {"@daily", "H H * * *"},
    {"@midnight", "H H(0-2) * * *"},
    {"@hourly", "H * * * *"},
}};

std::string_view trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string_view> split(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string_view> split_whitespace(std::string_view s) {
    std::vector<std::string_view> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto begin = s.find_first_not_of(" \t", pos);
        if (begin == std::string_view::npos) break;
        auto end = s.find_first_of(" \t", begin);
        if (end == std::string_view::npos) end = s.size();
        parts.push_back(s.substr(begin, end - begin));
        pos = end;
    }
    return parts;
}

/// Builds "<field> field '<term>': <reason>".
InvalidPatternError field_error(const FieldSpec& spec, std::string_view term,
                                const std::string& reason) {
    return InvalidPatternError{std::string{spec.name} + " field '" + std::string{term}
                               + "': " + reason};
}

/**
 * @brief Parses one term of a field into an inclusive range with a step.
 */
class TermParser {
public:
    TermParser(const FieldSpec& spec, std::string_view term) : spec_(spec), term_(term) {}

    Result<std::vector<int>, InvalidPatternError> values() const {
        std::string_view base = term_;
        int step = 1;

        if (auto slash = term_.find('/'); slash != std::string_view::npos) {
            base = term_.substr(0, slash);
            auto step_text = term_.substr(slash + 1);
            auto parsed = number(step_text);
            if (!parsed) {
                return field_error(spec_, term_, "invalid step '" + std::string{step_text} + "'");
            }
            if (*parsed <= 0) {
                return field_error(spec_, term_, "step must be positive, but found "
                                   + std::to_string(*parsed));
            }
            step = *parsed;
        }

        bool has_step = base.size() != term_.size();
        int low = spec_.min;
        int high = spec_.max;

        if (base == "*") {
            // full range
        } else if (base == "H") {
            // zero hash: first value of the range; a lone H is a single value
            high = has_step ? spec_.hash_max : low;
        } else if (base.starts_with("H(")) {
            if (!base.ends_with(")")) {
                return field_error(spec_, term_, "unterminated 'H(' range");
            }
            auto inner = base.substr(2, base.size() - 3);
            auto range = parse_range(inner);
            if (!range) return range.error();
            low = range->first;
            high = has_step ? range->second : range->first;
        } else {
            auto range = parse_range(base);
            if (!range) return range.error();
            low = range->first;
            high = range->second;
            // "N/S" means every S starting at N
            if (has_step && base.find('-') == std::string_view::npos) high = spec_.max;
        }

        std::vector<int> out;
        for (int v = low; v <= high; v += step) {
            out.push_back(v);
            if (step > high - v) break;
        }
        return out;
    }

private:
    static std::optional<int> number(std::string_view text) {
        if (text.empty()) return std::nullopt;
        int value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
        return value;
    }

    Result<int, InvalidPatternError> bounded(std::string_view text) const {
        auto value = number(text);
        if (!value) {
            return field_error(spec_, term_, "'" + std::string{text} + "' is not a number");
        }
        if (*value < spec_.min || *value > spec_.max) {
            return field_error(spec_, term_, std::to_string(*value)
                               + " is an invalid value. Must be within "
                               + std::to_string(spec_.min) + " and "
                               + std::to_string(spec_.max));
        }
        return *value;
    }

    Result<std::pair<int, int>, InvalidPatternError> parse_range(std::string_view text) const {
        auto dash = text.find('-');
        if (dash == std::string_view::npos) {
            auto v = bounded(text);
            if (!v) return v.error();
            return std::pair{*v, *v};
        }
        auto a = bounded(text.substr(0, dash));
        if (!a) return a.error();
        auto b = bounded(text.substr(dash + 1));
        if (!b) return b.error();
        if (*a > *b) {
            return field_error(spec_, term_, "You mean " + std::to_string(*b) + "-"
                               + std::to_string(*a) + "?");
        }
        return std::pair{*a, *b};
    }

    const FieldSpec& spec_;
    std::string_view term_;
};

template <size_t N>
Result<std::bitset<N>, InvalidPatternError> parse_field(std::string_view field,
                                                        const FieldSpec& spec) {
    std::bitset<N> bits;
    for (auto term : split(field, ',')) {
        if (term.empty()) {
            return field_error(spec, field, "empty list element");
        }
        auto values = TermParser(spec, term).values();
        if (!values) return values.error();
        for (int v : *values) {
            // day-of-week 7 is Sunday
            bits.set(static_cast<size_t>(v) % N);
        }
    }
    return bits;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────

CronPattern::CronPattern(std::string text, Fields fields)
    : text_(std::move(text)), fields_(fields) {}

Result<CronPattern, InvalidPatternError> CronPattern::parse(std::string_view text) {
    auto trimmed = trim(text);
    std::string_view expanded = trimmed;

    if (trimmed.starts_with("@")) {
        bool found = false;
        for (const auto& macro : kMacros) {
            if (macro.name == trimmed) {
                expanded = macro.expansion;
                found = true;
                break;
            }
        }
        if (!found) {
            return InvalidPatternError{"unknown macro '" + std::string{trimmed} + "'"};
        }
    }

    auto parts = split_whitespace(expanded);
    if (parts.size() != kFieldSpecs.size()) {
        return InvalidPatternError{
            "expected 5 fields (minute hour day-of-month month day-of-week) but found "
            + std::to_string(parts.size()) + " in '" + std::string{trimmed} + "'"};
    }

    Fields fields;

    auto minute = parse_field<60>(parts[0], kFieldSpecs[0]);
    if (!minute) return minute.error();
    fields.minute = *minute;

    auto hour = parse_field<24>(parts[1], kFieldSpecs[1]);
    if (!hour) return hour.error();
    fields.hour = *hour;

    auto dom = parse_field<32>(parts[2], kFieldSpecs[2]);
    if (!dom) return dom.error();
    fields.dom = *dom;

    auto month = parse_field<13>(parts[3], kFieldSpecs[3]);
    if (!month) return month.error();
    fields.month = *month;

    auto dow = parse_field<7>(parts[4], kFieldSpecs[4]);
    if (!dow) return dow.error();
    fields.dow = *dow;

    return CronPattern{std::string{trimmed}, fields};
}

// ─────────────────────────────────────────────
// Matching
// ─────────────────────────────────────────────

bool CronPattern::month_matches(const std::chrono::year_month_day& ymd) const noexcept {
    return fields_.month.test(static_cast<unsigned>(ymd.month()));
}

bool CronPattern::day_matches(std::chrono::sys_days day) const noexcept {
    std::chrono::year_month_day ymd{day};
    std::chrono::weekday wd{day};
    return month_matches(ymd)
        && fields_.dom.test(static_cast<unsigned>(ymd.day()))
        && fields_.dow.test(wd.c_encoding());
}

bool CronPattern::matches(MinutePoint t) const noexcept {
    if (t < kEarliestSupported || t >= kLatestSupported) return false;
    auto day = std::chrono::floor<std::chrono::days>(t);
    std::chrono::hh_mm_ss tod{t - day};
    return day_matches(day)
        && fields_.hour.test(static_cast<size_t>(tod.hours().count()))
        && fields_.minute.test(static_cast<size_t>(tod.minutes().count()));
}

bool CronPattern::matches(EpochMillis t) const noexcept {
    return matches(floor_to_minute(t));
}

std::optional<std::chrono::minutes>
CronPattern::first_time_at_or_after(std::chrono::minutes tod) const noexcept {
    auto start_hour = static_cast<int>(tod.count() / 60);
    auto start_minute = static_cast<int>(tod.count() % 60);
    for (int h = start_hour; h < 24; ++h) {
        if (!fields_.hour.test(static_cast<size_t>(h))) continue;
        for (int m = (h == start_hour ? start_minute : 0); m < 60; ++m) {
            if (fields_.minute.test(static_cast<size_t>(m))) {
                return std::chrono::minutes{h * 60 + m};
            }
        }
    }
    return std::nullopt;
}

std::optional<std::chrono::minutes>
CronPattern::last_time_at_or_before(std::chrono::minutes tod) const noexcept {
    auto start_hour = static_cast<int>(tod.count() / 60);
    auto start_minute = static_cast<int>(tod.count() % 60);
    for (int h = start_hour; h >= 0; --h) {
        if (!fields_.hour.test(static_cast<size_t>(h))) continue;
        for (int m = (h == start_hour ? start_minute : 59); m >= 0; --m) {
            if (fields_.minute.test(static_cast<size_t>(m))) {
                return std::chrono::minutes{h * 60 + m};
            }
        }
    }
    return std::nullopt;
}

InvalidPatternError CronPattern::horizon_error(MinutePoint from,
                                               std::string_view direction) const {
    return InvalidPatternError{"pattern '" + text_ + "' has no occurrence within "
                               + std::to_string(kSearchHorizon.count()) + " days "
                               + std::string{direction} + " "
                               + format_timestamp(to_epoch_millis(from))};
}

// ─────────────────────────────────────────────
// Floor / Ceil
// ─────────────────────────────────────────────

Result<MinutePoint, InvalidPatternError> CronPattern::ceil(MinutePoint t) const {
    using namespace std::chrono;

    if (t < kEarliestSupported || t >= kLatestSupported - kSearchHorizon) {
        return InvalidPatternError{"timestamp " + std::to_string(to_epoch_millis(t))
                                   + " is outside the supported calendar range"};
    }

    auto day = std::chrono::floor<days>(t);
    auto tod = minutes{t - day};
    const auto last_day = day + kSearchHorizon;

    while (day <= last_day) {
        year_month_day ymd{day};
        if (!month_matches(ymd)) {
            // jump to the first day of the next month
            auto next = ymd.year() / ymd.month() + months{1};
            day = sys_days{next / std::chrono::day{1}};
            tod = 0min;
            continue;
        }
        if (day_matches(day)) {
            if (auto found = first_time_at_or_after(tod)) {
                return MinutePoint{day} + *found;
            }
        }
        day += days{1};
        tod = 0min;
    }
    return horizon_error(t, "after");
}

Result<MinutePoint, InvalidPatternError> CronPattern::floor(MinutePoint t) const {
    using namespace std::chrono;

    if (t < kEarliestSupported + kSearchHorizon || t >= kLatestSupported) {
        return InvalidPatternError{"timestamp " + std::to_string(to_epoch_millis(t))
                                   + " is outside the supported calendar range"};
    }

    auto day = std::chrono::floor<days>(t);
    auto tod = minutes{t - day};
    const auto first_day = day - kSearchHorizon;

    while (day >= first_day) {
        year_month_day ymd{day};
        if (!month_matches(ymd)) {
            // jump to the last day of the previous month
            day = sys_days{ymd.year() / ymd.month() / std::chrono::day{1}} - days{1};
            tod = kMinutesPerDay - 1min;
            continue;
        }
        if (day_matches(day)) {
            if (auto found = last_time_at_or_before(tod)) {
                return MinutePoint{day} + *found;
            }
        }
        day -= days{1};
        tod = kMinutesPerDay - 1min;
    }
    return horizon_error(t, "before");
}

Result<EpochMillis, InvalidPatternError> CronPattern::floor(EpochMillis t) const {
    return floor(floor_to_minute(t)).map(
        [](MinutePoint p) { return to_epoch_millis(p); });
}

Result<EpochMillis, InvalidPatternError> CronPattern::ceil(EpochMillis t) const {
    return ceil(ceil_to_minute(t)).map(
        [](MinutePoint p) { return to_epoch_millis(p); });
}

}  // namespace slot_reserver
