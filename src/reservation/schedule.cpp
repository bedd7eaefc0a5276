/**
 * @file schedule.cpp
 * @brief Rule-text parsing and aggregation over entries.
 * @author Dimitris Kafetzis
 */

#include "reservation/schedule.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

namespace slot_reserver {

namespace {

std::string_view trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(begin, end - begin + 1);
}

template <typename Int>
bool parse_non_negative(std::string_view text, Int& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size() && out >= 0;
}

Result<ReservationSize, MalformedRuleError> parse_size(size_t line, std::string_view field) {
    if (field == "*") return ReservationSize::all();

    int32_t count = 0;
    if (!parse_non_negative(field, count)) {
        return MalformedRuleError{line, "invalid reservation size '" + std::string{field}
                                        + "': expected a non-negative integer or '*'"};
    }
    return ReservationSize::exactly(static_cast<SlotCount>(count));
}

Result<Millis, MalformedRuleError> parse_duration(size_t line, std::string_view field) {
    int64_t minutes = 0;
    if (!parse_non_negative(field, minutes)) {
        return MalformedRuleError{line, "invalid duration '" + std::string{field}
                                        + "': expected a non-negative number of minutes"};
    }
    if (minutes > std::numeric_limits<int64_t>::max() / kMillisPerMinute) {
        return MalformedRuleError{line, "duration '" + std::string{field}
                                        + "' is too large"};
    }
    return Millis{minutes * kMillisPerMinute};
}

Result<ReservationEntry, MalformedRuleError> parse_rule(size_t line, std::string_view rule) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        auto pos = rule.find(':', start);
        fields.push_back(trim(rule.substr(start, pos == std::string_view::npos
                                                     ? std::string_view::npos
                                                     : pos - start)));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }

    // Trailing empty fields are dropped, so "2:@daily:60:" is a 3-field rule
    while (!fields.empty() && fields.back().empty()) fields.pop_back();

    if (fields.size() != 3) {
        return MalformedRuleError{line, "3 fields separated by ':' are expected, but found "
                                        + std::to_string(fields.size()) + " in '"
                                        + std::string{rule} + "'"};
    }

    auto size = parse_size(line, fields[0]);
    if (!size) return size.error();

    auto pattern = CronPattern::parse(fields[1]);
    if (!pattern) {
        return MalformedRuleError{line, "invalid cron pattern '" + std::string{fields[1]}
                                        + "': " + pattern.error().message};
    }

    auto duration = parse_duration(line, fields[2]);
    if (!duration) return duration.error();

    return ReservationEntry{*size, *pattern, *duration};
}

}  // anonymous namespace

ReservationSchedule::ReservationSchedule(std::vector<ReservationEntry> entries)
    : entries_(std::move(entries)) {}

Result<ReservationSchedule, MalformedRuleError> ReservationSchedule::parse(
    std::string_view text) {
    std::vector<ReservationEntry> entries;

    size_t line_number = 0;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        ++line_number;

        auto line = trim(text.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line.front() == '#') continue;

        auto entry = parse_rule(line_number, line);
        if (!entry) return entry.error();
        entries.push_back(std::move(*entry));
    }

    return ReservationSchedule{std::move(entries)};
}

Result<SlotCount, InvalidPatternError> ReservationSchedule::size_of_reservation(
    const INode& node, EpochMillis t) const {
    SlotCount total = 0;
    for (const auto& entry : entries_) {
        auto size = entry.size_of_reservation(node, t);
        if (!size) return size.error();
        total = saturating_add(total, *size);
    }
    return total;
}

Result<EpochMillis, InvalidPatternError> ReservationSchedule::time_of_next_change(
    EpochMillis t) const {
    EpochMillis earliest = kNever;
    for (const auto& entry : entries_) {
        auto next = entry.time_of_next_change(t);
        if (!next) return next.error();
        earliest = std::min(earliest, *next);
    }
    return earliest;
}

}  // namespace slot_reserver
