/**
 * @file time_format.cpp
 * @brief ISO 8601 formatting and parsing on top of the <chrono> calendar.
 * @author Dimitris Kafetzis
 */

#include "core/time_format.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace slot_reserver {

namespace {

bool parse_int(std::string_view text, int& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

}  // anonymous namespace

std::string format_timestamp(EpochMillis t) {
    if (t == kNever) return "never";

    using namespace std::chrono;
    sys_time<milliseconds> tp{milliseconds{t}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss tod{tp - day};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':'
        << std::setw(2) << tod.seconds().count() << '.'
        << std::setw(3) << tod.subseconds().count() << 'Z';
    return oss.str();
}

Result<EpochMillis> parse_timestamp(std::string_view text) {
    if (text.empty()) {
        return Error{"Empty timestamp"};
    }

    // Plain epoch milliseconds
    if (text.find('-', 1) == std::string_view::npos) {
        EpochMillis value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return Error{"Invalid timestamp: " + std::string{text}};
        }
        return value;
    }

    if (text.back() == 'Z') text.remove_suffix(1);

    // YYYY-MM-DDTHH:MM[:SS]
    if (text.size() != 16 && text.size() != 19) {
        return Error{"Invalid timestamp (expected YYYY-MM-DDTHH:MM[:SS]): " + std::string{text}};
    }
    if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ')
        || text[13] != ':' || (text.size() == 19 && text[16] != ':')) {
        return Error{"Invalid timestamp (expected YYYY-MM-DDTHH:MM[:SS]): " + std::string{text}};
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_int(text.substr(0, 4), year) || !parse_int(text.substr(5, 2), month)
        || !parse_int(text.substr(8, 2), day) || !parse_int(text.substr(11, 2), hour)
        || !parse_int(text.substr(14, 2), minute)
        || (text.size() == 19 && !parse_int(text.substr(17, 2), second))) {
        return Error{"Invalid timestamp: " + std::string{text}};
    }

    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                       std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
        return Error{"Timestamp out of range: " + std::string{text}};
    }
    return make_timestamp(year, static_cast<unsigned>(month), static_cast<unsigned>(day),
                          hour, minute, second);
}

EpochMillis make_timestamp(int year, unsigned month, unsigned day,
                           int hour, int minute, int second) {
    using namespace std::chrono;
    sys_days date{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
    auto tp = date + hours{hour} + minutes{minute} + seconds{second};
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

}  // namespace slot_reserver
