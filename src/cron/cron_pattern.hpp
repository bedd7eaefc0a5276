/**
 * @file cron_pattern.hpp
 * @brief Five-field cron pattern with floor/ceil occurrence search.
 * @author Dimitris Kafetzis
 *
 * Field syntax per field (minute hour day-of-month month day-of-week):
 *   `*`, `N`, `N-M`, any of those with `/S`, `H`, `H(N-M)`, `H/S`,
 *   and comma-separated lists of the above.
 * Macros: @yearly @annually @monthly @weekly @daily @midnight @hourly.
 *
 * `H` is the hash token of job-scoped crontabs. A reservation rule has no
 * job name to hash, so the hash is zero and `H` picks the lowest value of
 * its range. Day-of-week accepts 0-7, with 7 meaning Sunday. All five fields
 * must match (day-of-month and day-of-week are ANDed).
 */

#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <bitset>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace slot_reserver {

class CronPattern {
public:
    /// How far floor/ceil search before declaring the pattern unmatchable.
    static constexpr std::chrono::days kSearchHorizon =
        std::chrono::floor<std::chrono::days>(std::chrono::years{50});

    /**
     * @brief Parse a cron pattern or macro.
     *
     * The error message names the offending field and term, e.g.
     * "minute field '75': 75 is an invalid value. Must be within 0 and 59".
     */
    static Result<CronPattern, InvalidPatternError> parse(std::string_view text);

    /// True if the minute containing `t` satisfies every field.
    [[nodiscard]] bool matches(MinutePoint t) const noexcept;
    [[nodiscard]] bool matches(EpochMillis t) const noexcept;

    /**
     * @brief Latest matching instant <= t. Sub-minute components of t are
     *        truncated.
     */
    Result<MinutePoint, InvalidPatternError> floor(MinutePoint t) const;
    Result<EpochMillis, InvalidPatternError> floor(EpochMillis t) const;

    /**
     * @brief Earliest matching instant >= t. A t with a sub-minute component
     *        is first rounded up to the next whole minute.
     */
    Result<MinutePoint, InvalidPatternError> ceil(MinutePoint t) const;
    Result<EpochMillis, InvalidPatternError> ceil(EpochMillis t) const;

    /// The text this pattern was parsed from.
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    using MinuteSet = std::bitset<60>;
    using HourSet = std::bitset<24>;
    using DomSet = std::bitset<32>;      ///< index 1-31
    using MonthSet = std::bitset<13>;    ///< index 1-12
    using DowSet = std::bitset<7>;       ///< 0 = Sunday

    struct Fields {
        MinuteSet minute;
        HourSet hour;
        DomSet dom;
        MonthSet month;
        DowSet dow;
    };

    CronPattern(std::string text, Fields fields);

    [[nodiscard]] bool month_matches(const std::chrono::year_month_day& ymd) const noexcept;
    [[nodiscard]] bool day_matches(std::chrono::sys_days day) const noexcept;

    /// First matching minute-of-day >= tod, if any on a matching day.
    [[nodiscard]] std::optional<std::chrono::minutes>
    first_time_at_or_after(std::chrono::minutes tod) const noexcept;

    /// Last matching minute-of-day <= tod.
    [[nodiscard]] std::optional<std::chrono::minutes>
    last_time_at_or_before(std::chrono::minutes tod) const noexcept;

    InvalidPatternError horizon_error(MinutePoint from, std::string_view direction) const;

    std::string text_;
    Fields fields_;
};

}  // namespace slot_reserver
