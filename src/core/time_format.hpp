/**
 * @file time_format.hpp
 * @brief Conversions between EpochMillis and ISO 8601 text (UTC).
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace slot_reserver {

/**
 * @brief Format as "YYYY-MM-DDTHH:MM:SS.mmmZ", or "never" for kNever.
 */
[[nodiscard]] std::string format_timestamp(EpochMillis t);

/**
 * @brief Parse a query instant.
 *
 * Accepts either a plain integer (epoch milliseconds) or
 * "YYYY-MM-DDTHH:MM" with optional ":SS" and optional trailing "Z".
 */
Result<EpochMillis> parse_timestamp(std::string_view text);

/**
 * @brief Build an instant from calendar fields (UTC). Used by tests and tools.
 */
[[nodiscard]] EpochMillis make_timestamp(int year, unsigned month, unsigned day,
                                         int hour = 0, int minute = 0, int second = 0);

}  // namespace slot_reserver
