/**
 * @file errors.hpp
 * @brief Error kinds raised while parsing and evaluating reservation rules.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace slot_reserver {

/**
 * @brief A cron pattern that cannot be parsed or cannot be matched.
 *
 * Raised by CronPattern::parse for malformed field syntax, and by
 * floor/ceil when no occurrence exists within the search horizon.
 */
struct InvalidPatternError {
    std::string message;

    explicit InvalidPatternError(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief A rule line that cannot be turned into a reservation entry.
 *
 * `line` is 1-based and counts every line of the source text, including
 * blank and comment lines, so an editor can point at it directly.
 */
struct MalformedRuleError {
    size_t line;
    std::string message;

    MalformedRuleError(size_t line_number, std::string msg)
        : line(line_number), message(std::move(msg)) {}

    /// "line N: <message>"
    [[nodiscard]] std::string what() const {
        return "line " + std::to_string(line) + ": " + message;
    }
};

}  // namespace slot_reserver
