/**
 * @file validator.hpp
 * @brief Parse-only check of rule text for editors and config tooling.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace slot_reserver {

/**
 * @brief Outcome of validating rule text.
 *
 * On failure `line` is the 1-based line of the first malformed rule.
 */
struct ValidationResult {
    bool ok = true;
    size_t line = 0;
    std::string message;

    [[nodiscard]] explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static ValidationResult success() { return ValidationResult{}; }
    [[nodiscard]] static ValidationResult failure(size_t line, std::string message) {
        return ValidationResult{false, line, std::move(message)};
    }
};

/**
 * @brief Attempt a full parse and report success or the first failure.
 */
[[nodiscard]] ValidationResult validate(std::string_view text);

}  // namespace slot_reserver
