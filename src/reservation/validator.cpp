/**
 * @file validator.cpp
 * @brief validate(): thin wrapper around ReservationSchedule::parse.
 * @author Dimitris Kafetzis
 */

#include "reservation/validator.hpp"

#include "reservation/schedule.hpp"

namespace slot_reserver {

ValidationResult validate(std::string_view text) {
    auto parsed = ReservationSchedule::parse(text);
    if (!parsed) {
        return ValidationResult::failure(parsed.error().line, parsed.error().message);
    }
    return ValidationResult::success();
}

}  // namespace slot_reserver
