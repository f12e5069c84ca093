#pragma once
// =============================================================================
// Time.hpp - Timezone-naive civil time parsing
// =============================================================================
// Accepted forms:
//   YYYY-MM-DD
//   YYYY-MM-DD[T| ]HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]
// A trailing offset is dropped, the wall-clock fields are kept as written.
// Anything else throws InvalidInputError.
// =============================================================================

#include <cstdint>
#include <string>

namespace vigil {

struct CivilTime {
    int year = 1970;
    int month = 1;      // 1..12
    int day = 1;        // 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;

    int64_t epochSeconds() const;
    int dayOfWeek() const;          // Monday = 0
};

int64_t daysFromCivil(int year, int month, int day);
int daysInMonth(int year, int month);

CivilTime parseTimestamp(const std::string& text);
CivilTime parseDate(const std::string& text);

// Whole days elapsed from `from` to `to`, floored (negative if `to` is earlier).
int64_t wholeDaysBetween(const CivilTime& from, const CivilTime& to);

} // namespace vigil
