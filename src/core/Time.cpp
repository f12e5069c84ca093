#include "vigil/core/Time.hpp"
#include "vigil/core/Errors.hpp"

#include <cctype>

namespace vigil {

namespace {

bool readInt(const std::string& s, size_t pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

[[noreturn]] void reject(const std::string& text, const char* why) {
    throw InvalidInputError("unparseable timestamp '" + text + "': " + why);
}

size_t parseDatePart(const std::string& s, CivilTime& t) {
    if (!readInt(s, 0, 4, t.year) || s.size() < 10 || s[4] != '-' ||
        !readInt(s, 5, 2, t.month) || s[7] != '-' || !readInt(s, 8, 2, t.day)) {
        reject(s, "expected YYYY-MM-DD");
    }
    if (t.month < 1 || t.month > 12) reject(s, "month out of range");
    if (t.day < 1 || t.day > daysInMonth(t.year, t.month)) reject(s, "day out of range");
    return 10;
}

} // namespace

int daysInMonth(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

// Proleptic Gregorian day count relative to 1970-01-01.
int64_t daysFromCivil(int year, int month, int day) {
    int64_t y = year - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

int64_t CivilTime::epochSeconds() const {
    return daysFromCivil(year, month, day) * 86400 +
           static_cast<int64_t>(hour) * 3600 + minute * 60 + second;
}

int CivilTime::dayOfWeek() const {
    // 1970-01-01 was a Thursday (Monday = 0 -> Thursday = 3)
    int64_t d = daysFromCivil(year, month, day);
    int64_t w = (d + 3) % 7;
    if (w < 0) w += 7;
    return static_cast<int>(w);
}

CivilTime parseDate(const std::string& text) {
    CivilTime t;
    size_t n = parseDatePart(text, t);
    if (n != text.size()) reject(text, "trailing characters after date");
    return t;
}

CivilTime parseTimestamp(const std::string& text) {
    CivilTime t;
    size_t pos = parseDatePart(text, t);
    if (pos == text.size()) return t;

    if (text[pos] != 'T' && text[pos] != ' ') reject(text, "expected 'T' or ' ' after date");
    ++pos;

    if (text.size() < pos + 5 || !readInt(text, pos, 2, t.hour) ||
        text[pos + 2] != ':' || !readInt(text, pos + 3, 2, t.minute)) {
        reject(text, "expected HH:MM");
    }
    pos += 5;

    if (pos < text.size() && text[pos] == ':') {
        if (!readInt(text, pos + 1, 2, t.second)) reject(text, "expected seconds");
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
                ++digits;
            }
            if (digits == 0) reject(text, "empty fractional seconds");
        }
    }

    if (pos < text.size()) {
        if (text[pos] == 'Z' && pos + 1 == text.size()) {
            pos += 1;
        } else if ((text[pos] == '+' || text[pos] == '-') && text.size() == pos + 6 &&
                   text[pos + 3] == ':') {
            int oh = 0, om = 0;
            if (!readInt(text, pos + 1, 2, oh) || !readInt(text, pos + 4, 2, om) ||
                oh > 23 || om > 59) {
                reject(text, "malformed UTC offset");
            }
            pos += 6;
        } else {
            reject(text, "trailing characters after time");
        }
    }

    if (t.hour > 23) reject(text, "hour out of range");
    if (t.minute > 59) reject(text, "minute out of range");
    if (t.second > 59) reject(text, "second out of range");
    return t;
}

int64_t wholeDaysBetween(const CivilTime& from, const CivilTime& to) {
    int64_t secs = to.epochSeconds() - from.epochSeconds();
    int64_t days = secs / 86400;
    if (secs % 86400 != 0 && secs < 0) --days;
    return days;
}

} // namespace vigil
