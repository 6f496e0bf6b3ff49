#include "diyanet/time_utils.h"
#include "diyanet/errors.h"
#include "diyanet/string_utils.h"

namespace diyanet {

namespace {

bool two_digits(const std::string& s, size_t pos, int& out) {
    if (pos + 2 > s.size()) return false;
    char a = s[pos];
    char b = s[pos + 1];
    if (a < '0' || a > '9' || b < '0' || b > '9') return false;
    out = (a - '0') * 10 + (b - '0');
    return true;
}

} // namespace

TimeOfDay parse_time_of_day(const std::string& text) {
    const std::string s = trim(text);
    TimeOfDay t;
    int seconds = 0;

    if (s.size() != 5 && s.size() != 8) {
        throw TimeFormatError(text);
    }
    if (!two_digits(s, 0, t.hour) || s[2] != ':' || !two_digits(s, 3, t.minute)) {
        throw TimeFormatError(text);
    }
    if (s.size() == 8 && (s[5] != ':' || !two_digits(s, 6, seconds))) {
        throw TimeFormatError(text);
    }
    if (t.hour > 23 || t.minute > 59 || seconds > 59) {
        throw TimeFormatError(text);
    }
    return t;
}

} // namespace diyanet
