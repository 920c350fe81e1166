#include "common/TimeUtils.h"

#include <cctype>
#include <cstdio>
#include <exception>

namespace replaybt {
namespace utils {

namespace {
constexpr long long MS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_DAY = 86400;

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<long long>(era) * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe + era * 400) + (m <= 2 ? 1 : 0);
}

bool isAllDigits(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) {
        return false;
    }
    for (size_t i = start; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}
}

TimestampMs toMsTimestamp(long long ts) {
    if (ts > -100000000000LL && ts < 100000000000LL) {
        return ts * MS_PER_SECOND;
    }
    return ts;
}

std::optional<TimestampMs> parseTimestamp(const std::string& text) {
    if (isAllDigits(text)) {
        try {
            return toMsTimestamp(std::stoll(text));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    char sep = ' ';
    const int fields = std::sscanf(text.c_str(), "%4d-%2u-%2u%c%2u:%2u:%2u",
                                   &year, &month, &day, &sep, &hour, &minute, &second);
    if (fields < 3) {
        return std::nullopt;
    }
    if (fields > 3 && sep != ' ' && sep != 'T') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    const long long days = daysFromCivil(year, month, day);
    const long long seconds = days * SECONDS_PER_DAY + hour * 3600LL + minute * 60LL + second;
    return seconds * MS_PER_SECOND;
}

std::string formatTimestamp(TimestampMs ts) {
    long long seconds = ts / MS_PER_SECOND;
    if (ts < 0 && ts % MS_PER_SECOND != 0) {
        --seconds;
    }
    long long days = seconds / SECONDS_PER_DAY;
    long long rem = seconds % SECONDS_PER_DAY;
    if (rem < 0) {
        rem += SECONDS_PER_DAY;
        --days;
    }

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u %02lld:%02lld:%02lld",
                  y, m, d, rem / 3600, (rem % 3600) / 60, rem % 60);
    return buf;
}

} // namespace utils
} // namespace replaybt
