#include "common/DateUtils.h"

#include <cctype>
#include <cstdio>

namespace optionlab {
namespace utils {

namespace {
// Howard Hinnant's days_from_civil / civil_from_days
long daysFromCivil(long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

void civilFromDays(long z, long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

bool isLeapYear(long y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

unsigned daysInMonth(long y, unsigned m) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return kDays[m - 1];
}
}

std::optional<long> DateUtils::toDayNumber(const std::string& iso_date) {
    if (iso_date.size() != 10 || iso_date[4] != '-' || iso_date[7] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < iso_date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(iso_date[i]))) {
            return std::nullopt;
        }
    }

    const long y = std::stol(iso_date.substr(0, 4));
    const unsigned m = static_cast<unsigned>(std::stoul(iso_date.substr(5, 2)));
    const unsigned d = static_cast<unsigned>(std::stoul(iso_date.substr(8, 2)));
    if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
        return std::nullopt;
    }
    return daysFromCivil(y, m, d);
}

std::string DateUtils::fromDayNumber(long day_number) {
    long y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civilFromDays(day_number, y, m, d);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04ld-%02u-%02u", y, m, d);
    return buffer;
}

bool DateUtils::isValid(const std::string& iso_date) {
    return toDayNumber(iso_date).has_value();
}

std::optional<int> DateUtils::daysBetween(const std::string& from, const std::string& to) {
    const auto a = toDayNumber(from);
    const auto b = toDayNumber(to);
    if (!a || !b) {
        return std::nullopt;
    }
    return static_cast<int>(*b - *a);
}

} // namespace utils
} // namespace optionlab
