#pragma once

#include <optional>
#include <string>

namespace optionlab {
namespace utils {

// Calendar arithmetic on ISO dates (YYYY-MM-DD)
class DateUtils {
public:
    // Days since 1970-01-01, nullopt when the text is not a valid date
    static std::optional<long> toDayNumber(const std::string& iso_date);

    static std::string fromDayNumber(long day_number);

    static bool isValid(const std::string& iso_date);

    // to - from in calendar days
    static std::optional<int> daysBetween(const std::string& from, const std::string& to);
};

} // namespace utils
} // namespace optionlab
