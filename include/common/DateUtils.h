#pragma once

#include <string>
#include <optional>

namespace finpack {
namespace utils {

// Calendar helpers for ISO "YYYY-MM-DD" trading dates.
class DateUtils {
public:
    // Days since 1970-01-01, nullopt when the string is not a valid date
    static std::optional<long> toDays(const std::string& date);

    static bool isValid(const std::string& date);

    // Whole days between two dates, rounded up (absolute value)
    static int daysBetween(const std::string& from, const std::string& to);

    // Monday-based week index; equal for dates in the same ISO week
    static long weekKey(const std::string& date);

    // "YYYY-MM"
    static std::string monthKey(const std::string& date);
};

} // namespace utils
} // namespace finpack
