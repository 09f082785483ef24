#include "common/DateUtils.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace finpack {
namespace utils {

namespace {
// Howard Hinnant's days_from_civil
long daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeap(y)) {
        return 29;
    }
    return table[m - 1];
}
}

std::optional<long> DateUtils::toDays(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
        return std::nullopt;
    }
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
            return std::nullopt;
        }
    }

    const int y = std::atoi(date.substr(0, 4).c_str());
    const int m = std::atoi(date.substr(5, 2).c_str());
    const int d = std::atoi(date.substr(8, 2).c_str());
    if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
        return std::nullopt;
    }
    return daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

bool DateUtils::isValid(const std::string& date) {
    return toDays(date).has_value();
}

int DateUtils::daysBetween(const std::string& from, const std::string& to) {
    const auto a = toDays(from);
    const auto b = toDays(to);
    if (!a || !b) {
        return 0;
    }
    return static_cast<int>(std::labs(*b - *a));
}

long DateUtils::weekKey(const std::string& date) {
    const auto days = toDays(date);
    if (!days) {
        return 0;
    }
    // 1970-01-01 was a Thursday; shift so weeks start on Monday
    const long shifted = *days + 3;
    return shifted >= 0 ? shifted / 7 : (shifted - 6) / 7;
}

std::string DateUtils::monthKey(const std::string& date) {
    return date.size() >= 7 ? date.substr(0, 7) : date;
}

} // namespace utils
} // namespace finpack
