#include "core/DateUtil.hpp"

#include <cctype>
#include <cstdio>

namespace dateutil {

std::int64_t days_from_civil(int year, unsigned month, unsigned day) {
    const std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t mp = (month + 9) % 12;
    const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(day) - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(std::int64_t days, int& year, unsigned& month, unsigned& day) {
    const std::int64_t z = days + 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;

    day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

static bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

static unsigned days_in_month(int y, unsigned m) {
    static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

static bool read_digits(const std::string& s, size_t pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

std::optional<std::int64_t> parse_date(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;

    int y = 0, m = 0, d = 0;
    if (!read_digits(s, a, 4, y)) return std::nullopt;
    if (a + 4 >= s.size() || s[a + 4] != '-') return std::nullopt;
    if (!read_digits(s, a + 5, 2, m)) return std::nullopt;
    if (a + 7 >= s.size() || s[a + 7] != '-') return std::nullopt;
    if (!read_digits(s, a + 8, 2, d)) return std::nullopt;

    const size_t rest = a + 10;
    if (rest < s.size() && s[rest] != 'T' && s[rest] != ' ' && s[rest] != 't') return std::nullopt;

    if (m < 1 || m > 12) return std::nullopt;
    if (d < 1 || static_cast<unsigned>(d) > days_in_month(y, static_cast<unsigned>(m))) return std::nullopt;

    return days_from_civil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

std::string format_date(std::int64_t days) {
    int y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

std::int64_t month_bucket(std::int64_t days, int bucket_months) {
    int y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);
    const std::int64_t months = static_cast<std::int64_t>(y) * 12 + (m - 1);
    return months / bucket_months;
}

std::int64_t bucket_start(std::int64_t bucket, int bucket_months) {
    const std::int64_t months = bucket * bucket_months;
    const int y = static_cast<int>(months / 12);
    const unsigned m = static_cast<unsigned>(months % 12) + 1;
    return days_from_civil(y, m, 1);
}

}
