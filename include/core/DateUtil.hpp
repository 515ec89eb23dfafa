#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dateutil {

// days since 1970-01-01 in the proleptic Gregorian calendar
std::int64_t days_from_civil(int year, unsigned month, unsigned day);
void civil_from_days(std::int64_t days, int& year, unsigned& month, unsigned& day);

// accepts "YYYY-MM-DD", optionally followed by "T..." or " ..." (time part ignored)
std::optional<std::int64_t> parse_date(const std::string& s);

std::string format_date(std::int64_t days);

// index of the fixed-width month window containing `days` (months counted from year 0)
std::int64_t month_bucket(std::int64_t days, int bucket_months);
std::int64_t bucket_start(std::int64_t bucket, int bucket_months);

}
