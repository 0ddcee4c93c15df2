// DateTimeUtils.hpp
#pragma once

#include <string>

long long add_hours_to_yyyymmddhh(long long start_time, int hours_to_add);

// Seconds since 1970-01-01T00:00:00Z for a proleptic Gregorian UTC date.
long long to_epoch_seconds(int year, int month, int day, int hour, int minute, int second);
long long yyyymmddhh_to_epoch(long long yyyymmddhh);

// Accepts "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]".
// The UTC offset is applied; fractional seconds are dropped.
// Throws std::invalid_argument on anything else.
long long parse_timestamp(const std::string& text);

std::string format_timestamp(long long epoch_seconds);

long long round_to_nearest_hour(long long epoch_seconds);

constexpr long long SECONDS_PER_HOUR = 3600;
