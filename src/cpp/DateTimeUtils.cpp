// DateTimeUtils.cpp
#include "DateTimeUtils.hpp"

#include <cstdio>
#include <regex>
#include <stdexcept>

static inline bool is_leap(int y) {
    return ((y % 4 == 0 && y % 100 != 0) || (y % 400 == 0));
}

static inline int days_in_month(int y, int m) {
    static const int md[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2) return md[1] + (is_leap(y) ? 1 : 0);
    return md[m - 1];
}

static inline long long floor_div(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// Days since 1970-01-01 (civil calendar, era based).
static long long days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const long long era = floor_div(y, 400);
    const long long yoe = y - era * 400;
    const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

static void civil_from_days(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = floor_div(z, 146097);
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    d = (int)(doy - (153 * mp + 2) / 5 + 1);
    m = (int)(mp < 10 ? mp + 3 : mp - 9);
    y = (int)(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

long long add_hours_to_yyyymmddhh(long long start_time, int hours_to_add) {
    int year = (int)(start_time / 1000000LL);
    int month = (int)((start_time / 10000LL) % 100LL);
    int day = (int)((start_time / 100LL) % 100LL);
    int hour = (int)(start_time % 100LL);

    long long total_hours = (long long)hour + hours_to_add;

    while (total_hours >= 24) {
        total_hours -= 24;
        day++;
        int dim = days_in_month(year, month);
        if (day > dim) {
            day = 1;
            month++;
            if (month > 12) { month = 1; year++; }
        }
    }
    while (total_hours < 0) {
        total_hours += 24;
        day--;
        if (day < 1) {
            month--;
            if (month < 1) { month = 12; year--; }
            day = days_in_month(year, month);
        }
    }
    return (long long)year * 1000000LL + (long long)month * 10000LL + (long long)day * 100LL + total_hours;
}

long long to_epoch_seconds(int year, int month, int day, int hour, int minute, int second) {
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        throw std::invalid_argument("Invalid calendar date/time");
    }
    return days_from_civil(year, month, day) * 86400LL + hour * 3600LL + minute * 60LL + second;
}

long long yyyymmddhh_to_epoch(long long yyyymmddhh) {
    int year = (int)(yyyymmddhh / 1000000LL);
    int month = (int)((yyyymmddhh / 10000LL) % 100LL);
    int day = (int)((yyyymmddhh / 100LL) % 100LL);
    int hour = (int)(yyyymmddhh % 100LL);
    return to_epoch_seconds(year, month, day, hour, 0, 0);
}

long long parse_timestamp(const std::string& text) {
    static const std::regex re(
        R"(^\s*(\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.\d+)?)?\s*(Z|[+-]\d{2}:?\d{2})?\s*$)");
    std::smatch m;
    if (!std::regex_match(text, m, re)) {
        throw std::invalid_argument("Malformed timestamp '" + text + "'");
    }
    long long t = to_epoch_seconds(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()),
                                   std::stoi(m[4].str()), std::stoi(m[5].str()),
                                   m[6].matched ? std::stoi(m[6].str()) : 0);
    if (m[7].matched && m[7].str() != "Z") {
        const std::string off = m[7].str();
        int sign = off[0] == '-' ? -1 : 1;
        int off_h = std::stoi(off.substr(1, 2));
        int off_m = std::stoi(off.substr(off.size() - 2));
        // Local time = UTC + offset.
        t -= sign * (off_h * 3600LL + off_m * 60LL);
    }
    return t;
}

std::string format_timestamp(long long epoch_seconds) {
    long long days = floor_div(epoch_seconds, 86400LL);
    long long secs = epoch_seconds - days * 86400LL;
    int y, m, d;
    civil_from_days(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d+00:00", y, m, d,
                  (int)(secs / 3600), (int)((secs % 3600) / 60), (int)(secs % 60));
    return buf;
}

long long round_to_nearest_hour(long long epoch_seconds) {
    long long into_hour = epoch_seconds - floor_div(epoch_seconds, SECONDS_PER_HOUR) * SECONDS_PER_HOUR;
    long long hour_start = epoch_seconds - into_hour;
    if (into_hour / 60 >= 30) return hour_start + SECONDS_PER_HOUR;
    return hour_start;
}
