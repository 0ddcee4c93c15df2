// IntervalUtils.cpp
#include "IntervalUtils.hpp"
#include "DateTimeUtils.hpp"

#include <cctype>

Interval parse_interval(const std::string& text) {
    Interval interval;
    std::string::size_type sep = text.find('/');
    std::string::size_type sep_len = 1;
    if (sep == std::string::npos) {
        sep = text.find("--");
        sep_len = 2;
    }
    if (sep == std::string::npos) {
        interval.start = parse_timestamp(text);
        return interval;
    }

    interval.start = parse_timestamp(text.substr(0, sep));
    const std::string duration = text.substr(sep + sep_len);
    int hours = 0;
    int integer = 0;
    for (char c : duration) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            integer = 10 * integer + (c - '0');
        } else if (c == 'H') {
            hours += integer;
            integer = 0;
        } else if (c == 'M') {
            hours += integer / 60;
            integer = 0;
        } else if (c == 'S') {
            hours += integer / 360;
            integer = 0;
        }
    }
    interval.hours = hours;
    return interval;
}

std::vector<Reading> expand_interval(const std::string& feature, const std::string& valid_time, double value) {
    const Interval interval = parse_interval(valid_time);
    const long long start = round_to_nearest_hour(interval.start);
    const int count = interval.hours > 0 ? interval.hours : 1;

    std::vector<Reading> out;
    out.reserve(count);
    for (int h = 0; h < count; ++h) {
        out.push_back({start + h * SECONDS_PER_HOUR, feature, value});
    }
    return out;
}
