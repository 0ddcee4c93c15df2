// CleaningUtils.cpp
#include "CleaningUtils.hpp"
#include "TableUtils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

const BoundsMap& default_feature_bounds() {
    static const BoundsMap bounds = {
        {features::HUMIDITY,   {0.0, 1.0}},
        {features::SHORTWAVE,  {-0.001, 1300.0}},
        {features::LONGWAVE,   {50.0, 450.0}},
        {features::PRESSURE,   {75000.0, 90000.0}},
        {features::AIR_TEMP,   {-20.0, 70.0}},
        {features::WIND_SPEED, {0.0, 40.0}},
        {features::WIND_DIR,   {0.0, 360.0}},
    };
    return bounds;
}

static inline void window_range(size_t i, size_t n, int window, size_t& begin, size_t& end) {
    const long long offset = (window - 1) / 2;
    long long e = (long long)i + offset + 1;
    long long b = e - window;
    begin = (size_t)std::max(0LL, b);
    end = (size_t)std::min((long long)n, e);
}

std::vector<double> rolling_median(const std::vector<double>& x, int window) {
    const size_t n = x.size();
    std::vector<double> out(n);
    std::vector<double> buf;
    buf.reserve(window);
    for (size_t i = 0; i < n; ++i) {
        size_t b, e;
        window_range(i, n, window, b, e);
        buf.assign(x.begin() + b, x.begin() + e);
        std::sort(buf.begin(), buf.end());
        const size_t k = buf.size();
        out[i] = (k % 2 == 1) ? buf[k / 2] : (buf[k / 2 - 1] + buf[k / 2]) / 2.0;
    }
    return out;
}

std::vector<double> rolling_mean(const std::vector<double>& x, int window) {
    const size_t n = x.size();
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        size_t b, e;
        window_range(i, n, window, b, e);
        double sum = 0.0;
        for (size_t j = b; j < e; ++j) sum += x[j];
        out[i] = sum / (double)(e - b);
    }
    return out;
}

std::vector<double> rolling_std(const std::vector<double>& x, int window) {
    const size_t n = x.size();
    std::vector<double> out(n);
    for (size_t i = 0; i < n; ++i) {
        size_t b, e;
        window_range(i, n, window, b, e);
        const size_t k = e - b;
        if (k < 2) {
            out[i] = std::numeric_limits<double>::quiet_NaN();
            continue;
        }
        double sum = 0.0;
        for (size_t j = b; j < e; ++j) sum += x[j];
        const double mean = sum / (double)k;
        double ss = 0.0;
        for (size_t j = b; j < e; ++j) ss += (x[j] - mean) * (x[j] - mean);
        out[i] = std::sqrt(ss / (double)(k - 1));
    }
    return out;
}

void median_filter(std::vector<double>& x, int window) {
    x = rolling_median(x, window);
}

void clip_to_bounds(std::vector<double>& x, const FeatureBounds& bounds) {
    for (auto& v : x) v = std::min(std::max(v, bounds.lo), bounds.hi);
}

void repair_sigma_outliers(std::vector<double>& x, int window, double n_sigma) {
    if (x.empty()) return;
    const std::vector<double> mean = rolling_mean(x, window);
    std::vector<double> sd = rolling_std(x, window);
    sd[0] = 0.0;

    const size_t n = x.size();
    std::vector<double> lo(n), hi(n);
    for (size_t i = 0; i < n; ++i) {
        lo[i] = mean[i] - n_sigma * sd[i];
        hi[i] = mean[i] + n_sigma * sd[i];
    }
    // Lower band first, then upper band, both against the same statistics.
    for (size_t i = 0; i < n; ++i) {
        if (!(lo[i] < x[i])) x[i] = mean[i];
    }
    for (size_t i = 0; i < n; ++i) {
        if (!(x[i] < hi[i])) x[i] = mean[i];
    }
}

void repair_bound_stuck(std::vector<double>& x, const FeatureBounds& bounds, int window) {
    const std::vector<double> mean = rolling_mean(x, window);
    for (size_t i = 0; i < x.size(); ++i) {
        if (x[i] == bounds.hi) x[i] = mean[i];
    }
    for (size_t i = 0; i < x.size(); ++i) {
        if (x[i] == bounds.lo) x[i] = mean[i];
    }
}

void clean_column(std::vector<double>& x, const std::string& feature,
                  const BoundsMap& bounds, const CleaningParams& params) {
    auto it = bounds.find(feature);
    const bool bounded = it != bounds.end();
    const bool exempt = std::find(params.bound_exempt.begin(), params.bound_exempt.end(), feature)
                        != params.bound_exempt.end();

    median_filter(x, params.median_window);
    if (bounded) clip_to_bounds(x, it->second);
    repair_sigma_outliers(x, params.rolling_window, params.n_sigma);
    if (bounded && !exempt) repair_bound_stuck(x, it->second, params.rolling_window);
    median_filter(x, params.median_window);
}

void remove_outliers(Table& table, const BoundsMap& bounds, const CleaningParams& params) {
    const int ncols = (int)table.columns.size();
    #pragma omp parallel for schedule(static)
    for (int c = 0; c < ncols; ++c) {
        std::vector<double> col = get_column(table, c);
        clean_column(col, table.columns[c], bounds, params);
        set_column(table, c, col);
    }
}
