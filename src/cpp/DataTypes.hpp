// DataTypes.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

// Column names of the fused station table, in output order.
namespace features {
const std::string SHORTWAVE = "shortwave";
const std::string AIR_TEMP = "air_temp";
const std::string PRESSURE = "atmospheric_pressure";
const std::string HUMIDITY = "relative_humidity";
const std::string LONGWAVE = "longwave";
const std::string WIND_SPEED = "wind_speed";
const std::string WIND_DIR = "wind_direction";
const std::string WIND_U = "wind_u";
const std::string WIND_V = "wind_v";
}

// One instrument value for one feature at one instant (epoch seconds, UTC).
struct Reading {
    long long time = 0;
    std::string feature;
    double value = 0.0;
};

// NASA buoy record; every quantity is measured by two sensors.
struct BuoySample {
    long long time = 0;
    double air_temp_1 = 0.0, air_temp_2 = 0.0;
    double wind_dir_1 = 0.0, wind_dir_2 = 0.0;
    double wind_speed_1 = 0.0, wind_speed_2 = 0.0;
};

// USCG shore station record, raw engineering units.
struct ShoreSample {
    long long time = 0;
    double shortwave_in = 0.0, shortwave_out = 0.0;
    double bp_mbar = 0.0;
    double rh_percent = 0.0;
    double longwave_in_corr = 0.0;
};

// Gridded forecast value valid over an ISO 8601 interval.
struct ForecastSample {
    std::string label;
    std::string valid_time;
    std::optional<double> value;
};

struct FusedRow {
    long long time = 0;
    std::vector<std::optional<double>> values;
};

struct Table {
    std::vector<std::string> columns;
    std::vector<FusedRow> rows;

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
};

struct FeatureBounds {
    double lo = 0.0, hi = 0.0;
};

using BoundsMap = std::map<std::string, FeatureBounds>;

struct CleaningParams {
    int median_window = 5;
    int rolling_window = 100;
    double n_sigma = 3.0;
    // Features allowed to sit at their clip bounds.
    std::vector<std::string> bound_exempt = {features::SHORTWAVE};
};
