#include "CleaningUtils.hpp"
#include "ConfigUtils.hpp"
#include "DateTimeUtils.hpp"
#include "FileUtils.hpp"
#include "FusionPipeline.hpp"
#include "MergeUtils.hpp"
#include "TableUtils.hpp"
#include "WindUtils.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

const long long T0 = 1644364800; // 2022-02-09 00:00:00 UTC

bool near(double a, double b, double tol = 1e-9) { return std::abs(a - b) < tol; }

void make_station_data(int n, std::vector<BuoySample>& buoy, std::vector<ShoreSample>& shore) {
    for (int i = 0; i < n; ++i) {
        const long long t = T0 + i * 1200LL;
        BuoySample b;
        b.time = t;
        b.air_temp_1 = 8.0 + 4.0 * std::sin(i * 0.03) - 0.2;
        b.air_temp_2 = 8.0 + 4.0 * std::sin(i * 0.03) + 0.2;
        b.wind_dir_1 = 200.0 + 40.0 * std::sin(i * 0.07);
        b.wind_dir_2 = 204.0 + 40.0 * std::sin(i * 0.07);
        b.wind_speed_1 = 4.0 + 2.0 * std::cos(i * 0.05);
        b.wind_speed_2 = 4.5 + 2.0 * std::cos(i * 0.05);
        if (i == 40) b.air_temp_1 = 900.0;        // spike on one sensor
        if (i == 90) b.wind_speed_2 = -50.0;
        buoy.push_back(b);

        ShoreSample s;
        s.time = t;
        s.shortwave_in = std::max(0.0, 850.0 * std::sin(i * 0.04));
        s.shortwave_out = 0.08 * s.shortwave_in;
        s.bp_mbar = 820.0 + 2.0 * std::sin(i * 0.01);
        s.rh_percent = 35.0 + 10.0 * std::cos(i * 0.02);
        s.longwave_in_corr = 280.0 + 20.0 * std::sin(i * 0.015);
        if (i == 120) s.bp_mbar = 0.0;              // dropped logger word
        shore.push_back(s);
    }
}

bool bit_identical(const Table& a, const Table& b) {
    if (a.columns != b.columns || a.rows.size() != b.rows.size()) return false;
    for (size_t i = 0; i < a.rows.size(); ++i) {
        if (a.rows[i].time != b.rows[i].time) return false;
        if (a.rows[i].values.size() != b.rows[i].values.size()) return false;
        for (size_t j = 0; j < a.rows[i].values.size(); ++j) {
            const auto& va = a.rows[i].values[j];
            const auto& vb = b.rows[i].values[j];
            if (va.has_value() != vb.has_value()) return false;
            if (va && std::memcmp(&*va, &*vb, sizeof(double)) != 0) return false;
        }
    }
    return true;
}

std::string write_temp(const std::string& name, const std::string& content) {
    const fs::path p = fs::temp_directory_path() / name;
    std::ofstream out(p, std::ios::trunc);
    out << content;
    return p.string();
}

}

static void test_wind_components() {
    WindVector north = wind_components(10.0, 0.0);
    assert(near(north.u, 0.0) && near(north.v, -10.0));
    WindVector east = wind_components(10.0, 90.0);
    assert(near(east.u, -10.0) && near(east.v, 0.0));
    WindVector south = wind_components(4.0, 180.0);
    assert(near(south.u, 0.0) && near(south.v, 4.0));
    std::cout << "  wind components: OK\n";
}

static void test_decompose_wind_table() {
    Table t;
    t.columns = {features::AIR_TEMP, features::WIND_SPEED, features::WIND_DIR};
    t.rows.push_back({T0, {12.0, 10.0, 90.0}});
    t.rows.push_back({T0 + 1200, {13.0, std::nullopt, 90.0}});
    decompose_wind(t);

    const std::vector<std::string> expected = {features::AIR_TEMP, features::WIND_U, features::WIND_V};
    assert(t.columns == expected);
    assert(*t.rows[0].values[0] == 12.0);
    assert(near(*t.rows[0].values[1], -10.0));
    assert(near(*t.rows[0].values[2], 0.0));
    // an absent speed leaves absent components
    assert(!t.rows[1].values[1] && !t.rows[1].values[2]);

    Table no_wind;
    no_wind.columns = {features::AIR_TEMP};
    bool threw = false;
    try { decompose_wind(no_wind); } catch (const std::out_of_range&) { threw = true; }
    assert(threw);
    std::cout << "  decompose wind: OK\n";
}

static void test_gap_trimming() {
    Table t;
    t.columns = {"a", "b", "c"};
    t.rows.push_back({T0, {1.0, 2.0, 3.0}});
    t.rows.push_back({T0 + 60, {1.0, std::nullopt, 3.0}});
    t.rows.push_back({T0 + 120, {4.0, 5.0, 6.0}});
    const FusedRow kept = t.rows[2];

    assert(trim_incomplete_rows(t) == 1);
    assert(t.size() == 2);
    assert(t.rows[0].time == T0);
    assert(t.rows[1].time == kept.time && t.rows[1].values == kept.values);
    assert(trim_incomplete_rows(t) == 0);

    t.rows.push_back({T0 + 180, {1.0, INFINITY, 2.0}});
    t.rows.push_back({T0 + 240, {NAN, 1.0, 2.0}});
    assert(trim_nonfinite_rows(t) == 2);
    assert(t.size() == 2);
    std::cout << "  gap trimming: OK\n";
}

static void test_historical_pipeline() {
    std::vector<BuoySample> buoy;
    std::vector<ShoreSample> shore;
    make_station_data(300, buoy, shore);

    // shore-only and buoy-only timestamps never make it through
    BuoySample lonely = buoy.front();
    lonely.time = T0 - 600;
    buoy.push_back(lonely);
    ShoreSample stray = shore.back();
    stray.time = T0 + 300 * 1200LL + 600;
    shore.push_back(stray);

    PipelineStats stats;
    Table t = build_historical_table(buoy, shore, default_feature_bounds(), CleaningParams{}, &stats);
    assert(stats.merged_rows == 302);
    assert(stats.incomplete_rows == 2);
    assert(stats.nonfinite_rows == 0);
    assert(t.size() == 300);

    const std::vector<std::string> expected = {
        features::SHORTWAVE, features::AIR_TEMP, features::PRESSURE, features::HUMIDITY,
        features::LONGWAVE, features::WIND_U, features::WIND_V
    };
    assert(t.columns == expected);

    const BoundsMap& bounds = default_feature_bounds();
    for (size_t i = 0; i < t.rows.size(); ++i) {
        const FusedRow& row = t.rows[i];
        if (i > 0) assert(row.time > t.rows[i - 1].time);
        for (size_t c = 0; c < t.columns.size(); ++c) {
            assert(row.values[c] && std::isfinite(*row.values[c]));
            auto it = bounds.find(t.columns[c]);
            if (it != bounds.end()) {
                assert(*row.values[c] >= it->second.lo && *row.values[c] <= it->second.hi);
            }
        }
        const double speed = std::hypot(*row.values[5], *row.values[6]);
        assert(speed <= 40.0);
    }
    // the pressure dropout and the temperature spike are gone
    assert(*t.rows[40].values[1] < 20.0);
    assert(*t.rows[120].values[2] > 80000.0);
    std::cout << "  historical pipeline: OK\n";
}

static void test_pipeline_no_usable_data() {
    Table empty = build_historical_table({}, {}, default_feature_bounds(), CleaningParams{});
    assert(empty.empty());
    assert(empty.columns.size() == 7);

    std::vector<BuoySample> buoy;
    std::vector<ShoreSample> shore;
    make_station_data(20, buoy, shore);
    for (auto& s : shore) s.time += 600;
    Table disjoint = build_historical_table(buoy, shore, default_feature_bounds(), CleaningParams{});
    assert(disjoint.empty());
    std::cout << "  no usable data: OK\n";
}

static void test_pipeline_deterministic() {
    std::vector<BuoySample> buoy;
    std::vector<ShoreSample> shore;
    make_station_data(250, buoy, shore);
    Table first = build_historical_table(buoy, shore, default_feature_bounds(), CleaningParams{});
    Table second = build_historical_table(buoy, shore, default_feature_bounds(), CleaningParams{});
    assert(!first.empty());
    assert(bit_identical(first, second));
    std::cout << "  determinism: OK\n";
}

static void test_time_range_and_splice() {
    Table t;
    t.columns = {"a"};
    for (int i = 0; i < 6; ++i) t.rows.push_back({T0 + i * 3600LL, {(double)i}});
    Table day = select_time_range(t, T0 + 3600, T0 + 4 * 3600);
    assert(day.size() == 3);
    assert(day.rows.front().time == T0 + 3600);

    Table fresh;
    fresh.columns = {"a"};
    fresh.rows.push_back({T0 + 3 * 3600, {30.0}});
    fresh.rows.push_back({T0 + 7 * 3600, {70.0}});
    Table db = splice_tables(t, fresh);
    assert(db.size() == 5);
    assert(*db.rows[2].values[0] == 2.0);
    assert(*db.rows[3].values[0] == 30.0);
    assert(db.rows.back().time == T0 + 7 * 3600);

    Table first_fetch = splice_tables(Table{}, fresh);
    assert(first_fetch.size() == 2);

    Table other;
    other.columns = {"b"};
    bool threw = false;
    try { splice_tables(t, other); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    std::cout << "  time range and splice: OK\n";
}

static void test_config_from_env() {
    unsetenv("FUSION_BOUNDS");
    unsetenv("FUSION_WINDOWS");
    unsetenv("FUSION_SIGMA");
    unsetenv("FORECAST_LABELS");
    BoundsMap defaults = load_feature_bounds();
    assert(defaults.at(features::AIR_TEMP).lo == -20.0);
    CleaningParams params = load_cleaning_params();
    assert(params.median_window == 5 && params.rolling_window == 100 && params.n_sigma == 3.0);
    assert(load_forecast_labels() == default_forecast_labels());

    setenv("FUSION_BOUNDS", "air_temp:-30:50 skyCover:0:100", 1);
    setenv("FUSION_WINDOWS", "7 50", 1);
    setenv("FUSION_SIGMA", "2.5", 1);
    setenv("FORECAST_LABELS", "temperature windSpeed", 1);
    BoundsMap bounds = load_feature_bounds();
    assert(bounds.at(features::AIR_TEMP).lo == -30.0 && bounds.at(features::AIR_TEMP).hi == 50.0);
    assert(bounds.at("skyCover").hi == 100.0);
    assert(bounds.at(features::LONGWAVE).lo == 50.0);
    params = load_cleaning_params();
    assert(params.median_window == 7 && params.rolling_window == 50 && params.n_sigma == 2.5);
    assert(load_forecast_labels().size() == 2);

    setenv("FUSION_BOUNDS", "air_temp:50:-30", 1);
    bool threw = false;
    try { load_feature_bounds(); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    setenv("FUSION_WINDOWS", "0 100", 1);
    threw = false;
    try { load_cleaning_params(); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    unsetenv("FUSION_BOUNDS");
    unsetenv("FUSION_WINDOWS");
    unsetenv("FUSION_SIGMA");
    unsetenv("FORECAST_LABELS");
    std::cout << "  config: OK\n";
}

static void test_station_files() {
    const std::string buoy_path = write_temp("metfusion_buoy.csv",
        "TmStamp,AirTemp_1,AirTemp_2,WindDir_1,WindDir_2,WindSpeed_1,WindSpeed_2,Battery\n"
        "2022-02-09 00:00:00,8.0,9.0,170,190,4.0,6.0,12.6\n"
        "2022-02-09 00:20:00,8.2,9.2,171,191,4.1,6.1,12.6\n");
    const std::string shore_path = write_temp("metfusion_shore.csv",
        "TmStamp,ShortWaveIn_wm2,ShortWaveOut_wm2,BP_mbar,RH_percent,LongWaveInCorr_wm2\n"
        "2022-02-09 00:00:00,194.57,0,820.2355,33.51,-125.6\n");

    auto buoy = read_buoy_file(buoy_path);
    auto shore = read_shore_file(shore_path);
    assert(buoy.size() == 2);
    assert(buoy[1].time == T0 + 1200);
    assert(buoy[0].wind_speed_2 == 6.0);
    assert(shore.size() == 1);
    assert(near(shore[0].bp_mbar, 820.2355));

    const std::string bad_number = write_temp("metfusion_bad.csv",
        "TmStamp,ShortWaveIn_wm2,ShortWaveOut_wm2,BP_mbar,RH_percent,LongWaveInCorr_wm2\n"
        "2022-02-09 00:00:00,194.57,0,n/a,33.51,-125.6\n");
    bool threw = false;
    try { read_shore_file(bad_number); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { read_buoy_file(shore_path); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { read_buoy_file((fs::temp_directory_path() / "metfusion_missing.csv").string()); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    fs::remove(buoy_path);
    fs::remove(shore_path);
    fs::remove(bad_number);
    std::cout << "  station files: OK\n";
}

static void test_forecast_database_files() {
    const std::string forecast_path = write_temp("metfusion_forecast.csv",
        "label,validTime,value\n"
        "temperature,2022-02-04T02:00:00+00:00/PT2H,-0.555556\n"
        "skyCover,2022-02-04T02:00:00+00:00/PT1H,null\n"
        "windSpeed,2022-02-04T03:00:00+00:00/PT1H,7.408\n");
    auto samples = read_forecast_file(forecast_path);
    assert(samples.size() == 3);
    assert(!samples[1].value);

    Table forecast = build_forecast_table(samples, default_forecast_labels());
    assert(forecast.size() == 2);

    const std::string db_path = (fs::temp_directory_path() / "metfusion_database.csv").string();
    write_table_csv(db_path, forecast);
    Table back = read_table_csv(db_path);
    assert(back.columns == forecast.columns);
    assert(back.size() == 2);
    assert(back.rows[0].time == to_epoch_seconds(2022, 2, 4, 2, 0, 0));
    const int sky = find_column(back, "skyCover");
    const int temp = find_column(back, "temperature");
    assert(!back.rows[0].values[sky]);
    assert(near(*back.rows[1].values[temp], -0.555556));

    fs::remove(forecast_path);
    fs::remove(db_path);
    std::cout << "  forecast database files: OK\n";
}

int main() {
    std::cout << "Running pipeline tests\n";
    test_wind_components();
    test_decompose_wind_table();
    test_gap_trimming();
    test_historical_pipeline();
    test_pipeline_no_usable_data();
    test_pipeline_deterministic();
    test_time_range_and_splice();
    test_config_from_env();
    test_station_files();
    test_forecast_database_files();
    std::cout << "pipeline tests passed" << std::endl;
    return 0;
}
