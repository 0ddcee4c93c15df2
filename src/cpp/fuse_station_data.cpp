// fuse_station_data.cpp
// Fuses buoy and shore-station exports into one cleaned hourly/sub-hourly
// table, and optionally refreshes the forecast database from an NWS export.
#include "ConfigUtils.hpp"
#include "DataTypes.hpp"
#include "DateTimeUtils.hpp"
#include "FileUtils.hpp"
#include "FusionPipeline.hpp"
#include "TableUtils.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <omp.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    if (argc < 5) {
        std::cerr << "Usage: " << argv[0] << " <start_YYYYMMDDHH> <end_YYYYMMDDHH|0> <buoy_csv> <shore_csv> [<forecast_csv>]" << std::endl;
        return 1;
    }

    long long start_dt, end_dt;
    try {
        start_dt = std::stoll(argv[1]);
        end_dt = std::stoll(argv[2]);
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid date range '" << argv[1] << "' '" << argv[2] << "'. Must be YYYYMMDDHH." << std::endl;
        return 1;
    }
    if (end_dt == 0) end_dt = add_hours_to_yyyymmddhh(start_dt, 24);
    const std::string buoy_path = argv[3];
    const std::string shore_path = argv[4];
    const std::string forecast_path = argc > 5 ? argv[5] : "";

    auto script_start_time = std::chrono::high_resolution_clock::now();

    try {
        const long long start_epoch = yyyymmddhh_to_epoch(start_dt);
        const long long end_epoch = yyyymmddhh_to_epoch(end_dt);
        if (end_epoch <= start_epoch) {
            std::cerr << "Error: End " << end_dt << " is not after start " << start_dt << "." << std::endl;
            return 1;
        }

        const BoundsMap bounds = load_feature_bounds();
        const CleaningParams params = load_cleaning_params();
        const std::string output_path = env_or_default("FUSION_OUTPUT", "historical_data.csv");
        const std::string forecast_db = env_or_default("FORECAST_DB", "database.csv");

        std::cout << "Reading station exports..." << std::endl;
        auto read_start_time = std::chrono::high_resolution_clock::now();
        std::vector<BuoySample> buoy = read_buoy_file(buoy_path);
        std::vector<ShoreSample> shore = read_shore_file(shore_path);
        auto in_range = [&](long long t) { return t >= start_epoch && t < end_epoch; };
        buoy.erase(std::remove_if(buoy.begin(), buoy.end(), [&](const BuoySample& s) { return !in_range(s.time); }), buoy.end());
        shore.erase(std::remove_if(shore.begin(), shore.end(), [&](const ShoreSample& s) { return !in_range(s.time); }), shore.end());
        auto read_end_time = std::chrono::high_resolution_clock::now();
        std::cout << "Found " << buoy.size() << " buoy and " << shore.size() << " shore records in "
                  << start_dt << " - " << end_dt << "." << std::endl;
        std::cout << "--- Time to read station exports: " << std::chrono::duration<double>(read_end_time - read_start_time).count() << " seconds ---" << std::endl;

        auto fusion_start_time = std::chrono::high_resolution_clock::now();
        std::cout << "Fusing and cleaning (" << omp_get_max_threads() << " threads, windows "
                  << params.median_window << "/" << params.rolling_window << ", " << params.n_sigma << " sigma)..." << std::endl;
        PipelineStats stats;
        Table historical = build_historical_table(buoy, shore, bounds, params, &stats);
        auto fusion_end_time = std::chrono::high_resolution_clock::now();
        std::cout << "Merged " << stats.merged_rows << " timestamps, dropped " << stats.incomplete_rows
                  << " incomplete and " << stats.nonfinite_rows << " non-finite rows, kept " << historical.size() << "." << std::endl;
        std::cout << "--- Time for fusion processing: " << std::chrono::duration<double>(fusion_end_time - fusion_start_time).count() << " seconds ---" << std::endl;

        if (historical.empty()) {
            std::cerr << "Warning: No fully populated timestamps in range; writing header only." << std::endl;
        }
        if (fs::exists(output_path)) fs::remove(output_path);
        std::cout << "Saving historical data to " << output_path << std::endl;
        write_table_csv(output_path, historical);

        if (!forecast_path.empty()) {
            std::vector<ForecastSample> samples = read_forecast_file(forecast_path);
            Table forecast = build_forecast_table(samples, load_forecast_labels());
            Table database;
            if (fs::exists(forecast_db)) database = read_table_csv(forecast_db);
            Table merged = splice_tables(database, forecast);
            std::cout << "Saving " << merged.size() << " forecast rows (" << forecast.size() << " fetched) to " << forecast_db << std::endl;
            write_table_csv(forecast_db, merged);
            if (!forecast.empty()) {
                std::cout << "Fetched forecasts from " << format_timestamp(forecast.rows.front().time)
                          << " to " << format_timestamp(forecast.rows.back().time) << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto script_end_time = std::chrono::high_resolution_clock::now();
    std::cout << "\n--- Total script execution time: " << std::chrono::duration<double>(script_end_time - script_start_time).count() << " seconds ---" << std::endl;

    return 0;
}
