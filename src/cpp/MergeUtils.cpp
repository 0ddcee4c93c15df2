// MergeUtils.cpp
#include "MergeUtils.hpp"
#include "IntervalUtils.hpp"

#include <stdexcept>
#include <utility>

TableBuilder::TableBuilder(std::vector<std::string> columns) : columns_(std::move(columns)) {
    for (size_t i = 0; i < columns_.size(); ++i) index_[columns_[i]] = i;
}

size_t TableBuilder::column_index(const std::string& feature) const {
    auto it = index_.find(feature);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown feature '" + feature + "'");
    }
    return it->second;
}

std::vector<TableBuilder::Cell>& TableBuilder::row(long long time) {
    auto it = rows_.find(time);
    if (it == rows_.end()) {
        it = rows_.emplace(time, std::vector<Cell>(columns_.size())).first;
    }
    return it->second;
}

void TableBuilder::set(long long time, const std::string& feature, double value) {
    Cell& cell = row(time)[column_index(feature)];
    cell.sum = value;
    cell.count = 1;
}

void TableBuilder::accumulate(long long time, const std::string& feature, double value) {
    Cell& cell = row(time)[column_index(feature)];
    cell.sum += value;
    cell.count++;
}

Table TableBuilder::build() const {
    Table table;
    table.columns = columns_;
    table.rows.reserve(rows_.size());
    for (const auto& p : rows_) {
        FusedRow fr;
        fr.time = p.first;
        fr.values.reserve(p.second.size());
        for (const auto& cell : p.second) {
            if (cell.count > 0) fr.values.emplace_back(cell.sum / cell.count);
            else fr.values.emplace_back(std::nullopt);
        }
        table.rows.push_back(std::move(fr));
    }
    return table;
}

double average_redundant(double a, double b) { return (a + b) / 2; }

const std::vector<std::string>& station_columns() {
    static const std::vector<std::string> cols = {
        features::SHORTWAVE, features::AIR_TEMP, features::PRESSURE, features::HUMIDITY,
        features::LONGWAVE, features::WIND_SPEED, features::WIND_DIR
    };
    return cols;
}

const std::vector<std::string>& default_forecast_labels() {
    static const std::vector<std::string> labels = {
        "windDirection", "windSpeed", "temperature", "skyCover", "relativeHumidity"
    };
    return labels;
}

Table merge_readings(const std::vector<std::string>& columns,
                     const std::vector<std::vector<Reading>>& sources) {
    TableBuilder builder(columns);
    for (const auto& source : sources) {
        for (const auto& r : source) builder.accumulate(r.time, r.feature, r.value);
    }
    return builder.build();
}

Table merge_station_data(const std::vector<BuoySample>& buoy, const std::vector<ShoreSample>& shore) {
    TableBuilder builder(station_columns());

    for (const auto& s : buoy) {
        builder.set(s.time, features::AIR_TEMP, average_redundant(s.air_temp_1, s.air_temp_2));
        builder.set(s.time, features::WIND_SPEED, average_redundant(s.wind_speed_1, s.wind_speed_2));
        builder.set(s.time, features::WIND_DIR, average_redundant(s.wind_dir_1, s.wind_dir_2));
    }

    for (const auto& s : shore) {
        builder.set(s.time, features::SHORTWAVE, s.shortwave_in - s.shortwave_out);
        builder.set(s.time, features::PRESSURE, millibar_to_pascal(s.bp_mbar));
        builder.set(s.time, features::HUMIDITY, percent_to_fraction(s.rh_percent));
        builder.set(s.time, features::LONGWAVE, s.longwave_in_corr);
    }

    return builder.build();
}

Table merge_forecast_samples(const std::vector<ForecastSample>& samples,
                             const std::vector<std::string>& labels) {
    TableBuilder builder(labels);
    for (const auto& label : labels) {
        for (const auto& s : samples) {
            if (s.label != label || !s.value) continue;
            for (const auto& r : expand_interval(s.label, s.valid_time, *s.value)) {
                builder.set(r.time, r.feature, r.value);
            }
        }
    }
    return builder.build();
}
