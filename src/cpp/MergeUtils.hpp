// MergeUtils.hpp
#pragma once

#include "DataTypes.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

// Sparse table keyed by timestamp. A row of absent cells is allocated the
// first time a timestamp is referenced; cells are then filled one at a time.
class TableBuilder {
public:
    explicit TableBuilder(std::vector<std::string> columns);

    // Overwrites the cell.
    void set(long long time, const std::string& feature, double value);
    // Adds one instrument's value to the cell; build() reports the mean.
    void accumulate(long long time, const std::string& feature, double value);

    Table build() const;

    size_t column_index(const std::string& feature) const;
    size_t row_count() const { return rows_.size(); }

private:
    struct Cell {
        double sum = 0.0;
        int count = 0;
    };

    std::vector<Cell>& row(long long time);

    std::vector<std::string> columns_;
    std::unordered_map<std::string, size_t> index_;
    std::map<long long, std::vector<Cell>> rows_;
};

double average_redundant(double a, double b);

inline double millibar_to_pascal(double mbar) { return mbar * 100.0; }
inline double percent_to_fraction(double pct) { return pct / 100.0; }

const std::vector<std::string>& station_columns();
const std::vector<std::string>& default_forecast_labels();

// Readings from every source are fused per timestamp; readings sharing a
// (timestamp, feature) are averaged. Throws std::out_of_range for a feature
// that is not one of the columns.
Table merge_readings(const std::vector<std::string>& columns,
                     const std::vector<std::vector<Reading>>& sources);

Table merge_station_data(const std::vector<BuoySample>& buoy, const std::vector<ShoreSample>& shore);

// Samples whose label is not in labels are ignored; null values leave cells untouched.
Table merge_forecast_samples(const std::vector<ForecastSample>& samples,
                             const std::vector<std::string>& labels);
