// FileUtils.hpp
#pragma once

#include "DataTypes.hpp"
#include <string>
#include <vector>

// CSV exports with a header row. Columns are located by name; extra columns
// are ignored. A missing column, malformed number or malformed timestamp
// throws std::runtime_error naming the file and line.
std::vector<BuoySample> read_buoy_file(const std::string& filepath);
std::vector<ShoreSample> read_shore_file(const std::string& filepath);
// "label,validTime,value"; an empty or "null" value is kept as absent.
std::vector<ForecastSample> read_forecast_file(const std::string& filepath);

// "time,<columns...>", fixed 6 digit precision, absent cells left empty.
void write_table_csv(const std::string& filepath, const Table& table);
Table read_table_csv(const std::string& filepath);
