// FileUtils.cpp
#include "FileUtils.hpp"
#include "DateTimeUtils.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace {

struct CsvSheet {
    std::string path;
    std::vector<std::string> header;
    std::unordered_map<std::string, int> col_map;
    std::vector<std::vector<std::string>> rows;
    std::vector<int> line_numbers;
};

std::string trim(const std::string& s) {
    const auto start = s.find_first_not_of(" \t\r\"");
    if (start == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\"");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> out;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) out.push_back(trim(field));
    if (!line.empty() && line.back() == ',') out.emplace_back();
    return out;
}

CsvSheet read_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open '" + filepath + "'");
    }
    CsvSheet sheet;
    sheet.path = filepath;
    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty() || line[0] == '#') continue;
        if (sheet.header.empty()) {
            sheet.header = split_csv_line(line);
            for (size_t i = 0; i < sheet.header.size(); ++i) sheet.col_map[sheet.header[i]] = i;
            continue;
        }
        sheet.rows.push_back(split_csv_line(line));
        sheet.line_numbers.push_back(line_no);
    }
    return sheet;
}

[[noreturn]] void fail(const CsvSheet& sheet, size_t row, const std::string& what) {
    throw std::runtime_error(sheet.path + ":" + std::to_string(sheet.line_numbers[row]) + ": " + what);
}

int require_column(const CsvSheet& sheet, const std::string& name) {
    auto it = sheet.col_map.find(name);
    if (it == sheet.col_map.end()) {
        throw std::runtime_error("Missing column '" + name + "' in '" + sheet.path + "'");
    }
    return it->second;
}

const std::string& field(const CsvSheet& sheet, size_t row, int col) {
    const auto& values = sheet.rows[row];
    if ((size_t)col >= values.size()) fail(sheet, row, "missing field '" + sheet.header[col] + "'");
    return values[col];
}

double number_field(const CsvSheet& sheet, size_t row, int col) {
    const std::string& text = field(sheet, row, col);
    try {
        size_t pos = 0;
        double v = std::stod(text, &pos);
        if (pos != text.size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::exception& e) {
        fail(sheet, row, "bad number '" + text + "' in '" + sheet.header[col] + "' (" + e.what() + ")");
    }
}

long long time_field(const CsvSheet& sheet, size_t row, int col) {
    const std::string& text = field(sheet, row, col);
    try {
        return parse_timestamp(text);
    } catch (const std::exception& e) {
        fail(sheet, row, e.what());
    }
}

}

std::vector<BuoySample> read_buoy_file(const std::string& filepath) {
    const CsvSheet sheet = read_csv(filepath);
    const int c_time = require_column(sheet, "TmStamp");
    const int c_t1 = require_column(sheet, "AirTemp_1");
    const int c_t2 = require_column(sheet, "AirTemp_2");
    const int c_d1 = require_column(sheet, "WindDir_1");
    const int c_d2 = require_column(sheet, "WindDir_2");
    const int c_s1 = require_column(sheet, "WindSpeed_1");
    const int c_s2 = require_column(sheet, "WindSpeed_2");

    std::vector<BuoySample> out;
    out.reserve(sheet.rows.size());
    for (size_t i = 0; i < sheet.rows.size(); ++i) {
        BuoySample s;
        s.time = time_field(sheet, i, c_time);
        s.air_temp_1 = number_field(sheet, i, c_t1);
        s.air_temp_2 = number_field(sheet, i, c_t2);
        s.wind_dir_1 = number_field(sheet, i, c_d1);
        s.wind_dir_2 = number_field(sheet, i, c_d2);
        s.wind_speed_1 = number_field(sheet, i, c_s1);
        s.wind_speed_2 = number_field(sheet, i, c_s2);
        out.push_back(s);
    }
    return out;
}

std::vector<ShoreSample> read_shore_file(const std::string& filepath) {
    const CsvSheet sheet = read_csv(filepath);
    const int c_time = require_column(sheet, "TmStamp");
    const int c_swi = require_column(sheet, "ShortWaveIn_wm2");
    const int c_swo = require_column(sheet, "ShortWaveOut_wm2");
    const int c_bp = require_column(sheet, "BP_mbar");
    const int c_rh = require_column(sheet, "RH_percent");
    const int c_lw = require_column(sheet, "LongWaveInCorr_wm2");

    std::vector<ShoreSample> out;
    out.reserve(sheet.rows.size());
    for (size_t i = 0; i < sheet.rows.size(); ++i) {
        ShoreSample s;
        s.time = time_field(sheet, i, c_time);
        s.shortwave_in = number_field(sheet, i, c_swi);
        s.shortwave_out = number_field(sheet, i, c_swo);
        s.bp_mbar = number_field(sheet, i, c_bp);
        s.rh_percent = number_field(sheet, i, c_rh);
        s.longwave_in_corr = number_field(sheet, i, c_lw);
        out.push_back(s);
    }
    return out;
}

std::vector<ForecastSample> read_forecast_file(const std::string& filepath) {
    const CsvSheet sheet = read_csv(filepath);
    const int c_label = require_column(sheet, "label");
    const int c_time = require_column(sheet, "validTime");
    const int c_value = require_column(sheet, "value");

    std::vector<ForecastSample> out;
    out.reserve(sheet.rows.size());
    for (size_t i = 0; i < sheet.rows.size(); ++i) {
        ForecastSample s;
        s.label = field(sheet, i, c_label);
        s.valid_time = field(sheet, i, c_time);
        const auto& values = sheet.rows[i];
        if ((size_t)c_value < values.size() && !values[c_value].empty() && values[c_value] != "null") {
            s.value = number_field(sheet, i, c_value);
        }
        out.push_back(s);
    }
    return out;
}

void write_table_csv(const std::string& filepath, const Table& table) {
    std::ofstream outfile(filepath, std::ios::trunc);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not write '" + filepath + "'");
    }
    outfile.precision(6);
    outfile << std::fixed << "time";
    for (const auto& c : table.columns) outfile << "," << c;
    outfile << "\n";
    for (const auto& row : table.rows) {
        outfile << format_timestamp(row.time);
        for (const auto& v : row.values) {
            outfile << ",";
            if (v) outfile << *v;
        }
        outfile << "\n";
    }
    if (!outfile) {
        throw std::runtime_error("Failed while writing '" + filepath + "'");
    }
}

Table read_table_csv(const std::string& filepath) {
    const CsvSheet sheet = read_csv(filepath);
    const int c_time = require_column(sheet, "time");

    Table table;
    for (size_t i = 0; i < sheet.header.size(); ++i) {
        if ((int)i != c_time) table.columns.push_back(sheet.header[i]);
    }
    for (size_t r = 0; r < sheet.rows.size(); ++r) {
        FusedRow row;
        row.time = time_field(sheet, r, c_time);
        for (size_t i = 0; i < sheet.header.size(); ++i) {
            if ((int)i == c_time) continue;
            if (i >= sheet.rows[r].size() || sheet.rows[r][i].empty()) row.values.emplace_back(std::nullopt);
            else row.values.emplace_back(number_field(sheet, r, (int)i));
        }
        table.rows.push_back(std::move(row));
    }
    return table;
}
