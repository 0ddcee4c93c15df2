// TableUtils.cpp
#include "TableUtils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

int find_column(const Table& table, const std::string& name) {
    auto it = std::find(table.columns.begin(), table.columns.end(), name);
    if (it == table.columns.end()) return -1;
    return (int)(it - table.columns.begin());
}

std::vector<double> get_column(const Table& table, size_t col) {
    std::vector<double> out;
    out.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        out.push_back(row.values[col].value_or(std::numeric_limits<double>::quiet_NaN()));
    }
    return out;
}

void set_column(Table& table, size_t col, const std::vector<double>& values) {
    if (values.size() != table.rows.size()) {
        throw std::invalid_argument("Column length does not match table for '" + table.columns.at(col) + "'");
    }
    for (size_t i = 0; i < values.size(); ++i) table.rows[i].values[col] = values[i];
}

void add_column(Table& table, const std::string& name, const std::vector<double>& values) {
    if (values.size() != table.rows.size()) {
        throw std::invalid_argument("Column length does not match table for '" + name + "'");
    }
    table.columns.push_back(name);
    for (size_t i = 0; i < values.size(); ++i) {
        if (std::isnan(values[i])) table.rows[i].values.emplace_back(std::nullopt);
        else table.rows[i].values.emplace_back(values[i]);
    }
}

void drop_column(Table& table, const std::string& name) {
    int col = find_column(table, name);
    if (col < 0) throw std::out_of_range("No column '" + name + "'");
    table.columns.erase(table.columns.begin() + col);
    for (auto& row : table.rows) row.values.erase(row.values.begin() + col);
}

size_t trim_incomplete_rows(Table& table) {
    const size_t before = table.rows.size();
    table.rows.erase(std::remove_if(table.rows.begin(), table.rows.end(), [](const FusedRow& row) {
        return std::any_of(row.values.begin(), row.values.end(),
                           [](const std::optional<double>& v) { return !v.has_value(); });
    }), table.rows.end());
    return before - table.rows.size();
}

size_t trim_nonfinite_rows(Table& table) {
    const size_t before = table.rows.size();
    table.rows.erase(std::remove_if(table.rows.begin(), table.rows.end(), [](const FusedRow& row) {
        return std::any_of(row.values.begin(), row.values.end(),
                           [](const std::optional<double>& v) { return !v || !std::isfinite(*v); });
    }), table.rows.end());
    return before - table.rows.size();
}

Table select_time_range(const Table& table, long long start, long long end) {
    Table out;
    out.columns = table.columns;
    for (const auto& row : table.rows) {
        if (row.time >= start && row.time < end) out.rows.push_back(row);
    }
    return out;
}

Table splice_tables(const Table& existing, const Table& fresh) {
    if (existing.rows.empty() && existing.columns.empty()) return fresh;
    if (existing.columns != fresh.columns) {
        throw std::invalid_argument("Cannot splice tables with different columns");
    }
    if (fresh.rows.empty()) return existing;

    const long long earliest = fresh.rows.front().time;
    Table out;
    out.columns = fresh.columns;
    for (const auto& row : existing.rows) {
        if (row.time < earliest) out.rows.push_back(row);
    }
    out.rows.insert(out.rows.end(), fresh.rows.begin(), fresh.rows.end());
    return out;
}
