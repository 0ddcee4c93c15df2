// TableUtils.hpp
#pragma once

#include "DataTypes.hpp"
#include <string>
#include <vector>

// Index of a column, or -1 when the table has no such column.
int find_column(const Table& table, const std::string& name);

// Absent cells come back as NaN.
std::vector<double> get_column(const Table& table, size_t col);
void set_column(Table& table, size_t col, const std::vector<double>& values);

void add_column(Table& table, const std::string& name, const std::vector<double>& values);
void drop_column(Table& table, const std::string& name);

// Removes every row with at least one absent cell. Returns the number removed.
size_t trim_incomplete_rows(Table& table);
// Removes every row with an absent or non-finite cell. Returns the number removed.
size_t trim_nonfinite_rows(Table& table);

// Rows with start <= time < end.
Table select_time_range(const Table& table, long long start, long long end);

// Existing rows strictly before the first fresh row, followed by all fresh rows.
Table splice_tables(const Table& existing, const Table& fresh);
