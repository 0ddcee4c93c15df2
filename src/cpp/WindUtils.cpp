// WindUtils.cpp
#include "WindUtils.hpp"
#include "TableUtils.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

WindVector wind_components(double speed, double direction_deg) {
    const double rad = direction_deg * M_PI / 180.0;
    return {-speed * std::sin(rad), -speed * std::cos(rad)};
}

void decompose_wind(Table& table, const std::string& speed_col, const std::string& dir_col,
                    const std::string& u_col, const std::string& v_col) {
    const int is = find_column(table, speed_col);
    const int id = find_column(table, dir_col);
    if (is < 0 || id < 0) {
        throw std::out_of_range("Wind columns '" + speed_col + "'/'" + dir_col + "' not in table");
    }

    const std::vector<double> speed = get_column(table, is);
    const std::vector<double> dir = get_column(table, id);
    std::vector<double> u(speed.size()), v(speed.size());
    for (size_t i = 0; i < speed.size(); ++i) {
        const WindVector w = wind_components(speed[i], dir[i]);
        u[i] = w.u;
        v[i] = w.v;
    }

    drop_column(table, dir_col);
    drop_column(table, speed_col);
    add_column(table, u_col, u);
    add_column(table, v_col, v);
}
