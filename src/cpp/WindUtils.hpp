// WindUtils.hpp
#pragma once

#include "DataTypes.hpp"
#include <string>

struct WindVector {
    double u = 0.0, v = 0.0;
};

// Direction is where the wind blows from, in degrees; (u, v) point downwind.
WindVector wind_components(double speed, double direction_deg);

// Replaces the speed/direction columns with u/v columns appended at the end.
// Absent inputs give absent outputs. Throws std::out_of_range when either
// input column is missing.
void decompose_wind(Table& table,
                    const std::string& speed_col = features::WIND_SPEED,
                    const std::string& dir_col = features::WIND_DIR,
                    const std::string& u_col = features::WIND_U,
                    const std::string& v_col = features::WIND_V);
