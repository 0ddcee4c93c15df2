// ConfigUtils.hpp
#pragma once

#include "DataTypes.hpp"
#include <string>
#include <vector>

// Whitespace separated tokens of an environment variable; empty when unset.
std::vector<std::string> parse_env_list(const char* name);
std::string env_or_default(const char* name, const std::string& fallback);

// Default bounds overridden by FUSION_BOUNDS ("feature:lo:hi ...").
BoundsMap load_feature_bounds();
// Defaults overridden by FUSION_WINDOWS ("<median> <rolling>") and FUSION_SIGMA.
CleaningParams load_cleaning_params();
// FORECAST_LABELS, or the default forecast columns.
std::vector<std::string> load_forecast_labels();

// Parsers shared by the loaders; throw std::invalid_argument.
FeatureBounds parse_bounds_token(const std::string& token, std::string& feature);
int parse_window(const std::string& token);
