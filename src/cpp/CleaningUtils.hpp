// CleaningUtils.hpp
#pragma once

#include "DataTypes.hpp"
#include <string>
#include <vector>

const BoundsMap& default_feature_bounds();

// Centered rolling statistics. The window for index i covers
// [i - w/2, i + (w-1)/2], shrunk at the series edges (min 1 sample).
std::vector<double> rolling_median(const std::vector<double>& x, int window);
std::vector<double> rolling_mean(const std::vector<double>& x, int window);
// Sample standard deviation; NaN where the window holds a single value.
std::vector<double> rolling_std(const std::vector<double>& x, int window);

void median_filter(std::vector<double>& x, int window);
void clip_to_bounds(std::vector<double>& x, const FeatureBounds& bounds);
void repair_sigma_outliers(std::vector<double>& x, int window, double n_sigma);
void repair_bound_stuck(std::vector<double>& x, const FeatureBounds& bounds, int window);

// Median filter, clip, sigma repair, bound-stuck repair, median filter.
// Clipping and bound-stuck repair apply only to features listed in bounds.
void clean_column(std::vector<double>& x, const std::string& feature,
                  const BoundsMap& bounds, const CleaningParams& params);

// Cleans every column of a dense table in place. Columns are independent
// and may be processed in parallel.
void remove_outliers(Table& table, const BoundsMap& bounds, const CleaningParams& params);
