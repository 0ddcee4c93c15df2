// FusionPipeline.hpp
#pragma once

#include "DataTypes.hpp"
#include <vector>

struct PipelineStats {
    size_t merged_rows = 0;
    size_t incomplete_rows = 0;
    size_t nonfinite_rows = 0;
};

// merge -> trim -> clean -> decompose wind -> trim.
// Returns an empty table when no timestamp is fully populated.
Table build_historical_table(const std::vector<BuoySample>& buoy,
                             const std::vector<ShoreSample>& shore,
                             const BoundsMap& bounds,
                             const CleaningParams& params,
                             PipelineStats* stats = nullptr);

Table build_forecast_table(const std::vector<ForecastSample>& samples,
                           const std::vector<std::string>& labels);
