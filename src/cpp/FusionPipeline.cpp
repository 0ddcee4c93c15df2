// FusionPipeline.cpp
#include "FusionPipeline.hpp"
#include "CleaningUtils.hpp"
#include "MergeUtils.hpp"
#include "TableUtils.hpp"
#include "WindUtils.hpp"

Table build_historical_table(const std::vector<BuoySample>& buoy,
                             const std::vector<ShoreSample>& shore,
                             const BoundsMap& bounds,
                             const CleaningParams& params,
                             PipelineStats* stats) {
    PipelineStats local;
    Table table = merge_station_data(buoy, shore);
    local.merged_rows = table.size();

    local.incomplete_rows = trim_incomplete_rows(table);
    remove_outliers(table, bounds, params);
    decompose_wind(table);
    local.nonfinite_rows = trim_nonfinite_rows(table);

    if (stats) *stats = local;
    return table;
}

Table build_forecast_table(const std::vector<ForecastSample>& samples,
                           const std::vector<std::string>& labels) {
    return merge_forecast_samples(samples, labels);
}
