// ConfigUtils.cpp
#include "ConfigUtils.hpp"
#include "CleaningUtils.hpp"
#include "MergeUtils.hpp"

#include <cstdlib>
#include <regex>
#include <sstream>
#include <stdexcept>

std::vector<std::string> parse_env_list(const char* name) {
    std::vector<std::string> out;
    const char* env = std::getenv(name);
    if (!env) return out;
    std::string env_str(env);
    std::istringstream iss{env_str};
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

std::string env_or_default(const char* name, const std::string& fallback) {
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;
    return env;
}

FeatureBounds parse_bounds_token(const std::string& token, std::string& feature) {
    static const std::regex re(R"(^(\w+):([-+]?[0-9]*\.?[0-9]+(?:[eE][-+]?\d+)?):([-+]?[0-9]*\.?[0-9]+(?:[eE][-+]?\d+)?)$)");
    std::smatch m;
    if (!std::regex_match(token, m, re)) {
        throw std::invalid_argument("Invalid bounds '" + token + "', expected feature:lo:hi");
    }
    FeatureBounds b{std::stod(m[2].str()), std::stod(m[3].str())};
    if (!(b.lo < b.hi)) {
        throw std::invalid_argument("Invalid bounds '" + token + "', lo must be below hi");
    }
    feature = m[1].str();
    return b;
}

int parse_window(const std::string& token) {
    size_t pos = 0;
    int w = std::stoi(token, &pos);
    if (pos != token.size() || w < 1) {
        throw std::invalid_argument("Invalid window '" + token + "'. Must be a positive integer.");
    }
    return w;
}

BoundsMap load_feature_bounds() {
    BoundsMap bounds = default_feature_bounds();
    for (const auto& tok : parse_env_list("FUSION_BOUNDS")) {
        std::string feature;
        FeatureBounds b = parse_bounds_token(tok, feature);
        bounds[feature] = b;
    }
    return bounds;
}

CleaningParams load_cleaning_params() {
    CleaningParams params;
    auto windows = parse_env_list("FUSION_WINDOWS");
    if (!windows.empty()) {
        if (windows.size() != 2) {
            throw std::invalid_argument("FUSION_WINDOWS expects '<median_window> <rolling_window>'");
        }
        params.median_window = parse_window(windows[0]);
        params.rolling_window = parse_window(windows[1]);
    }
    auto sigma = parse_env_list("FUSION_SIGMA");
    if (!sigma.empty()) {
        size_t pos = 0;
        double s = std::stod(sigma[0], &pos);
        if (pos != sigma[0].size() || !(s > 0.0)) {
            throw std::invalid_argument("Invalid FUSION_SIGMA '" + sigma[0] + "'");
        }
        params.n_sigma = s;
    }
    return params;
}

std::vector<std::string> load_forecast_labels() {
    auto from_env = parse_env_list("FORECAST_LABELS");
    if (!from_env.empty()) return from_env;
    return default_forecast_labels();
}
