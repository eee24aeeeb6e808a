#include "analytics/RegimeDetector.h"
#include "analytics/TechnicalIndicators.h"
#include <sstream>
#include <iomanip>

namespace optionlab {
namespace analytics {

std::string toString(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::LOW: return "low";
        case VolatilityRegime::NORMAL: return "normal";
        case VolatilityRegime::HIGH: return "high";
        case VolatilityRegime::UNKNOWN: return "unknown";
    }
    return "unknown";
}

bool volatilityRegimeFromString(const std::string& value, VolatilityRegime& out) {
    if (value == "low") { out = VolatilityRegime::LOW; return true; }
    if (value == "normal") { out = VolatilityRegime::NORMAL; return true; }
    if (value == "high") { out = VolatilityRegime::HIGH; return true; }
    return false;
}

RegimeAnalysis RegimeDetector::analyzeRegime(const std::vector<double>& iv_series,
                                             const RegimeParams& params) const {
    RegimeAnalysis result;

    if (params.lookback <= 0 || iv_series.size() < static_cast<size_t>(params.lookback)) {
        result.description = "Insufficient Data";
        return result;
    }

    // 1. Trailing window (current day inclusive)
    std::vector<double> window(iv_series.end() - params.lookback, iv_series.end());
    if (params.method == RegimeMethod::EWMA) {
        window = TechnicalIndicators::calculateEWMASeries(window, params.ewma_alpha);
    }

    result.sufficient_history = true;
    result.current_value = window.back();
    result.percentile = TechnicalIndicators::calculatePercentileRank(window, result.current_value);

    // 2. Bucket
    if (result.percentile <= params.low_percentile) {
        result.regime = VolatilityRegime::LOW;
    } else if (result.percentile >= params.high_percentile) {
        result.regime = VolatilityRegime::HIGH;
    } else {
        result.regime = VolatilityRegime::NORMAL;
    }

    std::ostringstream oss;
    oss << toString(result.regime) << " volatility (IV "
        << std::fixed << std::setprecision(3) << result.current_value
        << " at " << std::setprecision(1) << result.percentile << "th percentile)";
    result.description = oss.str();
    return result;
}

} // namespace analytics
} // namespace optionlab
