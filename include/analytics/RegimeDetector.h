#pragma once

#include <vector>
#include <string>

namespace optionlab {
namespace analytics {

enum class VolatilityRegime {
    UNKNOWN,
    LOW,        // current IV proxy at or below the low percentile
    NORMAL,
    HIGH        // current IV proxy at or above the high percentile
};

std::string toString(VolatilityRegime regime);
bool volatilityRegimeFromString(const std::string& value, VolatilityRegime& out);

enum class RegimeMethod {
    PERCENTILE,     // rank of the raw series
    EWMA            // rank of the EWMA-smoothed series
};

struct RegimeParams {
    int lookback = 20;
    RegimeMethod method = RegimeMethod::PERCENTILE;
    double ewma_alpha = 0.2;
    double low_percentile = 25.0;
    double high_percentile = 75.0;
};

struct RegimeAnalysis {
    VolatilityRegime regime = VolatilityRegime::UNKNOWN;
    double current_value = 0.0;
    double percentile = 0.0;    // 0~100
    bool sufficient_history = false;
    std::string description;
};

class RegimeDetector {
public:
    RegimeDetector() = default;

    // Classify the last element of the series against the trailing lookback window.
    // The series must only contain observations up to the current day.
    RegimeAnalysis analyzeRegime(const std::vector<double>& iv_series,
                                 const RegimeParams& params) const;
};

} // namespace analytics
} // namespace optionlab
