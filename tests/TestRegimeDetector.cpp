#include "analytics/RegimeDetector.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace optionlab::analytics;

int main() {
    RegimeDetector detector;
    RegimeParams params;
    params.lookback = 20;

    std::vector<double> rising;
    std::vector<double> falling;
    for (int i = 0; i < 20; ++i) {
        rising.push_back(0.10 + 0.01 * i);
        falling.push_back(0.30 - 0.01 * i);
    }

    // Not enough observations
    {
        const std::vector<double> shortSeries(rising.begin(), rising.begin() + 5);
        auto analysis = detector.analyzeRegime(shortSeries, params);
        assert(!analysis.sufficient_history);
        assert(analysis.regime == VolatilityRegime::UNKNOWN);
        assert(analysis.description == "Insufficient Data");
    }

    // Current value is the window maximum
    {
        auto analysis = detector.analyzeRegime(rising, params);
        assert(analysis.sufficient_history);
        assert(fixtures::near(analysis.percentile, 100.0));
        assert(analysis.regime == VolatilityRegime::HIGH);
    }

    // Current value is the window minimum: 1 of 20 at or below
    {
        auto analysis = detector.analyzeRegime(falling, params);
        assert(fixtures::near(analysis.percentile, 5.0));
        assert(analysis.regime == VolatilityRegime::LOW);
    }

    // Median value
    {
        std::vector<double> series(rising.begin(), rising.begin() + 19);
        series.push_back(0.195);
        auto analysis = detector.analyzeRegime(series, params);
        assert(fixtures::near(analysis.percentile, 55.0));
        assert(analysis.regime == VolatilityRegime::NORMAL);
    }

    // Only the trailing lookback window counts
    {
        std::vector<double> series(50, 0.90);
        series.insert(series.end(), rising.begin(), rising.end());
        auto analysis = detector.analyzeRegime(series, params);
        assert(analysis.regime == VolatilityRegime::HIGH);
        assert(fixtures::near(analysis.current_value, rising.back()));
    }

    // EWMA smoothing keeps the ordering of a monotonic series
    {
        RegimeParams ewma = params;
        ewma.method = RegimeMethod::EWMA;
        ewma.ewma_alpha = 0.3;
        auto analysis = detector.analyzeRegime(rising, ewma);
        assert(analysis.regime == VolatilityRegime::HIGH);
        assert(analysis.current_value < rising.back());
    }

    // Names
    {
        VolatilityRegime parsed = VolatilityRegime::UNKNOWN;
        assert(volatilityRegimeFromString("normal", parsed));
        assert(parsed == VolatilityRegime::NORMAL);
        assert(!volatilityRegimeFromString("extreme", parsed));
        assert(toString(VolatilityRegime::HIGH) == "high");
    }

    std::cout << "[TEST] RegimeDetector PASSED\n";
    return 0;
}
