#include "analytics/TechnicalIndicators.h"
#include "TestFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using optionlab::analytics::TechnicalIndicators;
using fixtures::near;

int main() {
    // RSI
    {
        std::vector<double> flat(20, 100.0);
        assert(near(TechnicalIndicators::calculateRSI(flat, 14), 50.0));

        std::vector<double> rising;
        std::vector<double> falling;
        for (int i = 0; i < 20; ++i) {
            rising.push_back(100.0 + i);
            falling.push_back(100.0 - i);
        }
        assert(near(TechnicalIndicators::calculateRSI(rising, 14), 100.0));
        assert(near(TechnicalIndicators::calculateRSI(falling, 14), 0.0));

        // Not enough bars: neutral
        assert(near(TechnicalIndicators::calculateRSI({1.0, 2.0, 3.0}, 14), 50.0));
    }

    // SMA / mean / standard deviation
    {
        const std::vector<double> prices = {1.0, 2.0, 3.0, 4.0, 5.0};
        assert(near(TechnicalIndicators::calculateSMA(prices, 5), 3.0));
        assert(near(TechnicalIndicators::calculateSMA(prices, 2), 4.5));
        assert(near(TechnicalIndicators::calculateSMA(prices, 6), 0.0));
        assert(near(TechnicalIndicators::calculateMean(prices), 3.0));
        assert(near(TechnicalIndicators::calculateStandardDeviation(prices, 3.0), std::sqrt(2.0)));
    }

    // Bollinger bands
    {
        const std::vector<double> prices = {1.0, 2.0, 3.0, 4.0, 5.0};
        auto bands = TechnicalIndicators::calculateBollingerBands(prices, 3.0, 5, 2.0);
        assert(near(bands.middle, 3.0));
        assert(near(bands.upper, 3.0 + 2.0 * std::sqrt(2.0)));
        assert(near(bands.lower, 3.0 - 2.0 * std::sqrt(2.0)));
        assert(near(bands.percent_b, 0.5));

        auto above = TechnicalIndicators::calculateBollingerBands(prices, bands.upper, 5, 2.0);
        assert(near(above.percent_b, 1.0));

        // Zero width: middle of the band
        std::vector<double> flat(5, 10.0);
        auto flat_bands = TechnicalIndicators::calculateBollingerBands(flat, 10.0, 5, 2.0);
        assert(near(flat_bands.percent_b, 0.5));
    }

    // EWMA
    {
        const auto ewma = TechnicalIndicators::calculateEWMASeries({1.0, 2.0, 3.0}, 0.5);
        assert(ewma.size() == 3);
        assert(near(ewma[0], 1.0));
        assert(near(ewma[1], 1.5));
        assert(near(ewma[2], 2.25));
    }

    // Percentile rank
    {
        const std::vector<double> values = {1.0, 2.0, 3.0, 4.0};
        assert(near(TechnicalIndicators::calculatePercentileRank(values, 2.0), 50.0));
        assert(near(TechnicalIndicators::calculatePercentileRank(values, 4.0), 100.0));
        assert(near(TechnicalIndicators::calculatePercentileRank(values, 0.5), 0.0));
        assert(near(TechnicalIndicators::calculatePercentileRank({}, 1.0), 50.0));
    }

    // Close extraction
    {
        std::vector<optionlab::UnderlyingBar> bars(3);
        bars[0].close = 10.0;
        bars[1].close = 11.0;
        bars[2].close = 12.0;
        const auto closes = TechnicalIndicators::extractClosePrices(bars);
        assert(closes.size() == 3);
        assert(near(closes[2], 12.0));
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}
