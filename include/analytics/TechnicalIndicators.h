#pragma once

#include <vector>
#include <string>
#include "common/Types.h"

namespace optionlab {
namespace analytics {

// Indicators over the underlying close history
class TechnicalIndicators {
public:
    // Wilder RSI over closes, oldest first. Fewer than period+1 closes gives 50
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    // Bollinger Bands - 가격 밴드
    struct BollingerBands {
        double upper;       // 상단 밴드
        double middle;      // 중간선 (SMA)
        double lower;       // 하단 밴드
        double width;       // upper - lower
        double percent_b;   // %B (현재가가 밴드 내 어디에 위치하는지: 0~1)

        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0) {}
    };
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                    double current_price,
                                                    int period = 20,
                                                    double std_dev_mult = 2.0);

    // Exponentially weighted series with smoothing factor alpha, seeded by the first value
    static std::vector<double> calculateEWMASeries(const std::vector<double>& values, double alpha);

    // SMA (Simple Moving Average) - 단순 이동평균
    static double calculateSMA(const std::vector<double>& prices, int period);

    // Share of values <= current, in percent (0~100)
    static double calculatePercentileRank(const std::vector<double>& values, double current);

    // Helper: 가격 배열 추출
    static std::vector<double> extractClosePrices(const std::vector<UnderlyingBar>& bars);

    // Population standard deviation around the given mean
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double calculateMean(const std::vector<double>& values);
};

} // namespace analytics
} // namespace optionlab
