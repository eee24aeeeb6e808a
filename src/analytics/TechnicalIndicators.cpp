#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace optionlab {
namespace analytics {

namespace {

constexpr double kFlatEpsilon = 1e-7;

} // namespace

// Wilder RSI: 첫 period 구간은 단순 평균, 이후 (n-1)/n 평활
double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period) + 1) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (size_t i = 1; i < prices.size(); ++i) {
        const double delta = prices[i] - prices[i - 1];
        const double gain = std::max(delta, 0.0);
        const double loss = std::max(-delta, 0.0);

        if (i <= static_cast<size_t>(period)) {
            avg_gain += gain / period;
            avg_loss += loss / period;
        } else {
            avg_gain += (gain - avg_gain) / period;
            avg_loss += (loss - avg_loss) / period;
        }
    }

    if (avg_loss < kFlatEpsilon) {
        // 하락 없음: 상승만 있으면 100, 변동 없으면 중립
        return avg_gain < kFlatEpsilon ? 50.0 : 100.0;
    }
    return 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    BollingerBands bands;
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return bands;
    }

    const std::vector<double> window(prices.end() - period, prices.end());
    bands.middle = calculateMean(window);
    const double spread = std_dev_mult * calculateStandardDeviation(window, bands.middle);

    bands.upper = bands.middle + spread;
    bands.lower = bands.middle - spread;
    bands.width = 2.0 * spread;
    bands.percent_b = bands.width > 1e-4
        ? (current_price - bands.lower) / bands.width
        : 0.5;
    return bands;
}

std::vector<double> TechnicalIndicators::calculateEWMASeries(
    const std::vector<double>& values,
    double alpha
) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double value : values) {
        out.push_back(out.empty() ? value : out.back() + alpha * (value - out.back()));
    }
    return out;
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    return std::accumulate(prices.end() - period, prices.end(), 0.0) / period;
}

double TechnicalIndicators::calculatePercentileRank(
    const std::vector<double>& values,
    double current
) {
    if (values.empty()) return 50.0;

    const auto at_or_below = std::count_if(values.begin(), values.end(),
                                           [current](double v) { return v <= current; });
    return 100.0 * static_cast<double>(at_or_below) / static_cast<double>(values.size());
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<UnderlyingBar>& bars) {
    std::vector<double> closes(bars.size());
    std::transform(bars.begin(), bars.end(), closes.begin(),
                   [](const UnderlyingBar& bar) { return bar.close; });
    return closes;
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.empty()) return 0.0;

    const double sum_sq = std::accumulate(values.begin(), values.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    return std::sqrt(sum_sq / values.size());
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace analytics
} // namespace optionlab
