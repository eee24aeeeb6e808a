#include "analytics/MarketConditionFilter.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace optionlab {
namespace analytics {

namespace {
constexpr double ATM_BAND_PCT = 0.02;

std::string fmt2(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

FilterCheck insufficient(const std::string& name, size_t have, int need) {
    FilterCheck check;
    check.name = name;
    check.passed = true;
    check.insufficient_history = true;
    check.message = "insufficient history (" + std::to_string(have) + "/" + std::to_string(need) + " bars)";
    return check;
}
}

std::string FilterDecision::rationale() const {
    std::ostringstream oss;
    for (size_t i = 0; i < checks.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << checks[i].name << ": " << checks[i].message;
    }
    return oss.str();
}

MarketConditionFilter::MarketConditionFilter(const strategy::MarketFilterConfig& config)
    : config_(config) {}

std::optional<double> MarketConditionFilter::atmImpliedVolatility(const MarketSnapshot& snapshot) {
    if (snapshot.underlying_price <= 0.0) {
        return std::nullopt;
    }

    const double spot = snapshot.underlying_price;
    double sum = 0.0;
    int count = 0;
    const OptionQuote* closest = nullptr;
    double closest_distance = 0.0;

    for (const auto& quote : snapshot.quotes) {
        if (!(quote.greeks.implied_volatility > 0.0)) {
            continue;
        }
        const double distance = std::abs(quote.contract.strike - spot) / spot;
        if (distance <= ATM_BAND_PCT) {
            sum += quote.greeks.implied_volatility;
            ++count;
        }
        if (closest == nullptr || distance < closest_distance) {
            closest = &quote;
            closest_distance = distance;
        }
    }

    if (count > 0) {
        return sum / count;
    }
    if (closest != nullptr) {
        return closest->greeks.implied_volatility;
    }
    return std::nullopt;
}

FilterDecision MarketConditionFilter::allowEntry(const std::string& date,
                                                 const MarketSnapshot& snapshot,
                                                 const std::vector<UnderlyingBar>& history,
                                                 strategy::OptionTypeBias bias) const {
    FilterDecision decision;
    if (!config_.anyEnabled()) {
        return decision;
    }

    // Only bars up to and including the decision date may be looked at
    std::vector<UnderlyingBar> window;
    window.reserve(history.size());
    for (const auto& bar : history) {
        if (bar.date <= date) {
            window.push_back(bar);
        }
    }

    const auto closes = TechnicalIndicators::extractClosePrices(window);
    const double price = snapshot.underlying_price;

    if (config_.trend.enabled) decision.checks.push_back(checkTrend(closes, price));
    if (config_.volatility_regime.enabled) decision.checks.push_back(checkVolatilityRegime(window));
    if (config_.iv_regime.enabled) decision.checks.push_back(checkIvRegime(snapshot, window));
    if (config_.rsi.enabled) decision.checks.push_back(checkRsi(closes, bias));
    if (config_.bollinger.enabled) decision.checks.push_back(checkBollinger(closes, price, bias));

    // AND across ungrouped filters, OR inside each named group
    std::map<std::string, std::string> group_of;
    for (const auto& [group, members] : config_.or_groups) {
        for (const auto& member : members) {
            group_of[member] = group;
        }
    }

    std::map<std::string, bool> group_passed;
    bool allowed = true;
    for (const auto& check : decision.checks) {
        const auto it = group_of.find(check.name);
        if (it == group_of.end()) {
            allowed = allowed && check.passed;
        } else {
            group_passed[it->second] = group_passed[it->second] || check.passed;
        }
    }
    for (const auto& [group, passed] : group_passed) {
        allowed = allowed && passed;
    }

    decision.allowed = allowed;
    return decision;
}

FilterCheck MarketConditionFilter::checkTrend(const std::vector<double>& closes, double price) const {
    const int period = config_.trend.period;
    if (closes.size() < static_cast<size_t>(period)) {
        return insufficient("trend_filter", closes.size(), period);
    }

    FilterCheck check;
    check.name = "trend_filter";
    const double ma = TechnicalIndicators::calculateSMA(closes, period);
    if (config_.trend.require_above_ma) {
        check.passed = price > ma;
        check.message = "price " + fmt2(price) + (check.passed ? " > " : " <= ") +
                        "MA" + std::to_string(period) + " " + fmt2(ma);
    } else {
        check.passed = price < ma;
        check.message = "price " + fmt2(price) + (check.passed ? " < " : " >= ") +
                        "MA" + std::to_string(period) + " " + fmt2(ma);
    }
    return check;
}

FilterCheck MarketConditionFilter::checkVolatilityRegime(const std::vector<UnderlyingBar>& history) const {
    const auto& cfg = config_.volatility_regime;

    std::vector<double> iv_series;
    for (const auto& bar : history) {
        if (bar.has_atm_iv) {
            iv_series.push_back(bar.atm_iv);
        }
    }

    const auto analysis = regime_detector_.analyzeRegime(iv_series, cfg.params);
    if (!analysis.sufficient_history) {
        return insufficient("volatility_regime", iv_series.size(), cfg.params.lookback);
    }

    FilterCheck check;
    check.name = "volatility_regime";
    check.passed = std::find(cfg.allowed.begin(), cfg.allowed.end(), analysis.regime) != cfg.allowed.end();
    check.message = analysis.description + (check.passed ? " allowed" : " not allowed");
    return check;
}

FilterCheck MarketConditionFilter::checkIvRegime(const MarketSnapshot& snapshot,
                                                 const std::vector<UnderlyingBar>& history) const {
    std::optional<double> iv;
    if (!history.empty() && history.back().date == snapshot.date && history.back().has_atm_iv) {
        iv = history.back().atm_iv;
    } else {
        iv = atmImpliedVolatility(snapshot);
    }

    if (!iv) {
        FilterCheck check = insufficient("iv_regime", 0, 1);
        check.message = "no at-the-money implied volatility";
        return check;
    }

    FilterCheck check;
    check.name = "iv_regime";
    check.passed = *iv >= config_.iv_regime.min_iv && *iv <= config_.iv_regime.max_iv;
    check.message = "ATM IV " + fmt2(*iv) + (check.passed ? " within [" : " outside [") +
                    fmt2(config_.iv_regime.min_iv) + ", " + fmt2(config_.iv_regime.max_iv) + "]";
    return check;
}

FilterCheck MarketConditionFilter::checkRsi(const std::vector<double>& closes,
                                            strategy::OptionTypeBias bias) const {
    const int period = config_.rsi.period;
    if (closes.size() < static_cast<size_t>(period + 1)) {
        return insufficient("rsi_filter", closes.size(), period + 1);
    }

    FilterCheck check;
    check.name = "rsi_filter";
    const double rsi = TechnicalIndicators::calculateRSI(closes, period);
    const bool oversold = rsi <= config_.rsi.oversold;
    const bool overbought = rsi >= config_.rsi.overbought;

    switch (bias) {
        case strategy::OptionTypeBias::CALL:
            check.passed = oversold;
            check.message = "RSI " + fmt2(rsi) + (oversold ? " <= " : " > ") + fmt2(config_.rsi.oversold);
            break;
        case strategy::OptionTypeBias::PUT:
            check.passed = overbought;
            check.message = "RSI " + fmt2(rsi) + (overbought ? " >= " : " < ") + fmt2(config_.rsi.overbought);
            break;
        case strategy::OptionTypeBias::EITHER:
            check.passed = oversold || overbought;
            check.message = "RSI " + fmt2(rsi) + (check.passed ? " at an extreme" : " between thresholds");
            break;
    }
    return check;
}

FilterCheck MarketConditionFilter::checkBollinger(const std::vector<double>& closes, double price,
                                                  strategy::OptionTypeBias bias) const {
    const auto& cfg = config_.bollinger;
    if (closes.size() < static_cast<size_t>(cfg.period)) {
        return insufficient("bollinger_bands", closes.size(), cfg.period);
    }

    FilterCheck check;
    check.name = "bollinger_bands";
    const auto bands = TechnicalIndicators::calculateBollingerBands(closes, price, cfg.period, cfg.std_dev);
    const double position = bands.percent_b;
    const bool near_lower = position < cfg.lower_band_threshold;
    const bool near_upper = position > cfg.upper_band_threshold;

    switch (bias) {
        case strategy::OptionTypeBias::CALL:
            check.passed = near_lower;
            break;
        case strategy::OptionTypeBias::PUT:
            check.passed = near_upper;
            break;
        case strategy::OptionTypeBias::EITHER:
            check.passed = near_lower || near_upper;
            break;
    }
    check.message = "band position " + fmt2(position) + " (lower " + fmt2(cfg.lower_band_threshold) +
                    ", upper " + fmt2(cfg.upper_band_threshold) + ")";
    return check;
}

} // namespace analytics
} // namespace optionlab
