#include "backtest/ExitEvaluator.h"
#include "analytics/TechnicalIndicators.h"
#include "common/DateUtils.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace optionlab {
namespace backtest {

namespace {
constexpr double IV_ADJUSTED_DELTA_FLOOR = 0.05;
constexpr double IV_ADJUSTED_DELTA_CEIL = 0.20;
constexpr double DEFAULT_CALL_BAND_EXIT = 0.9;
constexpr double DEFAULT_PUT_BAND_EXIT = 0.1;

ExitVerdict makeVerdict(strategy::ExitCondition condition, const std::string& detail) {
    ExitVerdict verdict;
    verdict.condition = condition;
    verdict.reason = strategy::toString(condition);
    verdict.detail = detail;
    return verdict;
}

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}
}

double ExitEvaluator::deltaStopThreshold(const strategy::ExitRule& rule, const Position& position) {
    if (!rule.iv_adjusted) {
        return rule.min_delta;
    }
    const double entry_iv = position.entry_greeks.implied_volatility;
    const double current_iv = position.current_greeks.implied_volatility;
    if (!(entry_iv > 0.0) || !(current_iv > 0.0)) {
        return rule.min_delta;
    }
    const double iv_ratio = current_iv / entry_iv;
    return std::clamp(rule.min_delta * (2.0 - iv_ratio), IV_ADJUSTED_DELTA_FLOOR, IV_ADJUSTED_DELTA_CEIL);
}

std::optional<ExitVerdict> ExitEvaluator::check(const strategy::ExitRule& rule,
                                                const Position& position,
                                                const MarketSnapshot& snapshot,
                                                const std::vector<double>& closes) {
    using strategy::ExitCondition;

    const double value = position.marketValue();
    const double cost = position.entry_cost;

    switch (rule.condition) {
        case ExitCondition::PROFIT_TARGET: {
            const double target = cost * (1.0 + rule.target_pct);
            if (value >= target) {
                return makeVerdict(rule.condition, "value " + fixed(value, 2) + " >= " + fixed(target, 2) +
                                   " (+" + fixed(rule.target_pct * 100.0, 1) + "%)");
            }
            return std::nullopt;
        }
        case ExitCondition::STOP_LOSS: {
            const double floor_value = cost * (1.0 - rule.stop_pct);
            if (value <= floor_value) {
                return makeVerdict(rule.condition, "value " + fixed(value, 2) + " <= " + fixed(floor_value, 2) +
                                   " (-" + fixed(rule.stop_pct * 100.0, 1) + "%)");
            }
            return std::nullopt;
        }
        case ExitCondition::DELTA_STOP: {
            const double threshold = deltaStopThreshold(rule, position);
            const double abs_delta = std::abs(position.current_greeks.delta);
            if (abs_delta < threshold) {
                return makeVerdict(rule.condition, "|delta| " + fixed(abs_delta, 3) + " < " + fixed(threshold, 3));
            }
            return std::nullopt;
        }
        case ExitCondition::INDICATOR_EXIT: {
            const bool is_call = position.contract.right == OptionRight::CALL;
            if (rule.indicator == strategy::IndicatorKind::RSI) {
                if (closes.size() < static_cast<size_t>(rule.period + 1)) {
                    return std::nullopt;
                }
                const double rsi = analytics::TechnicalIndicators::calculateRSI(closes, rule.period);
                if (is_call && rsi >= rule.exit_level) {
                    return makeVerdict(rule.condition, "RSI " + fixed(rsi, 1) + " >= " + fixed(rule.exit_level, 1));
                }
                if (!is_call && rsi <= rule.exit_level) {
                    return makeVerdict(rule.condition, "RSI " + fixed(rsi, 1) + " <= " + fixed(rule.exit_level, 1));
                }
                return std::nullopt;
            }

            if (closes.size() < static_cast<size_t>(rule.period)) {
                return std::nullopt;
            }
            const auto bands = analytics::TechnicalIndicators::calculateBollingerBands(
                closes, snapshot.underlying_price, rule.period, rule.std_dev);
            if (!(bands.upper > bands.lower)) {
                return std::nullopt;
            }
            const double band_position = bands.percent_b;
            if (is_call) {
                const double level = rule.band_pct.value_or(DEFAULT_CALL_BAND_EXIT);
                if (band_position >= level) {
                    return makeVerdict(rule.condition, "band position " + fixed(band_position, 2) + " >= " + fixed(level, 2));
                }
            } else {
                const double level = rule.band_pct.value_or(DEFAULT_PUT_BAND_EXIT);
                if (band_position <= level) {
                    return makeVerdict(rule.condition, "band position " + fixed(band_position, 2) + " <= " + fixed(level, 2));
                }
            }
            return std::nullopt;
        }
        case ExitCondition::TIME_STOP: {
            const int held = position.daysHeld();
            if (held >= rule.max_days) {
                return makeVerdict(rule.condition, std::to_string(held) + " days held >= " + std::to_string(rule.max_days));
            }
            return std::nullopt;
        }
        case ExitCondition::DTE_STOP: {
            const auto dte = utils::DateUtils::daysBetween(snapshot.date, position.contract.expiration);
            if (dte && *dte <= rule.min_dte) {
                return makeVerdict(rule.condition, "DTE " + std::to_string(*dte) + " <= " + std::to_string(rule.min_dte));
            }
            return std::nullopt;
        }
        case ExitCondition::EXPIRATION: {
            const auto dte = utils::DateUtils::daysBetween(snapshot.date, position.contract.expiration);
            if (dte && *dte <= 0) {
                return makeVerdict(rule.condition, "contract expired " + position.contract.expiration);
            }
            return std::nullopt;
        }
        case ExitCondition::END_OF_PERIOD:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<ExitVerdict> ExitEvaluator::evaluate(const Position& position,
                                                   const MarketSnapshot& snapshot,
                                                   const std::vector<strategy::ExitRule>& rules,
                                                   const std::vector<double>& closes) {
    if (position.status != PositionStatus::OPEN) {
        return std::nullopt;
    }

    std::vector<strategy::ExitRule> ordered = rules;
    std::stable_sort(ordered.begin(), ordered.end(), [](const strategy::ExitRule& a, const strategy::ExitRule& b) {
        return strategy::exitPriorityClass(a.condition) < strategy::exitPriorityClass(b.condition);
    });

    strategy::ExitRule expiration;
    expiration.condition = strategy::ExitCondition::EXPIRATION;
    ordered.push_back(expiration);

    for (const auto& rule : ordered) {
        if (auto verdict = check(rule, position, snapshot, closes)) {
            return verdict;
        }
    }
    return std::nullopt;
}

} // namespace backtest
} // namespace optionlab
