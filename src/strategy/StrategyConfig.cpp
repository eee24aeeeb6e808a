#include "strategy/StrategyConfig.h"

#include <algorithm>

namespace optionlab {
namespace strategy {

std::string toString(OptionTypeBias bias) {
    switch (bias) {
        case OptionTypeBias::CALL: return "call";
        case OptionTypeBias::PUT: return "put";
        case OptionTypeBias::EITHER: return "either";
    }
    return "call";
}

std::string toString(ExitCondition condition) {
    switch (condition) {
        case ExitCondition::PROFIT_TARGET: return "profit_target";
        case ExitCondition::STOP_LOSS: return "stop_loss";
        case ExitCondition::DELTA_STOP: return "delta_stop";
        case ExitCondition::INDICATOR_EXIT: return "indicator_exit";
        case ExitCondition::TIME_STOP: return "time_stop";
        case ExitCondition::DTE_STOP: return "dte_stop";
        case ExitCondition::EXPIRATION: return "expiration";
        case ExitCondition::END_OF_PERIOD: return "end_of_period";
    }
    return "end_of_period";
}

std::optional<ExitCondition> exitConditionFromString(const std::string& value) {
    if (value == "profit_target") return ExitCondition::PROFIT_TARGET;
    if (value == "stop_loss") return ExitCondition::STOP_LOSS;
    if (value == "delta_stop") return ExitCondition::DELTA_STOP;
    if (value == "indicator_exit") return ExitCondition::INDICATOR_EXIT;
    if (value == "time_stop") return ExitCondition::TIME_STOP;
    if (value == "dte_stop") return ExitCondition::DTE_STOP;
    if (value == "expiration") return ExitCondition::EXPIRATION;
    if (value == "end_of_period") return ExitCondition::END_OF_PERIOD;
    return std::nullopt;
}

int exitPriorityClass(ExitCondition condition) {
    switch (condition) {
        case ExitCondition::PROFIT_TARGET:
        case ExitCondition::STOP_LOSS:
            return 0;
        case ExitCondition::DELTA_STOP:
            return 1;
        case ExitCondition::INDICATOR_EXIT:
            return 2;
        case ExitCondition::TIME_STOP:
        case ExitCondition::DTE_STOP:
            return 3;
        case ExitCondition::EXPIRATION:
        case ExitCondition::END_OF_PERIOD:
            return 4;
    }
    return 4;
}

int StrategyConfig::requiredHistory() const {
    int bars = 2;
    const auto& f = market_filters;
    if (f.trend.enabled) bars = std::max(bars, f.trend.period);
    if (f.volatility_regime.enabled) bars = std::max(bars, f.volatility_regime.params.lookback);
    if (f.rsi.enabled) bars = std::max(bars, f.rsi.period + 1);
    if (f.bollinger.enabled) bars = std::max(bars, f.bollinger.period);
    for (const auto& rule : exit_rules) {
        if (rule.condition == ExitCondition::INDICATOR_EXIT) {
            bars = std::max(bars, rule.indicator == IndicatorKind::RSI ? rule.period + 1 : rule.period);
        }
    }
    return bars;
}

} // namespace strategy
} // namespace optionlab
