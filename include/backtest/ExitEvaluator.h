#pragma once

#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestTypes.h"
#include "strategy/StrategyConfig.h"

namespace optionlab {
namespace backtest {

struct ExitVerdict {
    strategy::ExitCondition condition = strategy::ExitCondition::END_OF_PERIOD;
    std::string reason;     // rule identifier, e.g. "profit_target"
    std::string detail;     // e.g. "value 750.00 >= 750.00 (+50.0%)"
};

// Priority-ordered exit state machine for one open position on one day.
// Rules are evaluated P&L first, then Greeks, indicators and time; expiration
// is always checked last. The first rule that fires wins.
class ExitEvaluator {
public:
    // closes: underlying closes up to and including the snapshot date
    static std::optional<ExitVerdict> evaluate(const Position& position,
                                               const MarketSnapshot& snapshot,
                                               const std::vector<strategy::ExitRule>& rules,
                                               const std::vector<double>& closes = {});

    // Evaluates one rule in isolation
    static std::optional<ExitVerdict> check(const strategy::ExitRule& rule,
                                            const Position& position,
                                            const MarketSnapshot& snapshot,
                                            const std::vector<double>& closes);

    // Threshold after the optional IV adjustment: min_delta * (2 - iv_now / iv_entry), clamped to [0.05, 0.20]
    static double deltaStopThreshold(const strategy::ExitRule& rule, const Position& position);
};

} // namespace backtest
} // namespace optionlab
