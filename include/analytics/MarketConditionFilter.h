#pragma once

#include <optional>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace optionlab {
namespace analytics {

struct FilterCheck {
    std::string name;               // trend_filter, volatility_regime, ...
    bool passed = true;
    bool insufficient_history = false;
    std::string message;
};

struct FilterDecision {
    bool allowed = true;
    std::vector<FilterCheck> checks;

    // "name: message; name: message"
    std::string rationale() const;
};

// Entry gate over regime and technical sub-filters. Stateless: every input is
// passed in, and the history window ends at the current day.
class MarketConditionFilter {
public:
    explicit MarketConditionFilter(const strategy::MarketFilterConfig& config);

    FilterDecision allowEntry(const std::string& date,
                              const MarketSnapshot& snapshot,
                              const std::vector<UnderlyingBar>& history,
                              strategy::OptionTypeBias bias) const;

    // Mean IV of quotes within 2% of the underlying; falls back to the strike closest to it
    static std::optional<double> atmImpliedVolatility(const MarketSnapshot& snapshot);

private:
    FilterCheck checkTrend(const std::vector<double>& closes, double price) const;
    FilterCheck checkVolatilityRegime(const std::vector<UnderlyingBar>& history) const;
    FilterCheck checkIvRegime(const MarketSnapshot& snapshot, const std::vector<UnderlyingBar>& history) const;
    FilterCheck checkRsi(const std::vector<double>& closes, strategy::OptionTypeBias bias) const;
    FilterCheck checkBollinger(const std::vector<double>& closes, double price,
                               strategy::OptionTypeBias bias) const;

    strategy::MarketFilterConfig config_;
    RegimeDetector regime_detector_;
};

} // namespace analytics
} // namespace optionlab
