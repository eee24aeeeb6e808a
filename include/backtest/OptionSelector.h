#pragma once

#include <optional>
#include <string>
#include <vector>

#include "backtest/BacktestTypes.h"
#include "common/Types.h"
#include "strategy/StrategyConfig.h"

namespace optionlab {
namespace backtest {

struct SelectedContract {
    OptionQuote quote;
    int dte = 0;
    Price fill_price = 0.0;
    double delta_distance = 0.0;    // | |delta| - target |
    bool relaxed = false;           // found by the relaxed liquidity pass
};

struct QuoteAnomaly {
    ContractKey contract;
    std::string reason;
};

struct SelectionResult {
    std::optional<SelectedContract> selection;
    SelectionFunnel funnel;
    std::vector<QuoteAnomaly> anomalies;
    std::string rationale;
};

struct PositionSizing {
    int contracts = 0;
    Amount commission = 0.0;
    Amount entry_cost = 0.0;
    std::string rationale;
};

// Picks the contract closest to the target delta among liquid, in-range rows
// of one snapshot. Finding nothing is a normal outcome.
class OptionSelector {
public:
    explicit OptionSelector(const strategy::StrategyConfig& config);

    SelectionResult select(const MarketSnapshot& snapshot,
                           Price underlying_price,
                           int open_position_count,
                           const std::vector<ContractKey>& held = {}) const;

    // floor(cash * fraction / (fill * 100)) capped at max_contracts; cost incl. commission <= cash
    PositionSizing size(Price fill_price, Amount cash) const;

    // Reason the row cannot be trusted, nullopt for a sane quote
    static std::optional<std::string> quoteAnomaly(const OptionQuote& quote);

private:
    struct Candidate {
        const OptionQuote* quote = nullptr;
        int dte = 0;
        double distance = 0.0;
        double spread_pct = 0.0;
    };

    std::vector<Candidate> rankStage(const std::vector<const OptionQuote*>& quotes,
                                     const std::string& date,
                                     const std::vector<ContractKey>& held,
                                     bool relaxed,
                                     SelectionFunnel& funnel) const;
    bool passesLiquidity(const OptionQuote& quote, bool relaxed) const;
    bool matchesType(const OptionQuote& quote) const;
    Price fillPrice(const OptionQuote& quote) const;
    bool withinTolerance(const Candidate& candidate) const;
    SelectedContract toSelection(const Candidate& candidate, bool relaxed) const;

    strategy::OptionSelectionConfig selection_;
    strategy::RiskConfig risk_;
};

} // namespace backtest
} // namespace optionlab
