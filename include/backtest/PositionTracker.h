#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "backtest/BacktestTypes.h"
#include "backtest/OptionSelector.h"
#include "strategy/StrategyConfig.h"

namespace optionlab {
namespace backtest {

struct MarkOutcome {
    std::uint64_t position_id = 0;
    Price mark = 0.0;
    bool stale = false;             // no usable quote, prior mark carried forward
    bool intrinsic = false;         // expired without a quote, settled at intrinsic value
};

// Owns every position of a run. Positions live in an arena indexed by id;
// the open set is a sorted id list so callers can iterate a stable copy and
// close positions afterwards.
class PositionTracker {
public:
    explicit PositionTracker(strategy::FillPriceMode mark_mode = strategy::FillPriceMode::CLOSE);

    // Records the entry-day Greeks snapshot, so history starts at length 1
    std::uint64_t open(const std::string& symbol,
                       const SelectedContract& selected,
                       const PositionSizing& sizing,
                       const MarketSnapshot& snapshot);

    // Exact lookup by (strike, expiration, right); updates mark, Greeks and unrealized P&L
    MarkOutcome markToMarket(Position& position, const MarketSnapshot& snapshot) const;
    void appendGreeks(Position& position, const MarketSnapshot& snapshot, bool stale) const;

    // Mark and append for every open position
    std::vector<MarkOutcome> markAll(const MarketSnapshot& snapshot);

    // Data gap: keep marks, append carried Greeks for the day
    std::vector<MarkOutcome> carryForward(const std::string& date);

    std::vector<std::uint64_t> openIds() const { return open_ids_; }
    Position& get(std::uint64_t id);
    const Position& get(std::uint64_t id) const;

    void markExitPending(std::uint64_t id);
    void close(std::uint64_t id);

    std::vector<ContractKey> heldContracts() const;
    int openCount() const { return static_cast<int>(open_ids_.size()); }
    Amount openMarketValue() const;
    const std::vector<Position>& all() const { return arena_; }

private:
    Price markPrice(const OptionQuote& quote) const;

    strategy::FillPriceMode mark_mode_;
    std::vector<Position> arena_;
    std::vector<std::uint64_t> open_ids_;
};

} // namespace backtest
} // namespace optionlab
