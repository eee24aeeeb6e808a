#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/MarketConditionFilter.h"
#include "backtest/BacktestTypes.h"
#include "backtest/OptionSelector.h"
#include "backtest/PerformanceMetrics.h"
#include "backtest/PositionTracker.h"
#include "backtest/TradeRecorder.h"
#include "core/contracts/IMarketSnapshotProvider.h"
#include "strategy/StrategyConfig.h"

namespace optionlab {
namespace backtest {

// Everything one run needs. The provider is borrowed and must outlive the engine.
struct BacktestContext {
    const core::IMarketSnapshotProvider& provider;
    strategy::StrategyConfig strategy;
    std::string start_date;     // empty: first trading date of the provider
    std::string end_date;       // empty: last trading date of the provider

    // Expected trading days. A listed day the provider has no snapshot for
    // is a data gap. Without a calendar the provider's dates are simulated.
    std::optional<std::vector<std::string>> calendar;
};

struct BacktestResult {
    std::string run_id;
    std::string strategy_name;
    std::string symbol;
    std::string start_date;
    std::string end_date;

    std::vector<ClosedTrade> trades;
    std::vector<EquityPoint> equity_curve;
    Metrics metrics;
    std::vector<std::string> audit_log;     // one JSON object per line
    std::string audit_digest;               // SHA-256 of audit_log

    int days_processed = 0;
    int gap_days = 0;
};

nlohmann::json toJson(const BacktestResult& result);

// Day-by-day driver. Each simulated day runs, in order: mark open positions,
// evaluate exits, attempt one entry, record the equity point. Only the
// current day's snapshot is ever handed to a component.
class BacktestEngine {
public:
    enum class State { INITIALIZING, RUNNING, FINALIZING, COMPLETED };

    // Validates the strategy; throws ConfigValidationError before any day is simulated
    explicit BacktestEngine(BacktestContext context);

    // Each call starts from a clean account, so repeated runs are identical
    BacktestResult run();

    State state() const { return state_; }

    // Audit trail of the latest run
    const core::AuditJournal& journal() const { return recorder_.journal(); }

    static std::string runId(const std::string& strategy_name,
                             const std::string& symbol,
                             const std::string& start_date,
                             const std::string& end_date);

private:
    void reset();
    std::vector<std::string> simulationDays() const;

    void processDay(const MarketSnapshot& snapshot, bool final_day);
    void processGap(const std::string& date, bool final_day, const std::string& reason);
    void manageExits(const MarketSnapshot& snapshot);
    void manageEntry(const MarketSnapshot& snapshot);
    void forceCloseAll(const std::string& date, const MarketSnapshot* snapshot);
    void closePosition(std::uint64_t id, const std::string& reason, const std::string& detail,
                       const std::string& date, const MarketSnapshot* snapshot);
    void recordEquity(const std::string& date);
    void appendHistory(const MarketSnapshot& snapshot);
    std::vector<double> historyCloses() const;

    BacktestContext context_;
    State state_ = State::INITIALIZING;

    OptionSelector selector_;
    analytics::MarketConditionFilter filter_;
    PositionTracker tracker_;
    TradeRecorder recorder_;

    Amount cash_ = 0.0;
    std::vector<UnderlyingBar> history_;
    size_t history_capacity_ = 200;
    std::string last_entry_date_;
    std::vector<EquityPoint> equity_curve_;
    int gap_days_ = 0;
};

std::string toString(BacktestEngine::State state);

} // namespace backtest
} // namespace optionlab
