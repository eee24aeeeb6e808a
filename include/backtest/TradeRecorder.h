#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backtest/BacktestTypes.h"
#include "core/state/AuditJournal.h"
#include "strategy/StrategyConfig.h"

namespace optionlab {
namespace backtest {

// Turns position lifecycles into immutable trade records and keeps the audit
// trail of every decision the run makes.
class TradeRecorder {
public:
    explicit TradeRecorder(const strategy::OptionSelectionConfig& selection);

    void recordOpen(const Position& position, Amount cash_after,
                    const SelectionFunnel& funnel, const std::string& rationale);

    // exit_snapshot may be null on a data gap
    ClosedTrade recordClose(const Position& position,
                            const std::string& exit_reason,
                            const std::string& exit_detail,
                            Price exit_price,
                            const std::string& exit_date,
                            const MarketSnapshot* exit_snapshot,
                            Amount cash_after);

    // Skips, stale marks, gaps, anomalies and run markers
    void recordEvent(core::AuditEventType type,
                     const std::string& date,
                     const std::string& rationale,
                     const std::string& contract = "",
                     nlohmann::json payload = nlohmann::json::object(),
                     Amount cash = 0.0);

    void recordEquity(const EquityPoint& point);

    const std::vector<ClosedTrade>& trades() const { return trades_; }
    const core::AuditJournal& journal() const { return journal_; }

    bool isDeltaCompliant(const Position& position) const;
    bool isDteCompliant(const Position& position) const;

private:
    strategy::OptionSelectionConfig selection_;
    std::vector<ClosedTrade> trades_;
    core::AuditJournal journal_;
};

} // namespace backtest
} // namespace optionlab
