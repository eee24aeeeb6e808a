#include "backtest/TradeRecorder.h"
#include "backtest/BacktestSchema.h"
#include "common/DateUtils.h"
#include "common/Logger.h"

#include <cmath>

namespace optionlab {
namespace backtest {

TradeRecorder::TradeRecorder(const strategy::OptionSelectionConfig& selection)
    : selection_(selection) {}

bool TradeRecorder::isDeltaCompliant(const Position& position) const {
    const double abs_delta = std::abs(position.entry_greeks.delta);
    if (selection_.delta.tolerance) {
        return std::abs(abs_delta - selection_.delta.target) <= *selection_.delta.tolerance + 1e-12;
    }
    return abs_delta >= selection_.delta.min && abs_delta <= selection_.delta.max;
}

bool TradeRecorder::isDteCompliant(const Position& position) const {
    return position.entry_dte >= selection_.dte.min && position.entry_dte <= selection_.dte.max;
}

void TradeRecorder::recordOpen(const Position& position, Amount cash_after,
                               const SelectionFunnel& funnel, const std::string& rationale) {
    core::AuditEntry entry;
    entry.date = position.entry_date;
    entry.type = core::AuditEventType::ENTRY;
    entry.contract = position.contract.toString();
    entry.price = position.entry_price;
    entry.contracts = position.contracts;
    entry.cash = cash_after;
    entry.rationale = rationale;
    entry.payload["position"] = toJson(position);
    entry.payload["funnel"] = toJson(funnel);
    journal_.append(std::move(entry));

    LOG_INFO("[{}] OPEN {} x{} @ {:.2f} cost {:.2f} (delta {:.3f}, DTE {})",
             position.entry_date, position.contract.toString(), position.contracts,
             position.entry_price, position.entry_cost, position.entry_greeks.delta, position.entry_dte);
}

ClosedTrade TradeRecorder::recordClose(const Position& position,
                                       const std::string& exit_reason,
                                       const std::string& exit_detail,
                                       Price exit_price,
                                       const std::string& exit_date,
                                       const MarketSnapshot* exit_snapshot,
                                       Amount cash_after) {
    ClosedTrade trade;
    trade.position = position;
    trade.position.status = PositionStatus::CLOSED;
    trade.position.current_mark = exit_price;
    trade.position.unrealized_pnl = 0.0;

    trade.exit_date = exit_date;
    trade.exit_price = exit_price;
    trade.exit_value = exit_price * position.contracts * kContractMultiplier;
    trade.exit_greeks = position.current_greeks;
    trade.realized_pnl = trade.exit_value - position.entry_cost;
    trade.pnl_pct = (position.entry_cost > 0.0) ? trade.realized_pnl / position.entry_cost : 0.0;
    trade.days_held = position.daysHeld();
    trade.calendar_days_held = utils::DateUtils::daysBetween(position.entry_date, exit_date).value_or(0);
    trade.exit_reason = exit_reason;
    trade.exit_detail = exit_detail;

    if (exit_snapshot != nullptr) {
        trade.exit_underlying_price = exit_snapshot->underlying_price;
        if (const OptionQuote* quote = exit_snapshot->find(position.contract)) {
            trade.exit_bid = quote->bid;
            trade.exit_ask = quote->ask;
        }
    } else if (!position.greeks_history.empty()) {
        trade.exit_underlying_price = position.greeks_history.back().underlying_price;
    }

    trade.delta_compliant = isDeltaCompliant(position);
    trade.dte_compliant = isDteCompliant(position);
    trade.compliance_score = (trade.delta_compliant ? 50.0 : 0.0) + (trade.dte_compliant ? 50.0 : 0.0);

    core::AuditEntry entry;
    entry.date = exit_date;
    entry.type = core::AuditEventType::EXIT;
    entry.contract = position.contract.toString();
    entry.price = exit_price;
    entry.contracts = position.contracts;
    entry.cash = cash_after;
    entry.rationale = exit_reason + (exit_detail.empty() ? "" : ": " + exit_detail);
    entry.payload["trade"] = toJson(trade);
    journal_.append(std::move(entry));

    trades_.push_back(trade);

    LOG_INFO("[{}] CLOSE {} x{} @ {:.2f} pnl {:.2f} ({:.1f}%) reason {}",
             exit_date, position.contract.toString(), position.contracts, exit_price,
             trade.realized_pnl, trade.pnl_pct * 100.0, exit_reason);
    Logger::getInstance().logTrade(position.symbol, position.contract.toString(),
                                   position.entry_date, exit_date, position.contracts,
                                   position.entry_price, exit_price, trade.realized_pnl, exit_reason);
    return trade;
}

void TradeRecorder::recordEvent(core::AuditEventType type,
                                const std::string& date,
                                const std::string& rationale,
                                const std::string& contract,
                                nlohmann::json payload,
                                Amount cash) {
    core::AuditEntry entry;
    entry.date = date;
    entry.type = type;
    entry.contract = contract;
    entry.cash = cash;
    entry.rationale = rationale;
    entry.payload = std::move(payload);
    journal_.append(std::move(entry));
}

void TradeRecorder::recordEquity(const EquityPoint& point) {
    core::AuditEntry entry;
    entry.date = point.date;
    entry.type = core::AuditEventType::EQUITY;
    entry.cash = point.cash;
    entry.contracts = point.open_positions;
    entry.price = point.total_value;
    entry.payload["equity"] = toJson(point);
    journal_.append(std::move(entry));
}

} // namespace backtest
} // namespace optionlab
