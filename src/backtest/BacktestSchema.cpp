#include "backtest/BacktestSchema.h"

namespace optionlab {
namespace backtest {

namespace {
PositionStatus statusFromString(const std::string& value) {
    if (value == "EXIT_PENDING") return PositionStatus::EXIT_PENDING;
    if (value == "CLOSED") return PositionStatus::CLOSED;
    return PositionStatus::OPEN;
}
}

nlohmann::json toJson(const Greeks& greeks) {
    nlohmann::json j;
    j["delta"] = greeks.delta;
    j["gamma"] = greeks.gamma;
    j["theta"] = greeks.theta;
    j["vega"] = greeks.vega;
    j["rho"] = greeks.rho;
    j["iv"] = greeks.implied_volatility;
    return j;
}

nlohmann::json toJson(const ContractKey& contract) {
    nlohmann::json j;
    j["strike"] = contract.strike;
    j["expiration"] = contract.expiration;
    j["right"] = toString(contract.right);
    return j;
}

nlohmann::json toJson(const SelectionFunnel& funnel) {
    nlohmann::json j;
    j["total"] = funnel.total;
    j["after_type"] = funnel.after_type;
    j["after_anomaly"] = funnel.after_anomaly;
    j["after_liquidity"] = funnel.after_liquidity;
    j["after_dte"] = funnel.after_dte;
    j["after_delta"] = funnel.after_delta;
    j["after_held"] = funnel.after_held;
    j["relaxed"] = funnel.relaxed;
    return j;
}

nlohmann::json toJson(const Position& position) {
    nlohmann::json j;
    j["id"] = position.id;
    j["symbol"] = position.symbol;
    j["contract"] = toJson(position.contract);
    j["entry_date"] = position.entry_date;
    j["entry_price"] = position.entry_price;
    j["contracts"] = position.contracts;
    j["entry_commission"] = position.entry_commission;
    j["entry_cost"] = position.entry_cost;
    j["entry_dte"] = position.entry_dte;
    j["entry_underlying_price"] = position.entry_underlying_price;
    j["entry_bid"] = position.entry_bid;
    j["entry_ask"] = position.entry_ask;
    j["entry_volume"] = position.entry_volume;
    j["entry_open_interest"] = position.entry_open_interest;
    j["relaxed_selection"] = position.relaxed_selection;
    j["current_mark"] = position.current_mark;
    j["unrealized_pnl"] = position.unrealized_pnl;
    j["entry_greeks"] = toJson(position.entry_greeks);
    j["current_greeks"] = toJson(position.current_greeks);
    j["last_quote_date"] = position.last_quote_date;
    j["status"] = toString(position.status);

    j["greeks_history"] = nlohmann::json::array();
    for (const auto& day : position.greeks_history) {
        j["greeks_history"].push_back({
            {"date", day.date},
            {"greeks", toJson(day.greeks)},
            {"mark", day.mark},
            {"underlying_price", day.underlying_price},
            {"stale", day.stale}
        });
    }
    return j;
}

nlohmann::json toJson(const ClosedTrade& trade) {
    nlohmann::json j;
    j["position"] = toJson(trade.position);
    j["exit_date"] = trade.exit_date;
    j["exit_price"] = trade.exit_price;
    j["exit_value"] = trade.exit_value;
    j["exit_greeks"] = toJson(trade.exit_greeks);
    j["exit_underlying_price"] = trade.exit_underlying_price;
    j["exit_bid"] = trade.exit_bid;
    j["exit_ask"] = trade.exit_ask;
    j["realized_pnl"] = trade.realized_pnl;
    j["pnl_pct"] = trade.pnl_pct;
    j["days_held"] = trade.days_held;
    j["calendar_days_held"] = trade.calendar_days_held;
    j["exit_reason"] = trade.exit_reason;
    j["exit_detail"] = trade.exit_detail;
    j["delta_compliant"] = trade.delta_compliant;
    j["dte_compliant"] = trade.dte_compliant;
    j["compliance_score"] = trade.compliance_score;
    return j;
}

nlohmann::json toJson(const EquityPoint& point) {
    nlohmann::json j;
    j["date"] = point.date;
    j["cash"] = point.cash;
    j["positions_value"] = point.positions_value;
    j["total_value"] = point.total_value;
    j["open_positions"] = point.open_positions;
    return j;
}

nlohmann::json toJson(const Metrics& metrics) {
    nlohmann::json j;
    j["initial_capital"] = metrics.initial_capital;
    j["final_value"] = metrics.final_value;
    j["total_return"] = metrics.total_return;
    j["annualized_return"] = metrics.annualized_return;
    j["sharpe_ratio"] = metrics.sharpe_ratio;
    j["sortino_ratio"] = metrics.sortino_ratio;
    j["max_drawdown"] = metrics.max_drawdown;
    j["max_drawdown_date"] = metrics.max_drawdown_date;
    j["trading_days"] = metrics.trading_days;

    j["total_trades"] = metrics.total_trades;
    j["winning_trades"] = metrics.winning_trades;
    j["losing_trades"] = metrics.losing_trades;
    j["win_rate"] = metrics.win_rate;
    j["avg_win"] = metrics.avg_win;
    j["avg_loss"] = metrics.avg_loss;
    j["profit_factor"] = metrics.profit_factor;
    j["expectancy"] = metrics.expectancy;
    j["total_pnl"] = metrics.total_pnl;
    j["avg_days_held"] = metrics.avg_days_held;
    j["best_trade_pnl"] = metrics.best_trade_pnl;
    j["worst_trade_pnl"] = metrics.worst_trade_pnl;

    j["delta_compliance"] = metrics.delta_compliance;
    j["dte_compliance"] = metrics.dte_compliance;
    j["fully_compliant_trades"] = metrics.fully_compliant_trades;
    j["compliance_score"] = metrics.compliance_score;
    j["relaxed_entries"] = metrics.relaxed_entries;

    j["exit_reason_counts"] = nlohmann::json::object();
    for (const auto& [reason, count] : metrics.exit_reason_counts) {
        j["exit_reason_counts"][reason] = count;
    }
    j["by_exit_reason"] = nlohmann::json::object();
    for (const auto& [reason, stats] : metrics.by_exit_reason) {
        j["by_exit_reason"][reason] = {
            {"trades", stats.trades},
            {"win_rate", stats.winRate()},
            {"net_profit", stats.net_profit},
            {"profit_factor", stats.profitFactor()}
        };
    }
    return j;
}

Greeks greeksFromJson(const nlohmann::json& j) {
    Greeks greeks;
    greeks.delta = j.value("delta", 0.0);
    greeks.gamma = j.value("gamma", 0.0);
    greeks.theta = j.value("theta", 0.0);
    greeks.vega = j.value("vega", 0.0);
    greeks.rho = j.value("rho", 0.0);
    greeks.implied_volatility = j.value("iv", 0.0);
    return greeks;
}

ContractKey contractFromJson(const nlohmann::json& j) {
    ContractKey contract;
    contract.strike = j.value("strike", 0.0);
    contract.expiration = j.value("expiration", std::string());
    contract.right = (j.value("right", std::string("C")) == "P") ? OptionRight::PUT : OptionRight::CALL;
    return contract;
}

Position positionFromJson(const nlohmann::json& j) {
    Position position;
    position.id = j.value("id", static_cast<std::uint64_t>(0));
    position.symbol = j.value("symbol", std::string());
    position.contract = contractFromJson(j.value("contract", nlohmann::json::object()));
    position.entry_date = j.value("entry_date", std::string());
    position.entry_price = j.value("entry_price", 0.0);
    position.contracts = j.value("contracts", 0);
    position.entry_commission = j.value("entry_commission", 0.0);
    position.entry_cost = j.value("entry_cost", 0.0);
    position.entry_dte = j.value("entry_dte", 0);
    position.entry_underlying_price = j.value("entry_underlying_price", 0.0);
    position.entry_bid = j.value("entry_bid", 0.0);
    position.entry_ask = j.value("entry_ask", 0.0);
    position.entry_volume = j.value("entry_volume", 0LL);
    position.entry_open_interest = j.value("entry_open_interest", 0LL);
    position.relaxed_selection = j.value("relaxed_selection", false);
    position.current_mark = j.value("current_mark", 0.0);
    position.unrealized_pnl = j.value("unrealized_pnl", 0.0);
    position.entry_greeks = greeksFromJson(j.value("entry_greeks", nlohmann::json::object()));
    position.current_greeks = greeksFromJson(j.value("current_greeks", nlohmann::json::object()));
    position.last_quote_date = j.value("last_quote_date", std::string());
    position.status = statusFromString(j.value("status", std::string("OPEN")));

    for (const auto& day : j.value("greeks_history", nlohmann::json::array())) {
        GreeksSnapshot snapshot;
        snapshot.date = day.value("date", std::string());
        snapshot.greeks = greeksFromJson(day.value("greeks", nlohmann::json::object()));
        snapshot.mark = day.value("mark", 0.0);
        snapshot.underlying_price = day.value("underlying_price", 0.0);
        snapshot.stale = day.value("stale", false);
        position.greeks_history.push_back(snapshot);
    }
    return position;
}

ClosedTrade closedTradeFromJson(const nlohmann::json& j) {
    ClosedTrade trade;
    trade.position = positionFromJson(j.value("position", nlohmann::json::object()));
    trade.exit_date = j.value("exit_date", std::string());
    trade.exit_price = j.value("exit_price", 0.0);
    trade.exit_value = j.value("exit_value", 0.0);
    trade.exit_greeks = greeksFromJson(j.value("exit_greeks", nlohmann::json::object()));
    trade.exit_underlying_price = j.value("exit_underlying_price", 0.0);
    trade.exit_bid = j.value("exit_bid", 0.0);
    trade.exit_ask = j.value("exit_ask", 0.0);
    trade.realized_pnl = j.value("realized_pnl", 0.0);
    trade.pnl_pct = j.value("pnl_pct", 0.0);
    trade.days_held = j.value("days_held", 0);
    trade.calendar_days_held = j.value("calendar_days_held", 0);
    trade.exit_reason = j.value("exit_reason", std::string());
    trade.exit_detail = j.value("exit_detail", std::string());
    trade.delta_compliant = j.value("delta_compliant", false);
    trade.dte_compliant = j.value("dte_compliant", false);
    trade.compliance_score = j.value("compliance_score", 0.0);
    return trade;
}

EquityPoint equityPointFromJson(const nlohmann::json& j) {
    EquityPoint point;
    point.date = j.value("date", std::string());
    point.cash = j.value("cash", 0.0);
    point.positions_value = j.value("positions_value", 0.0);
    point.total_value = j.value("total_value", 0.0);
    point.open_positions = j.value("open_positions", 0);
    return point;
}

} // namespace backtest
} // namespace optionlab
