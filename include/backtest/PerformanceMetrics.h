#pragma once

#include <map>
#include <string>
#include <vector>

#include "backtest/BacktestTypes.h"

namespace optionlab {
namespace backtest {

struct TradeStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double expectancy() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
};

struct Metrics {
    double initial_capital = 0.0;
    double final_value = 0.0;
    double total_return = 0.0;          // fraction
    double annualized_return = 0.0;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double max_drawdown = 0.0;          // fraction of peak, >= 0
    std::string max_drawdown_date;
    int trading_days = 0;

    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;              // absolute value
    double profit_factor = 0.0;
    double expectancy = 0.0;
    double total_pnl = 0.0;
    double avg_days_held = 0.0;
    double best_trade_pnl = 0.0;
    double worst_trade_pnl = 0.0;

    double delta_compliance = 0.0;      // fraction of trades
    double dte_compliance = 0.0;
    int fully_compliant_trades = 0;
    double compliance_score = 0.0;      // mean per-trade score, 0~100
    int relaxed_entries = 0;

    std::map<std::string, int> exit_reason_counts;
    std::map<std::string, TradeStats> by_exit_reason;
};

// Pure function of closed trades and the daily equity curve. Empty inputs
// produce zeros, never NaN or infinity.
class PerformanceMetrics {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;

    static Metrics compute(const std::vector<ClosedTrade>& trades,
                           const std::vector<EquityPoint>& equity_curve,
                           double initial_capital);

    static std::vector<double> dailyReturns(const std::vector<EquityPoint>& equity_curve);
};

} // namespace backtest
} // namespace optionlab
