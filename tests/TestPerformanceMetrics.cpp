#include "backtest/PerformanceMetrics.h"
#include "TestFixtures.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace optionlab;
using namespace optionlab::backtest;
using fixtures::near;

namespace {

ClosedTrade trade(double pnl, const std::string& reason, bool compliant = true, int days = 2) {
    ClosedTrade t;
    t.realized_pnl = pnl;
    t.exit_reason = reason;
    t.delta_compliant = compliant;
    t.dte_compliant = true;
    t.compliance_score = compliant ? 100.0 : 50.0;
    t.days_held = days;
    return t;
}

std::vector<EquityPoint> curve(const std::vector<double>& values) {
    std::vector<EquityPoint> points;
    for (size_t i = 0; i < values.size(); ++i) {
        EquityPoint point;
        point.date = fixtures::addDays("2024-01-02", static_cast<int>(i));
        point.total_value = values[i];
        point.cash = values[i];
        points.push_back(point);
    }
    return points;
}

bool allFinite(const Metrics& m) {
    return std::isfinite(m.total_return) && std::isfinite(m.annualized_return) &&
           std::isfinite(m.sharpe_ratio) && std::isfinite(m.sortino_ratio) &&
           std::isfinite(m.max_drawdown) && std::isfinite(m.win_rate) &&
           std::isfinite(m.profit_factor) && std::isfinite(m.expectancy);
}

} // namespace

int main() {
    // Nothing happened
    {
        const auto m = PerformanceMetrics::compute({}, {}, 10000.0);
        assert(allFinite(m));
        assert(near(m.final_value, 10000.0));
        assert(near(m.total_return, 0.0));
        assert(near(m.sharpe_ratio, 0.0));
        assert(m.total_trades == 0);
        assert(near(m.win_rate, 0.0));
        assert(near(m.profit_factor, 0.0));

        const auto zero_capital = PerformanceMetrics::compute({}, curve({0.0, 0.0}), 0.0);
        assert(allFinite(zero_capital));
    }

    // Trade statistics
    {
        const std::vector<ClosedTrade> trades = {
            trade(100.0, "profit_target"),
            trade(-50.0, "stop_loss", false, 4),
            trade(50.0, "profit_target")
        };
        const auto m = PerformanceMetrics::compute(trades, curve({10000.0, 10100.0}), 10000.0);
        assert(m.total_trades == 3);
        assert(m.winning_trades == 2);
        assert(m.losing_trades == 1);
        assert(near(m.win_rate, 2.0 / 3.0));
        assert(near(m.profit_factor, 3.0));
        assert(near(m.avg_win, 75.0));
        assert(near(m.avg_loss, 50.0));
        assert(near(m.expectancy, 100.0 / 3.0));
        assert(near(m.total_pnl, 100.0));
        assert(near(m.best_trade_pnl, 100.0));
        assert(near(m.worst_trade_pnl, -50.0));
        assert(near(m.avg_days_held, 8.0 / 3.0));

        assert(near(m.delta_compliance, 2.0 / 3.0));
        assert(near(m.dte_compliance, 1.0));
        assert(m.fully_compliant_trades == 2);
        assert(near(m.compliance_score, 250.0 / 3.0));

        assert(m.exit_reason_counts.at("profit_target") == 2);
        assert(m.exit_reason_counts.at("stop_loss") == 1);
        assert(near(m.by_exit_reason.at("profit_target").net_profit, 150.0));
        assert(near(m.by_exit_reason.at("profit_target").winRate(), 1.0));
        assert(near(m.by_exit_reason.at("stop_loss").profitFactor(), 0.0));
    }

    // Equity curve
    {
        const auto m = PerformanceMetrics::compute({}, curve({10000.0, 11000.0, 9900.0, 10500.0}), 10000.0);
        assert(near(m.max_drawdown, 0.1));
        assert(m.max_drawdown_date == "2024-01-04");
        assert(near(m.total_return, 0.05));
        assert(near(m.annualized_return, std::pow(1.05, 252.0 / 3.0) - 1.0, 1e-6));
        assert(m.trading_days == 4);
        assert(m.sharpe_ratio > 0.0);
        assert(m.sortino_ratio > 0.0);

        const auto returns = PerformanceMetrics::dailyReturns(curve({10000.0, 11000.0, 9900.0, 10500.0}));
        assert(returns.size() == 3);
        assert(near(returns[0], 0.1));
        assert(near(returns[1], -0.1));
    }

    // A first-day loss counts from the starting capital
    {
        const auto m = PerformanceMetrics::compute({}, curve({9000.0, 9500.0}), 10000.0);
        assert(near(m.max_drawdown, 0.1));
    }

    // Flat curve: no volatility, no ratio
    {
        const auto m = PerformanceMetrics::compute({}, curve({10000.0, 10000.0, 10000.0}), 10000.0);
        assert(near(m.sharpe_ratio, 0.0));
        assert(near(m.sortino_ratio, 0.0));
        assert(near(m.max_drawdown, 0.0));
        assert(near(m.annualized_return, 0.0));
    }

    std::cout << "[TEST] PerformanceMetrics PASSED\n";
    return 0;
}
