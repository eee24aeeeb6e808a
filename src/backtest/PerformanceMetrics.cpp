#include "backtest/PerformanceMetrics.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace optionlab {
namespace backtest {

namespace {
double finiteOrZero(double value) {
    return std::isfinite(value) ? value : 0.0;
}
}

std::vector<double> PerformanceMetrics::dailyReturns(const std::vector<EquityPoint>& equity_curve) {
    std::vector<double> returns;
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        const double prev = equity_curve[i - 1].total_value;
        if (prev > 0.0) {
            returns.push_back(equity_curve[i].total_value / prev - 1.0);
        }
    }
    return returns;
}

Metrics PerformanceMetrics::compute(const std::vector<ClosedTrade>& trades,
                                    const std::vector<EquityPoint>& equity_curve,
                                    double initial_capital) {
    Metrics m;
    m.initial_capital = initial_capital;
    m.final_value = equity_curve.empty() ? initial_capital : equity_curve.back().total_value;
    m.trading_days = static_cast<int>(equity_curve.size());

    // 1. Equity curve
    if (initial_capital > 0.0) {
        m.total_return = m.final_value / initial_capital - 1.0;
        const size_t periods = equity_curve.size() > 1 ? equity_curve.size() - 1 : 0;
        if (periods > 0 && m.final_value > 0.0) {
            m.annualized_return = std::pow(m.final_value / initial_capital,
                                           TRADING_DAYS_PER_YEAR / static_cast<double>(periods)) - 1.0;
        } else if (periods > 0) {
            m.annualized_return = -1.0;
        }
    }

    const auto returns = dailyReturns(equity_curve);
    if (returns.size() > 1) {
        const double mean = analytics::TechnicalIndicators::calculateMean(returns);
        const double std_dev = analytics::TechnicalIndicators::calculateStandardDeviation(returns, mean);
        if (std_dev > 1e-12) {
            m.sharpe_ratio = mean / std_dev * std::sqrt(TRADING_DAYS_PER_YEAR);
        }

        double downside_sq = 0.0;
        for (double r : returns) {
            if (r < 0.0) downside_sq += r * r;
        }
        const double downside_dev = std::sqrt(downside_sq / static_cast<double>(returns.size()));
        if (downside_dev > 1e-12) {
            m.sortino_ratio = mean / downside_dev * std::sqrt(TRADING_DAYS_PER_YEAR);
        }
    }

    double peak = initial_capital > 0.0 ? initial_capital : 0.0;
    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.total_value);
        if (peak > 0.0) {
            const double drawdown = (peak - point.total_value) / peak;
            if (drawdown > m.max_drawdown) {
                m.max_drawdown = drawdown;
                m.max_drawdown_date = point.date;
            }
        }
    }

    // 2. Trades
    TradeStats all;
    int delta_ok = 0;
    int dte_ok = 0;
    double score_sum = 0.0;
    double days_sum = 0.0;

    for (const auto& trade : trades) {
        all.trades++;
        all.net_profit += trade.realized_pnl;
        auto& by_reason = m.by_exit_reason[trade.exit_reason];
        by_reason.trades++;
        by_reason.net_profit += trade.realized_pnl;

        if (trade.realized_pnl > 0.0) {
            all.wins++;
            all.gross_profit += trade.realized_pnl;
            by_reason.wins++;
            by_reason.gross_profit += trade.realized_pnl;
        } else if (trade.realized_pnl < 0.0) {
            all.gross_loss_abs += std::abs(trade.realized_pnl);
            by_reason.gross_loss_abs += std::abs(trade.realized_pnl);
        }

        m.exit_reason_counts[trade.exit_reason]++;
        if (trade.delta_compliant) delta_ok++;
        if (trade.dte_compliant) dte_ok++;
        if (trade.delta_compliant && trade.dte_compliant) m.fully_compliant_trades++;
        if (trade.position.relaxed_selection) m.relaxed_entries++;
        score_sum += trade.compliance_score;
        days_sum += trade.days_held;

        if (all.trades == 1) {
            m.best_trade_pnl = trade.realized_pnl;
            m.worst_trade_pnl = trade.realized_pnl;
        } else {
            m.best_trade_pnl = std::max(m.best_trade_pnl, trade.realized_pnl);
            m.worst_trade_pnl = std::min(m.worst_trade_pnl, trade.realized_pnl);
        }
    }

    m.total_trades = all.trades;
    m.winning_trades = all.wins;
    m.losing_trades = all.trades - all.wins;
    m.win_rate = all.winRate();
    m.total_pnl = all.net_profit;
    m.expectancy = all.expectancy();
    m.profit_factor = all.profitFactor();
    m.avg_win = all.wins > 0 ? all.gross_profit / all.wins : 0.0;
    const int losses_with_pnl = static_cast<int>(std::count_if(trades.begin(), trades.end(),
        [](const ClosedTrade& t) { return t.realized_pnl < 0.0; }));
    m.avg_loss = losses_with_pnl > 0 ? all.gross_loss_abs / losses_with_pnl : 0.0;

    if (all.trades > 0) {
        m.delta_compliance = static_cast<double>(delta_ok) / all.trades;
        m.dte_compliance = static_cast<double>(dte_ok) / all.trades;
        m.compliance_score = score_sum / all.trades;
        m.avg_days_held = days_sum / all.trades;
    }

    m.total_return = finiteOrZero(m.total_return);
    m.annualized_return = finiteOrZero(m.annualized_return);
    m.sharpe_ratio = finiteOrZero(m.sharpe_ratio);
    m.sortino_ratio = finiteOrZero(m.sortino_ratio);
    return m;
}

} // namespace backtest
} // namespace optionlab
