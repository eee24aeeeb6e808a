#include "backtest/TradeRecorder.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>

using namespace optionlab;
using namespace optionlab::backtest;
using core::AuditEventType;
using fixtures::near;

namespace {

Position openedCall(double entry_delta, int entry_dte) {
    Position position;
    position.id = 1;
    position.symbol = "SPY";
    position.contract.strike = 450.0;
    position.contract.expiration = "2024-02-16";
    position.contract.right = OptionRight::CALL;
    position.entry_date = "2024-01-02";
    position.entry_price = 2.0;
    position.contracts = 2;
    position.entry_commission = 1.30;
    position.entry_cost = 401.30;
    position.entry_dte = entry_dte;
    position.entry_greeks.delta = entry_delta;
    position.current_greeks.delta = 0.55;
    position.current_mark = 3.0;

    GreeksSnapshot day;
    day.date = position.entry_date;
    day.underlying_price = 450.0;
    position.greeks_history.push_back(day);
    day.date = "2024-01-03";
    day.underlying_price = 455.0;
    position.greeks_history.push_back(day);
    return position;
}

} // namespace

int main() {
    TradeRecorder recorder(fixtures::baseConfig().option_selection);

    // Open then close: realized = exit value - entry cost
    {
        const Position position = openedCall(0.40, 45);
        SelectionFunnel funnel;
        funnel.total = 3;
        recorder.recordOpen(position, 10000.0 - 401.30, funnel, "selected");

        auto snapshot = fixtures::makeSnapshot("2024-01-03", 455.0,
            {fixtures::makeQuote(450.0, "2024-02-16", OptionRight::CALL, 3.0, 0.55)});
        const auto trade = recorder.recordClose(position, "profit_target", "value 600.00 >= 600.00",
                                                3.0, "2024-01-03", &snapshot, 10198.70);

        assert(near(trade.exit_value, 600.0));
        assert(near(trade.realized_pnl, 600.0 - 401.30));
        assert(near(trade.pnl_pct, (600.0 - 401.30) / 401.30));
        assert(trade.days_held == 1);
        assert(trade.calendar_days_held == 1);
        assert(near(trade.exit_underlying_price, 455.0));
        assert(near(trade.exit_bid, 2.95) && near(trade.exit_ask, 3.05));
        assert(trade.position.status == PositionStatus::CLOSED);
        assert(trade.delta_compliant && trade.dte_compliant);
        assert(near(trade.compliance_score, 100.0));
        assert(recorder.trades().size() == 1);
    }

    // Compliance is judged on the entry Greeks
    {
        const Position off_delta = openedCall(0.50, 45);
        assert(!recorder.isDeltaCompliant(off_delta));
        assert(recorder.isDteCompliant(off_delta));

        // Closed on a data gap: underlying from the last recorded day
        const auto trade = recorder.recordClose(off_delta, "end_of_period", "forced close at final mark",
                                                1.0, "2024-01-05", nullptr, 10000.0);
        assert(near(trade.compliance_score, 50.0));
        assert(near(trade.exit_underlying_price, 455.0));
        assert(near(trade.realized_pnl, 200.0 - 401.30));
        assert(trade.calendar_days_held == 3);

        assert(!recorder.isDteCompliant(openedCall(0.40, 70)));
    }

    // Audit trail
    {
        EquityPoint point;
        point.date = "2024-01-05";
        point.cash = 10000.0;
        point.total_value = 10000.0;
        recorder.recordEvent(AuditEventType::NO_CONTRACT, "2024-01-05", "0 liquid");
        recorder.recordEquity(point);

        const auto& entries = recorder.journal().entries();
        assert(entries.size() == 5);
        assert(entries[0].type == AuditEventType::ENTRY);
        assert(entries[0].payload["funnel"]["total"].get<int>() == 3);
        assert(entries[1].type == AuditEventType::EXIT);
        assert(entries[1].rationale == "profit_target: value 600.00 >= 600.00");
        assert(entries[2].type == AuditEventType::EXIT);
        assert(entries[3].type == AuditEventType::NO_CONTRACT);
        assert(entries[4].type == AuditEventType::EQUITY);
        for (size_t i = 0; i < entries.size(); ++i) {
            assert(entries[i].seq == i + 1);
        }
    }

    std::cout << "[TEST] TradeRecorder PASSED\n";
    return 0;
}
