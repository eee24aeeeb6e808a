#include "backtest/PositionTracker.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace optionlab;
using namespace optionlab::backtest;
using fixtures::makeQuote;
using fixtures::makeSnapshot;
using fixtures::near;

namespace {

SelectedContract selectedFrom(const OptionQuote& quote, int dte) {
    SelectedContract selected;
    selected.quote = quote;
    selected.dte = dte;
    selected.fill_price = quote.close;
    return selected;
}

PositionSizing twoContracts(Price fill) {
    PositionSizing sizing;
    sizing.contracts = 2;
    sizing.commission = 1.30;
    sizing.entry_cost = 2 * fill * kContractMultiplier + sizing.commission;
    return sizing;
}

} // namespace

int main() {
    const std::string day0 = "2024-01-02";
    const std::string expiration = fixtures::addDays(day0, 45);
    const auto quote = makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40);

    // Open
    PositionTracker tracker;
    const auto id = tracker.open("SPY", selectedFrom(quote, 45), twoContracts(2.0),
                                 makeSnapshot(day0, 450.0, {quote}));
    {
        const Position& position = tracker.get(id);
        assert(id == 1);
        assert(tracker.openCount() == 1);
        assert(position.status == PositionStatus::OPEN);
        assert(near(position.entry_cost, 401.30));
        assert(near(position.marketValue(), 400.0));
        assert(near(position.unrealized_pnl, -1.30));
        assert(position.greeks_history.size() == 1);
        assert(position.daysHeld() == 0);
        assert(tracker.heldContracts().front() == quote.contract);
    }

    // Next day: exact contract lookup, other strikes ignored
    {
        auto moved = makeQuote(450.0, expiration, OptionRight::CALL, 3.0, 0.55);
        auto other = makeQuote(455.0, expiration, OptionRight::CALL, 9.0, 0.30);
        auto outcomes = tracker.markAll(makeSnapshot(fixtures::addDays(day0, 1), 455.0, {other, moved}));
        assert(outcomes.size() == 1);
        assert(!outcomes[0].stale);

        const Position& position = tracker.get(id);
        assert(near(position.current_mark, 3.0));
        assert(near(position.current_greeks.delta, 0.55));
        assert(near(position.unrealized_pnl, 600.0 - 401.30));
        assert(position.daysHeld() == 1);
        assert(near(tracker.openMarketValue(), 600.0));
    }

    // Quote missing before expiration: stale, prior mark kept
    {
        const std::string day2 = fixtures::addDays(day0, 2);
        auto outcomes = tracker.markAll(makeSnapshot(day2, 456.0,
            {makeQuote(455.0, expiration, OptionRight::CALL, 9.0, 0.30)}));
        assert(outcomes[0].stale);
        assert(!outcomes[0].intrinsic);

        const Position& position = tracker.get(id);
        assert(near(position.current_mark, 3.0));
        assert(position.greeks_history.back().stale);
        assert(position.last_quote_date == fixtures::addDays(day0, 1));
    }

    // Data gap
    {
        auto outcomes = tracker.carryForward(fixtures::addDays(day0, 3));
        assert(outcomes.size() == 1 && outcomes[0].stale);
        const Position& position = tracker.get(id);
        assert(position.greeks_history.size() == 4);
        assert(near(position.greeks_history.back().underlying_price, 456.0));
        assert(near(position.current_mark, 3.0));
    }

    // Expired without a quote: intrinsic value
    {
        auto outcomes = tracker.markAll(makeSnapshot(expiration, 460.0, {}));
        assert(outcomes[0].intrinsic);
        assert(!outcomes[0].stale);
        assert(near(tracker.get(id).current_mark, 10.0));
    }

    // Put intrinsic floors at zero
    {
        PositionTracker puts;
        auto put = makeQuote(440.0, expiration, OptionRight::PUT, 2.0, -0.40);
        const auto put_id = puts.open("SPY", selectedFrom(put, 45), twoContracts(2.0),
                                      makeSnapshot(day0, 450.0, {put}));
        puts.markAll(makeSnapshot(fixtures::addDays(expiration, 1), 460.0, {}));
        assert(near(puts.get(put_id).current_mark, 0.0));
    }

    // Mid marks
    {
        PositionTracker mid(strategy::FillPriceMode::MID);
        auto q = makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40);
        const auto mid_id = mid.open("SPY", selectedFrom(q, 45), twoContracts(2.0),
                                     makeSnapshot(day0, 450.0, {q}));
        auto next = q;
        next.close = 5.0;
        next.bid = 2.4;
        next.ask = 2.6;
        mid.markAll(makeSnapshot(fixtures::addDays(day0, 1), 451.0, {next}));
        assert(near(mid.get(mid_id).current_mark, 2.5));
    }

    // No trade that day: close 0 with a live book keeps the prior mark
    {
        PositionTracker idle;
        const auto idle_id = idle.open("SPY", selectedFrom(quote, 45), twoContracts(2.0),
                                       makeSnapshot(day0, 450.0, {quote}));
        auto untraded = quote;
        untraded.close = 0.0;
        untraded.bid = 1.95;
        untraded.ask = 2.05;
        auto outcomes = idle.markAll(makeSnapshot(fixtures::addDays(day0, 1), 451.0, {untraded}));
        assert(outcomes[0].stale);
        assert(!outcomes[0].intrinsic);

        const Position& position = idle.get(idle_id);
        assert(near(position.current_mark, 2.0));
        assert(near(position.marketValue(), 400.0));
        assert(position.last_quote_date == day0);
        assert(position.greeks_history.back().stale);
    }

    // Crossed book in mid mode is not a mark
    {
        PositionTracker mid(strategy::FillPriceMode::MID);
        const auto mid_id = mid.open("SPY", selectedFrom(quote, 45), twoContracts(2.0),
                                     makeSnapshot(day0, 450.0, {quote}));
        auto crossed = quote;
        crossed.bid = 3.0;
        crossed.ask = 2.0;
        auto outcomes = mid.markAll(makeSnapshot(fixtures::addDays(day0, 1), 451.0, {crossed}));
        assert(outcomes[0].stale);
        assert(near(mid.get(mid_id).current_mark, 2.0));
    }

    // Close
    {
        tracker.markExitPending(id);
        assert(tracker.get(id).status == PositionStatus::EXIT_PENDING);
        tracker.close(id);
        assert(tracker.get(id).status == PositionStatus::CLOSED);
        assert(tracker.openCount() == 0);
        assert(tracker.openIds().empty());
        assert(tracker.all().size() == 1);
        assert(near(tracker.openMarketValue(), 0.0));
    }

    // Misuse
    {
        bool threw = false;
        try {
            PositionSizing none;
            tracker.open("SPY", selectedFrom(quote, 45), none, makeSnapshot(day0, 450.0, {quote}));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            tracker.get(42);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[TEST] PositionTracker PASSED\n";
    return 0;
}
