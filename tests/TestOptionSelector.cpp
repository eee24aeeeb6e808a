#include "backtest/OptionSelector.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>

using namespace optionlab;
using backtest::OptionSelector;
using fixtures::makeQuote;
using fixtures::makeSnapshot;
using fixtures::near;

int main() {
    const std::string today = "2024-01-02";
    const std::string expiration = fixtures::addDays(today, 45);

    // One liquid 0.40 delta call at 2.00: 5% of 10000 buys two contracts
    {
        OptionSelector selector(fixtures::baseConfig());
        auto snapshot = makeSnapshot(today, 450.0, {makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40)});
        auto result = selector.select(snapshot, snapshot.underlying_price, 0);
        assert(result.selection.has_value());
        assert(!result.selection->relaxed);
        assert(result.selection->dte == 45);
        assert(near(result.selection->fill_price, 2.0));
        assert(result.rationale.rfind("underlying 450.00", 0) == 0);
        assert(result.funnel.total == 1 && result.funnel.after_held == 1);

        auto sizing = selector.size(result.selection->fill_price, 10000.0);
        assert(sizing.contracts == 2);
        assert(near(sizing.commission, 1.30));
        assert(near(sizing.entry_cost, 401.30));
    }

    // Closest delta wins; equal distance falls back to the tighter spread
    {
        OptionSelector selector(fixtures::baseConfig());
        auto snapshot = makeSnapshot(today, 450.0, {
            makeQuote(445.0, expiration, OptionRight::CALL, 4.0, 0.50),
            makeQuote(455.0, expiration, OptionRight::CALL, 2.0, 0.41),
            makeQuote(460.0, expiration, OptionRight::CALL, 1.5, 0.35)
        });
        auto result = selector.select(snapshot, 450.0, 0);
        assert(result.selection && near(result.selection->quote.contract.strike, 455.0));

        auto tied = makeSnapshot(today, 450.0, {
            makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40, 500, 0.20),
            makeQuote(451.0, expiration, OptionRight::CALL, 2.0, 0.40, 500, 0.10)
        });
        result = selector.select(tied, 450.0, 0);
        assert(result.selection && near(result.selection->quote.contract.strike, 451.0));
    }

    // Type bias and DTE window
    {
        auto put_only = makeSnapshot(today, 450.0, {makeQuote(440.0, expiration, OptionRight::PUT, 2.0, -0.40)});

        OptionSelector calls(fixtures::baseConfig());
        auto result = calls.select(put_only, 450.0, 0);
        assert(!result.selection);
        assert(result.funnel.after_type == 0);

        auto config = fixtures::baseConfig();
        config.option_selection.type = strategy::OptionTypeBias::PUT;
        OptionSelector puts(config);
        result = puts.select(put_only, 450.0, 0);
        assert(result.selection && result.selection->quote.contract.right == OptionRight::PUT);

        auto near_term = makeSnapshot(today, 450.0,
            {makeQuote(450.0, fixtures::addDays(today, 10), OptionRight::CALL, 2.0, 0.40)});
        result = calls.select(near_term, 450.0, 0);
        assert(!result.selection);
        assert(result.funnel.after_liquidity == 1 && result.funnel.after_dte == 0);
    }

    // Thin volume is picked up by the relaxed pass
    {
        OptionSelector selector(fixtures::baseConfig());
        auto thin = makeSnapshot(today, 450.0, {makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40, 5)});
        auto result = selector.select(thin, 450.0, 0);
        assert(result.selection.has_value());
        assert(result.selection->relaxed);
        assert(result.funnel.relaxed);
    }

    // Without a delta tolerance there is nothing to relax against
    {
        auto config = fixtures::baseConfig();
        config.option_selection.delta.tolerance.reset();
        config.option_selection.liquidity.min_volume = 100;
        OptionSelector selector(config);
        auto thin = makeSnapshot(today, 450.0, {makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40, 30)});
        auto result = selector.select(thin, 450.0, 0);
        assert(!result.selection);
        assert(!result.funnel.relaxed);
        assert(result.funnel.after_liquidity == 0);
    }

    // Delta tolerance is never relaxed
    {
        auto far = makeSnapshot(today, 450.0, {makeQuote(430.0, expiration, OptionRight::CALL, 4.0, 0.60)});

        OptionSelector strict(fixtures::baseConfig());
        auto result = strict.select(far, 450.0, 0);
        assert(!result.selection);
        assert(result.funnel.relaxed);

        auto config = fixtures::baseConfig();
        config.option_selection.delta.tolerance.reset();
        OptionSelector loose(config);
        result = loose.select(far, 450.0, 0);
        assert(result.selection && near(result.selection->quote.greeks.delta, 0.60));
    }

    // A zero volume cap blocks everything, relaxed or not
    {
        auto config = fixtures::baseConfig();
        config.option_selection.liquidity.max_volume = 0;
        OptionSelector selector(config);
        auto snapshot = makeSnapshot(today, 450.0, {makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40)});
        auto result = selector.select(snapshot, 450.0, 0);
        assert(!result.selection);
    }

    // Broken rows are dropped and reported
    {
        OptionSelector selector(fixtures::baseConfig());
        auto bad = makeQuote(455.0, expiration, OptionRight::CALL, 2.5, 0.40);
        bad.bid = 3.0;
        bad.ask = 2.0;
        auto snapshot = makeSnapshot(today, 450.0, {bad, makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.42)});
        auto result = selector.select(snapshot, 450.0, 0);
        assert(result.anomalies.size() == 1);
        assert(result.anomalies[0].reason == "bid above ask");
        assert(result.funnel.after_anomaly == 1);
        assert(result.selection && near(result.selection->quote.contract.strike, 450.0));

        auto undated = makeQuote(450.0, "2024-13-40", OptionRight::CALL, 2.0, 0.40);
        assert(OptionSelector::quoteAnomaly(undated).has_value());
        assert(!OptionSelector::quoteAnomaly(makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40)));
    }

    // Held contracts and the position limit
    {
        auto config = fixtures::baseConfig();
        config.risk.max_concurrent_positions = 2;
        OptionSelector selector(config);
        auto quote = makeQuote(450.0, expiration, OptionRight::CALL, 2.0, 0.40);
        auto snapshot = makeSnapshot(today, 450.0, {quote});

        auto result = selector.select(snapshot, 450.0, 1, {quote.contract});
        assert(!result.selection);
        assert(result.funnel.after_delta == 1 && result.funnel.after_held == 0);

        result = selector.select(snapshot, 450.0, 2);
        assert(!result.selection);
        assert(result.rationale.rfind("max concurrent positions", 0) == 0);
    }

    // Sizing edges
    {
        OptionSelector selector(fixtures::baseConfig());
        assert(selector.size(0.0, 10000.0).contracts == 0);
        assert(selector.size(2.0, 100.0).contracts == 0);
        assert(selector.size(2.0, 0.0).contracts == 0);

        // Capped at max_contracts
        assert(selector.size(0.01, 10000.0).contracts == 100);

        // Commission pushes the only affordable contract over cash
        auto config = fixtures::baseConfig();
        config.risk.position_size_fraction = 1.0;
        OptionSelector all_in(config);
        assert(all_in.size(2.0, 200.5).contracts == 0);
        assert(all_in.size(2.0, 201.0).contracts == 1);

        // A budget a hair under three contracts buys two
        config.risk.position_size_fraction = 0.5;
        config.risk.commission_per_contract = 0.0;
        OptionSelector half(config);
        assert(half.size(1.0, 599.9999999998).contracts == 2);
        assert(half.size(1.0, 600.0).contracts == 3);
    }

    std::cout << "[TEST] OptionSelector PASSED\n";
    return 0;
}
