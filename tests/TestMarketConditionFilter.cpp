#include "analytics/MarketConditionFilter.h"
#include "TestFixtures.h"

#include <cassert>
#include <iostream>
#include <vector>

using namespace optionlab;
using analytics::MarketConditionFilter;
using strategy::OptionTypeBias;

namespace {

std::vector<UnderlyingBar> risingHistory(const std::string& start, int bars, double first = 400.0) {
    std::vector<UnderlyingBar> history;
    for (int i = 0; i < bars; ++i) {
        UnderlyingBar bar;
        bar.date = fixtures::addDays(start, i);
        bar.close = first + i;
        bar.atm_iv = 0.20;
        bar.has_atm_iv = true;
        history.push_back(bar);
    }
    return history;
}

MarketSnapshot snapshotAt(const std::string& date, double underlying, double iv = 0.20) {
    return fixtures::makeSnapshot(date, underlying,
        {fixtures::makeQuote(underlying, fixtures::addDays(date, 40), OptionRight::CALL, 5.0, 0.5, 500, 0.1, iv)});
}

} // namespace

int main() {
    const std::string start = "2024-01-02";

    // Nothing enabled: always allowed, no checks
    {
        strategy::MarketFilterConfig config;
        MarketConditionFilter filter(config);
        auto decision = filter.allowEntry(start, snapshotAt(start, 450.0), {}, OptionTypeBias::CALL);
        assert(decision.allowed);
        assert(decision.checks.empty());
    }

    // Insufficient history defaults to allow with a rationale
    {
        strategy::MarketFilterConfig config;
        config.trend.enabled = true;
        config.trend.period = 20;
        MarketConditionFilter filter(config);
        const auto history = risingHistory(start, 5);
        auto decision = filter.allowEntry(history.back().date, snapshotAt(history.back().date, 404.0),
                                          history, OptionTypeBias::CALL);
        assert(decision.allowed);
        assert(decision.checks.size() == 1);
        assert(decision.checks[0].insufficient_history);
        assert(decision.rationale() == "trend_filter: insufficient history (5/20 bars)");
    }

    // Trend filter
    {
        strategy::MarketFilterConfig config;
        config.trend.enabled = true;
        config.trend.period = 20;
        MarketConditionFilter filter(config);
        const auto history = risingHistory(start, 25);
        const std::string today = history.back().date;

        // MA20 of 405..424 is 414.5
        assert(filter.allowEntry(today, snapshotAt(today, 424.0), history, OptionTypeBias::CALL).allowed);
        assert(!filter.allowEntry(today, snapshotAt(today, 410.0), history, OptionTypeBias::CALL).allowed);

        config.trend.require_above_ma = false;
        MarketConditionFilter below(config);
        assert(below.allowEntry(today, snapshotAt(today, 410.0), history, OptionTypeBias::CALL).allowed);
    }

    // Bars dated after the decision day are never looked at
    {
        strategy::MarketFilterConfig config;
        config.trend.enabled = true;
        config.trend.period = 20;
        MarketConditionFilter filter(config);
        const auto history = risingHistory(start, 25);
        const std::string early = history[9].date;
        auto decision = filter.allowEntry(early, snapshotAt(early, 409.0), history, OptionTypeBias::CALL);
        assert(decision.allowed);
        assert(decision.checks[0].insufficient_history);
    }

    // IV regime bounds
    {
        strategy::MarketFilterConfig config;
        config.iv_regime.enabled = true;
        config.iv_regime.min_iv = 0.10;
        config.iv_regime.max_iv = 0.50;
        MarketConditionFilter filter(config);
        assert(filter.allowEntry(start, snapshotAt(start, 450.0, 0.30), {}, OptionTypeBias::CALL).allowed);
        assert(!filter.allowEntry(start, snapshotAt(start, 450.0, 0.65), {}, OptionTypeBias::CALL).allowed);
    }

    // Volatility regime: today's IV is the highest of the window
    {
        strategy::MarketFilterConfig config;
        config.volatility_regime.enabled = true;
        config.volatility_regime.params.lookback = 10;
        MarketConditionFilter filter(config);

        auto history = risingHistory(start, 10);
        for (size_t i = 0; i < history.size(); ++i) {
            history[i].atm_iv = 0.15 + 0.01 * static_cast<double>(i);
        }
        const std::string today = history.back().date;
        auto decision = filter.allowEntry(today, snapshotAt(today, 409.0), history, OptionTypeBias::CALL);
        assert(!decision.allowed);
        assert(decision.checks[0].name == "volatility_regime");

        config.volatility_regime.allowed.push_back(analytics::VolatilityRegime::HIGH);
        MarketConditionFilter permissive(config);
        assert(permissive.allowEntry(today, snapshotAt(today, 409.0), history, OptionTypeBias::CALL).allowed);
    }

    // Direction-aware oscillators, AND by default, OR inside a group
    {
        strategy::MarketFilterConfig config;
        config.rsi.enabled = true;
        config.bollinger.enabled = true;
        config.trend.enabled = true;
        config.trend.period = 5;
        const auto history = risingHistory(start, 30);
        const std::string today = history.back().date;
        const auto snapshot = snapshotAt(today, 429.0);

        // Steady rise: RSI 100, price at the upper band, above MA5
        MarketConditionFilter filter(config);
        auto call = filter.allowEntry(today, snapshot, history, OptionTypeBias::CALL);
        assert(!call.allowed);
        assert(call.checks.size() == 3);

        // Puts want overbought, but the trend filter asks for price above MA: passes
        auto put = filter.allowEntry(today, snapshot, history, OptionTypeBias::PUT);
        assert(put.allowed);

        // Trend fails for puts when it requires a falling market
        config.trend.require_above_ma = false;
        MarketConditionFilter strict(config);
        assert(!strict.allowEntry(today, snapshot, history, OptionTypeBias::PUT).allowed);

        // OR group: one passing member is enough for the group
        config.trend.enabled = false;
        config.rsi.overbought = 101.0;     // RSI can never reach it
        config.or_groups["oscillators"] = {"rsi_filter", "bollinger_bands"};
        MarketConditionFilter grouped(config);
        assert(grouped.allowEntry(today, snapshot, history, OptionTypeBias::PUT).allowed);

        config.or_groups.clear();
        MarketConditionFilter anded(config);
        assert(!anded.allowEntry(today, snapshot, history, OptionTypeBias::PUT).allowed);
    }

    // At-the-money IV
    {
        const std::string expiration = "2024-02-16";
        auto snapshot = fixtures::makeSnapshot(start, 450.0, {
            fixtures::makeQuote(450.0, expiration, OptionRight::CALL, 5.0, 0.50, 500, 0.1, 0.20),
            fixtures::makeQuote(452.0, expiration, OptionRight::CALL, 4.0, 0.45, 500, 0.1, 0.30),
            fixtures::makeQuote(500.0, expiration, OptionRight::CALL, 0.5, 0.05, 500, 0.1, 0.90)
        });
        auto iv = MarketConditionFilter::atmImpliedVolatility(snapshot);
        assert(iv && fixtures::near(*iv, 0.25));

        auto far = fixtures::makeSnapshot(start, 450.0, {
            fixtures::makeQuote(500.0, expiration, OptionRight::CALL, 0.5, 0.05, 500, 0.1, 0.40),
            fixtures::makeQuote(520.0, expiration, OptionRight::CALL, 0.2, 0.02, 500, 0.1, 0.50)
        });
        iv = MarketConditionFilter::atmImpliedVolatility(far);
        assert(iv && fixtures::near(*iv, 0.40));

        assert(!MarketConditionFilter::atmImpliedVolatility(fixtures::makeSnapshot(start, 450.0, {})));
    }

    std::cout << "[TEST] MarketConditionFilter PASSED\n";
    return 0;
}
