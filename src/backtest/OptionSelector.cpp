#include "backtest/OptionSelector.h"
#include "common/DateUtils.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace optionlab {
namespace backtest {

namespace {
constexpr double RELAXED_MIN_BID = 0.01;
constexpr double RELAXED_MAX_SPREAD_PCT = 0.30;
constexpr long long RELAXED_VOLUME_DIVISOR = 4;
constexpr double DISTANCE_EPSILON = 1e-12;

bool isFinite(double v) {
    return std::isfinite(v);
}
}

OptionSelector::OptionSelector(const strategy::StrategyConfig& config)
    : selection_(config.option_selection), risk_(config.risk) {}

std::optional<std::string> OptionSelector::quoteAnomaly(const OptionQuote& quote) {
    if (!isFinite(quote.bid) || !isFinite(quote.ask) || !isFinite(quote.close) ||
        !isFinite(quote.greeks.delta) || !isFinite(quote.contract.strike)) {
        return std::string("non-finite price or greek");
    }
    if (quote.bid < 0.0 || quote.ask < 0.0 || quote.close < 0.0) {
        return std::string("negative price");
    }
    if (quote.bid > quote.ask) {
        return std::string("bid above ask");
    }
    if (quote.contract.strike <= 0.0) {
        return std::string("non-positive strike");
    }
    if (!utils::DateUtils::isValid(quote.contract.expiration)) {
        return std::string("invalid expiration '") + quote.contract.expiration + "'";
    }
    if (quote.volume < 0 || quote.open_interest < 0) {
        return std::string("negative volume");
    }
    return std::nullopt;
}

bool OptionSelector::matchesType(const OptionQuote& quote) const {
    switch (selection_.type) {
        case strategy::OptionTypeBias::CALL: return quote.contract.right == OptionRight::CALL;
        case strategy::OptionTypeBias::PUT: return quote.contract.right == OptionRight::PUT;
        case strategy::OptionTypeBias::EITHER: return true;
    }
    return false;
}

Price OptionSelector::fillPrice(const OptionQuote& quote) const {
    return selection_.fill_price == strategy::FillPriceMode::MID ? quote.mid() : quote.close;
}

bool OptionSelector::passesLiquidity(const OptionQuote& quote, bool relaxed) const {
    const auto& liq = selection_.liquidity;

    // The max-volume cap is a hard limit in both passes
    if (liq.max_volume && quote.volume > *liq.max_volume) {
        return false;
    }
    if (!(fillPrice(quote) > 0.0)) {
        return false;
    }

    if (relaxed) {
        const long long min_volume = std::max<long long>(1, liq.min_volume / RELAXED_VOLUME_DIVISOR);
        return quote.volume >= min_volume &&
               quote.bid > RELAXED_MIN_BID &&
               quote.spreadPct() <= std::max(RELAXED_MAX_SPREAD_PCT, liq.max_spread_pct);
    }

    return quote.volume >= std::max<long long>(1, liq.min_volume) &&
           quote.bid > 0.0 &&
           quote.ask >= quote.bid &&
           quote.spreadPct() <= liq.max_spread_pct;
}

bool OptionSelector::withinTolerance(const Candidate& candidate) const {
    if (!selection_.delta.tolerance) {
        return true;
    }
    return candidate.distance <= *selection_.delta.tolerance + DISTANCE_EPSILON;
}

std::vector<OptionSelector::Candidate> OptionSelector::rankStage(
    const std::vector<const OptionQuote*>& quotes,
    const std::string& date,
    const std::vector<ContractKey>& held,
    bool relaxed,
    SelectionFunnel& funnel
) const {
    std::vector<const OptionQuote*> liquid;
    for (const auto* quote : quotes) {
        if (passesLiquidity(*quote, relaxed)) {
            liquid.push_back(quote);
        }
    }

    std::vector<Candidate> in_dte;
    for (const auto* quote : liquid) {
        const auto dte = utils::DateUtils::daysBetween(date, quote->contract.expiration);
        if (!dte || *dte < selection_.dte.min || *dte > selection_.dte.max) {
            continue;
        }
        Candidate candidate;
        candidate.quote = quote;
        candidate.dte = *dte;
        candidate.spread_pct = quote->spreadPct();
        candidate.distance = std::abs(std::abs(quote->greeks.delta) - selection_.delta.target);
        in_dte.push_back(candidate);
    }

    std::vector<Candidate> in_delta;
    for (const auto& candidate : in_dte) {
        const double abs_delta = std::abs(candidate.quote->greeks.delta);
        if (abs_delta >= selection_.delta.min && abs_delta <= selection_.delta.max) {
            in_delta.push_back(candidate);
        }
    }

    std::vector<Candidate> ranked;
    for (const auto& candidate : in_delta) {
        if (std::find(held.begin(), held.end(), candidate.quote->contract) == held.end()) {
            ranked.push_back(candidate);
        }
    }

    funnel.after_liquidity = static_cast<int>(liquid.size());
    funnel.after_dte = static_cast<int>(in_dte.size());
    funnel.after_delta = static_cast<int>(in_delta.size());
    funnel.after_held = static_cast<int>(ranked.size());

    std::sort(ranked.begin(), ranked.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        if (a.spread_pct != b.spread_pct) return a.spread_pct < b.spread_pct;
        if (a.quote->volume != b.quote->volume) return a.quote->volume > b.quote->volume;
        return a.quote->contract < b.quote->contract;
    });
    return ranked;
}

SelectedContract OptionSelector::toSelection(const Candidate& candidate, bool relaxed) const {
    SelectedContract selected;
    selected.quote = *candidate.quote;
    selected.dte = candidate.dte;
    selected.fill_price = fillPrice(*candidate.quote);
    selected.delta_distance = candidate.distance;
    selected.relaxed = relaxed;
    return selected;
}

SelectionResult OptionSelector::select(const MarketSnapshot& snapshot,
                                       Price underlying_price,
                                       int open_position_count,
                                       const std::vector<ContractKey>& held) const {
    SelectionResult result;
    result.funnel.total = static_cast<int>(snapshot.quotes.size());

    if (open_position_count >= risk_.max_concurrent_positions) {
        result.rationale = "max concurrent positions reached (" + std::to_string(open_position_count) + ")";
        return result;
    }

    // 1. Type bias
    std::vector<const OptionQuote*> typed;
    for (const auto& quote : snapshot.quotes) {
        if (matchesType(quote)) {
            typed.push_back(&quote);
        }
    }
    result.funnel.after_type = static_cast<int>(typed.size());

    // 2. Quote anomalies are dropped and reported
    std::vector<const OptionQuote*> sane;
    for (const auto* quote : typed) {
        if (auto reason = quoteAnomaly(*quote)) {
            result.anomalies.push_back({quote->contract, *reason});
            continue;
        }
        sane.push_back(quote);
    }
    result.funnel.after_anomaly = static_cast<int>(sane.size());

    // 3. Strict liquidity -> DTE -> delta -> not held, ranked
    const auto strict = rankStage(sane, snapshot.date, held, false, result.funnel);

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "underlying " << std::setprecision(2) << underlying_price << std::setprecision(3)
        << ", " << result.funnel.total << " quotes, " << result.funnel.after_type << " "
        << strategy::toString(selection_.type) << ", " << result.funnel.after_liquidity << " liquid, "
        << result.funnel.after_dte << " in DTE, " << result.funnel.after_delta << " in delta";

    if (!strict.empty() && withinTolerance(strict.front())) {
        result.selection = toSelection(strict.front(), false);
        oss << "; selected " << strict.front().quote->contract.toString()
            << " delta " << strict.front().quote->greeks.delta;
        result.rationale = oss.str();
        return result;
    }

    if (!selection_.delta.tolerance) {
        oss << "; no strict candidate, no delta tolerance to relax against";
        result.rationale = oss.str();
        return result;
    }

    if (!strict.empty()) {
        oss << "; best strict candidate delta distance " << strict.front().distance
            << " outside tolerance " << *selection_.delta.tolerance;
    }

    // 4. One relaxed liquidity pass, only against an explicit tolerance
    SelectionFunnel relaxed_funnel = result.funnel;
    const auto relaxed = rankStage(sane, snapshot.date, held, true, relaxed_funnel);
    result.funnel.relaxed = true;

    if (!relaxed.empty() && withinTolerance(relaxed.front())) {
        result.selection = toSelection(relaxed.front(), true);
        oss << "; relaxed liquidity selected " << relaxed.front().quote->contract.toString()
            << " delta " << relaxed.front().quote->greeks.delta;
        result.rationale = oss.str();
        return result;
    }

    oss << "; relaxed liquidity found " << relaxed_funnel.after_held << " candidates, none suitable";
    result.rationale = oss.str();
    return result;
}

PositionSizing OptionSelector::size(Price fill_price, Amount cash) const {
    PositionSizing sizing;

    if (!(fill_price > 0.0)) {
        sizing.rationale = "no valid fill price";
        return sizing;
    }
    if (!(cash > 0.0)) {
        sizing.rationale = "no cash available";
        return sizing;
    }

    const double budget = cash * risk_.position_size_fraction;
    const double per_contract = fill_price * kContractMultiplier;
    int contracts = static_cast<int>(std::floor(budget / per_contract));
    contracts = std::min(contracts, risk_.max_contracts);

    auto costFor = [&](int n) {
        return n * per_contract + n * risk_.commission_per_contract;
    };

    // Commission may push the total above cash
    while (contracts > 0 && costFor(contracts) > cash) {
        --contracts;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (contracts <= 0) {
        oss << "budget " << budget << " below one contract at " << per_contract;
        sizing.rationale = oss.str();
        return sizing;
    }

    sizing.contracts = contracts;
    sizing.commission = contracts * risk_.commission_per_contract;
    sizing.entry_cost = costFor(contracts);
    oss << contracts << " contracts from budget " << budget << " at " << per_contract
        << " per contract, cost " << sizing.entry_cost;
    sizing.rationale = oss.str();
    return sizing;
}

} // namespace backtest
} // namespace optionlab
