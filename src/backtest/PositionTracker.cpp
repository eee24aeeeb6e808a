#include "backtest/PositionTracker.h"
#include "common/DateUtils.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace optionlab {
namespace backtest {

std::string toString(PositionStatus status) {
    switch (status) {
        case PositionStatus::OPEN: return "OPEN";
        case PositionStatus::EXIT_PENDING: return "EXIT_PENDING";
        case PositionStatus::CLOSED: return "CLOSED";
    }
    return "OPEN";
}

PositionTracker::PositionTracker(strategy::FillPriceMode mark_mode)
    : mark_mode_(mark_mode) {}

Price PositionTracker::markPrice(const OptionQuote& quote) const {
    return mark_mode_ == strategy::FillPriceMode::MID ? quote.mid() : quote.close;
}

std::uint64_t PositionTracker::open(const std::string& symbol,
                                    const SelectedContract& selected,
                                    const PositionSizing& sizing,
                                    const MarketSnapshot& snapshot) {
    if (sizing.contracts <= 0) {
        throw std::invalid_argument("cannot open a position with no contracts");
    }

    Position position;
    position.id = static_cast<std::uint64_t>(arena_.size()) + 1;
    position.symbol = symbol;
    position.contract = selected.quote.contract;
    position.entry_date = snapshot.date;
    position.entry_price = selected.fill_price;
    position.contracts = sizing.contracts;
    position.entry_commission = sizing.commission;
    position.entry_cost = sizing.entry_cost;
    position.entry_dte = selected.dte;
    position.entry_underlying_price = snapshot.underlying_price;
    position.entry_bid = selected.quote.bid;
    position.entry_ask = selected.quote.ask;
    position.entry_volume = selected.quote.volume;
    position.entry_open_interest = selected.quote.open_interest;
    position.relaxed_selection = selected.relaxed;

    position.current_mark = selected.fill_price;
    position.entry_greeks = selected.quote.greeks;
    position.current_greeks = selected.quote.greeks;
    position.last_quote_date = snapshot.date;
    position.unrealized_pnl = position.marketValue() - position.entry_cost;
    position.status = PositionStatus::OPEN;

    GreeksSnapshot entry;
    entry.date = snapshot.date;
    entry.greeks = position.entry_greeks;
    entry.mark = position.current_mark;
    entry.underlying_price = snapshot.underlying_price;
    position.greeks_history.push_back(entry);

    arena_.push_back(std::move(position));
    open_ids_.push_back(arena_.back().id);
    return arena_.back().id;
}

MarkOutcome PositionTracker::markToMarket(Position& position, const MarketSnapshot& snapshot) const {
    MarkOutcome outcome;
    outcome.position_id = position.id;

    // A row with no trade (close 0) or a broken book does not move the mark
    const OptionQuote* quote = snapshot.find(position.contract);
    const bool usable = quote != nullptr &&
                        !OptionSelector::quoteAnomaly(*quote) &&
                        std::isfinite(markPrice(*quote)) && markPrice(*quote) > 0.0;

    if (usable) {
        position.current_mark = markPrice(*quote);
        position.current_greeks = quote->greeks;
        position.last_quote_date = snapshot.date;
    } else {
        const auto dte = utils::DateUtils::daysBetween(snapshot.date, position.contract.expiration);
        if (dte && *dte <= 0 && snapshot.underlying_price > 0.0) {
            const double spot = snapshot.underlying_price;
            const double strike = position.contract.strike;
            position.current_mark = (position.contract.right == OptionRight::CALL)
                ? std::max(0.0, spot - strike)
                : std::max(0.0, strike - spot);
            outcome.intrinsic = true;
        } else {
            outcome.stale = true;
        }
    }

    position.unrealized_pnl = position.marketValue() - position.entry_cost;
    outcome.mark = position.current_mark;
    return outcome;
}

void PositionTracker::appendGreeks(Position& position, const MarketSnapshot& snapshot, bool stale) const {
    GreeksSnapshot day;
    day.date = snapshot.date;
    day.greeks = position.current_greeks;
    day.mark = position.current_mark;
    day.underlying_price = snapshot.underlying_price;
    day.stale = stale;
    position.greeks_history.push_back(day);
}

std::vector<MarkOutcome> PositionTracker::markAll(const MarketSnapshot& snapshot) {
    std::vector<MarkOutcome> outcomes;
    for (const auto id : open_ids_) {
        Position& position = get(id);
        const MarkOutcome outcome = markToMarket(position, snapshot);
        appendGreeks(position, snapshot, outcome.stale);
        outcomes.push_back(outcome);
    }
    return outcomes;
}

std::vector<MarkOutcome> PositionTracker::carryForward(const std::string& date) {
    std::vector<MarkOutcome> outcomes;
    for (const auto id : open_ids_) {
        Position& position = get(id);
        GreeksSnapshot day;
        day.date = date;
        day.greeks = position.current_greeks;
        day.mark = position.current_mark;
        day.underlying_price = position.greeks_history.empty()
            ? position.entry_underlying_price
            : position.greeks_history.back().underlying_price;
        day.stale = true;
        position.greeks_history.push_back(day);

        MarkOutcome outcome;
        outcome.position_id = id;
        outcome.mark = position.current_mark;
        outcome.stale = true;
        outcomes.push_back(outcome);
    }
    return outcomes;
}

Position& PositionTracker::get(std::uint64_t id) {
    if (id == 0 || id > arena_.size()) {
        throw std::out_of_range("unknown position id " + std::to_string(id));
    }
    return arena_[id - 1];
}

const Position& PositionTracker::get(std::uint64_t id) const {
    if (id == 0 || id > arena_.size()) {
        throw std::out_of_range("unknown position id " + std::to_string(id));
    }
    return arena_[id - 1];
}

void PositionTracker::markExitPending(std::uint64_t id) {
    Position& position = get(id);
    if (position.status == PositionStatus::OPEN) {
        position.status = PositionStatus::EXIT_PENDING;
    }
}

void PositionTracker::close(std::uint64_t id) {
    Position& position = get(id);
    position.status = PositionStatus::CLOSED;
    position.unrealized_pnl = 0.0;
    open_ids_.erase(std::remove(open_ids_.begin(), open_ids_.end(), id), open_ids_.end());
}

std::vector<ContractKey> PositionTracker::heldContracts() const {
    std::vector<ContractKey> held;
    for (const auto id : open_ids_) {
        held.push_back(get(id).contract);
    }
    return held;
}

Amount PositionTracker::openMarketValue() const {
    Amount total = 0.0;
    for (const auto id : open_ids_) {
        total += get(id).marketValue();
    }
    return total;
}

} // namespace backtest
} // namespace optionlab
