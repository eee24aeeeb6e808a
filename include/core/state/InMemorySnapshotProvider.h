#pragma once

#include <map>

#include "core/contracts/IMarketSnapshotProvider.h"

namespace optionlab {
namespace core {

class InMemorySnapshotProvider : public IMarketSnapshotProvider {
public:
    InMemorySnapshotProvider() = default;

    // Replaces any snapshot already stored for the same date.
    // Throws std::invalid_argument when the date is not YYYY-MM-DD.
    void add(MarketSnapshot snapshot);

    // Appends one quote to the snapshot of the given date, creating it if needed
    void addQuote(const std::string& date, double underlying_price, const OptionQuote& quote);

    bool remove(const std::string& date);

    std::vector<std::string> tradingDates() const override;
    std::optional<MarketSnapshot> snapshot(const std::string& date) const override;

    size_t size() const { return snapshots_.size(); }
    size_t quoteCount() const;

private:
    std::map<std::string, MarketSnapshot> snapshots_;
};

} // namespace core
} // namespace optionlab
