#include "core/state/InMemorySnapshotProvider.h"
#include "common/DateUtils.h"

#include <stdexcept>

namespace optionlab {
namespace core {

void InMemorySnapshotProvider::add(MarketSnapshot snapshot) {
    if (!utils::DateUtils::isValid(snapshot.date)) {
        throw std::invalid_argument("invalid snapshot date '" + snapshot.date + "'");
    }
    const std::string date = snapshot.date;
    snapshots_[date] = std::move(snapshot);
}

void InMemorySnapshotProvider::addQuote(const std::string& date, double underlying_price,
                                        const OptionQuote& quote) {
    auto it = snapshots_.find(date);
    if (it == snapshots_.end()) {
        MarketSnapshot snapshot;
        snapshot.date = date;
        snapshot.underlying_price = underlying_price;
        add(std::move(snapshot));
        it = snapshots_.find(date);
    }
    it->second.quotes.push_back(quote);
}

bool InMemorySnapshotProvider::remove(const std::string& date) {
    return snapshots_.erase(date) > 0;
}

std::vector<std::string> InMemorySnapshotProvider::tradingDates() const {
    std::vector<std::string> dates;
    dates.reserve(snapshots_.size());
    for (const auto& entry : snapshots_) {
        dates.push_back(entry.first);
    }
    return dates;
}

std::optional<MarketSnapshot> InMemorySnapshotProvider::snapshot(const std::string& date) const {
    const auto it = snapshots_.find(date);
    if (it == snapshots_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t InMemorySnapshotProvider::quoteCount() const {
    size_t total = 0;
    for (const auto& entry : snapshots_) {
        total += entry.second.quotes.size();
    }
    return total;
}

} // namespace core
} // namespace optionlab
