#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"

namespace optionlab {
namespace core {

// Read-only lookup of option-chain snapshots by trading date
class IMarketSnapshotProvider {
public:
    virtual ~IMarketSnapshotProvider() = default;

    // Ascending, unique
    virtual std::vector<std::string> tradingDates() const = 0;
    virtual std::optional<MarketSnapshot> snapshot(const std::string& date) const = 0;
};

} // namespace core
} // namespace optionlab
