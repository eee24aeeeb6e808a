#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "core/state/InMemorySnapshotProvider.h"

namespace optionlab {
namespace backtest {

class DataHistory {
public:
    // Load an option chain from a header-driven CSV, one row per quote:
    // date,underlying_price,strike,expiration,right,bid,ask,close,volume,
    // open_interest,delta,gamma,theta,vega,iv[,rho]
    // Throws SnapshotLoadError when the file cannot be read or a required column is missing.
    static core::InMemorySnapshotProvider loadOptionChainCSV(const std::string& file_path);

    // Trading dates within [start_date, end_date]; empty bounds are open
    static std::vector<std::string> filterByDate(const std::vector<std::string>& dates,
                                                 const std::string& start_date,
                                                 const std::string& end_date);
};

} // namespace backtest
} // namespace optionlab
