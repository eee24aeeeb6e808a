#pragma once

#include <string>
#include <vector>

#include "backtest/BacktestTypes.h"
#include "backtest/PerformanceMetrics.h"
#include "core/state/AuditJournal.h"

namespace optionlab {
namespace backtest {

struct ReplayResult {
    std::string run_id;
    double initial_capital = 0.0;
    std::vector<ClosedTrade> trades;
    std::vector<EquityPoint> equity_curve;
    int entries = 0;
    int skipped_entries = 0;
    int stale_marks = 0;
    int data_gaps = 0;
    int quote_anomalies = 0;
    Metrics metrics;                // recomputed from trades and equity_curve
};

// Rebuilds the trade ledger, equity curve and metrics of a run from its audit trail alone
class AuditReplay {
public:
    static ReplayResult rebuild(const std::vector<core::AuditEntry>& entries);
    static ReplayResult rebuild(const std::vector<std::string>& lines);
};

} // namespace backtest
} // namespace optionlab
