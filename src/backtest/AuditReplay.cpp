#include "backtest/AuditReplay.h"
#include "backtest/BacktestSchema.h"
#include "common/Logger.h"

namespace optionlab {
namespace backtest {

ReplayResult AuditReplay::rebuild(const std::vector<core::AuditEntry>& entries) {
    ReplayResult result;

    for (const auto& entry : entries) {
        switch (entry.type) {
            case core::AuditEventType::ENTRY:
                result.entries++;
                break;
            case core::AuditEventType::EXIT:
                if (entry.payload.contains("trade")) {
                    result.trades.push_back(closedTradeFromJson(entry.payload.at("trade")));
                } else {
                    LOG_WARN("EXIT audit entry {} has no trade payload", entry.seq);
                }
                break;
            case core::AuditEventType::EQUITY:
                if (entry.payload.contains("equity")) {
                    result.equity_curve.push_back(equityPointFromJson(entry.payload.at("equity")));
                } else {
                    LOG_WARN("EQUITY audit entry {} has no equity payload", entry.seq);
                }
                break;
            case core::AuditEventType::NO_CONTRACT:
            case core::AuditEventType::INSUFFICIENT_CAPITAL:
            case core::AuditEventType::FILTER_BLOCKED:
            case core::AuditEventType::MAX_POSITIONS:
            case core::AuditEventType::ENTRY_THROTTLED:
                result.skipped_entries++;
                break;
            case core::AuditEventType::STALE_MARK:
                result.stale_marks++;
                break;
            case core::AuditEventType::DATA_GAP:
                result.data_gaps++;
                break;
            case core::AuditEventType::QUOTE_ANOMALY:
                result.quote_anomalies++;
                break;
            case core::AuditEventType::RUN_START:
                result.run_id = entry.payload.value("run_id", std::string());
                result.initial_capital = entry.payload.value("initial_capital", 0.0);
                break;
            case core::AuditEventType::RUN_END:
                break;
        }
    }
    result.metrics = PerformanceMetrics::compute(result.trades, result.equity_curve, result.initial_capital);
    return result;
}

ReplayResult AuditReplay::rebuild(const std::vector<std::string>& lines) {
    std::vector<core::AuditEntry> entries;
    entries.reserve(lines.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].empty()) {
            continue;
        }
        auto entry = core::AuditJournal::parseLine(lines[i]);
        if (!entry) {
            LOG_WARN("Skipping malformed audit line {}", i + 1);
            continue;
        }
        entries.push_back(std::move(*entry));
    }
    return rebuild(entries);
}

} // namespace backtest
} // namespace optionlab
