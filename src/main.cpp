#include "common/Errors.h"
#include "common/Logger.h"
#include "backtest/AuditReplay.h"
#include "backtest/BacktestEngine.h"
#include "backtest/BacktestSchema.h"
#include "backtest/DataHistory.h"
#include "strategy/StrategyConfigLoader.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace optionlab;

namespace {

struct CliOptions {
    std::string config_path;
    std::string data_path;
    std::string log_dir = "logs";
    std::string audit_out;
    std::string start_date;
    std::string end_date;
    std::string replay_path;
    bool json_mode = false;
};

void printUsage() {
    std::cerr << "Usage: optionlab_backtest --config <strategy.json> --data <chain.csv>\n"
              << "                          [--start YYYY-MM-DD] [--end YYYY-MM-DD]\n"
              << "                          [--log-dir <dir>] [--audit-out <file.jsonl>] [--json]\n"
              << "       optionlab_backtest --replay <file.jsonl> [--log-dir <dir>] [--json]\n";
}

bool parseArgs(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            options.json_mode = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        if (arg == "--config") {
            options.config_path = argv[++i];
        } else if (arg == "--data") {
            options.data_path = argv[++i];
        } else if (arg == "--log-dir") {
            options.log_dir = argv[++i];
        } else if (arg == "--audit-out") {
            options.audit_out = argv[++i];
        } else if (arg == "--start") {
            options.start_date = argv[++i];
        } else if (arg == "--end") {
            options.end_date = argv[++i];
        } else if (arg == "--replay") {
            options.replay_path = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    if (!options.replay_path.empty()) {
        return true;
    }
    return !options.config_path.empty() && !options.data_path.empty();
}

void printSummary(const backtest::BacktestResult& result) {
    const auto& m = result.metrics;
    std::cout << "\nBacktest result (" << result.strategy_name << " on " << result.symbol << ")\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Run id:        " << result.run_id << "\n";
    std::cout << "Audit digest:  " << result.audit_digest << "\n";
    std::cout << "Period:        " << result.start_date << " ~ " << result.end_date
              << " (" << result.days_processed << " days, " << result.gap_days << " gaps)\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Final value:   " << m.final_value << "\n";
    std::cout << "Total return:  " << (m.total_return * 100.0) << "%\n";
    std::cout << "Annualized:    " << (m.annualized_return * 100.0) << "%\n";
    std::cout << "MDD:           " << (m.max_drawdown * 100.0) << "%\n";
    std::cout << "Sharpe:        " << std::setprecision(3) << m.sharpe_ratio << "\n";
    std::cout << "Sortino:       " << m.sortino_ratio << "\n";
    std::cout << "Total trades:  " << m.total_trades << "\n";
    std::cout << "Wins/Losses:   " << m.winning_trades << " / " << m.losing_trades << "\n";
    std::cout << std::setprecision(2);
    std::cout << "Win rate:      " << (m.win_rate * 100.0) << "%\n";
    std::cout << "Avg win:       " << m.avg_win << "\n";
    std::cout << "Avg loss:      " << m.avg_loss << "\n";
    std::cout << "Profit Factor: " << std::setprecision(3) << m.profit_factor << "\n";
    std::cout << "Expectancy:    " << std::setprecision(2) << m.expectancy << " /trade\n";
    std::cout << "Compliance:    delta " << (m.delta_compliance * 100.0) << "%, DTE "
              << (m.dte_compliance * 100.0) << "%, score " << m.compliance_score << "\n";
    if (!m.exit_reason_counts.empty()) {
        std::cout << "Exit reasons:\n";
        for (const auto& [reason, count] : m.exit_reason_counts) {
            std::cout << "  - " << reason << ": " << count << "\n";
        }
    }
    std::cout << "---------------------------------------------\n";
}

// Rebuilds a finished run from its audit file alone
int replayAudit(const CliOptions& options) {
    if (!std::filesystem::exists(options.replay_path)) {
        std::cerr << "Audit file not found: " << options.replay_path << "\n";
        return 1;
    }
    const auto entries = core::AuditJournal::readJsonl(options.replay_path);
    const auto replay = backtest::AuditReplay::rebuild(entries);
    const auto& m = replay.metrics;

    if (options.json_mode) {
        nlohmann::json j;
        j["run_id"] = replay.run_id;
        j["entries"] = replay.entries;
        j["skipped_entries"] = replay.skipped_entries;
        j["stale_marks"] = replay.stale_marks;
        j["data_gaps"] = replay.data_gaps;
        j["quote_anomalies"] = replay.quote_anomalies;
        j["metrics"] = backtest::toJson(m);
        std::cout << j.dump() << "\n";
        return 0;
    }

    std::cout << "\nReplayed audit " << options.replay_path << " (" << entries.size() << " lines)\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Run id:        " << replay.run_id << "\n";
    std::cout << "Entries:       " << replay.entries << " (skipped " << replay.skipped_entries << ")\n";
    std::cout << "Stale marks:   " << replay.stale_marks << ", gaps " << replay.data_gaps
              << ", anomalies " << replay.quote_anomalies << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Final value:   " << m.final_value << "\n";
    std::cout << "Total return:  " << (m.total_return * 100.0) << "%\n";
    std::cout << "MDD:           " << (m.max_drawdown * 100.0) << "%\n";
    std::cout << "Total trades:  " << m.total_trades << "\n";
    std::cout << "Total P&L:     " << m.total_pnl << "\n";
    std::cout << "---------------------------------------------\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 1;
    }

    try {
        // JSON mode keeps stdout clean for the result document
        Logger::getInstance().initialize(options.log_dir, !options.json_mode);

        if (!options.replay_path.empty()) {
            return replayAudit(options);
        }

        const auto config = strategy::StrategyConfigLoader::loadFile(options.config_path);

        if (!std::filesystem::exists(options.data_path)) {
            std::cerr << "Option chain file not found: " << options.data_path << "\n";
            return 1;
        }
        const auto provider = backtest::DataHistory::loadOptionChainCSV(options.data_path);

        backtest::BacktestContext context{provider, config, options.start_date, options.end_date, std::nullopt};
        backtest::BacktestEngine engine(std::move(context));
        const auto result = engine.run();

        if (!options.audit_out.empty()) {
            if (!engine.journal().writeJsonl(options.audit_out)) {
                std::cerr << "Failed to write audit log: " << options.audit_out << "\n";
                return 1;
            }
            LOG_INFO("Audit log written to {} ({} lines)", options.audit_out, result.audit_log.size());
        }

        if (options.json_mode) {
            std::cout << backtest::toJson(result).dump() << "\n";
        } else {
            printSummary(result);
        }
        return 0;
    } catch (const ConfigValidationError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
