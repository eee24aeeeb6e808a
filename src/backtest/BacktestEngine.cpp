#include "backtest/BacktestEngine.h"
#include "analytics/TechnicalIndicators.h"
#include "backtest/BacktestSchema.h"
#include "backtest/DataHistory.h"
#include "backtest/ExitEvaluator.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Hashing.h"
#include "common/Logger.h"
#include "strategy/StrategyConfigLoader.h"

#include <algorithm>

namespace optionlab {
namespace backtest {

namespace {

BacktestContext prepare(BacktestContext context) {
    strategy::StrategyConfigLoader::sortExitRules(context.strategy.exit_rules);
    strategy::StrategyConfigLoader::validate(context.strategy);

    if (!context.start_date.empty() && !utils::DateUtils::isValid(context.start_date)) {
        throw ConfigValidationError("start_date", "'" + context.start_date + "' is not a YYYY-MM-DD date");
    }
    if (!context.end_date.empty() && !utils::DateUtils::isValid(context.end_date)) {
        throw ConfigValidationError("end_date", "'" + context.end_date + "' is not a YYYY-MM-DD date");
    }
    if (!context.start_date.empty() && !context.end_date.empty() &&
        context.end_date < context.start_date) {
        throw ConfigValidationError("end_date", "end_date is before start_date");
    }
    if (context.calendar) {
        for (const auto& date : *context.calendar) {
            if (!utils::DateUtils::isValid(date)) {
                throw ConfigValidationError("calendar", "'" + date + "' is not a YYYY-MM-DD date");
            }
        }
    }
    return context;
}

} // namespace

std::string toString(BacktestEngine::State state) {
    switch (state) {
        case BacktestEngine::State::INITIALIZING: return "INITIALIZING";
        case BacktestEngine::State::RUNNING: return "RUNNING";
        case BacktestEngine::State::FINALIZING: return "FINALIZING";
        case BacktestEngine::State::COMPLETED: return "COMPLETED";
    }
    return "INITIALIZING";
}

BacktestEngine::BacktestEngine(BacktestContext context)
    : context_(prepare(std::move(context)))
    , selector_(context_.strategy)
    , filter_(context_.strategy.market_filters)
    , tracker_(context_.strategy.option_selection.fill_price)
    , recorder_(context_.strategy.option_selection) {
    history_capacity_ = static_cast<size_t>(std::max(200, context_.strategy.requiredHistory()));
    LOG_INFO("BacktestEngine initialized: strategy '{}' on {}, {} exit rules",
             context_.strategy.name, context_.strategy.symbol, context_.strategy.exit_rules.size());
}

std::string BacktestEngine::runId(const std::string& strategy_name,
                                  const std::string& symbol,
                                  const std::string& start_date,
                                  const std::string& end_date) {
    const std::string key = strategy_name + "|" + symbol + "|" + start_date + "|" + end_date;
    return utils::Hashing::sha256Hex(key).substr(0, 16);
}

void BacktestEngine::reset() {
    state_ = State::INITIALIZING;
    tracker_ = PositionTracker(context_.strategy.option_selection.fill_price);
    recorder_ = TradeRecorder(context_.strategy.option_selection);
    cash_ = context_.strategy.risk.initial_capital;
    history_.clear();
    last_entry_date_.clear();
    equity_curve_.clear();
    gap_days_ = 0;
}

std::vector<std::string> BacktestEngine::simulationDays() const {
    std::vector<std::string> dates = context_.calendar ? *context_.calendar
                                                       : context_.provider.tradingDates();
    std::sort(dates.begin(), dates.end());
    dates.erase(std::unique(dates.begin(), dates.end()), dates.end());
    return DataHistory::filterByDate(dates, context_.start_date, context_.end_date);
}

BacktestResult BacktestEngine::run() {
    reset();
    const auto days = simulationDays();
    const auto& config = context_.strategy;

    BacktestResult result;
    result.strategy_name = config.name;
    result.symbol = config.symbol;
    result.start_date = days.empty() ? context_.start_date : days.front();
    result.end_date = days.empty() ? context_.end_date : days.back();
    result.run_id = runId(config.name, config.symbol, result.start_date, result.end_date);

    nlohmann::json start_payload;
    start_payload["run_id"] = result.run_id;
    start_payload["strategy"] = config.name;
    start_payload["symbol"] = config.symbol;
    start_payload["start_date"] = result.start_date;
    start_payload["end_date"] = result.end_date;
    start_payload["initial_capital"] = config.risk.initial_capital;
    start_payload["days"] = days.size();
    recorder_.recordEvent(core::AuditEventType::RUN_START, result.start_date,
                          "run " + result.run_id + " started", "", start_payload, cash_);

    LOG_INFO("Starting backtest '{}' on {} from {} to {} ({} days)",
             config.name, config.symbol, result.start_date, result.end_date, days.size());

    state_ = State::RUNNING;
    for (size_t i = 0; i < days.size(); ++i) {
        const std::string& date = days[i];
        const bool final_day = (i + 1 == days.size());
        if (final_day) {
            state_ = State::FINALIZING;
        }

        const auto snapshot = context_.provider.snapshot(date);
        if (!snapshot) {
            processGap(date, final_day, "no snapshot");
        } else if (snapshot->date != date) {
            processGap(date, final_day, "snapshot dated " + snapshot->date);
        } else if (snapshot->empty()) {
            processGap(date, final_day, "empty snapshot");
        } else {
            processDay(*snapshot, final_day);
        }
    }

    state_ = State::FINALIZING;
    result.trades = recorder_.trades();
    result.equity_curve = equity_curve_;
    result.metrics = PerformanceMetrics::compute(result.trades, result.equity_curve, config.risk.initial_capital);
    result.days_processed = static_cast<int>(days.size());
    result.gap_days = gap_days_;

    nlohmann::json end_payload;
    end_payload["trades"] = result.trades.size();
    end_payload["final_value"] = result.metrics.final_value;
    end_payload["total_return"] = result.metrics.total_return;
    end_payload["gap_days"] = gap_days_;
    recorder_.recordEvent(core::AuditEventType::RUN_END, result.end_date,
                          "run " + result.run_id + " completed", "", end_payload, cash_);
    result.audit_log = recorder_.journal().lines();
    result.audit_digest = utils::Hashing::sha256Hex(result.audit_log);

    LOG_INFO("Backtest Completed. {} trades, final value {:.2f} ({:+.2f}%), max drawdown {:.2f}%",
             result.trades.size(), result.metrics.final_value,
             result.metrics.total_return * 100.0, result.metrics.max_drawdown * 100.0);

    state_ = State::COMPLETED;
    return result;
}

void BacktestEngine::processDay(const MarketSnapshot& snapshot, bool final_day) {
    appendHistory(snapshot);

    // 1. Mark open positions to today's quotes
    for (const auto& outcome : tracker_.markAll(snapshot)) {
        const Position& position = tracker_.get(outcome.position_id);
        if (outcome.stale) {
            nlohmann::json payload;
            payload["position_id"] = position.id;
            payload["mark"] = outcome.mark;
            payload["last_quote_date"] = position.last_quote_date;
            recorder_.recordEvent(core::AuditEventType::STALE_MARK, snapshot.date,
                                  "no usable quote, mark carried from " + position.last_quote_date,
                                  position.contract.toString(), payload, cash_);
            LOG_WARN("[{}] stale mark for {} (last quote {})",
                     snapshot.date, position.contract.toString(), position.last_quote_date);
        } else if (outcome.intrinsic) {
            LOG_DEBUG("[{}] {} expired without a quote, marked at intrinsic {:.2f}",
                      snapshot.date, position.contract.toString(), outcome.mark);
        }
    }

    // 2. Exits
    manageExits(snapshot);

    // 3. Entry
    manageEntry(snapshot);

    // Nothing stays open past the last simulated day
    if (final_day) {
        forceCloseAll(snapshot.date, &snapshot);
    }

    // 4. Equity
    recordEquity(snapshot.date);
}

void BacktestEngine::processGap(const std::string& date, bool final_day, const std::string& reason) {
    gap_days_++;
    const auto carried = tracker_.carryForward(date);

    nlohmann::json payload;
    payload["reason"] = reason;
    payload["open_positions"] = carried.size();
    recorder_.recordEvent(core::AuditEventType::DATA_GAP, date,
                          reason + ": entries skipped, " + std::to_string(carried.size()) +
                          " open positions carried forward",
                          "", payload, cash_);
    LOG_WARN("[{}] data gap ({}), {} open positions carried forward", date, reason, carried.size());

    if (final_day) {
        forceCloseAll(date, nullptr);
    }
    recordEquity(date);
}

void BacktestEngine::manageExits(const MarketSnapshot& snapshot) {
    struct PendingExit {
        std::uint64_t id;
        ExitVerdict verdict;
    };

    const auto closes = historyCloses();
    std::vector<PendingExit> pending;

    // Closures are applied after the scan so the open set is never mutated while iterated
    for (const auto id : tracker_.openIds()) {
        const Position& position = tracker_.get(id);
        auto verdict = ExitEvaluator::evaluate(position, snapshot, context_.strategy.exit_rules, closes);
        if (verdict) {
            tracker_.markExitPending(id);
            pending.push_back({id, std::move(*verdict)});
        }
    }

    for (const auto& exit : pending) {
        closePosition(exit.id, exit.verdict.reason, exit.verdict.detail, snapshot.date, &snapshot);
    }
}

void BacktestEngine::manageEntry(const MarketSnapshot& snapshot) {
    const auto& config = context_.strategy;
    const std::string& date = snapshot.date;

    if (tracker_.openCount() >= config.risk.max_concurrent_positions) {
        recorder_.recordEvent(core::AuditEventType::MAX_POSITIONS, date,
                              std::to_string(tracker_.openCount()) + " open positions, max " +
                              std::to_string(config.risk.max_concurrent_positions),
                              "", nlohmann::json::object(), cash_);
        return;
    }

    if (config.risk.entry_frequency_days > 0 && !last_entry_date_.empty()) {
        const int since = utils::DateUtils::daysBetween(last_entry_date_, date).value_or(0);
        if (since < config.risk.entry_frequency_days) {
            nlohmann::json payload;
            payload["last_entry_date"] = last_entry_date_;
            payload["days_since"] = since;
            recorder_.recordEvent(core::AuditEventType::ENTRY_THROTTLED, date,
                                  std::to_string(since) + " days since last entry, need " +
                                  std::to_string(config.risk.entry_frequency_days),
                                  "", payload, cash_);
            return;
        }
    }

    std::string filter_rationale;
    if (config.market_filters.anyEnabled()) {
        const auto decision = filter_.allowEntry(date, snapshot, history_, config.option_selection.type);
        filter_rationale = decision.rationale();
        if (!decision.allowed) {
            nlohmann::json checks = nlohmann::json::array();
            for (const auto& check : decision.checks) {
                checks.push_back({{"name", check.name}, {"passed", check.passed},
                                  {"insufficient_history", check.insufficient_history},
                                  {"message", check.message}});
            }
            recorder_.recordEvent(core::AuditEventType::FILTER_BLOCKED, date, filter_rationale,
                                  "", {{"checks", checks}}, cash_);
            LOG_DEBUG("[{}] entry blocked by market filters: {}", date, filter_rationale);
            return;
        }
    }

    const auto selection = selector_.select(snapshot, snapshot.underlying_price,
                                            tracker_.openCount(), tracker_.heldContracts());
    for (const auto& anomaly : selection.anomalies) {
        recorder_.recordEvent(core::AuditEventType::QUOTE_ANOMALY, date, anomaly.reason,
                              anomaly.contract.toString(), nlohmann::json::object(), cash_);
    }
    if (!selection.selection) {
        recorder_.recordEvent(core::AuditEventType::NO_CONTRACT, date, selection.rationale,
                              "", {{"funnel", toJson(selection.funnel)}}, cash_);
        return;
    }

    const SelectedContract& selected = *selection.selection;
    const PositionSizing sizing = selector_.size(selected.fill_price, cash_);
    if (sizing.contracts <= 0) {
        nlohmann::json payload;
        payload["fill_price"] = selected.fill_price;
        payload["cash"] = cash_;
        recorder_.recordEvent(core::AuditEventType::INSUFFICIENT_CAPITAL, date, sizing.rationale,
                              selected.quote.contract.toString(), payload, cash_);
        return;
    }

    const std::uint64_t id = tracker_.open(config.symbol, selected, sizing, snapshot);
    cash_ -= sizing.entry_cost;
    last_entry_date_ = date;

    std::string rationale = selection.rationale + "; " + sizing.rationale;
    if (!filter_rationale.empty()) {
        rationale += "; filters: " + filter_rationale;
    }
    recorder_.recordOpen(tracker_.get(id), cash_, selection.funnel, rationale);
}

void BacktestEngine::forceCloseAll(const std::string& date, const MarketSnapshot* snapshot) {
    const std::string reason = strategy::toString(strategy::ExitCondition::END_OF_PERIOD);
    for (const auto id : tracker_.openIds()) {
        tracker_.markExitPending(id);
    }
    for (const auto id : tracker_.openIds()) {
        closePosition(id, reason, "forced close at final mark", date, snapshot);
    }
}

void BacktestEngine::closePosition(std::uint64_t id, const std::string& reason, const std::string& detail,
                                   const std::string& date, const MarketSnapshot* snapshot) {
    const Position& position = tracker_.get(id);
    const Price exit_price = position.current_mark;
    cash_ += exit_price * position.contracts * kContractMultiplier;
    tracker_.close(id);
    recorder_.recordClose(tracker_.get(id), reason, detail, exit_price, date, snapshot, cash_);
}

void BacktestEngine::recordEquity(const std::string& date) {
    EquityPoint point;
    point.date = date;
    point.cash = cash_;
    point.positions_value = tracker_.openMarketValue();
    point.total_value = point.cash + point.positions_value;
    point.open_positions = tracker_.openCount();
    equity_curve_.push_back(point);
    recorder_.recordEquity(point);
}

void BacktestEngine::appendHistory(const MarketSnapshot& snapshot) {
    UnderlyingBar bar;
    bar.date = snapshot.date;
    bar.close = snapshot.underlying_price;
    if (const auto iv = analytics::MarketConditionFilter::atmImpliedVolatility(snapshot)) {
        bar.atm_iv = *iv;
        bar.has_atm_iv = true;
    }
    history_.push_back(bar);
    if (history_.size() > history_capacity_) {
        history_.erase(history_.begin()); // Keep window size
    }
}

std::vector<double> BacktestEngine::historyCloses() const {
    return analytics::TechnicalIndicators::extractClosePrices(history_);
}

nlohmann::json toJson(const BacktestResult& result) {
    nlohmann::json j;
    j["run_id"] = result.run_id;
    j["strategy"] = result.strategy_name;
    j["symbol"] = result.symbol;
    j["start_date"] = result.start_date;
    j["end_date"] = result.end_date;
    j["days_processed"] = result.days_processed;
    j["gap_days"] = result.gap_days;

    j["trades"] = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        j["trades"].push_back(toJson(trade));
    }
    j["equity_curve"] = nlohmann::json::array();
    for (const auto& point : result.equity_curve) {
        j["equity_curve"].push_back(toJson(point));
    }
    j["metrics"] = toJson(result.metrics);
    j["audit_log"] = result.audit_log;
    j["audit_digest"] = result.audit_digest;
    return j;
}

} // namespace backtest
} // namespace optionlab
