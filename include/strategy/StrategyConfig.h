#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "analytics/RegimeDetector.h"
#include "common/Types.h"

namespace optionlab {
namespace strategy {

enum class OptionTypeBias { CALL, PUT, EITHER };
enum class FillPriceMode { CLOSE, MID };

std::string toString(OptionTypeBias bias);

struct DeltaCriteria {
    double target = 0.30;
    std::optional<double> tolerance;    // none: best match wins regardless of distance
    double min = 0.0;                   // bounds on |delta|
    double max = 1.0;
};

struct DteCriteria {
    int target = 45;
    int min = 30;
    int max = 60;
};

struct LiquidityCriteria {
    long long min_volume = 0;
    std::optional<long long> max_volume;    // hard cap, never relaxed
    double max_spread_pct = 0.15;           // (ask - bid) / mid
};

struct OptionSelectionConfig {
    OptionTypeBias type = OptionTypeBias::CALL;
    FillPriceMode fill_price = FillPriceMode::CLOSE;
    DeltaCriteria delta;
    DteCriteria dte;
    LiquidityCriteria liquidity;
};

// Listed in evaluation priority class order
enum class ExitCondition {
    PROFIT_TARGET,
    STOP_LOSS,
    DELTA_STOP,
    INDICATOR_EXIT,
    TIME_STOP,
    DTE_STOP,
    EXPIRATION,
    END_OF_PERIOD
};

std::string toString(ExitCondition condition);
std::optional<ExitCondition> exitConditionFromString(const std::string& value);

// 0: P&L, 1: Greeks, 2: indicators, 3: time, 4: expiration
int exitPriorityClass(ExitCondition condition);

enum class IndicatorKind { RSI, BOLLINGER };

// Tagged exit rule; only the fields of its condition are meaningful.
struct ExitRule {
    ExitCondition condition = ExitCondition::PROFIT_TARGET;

    double target_pct = 0.50;           // profit_target
    double stop_pct = 0.30;             // stop_loss
    double min_delta = 0.10;            // delta_stop
    bool iv_adjusted = false;           // delta_stop
    IndicatorKind indicator = IndicatorKind::RSI;   // indicator_exit
    int period = 14;
    double exit_level = 50.0;           // RSI level
    double std_dev = 2.0;               // Bollinger width
    std::optional<double> band_pct;     // Bollinger exit position, default 0.9 calls / 0.1 puts
    int max_days = 30;                  // time_stop (trading days held)
    int min_dte = 7;                    // dte_stop
};

struct RiskConfig {
    double initial_capital = 10000.0;
    double position_size_fraction = 0.05;
    int max_concurrent_positions = 1;
    double commission_per_contract = 0.65;
    int max_contracts = 100;
    int entry_frequency_days = 0;       // min calendar days between entries, 0 = no limit
};

struct TrendFilterConfig {
    bool enabled = false;
    int period = 20;
    bool require_above_ma = true;
};

struct VolatilityRegimeFilterConfig {
    bool enabled = false;
    analytics::RegimeParams params;
    std::vector<analytics::VolatilityRegime> allowed = {
        analytics::VolatilityRegime::LOW, analytics::VolatilityRegime::NORMAL
    };
};

struct IvRegimeFilterConfig {
    bool enabled = false;
    double min_iv = 0.10;
    double max_iv = 0.50;
};

struct RsiFilterConfig {
    bool enabled = false;
    int period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
};

struct BollingerFilterConfig {
    bool enabled = false;
    int period = 20;
    double std_dev = 2.0;
    double lower_band_threshold = 0.2;
    double upper_band_threshold = 0.8;
};

struct MarketFilterConfig {
    TrendFilterConfig trend;
    VolatilityRegimeFilterConfig volatility_regime;
    IvRegimeFilterConfig iv_regime;
    RsiFilterConfig rsi;
    BollingerFilterConfig bollinger;

    // group name -> filter names whose results are OR-ed together
    std::map<std::string, std::vector<std::string>> or_groups;

    bool anyEnabled() const {
        return trend.enabled || volatility_regime.enabled || iv_regime.enabled ||
               rsi.enabled || bollinger.enabled;
    }
};

struct StrategyConfig {
    std::string name = "unnamed";
    std::string symbol = "SPY";
    OptionSelectionConfig option_selection;
    std::vector<ExitRule> exit_rules;   // sorted by priority class, stable
    RiskConfig risk;
    MarketFilterConfig market_filters;

    // Bars of underlying history the filters and indicator exits need
    int requiredHistory() const;
};

} // namespace strategy
} // namespace optionlab
