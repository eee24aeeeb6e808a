#include "strategy/StrategyConfigLoader.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <set>

namespace optionlab {
namespace strategy {

namespace {
using nlohmann::json;

std::string joinPath(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

void requireObject(const json& node, const std::string& path) {
    if (!node.is_object()) {
        throw ConfigValidationError(path.empty() ? "<root>" : path, "expected an object");
    }
}

void rejectUnknownKeys(const json& node, const std::string& path,
                       std::initializer_list<const char*> allowed) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        bool known = false;
        for (const char* key : allowed) {
            if (it.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            throw ConfigValidationError(joinPath(path, it.key()), "unknown field");
        }
    }
}

double readNumber(const json& node, const std::string& key, const std::string& path, double def) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return def;
    }
    const auto& v = node.at(key);
    if (!v.is_number()) {
        throw ConfigValidationError(joinPath(path, key), "expected a number");
    }
    return v.get<double>();
}

std::optional<double> readOptionalNumber(const json& node, const std::string& key, const std::string& path) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return readNumber(node, key, path, 0.0);
}

long long readInteger(const json& node, const std::string& key, const std::string& path, long long def) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return def;
    }
    const auto& v = node.at(key);
    if (!v.is_number_integer()) {
        throw ConfigValidationError(joinPath(path, key), "expected an integer");
    }
    return v.get<long long>();
}

int readInt(const json& node, const std::string& key, const std::string& path, int def) {
    const long long value = readInteger(node, key, path, def);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigValidationError(joinPath(path, key), "integer out of range");
    }
    return static_cast<int>(value);
}

bool readBool(const json& node, const std::string& key, const std::string& path, bool def) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return def;
    }
    const auto& v = node.at(key);
    if (!v.is_boolean()) {
        throw ConfigValidationError(joinPath(path, key), "expected true or false");
    }
    return v.get<bool>();
}

std::string readString(const json& node, const std::string& key, const std::string& path, const std::string& def) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return def;
    }
    const auto& v = node.at(key);
    if (!v.is_string()) {
        throw ConfigValidationError(joinPath(path, key), "expected a string");
    }
    return v.get<std::string>();
}

void requireRange(double value, double lo, double hi, const std::string& field) {
    if (!(value >= lo && value <= hi)) {
        throw ConfigValidationError(field, "must be within [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

void requirePositive(double value, const std::string& field) {
    if (!(value > 0.0)) {
        throw ConfigValidationError(field, "must be greater than zero");
    }
}

OptionSelectionConfig parseOptionSelection(const json& node) {
    const std::string path = "option_selection";
    requireObject(node, path);
    rejectUnknownKeys(node, path, {"type", "fill_price", "delta", "dte", "liquidity"});

    OptionSelectionConfig cfg;

    const std::string type = readString(node, "type", path, "call");
    if (type == "call") cfg.type = OptionTypeBias::CALL;
    else if (type == "put") cfg.type = OptionTypeBias::PUT;
    else if (type == "either") cfg.type = OptionTypeBias::EITHER;
    else throw ConfigValidationError(path + ".type", "expected call, put or either, got '" + type + "'");

    const std::string fill = readString(node, "fill_price", path, "close");
    if (fill == "close") cfg.fill_price = FillPriceMode::CLOSE;
    else if (fill == "mid") cfg.fill_price = FillPriceMode::MID;
    else throw ConfigValidationError(path + ".fill_price", "expected close or mid, got '" + fill + "'");

    if (node.contains("delta")) {
        const auto& d = node.at("delta");
        const std::string dpath = path + ".delta";
        requireObject(d, dpath);
        rejectUnknownKeys(d, dpath, {"target", "tolerance", "min", "max"});
        cfg.delta.target = readNumber(d, "target", dpath, cfg.delta.target);
        cfg.delta.tolerance = readOptionalNumber(d, "tolerance", dpath);
        cfg.delta.min = readNumber(d, "min", dpath, cfg.delta.min);
        cfg.delta.max = readNumber(d, "max", dpath, cfg.delta.max);
    }

    if (node.contains("dte")) {
        const auto& d = node.at("dte");
        const std::string dpath = path + ".dte";
        requireObject(d, dpath);
        rejectUnknownKeys(d, dpath, {"target", "min", "max"});
        cfg.dte.target = readInt(d, "target", dpath, cfg.dte.target);
        cfg.dte.min = readInt(d, "min", dpath, cfg.dte.min);
        cfg.dte.max = readInt(d, "max", dpath, cfg.dte.max);
    }

    if (node.contains("liquidity")) {
        const auto& l = node.at("liquidity");
        const std::string lpath = path + ".liquidity";
        requireObject(l, lpath);
        rejectUnknownKeys(l, lpath, {"min_volume", "max_volume", "max_spread_pct"});
        cfg.liquidity.min_volume = readInteger(l, "min_volume", lpath, cfg.liquidity.min_volume);
        if (l.contains("max_volume") && !l.at("max_volume").is_null()) {
            cfg.liquidity.max_volume = readInteger(l, "max_volume", lpath, 0);
        }
        cfg.liquidity.max_spread_pct = readNumber(l, "max_spread_pct", lpath, cfg.liquidity.max_spread_pct);
    }

    return cfg;
}

ExitRule parseExitRule(const json& node, const std::string& path) {
    requireObject(node, path);
    if (!node.contains("condition")) {
        throw ConfigValidationError(path + ".condition", "missing");
    }

    const std::string name = readString(node, "condition", path, "");
    const auto condition = exitConditionFromString(name);
    if (!condition) {
        throw ConfigValidationError(path + ".condition", "unknown exit condition '" + name + "'");
    }
    if (*condition == ExitCondition::EXPIRATION || *condition == ExitCondition::END_OF_PERIOD) {
        throw ConfigValidationError(path + ".condition", "'" + name + "' is always applied and cannot be configured");
    }

    ExitRule rule;
    rule.condition = *condition;

    switch (rule.condition) {
        case ExitCondition::PROFIT_TARGET:
            rejectUnknownKeys(node, path, {"condition", "target_pct"});
            rule.target_pct = readNumber(node, "target_pct", path, rule.target_pct);
            break;
        case ExitCondition::STOP_LOSS:
            rejectUnknownKeys(node, path, {"condition", "stop_pct"});
            rule.stop_pct = readNumber(node, "stop_pct", path, rule.stop_pct);
            break;
        case ExitCondition::DELTA_STOP:
            rejectUnknownKeys(node, path, {"condition", "min_delta", "iv_adjusted"});
            rule.min_delta = readNumber(node, "min_delta", path, rule.min_delta);
            rule.iv_adjusted = readBool(node, "iv_adjusted", path, rule.iv_adjusted);
            break;
        case ExitCondition::INDICATOR_EXIT: {
            rejectUnknownKeys(node, path, {"condition", "indicator", "period", "exit_level", "std_dev", "band_pct"});
            const std::string indicator = readString(node, "indicator", path, "rsi");
            if (indicator == "rsi") rule.indicator = IndicatorKind::RSI;
            else if (indicator == "bollinger") rule.indicator = IndicatorKind::BOLLINGER;
            else throw ConfigValidationError(path + ".indicator", "expected rsi or bollinger, got '" + indicator + "'");
            rule.period = readInt(node, "period", path, rule.indicator == IndicatorKind::RSI ? 14 : 20);
            rule.exit_level = readNumber(node, "exit_level", path, rule.exit_level);
            rule.std_dev = readNumber(node, "std_dev", path, rule.std_dev);
            rule.band_pct = readOptionalNumber(node, "band_pct", path);
            break;
        }
        case ExitCondition::TIME_STOP:
            rejectUnknownKeys(node, path, {"condition", "max_days"});
            rule.max_days = readInt(node, "max_days", path, rule.max_days);
            break;
        case ExitCondition::DTE_STOP:
            rejectUnknownKeys(node, path, {"condition", "min_dte"});
            rule.min_dte = readInt(node, "min_dte", path, rule.min_dte);
            break;
        case ExitCondition::EXPIRATION:
        case ExitCondition::END_OF_PERIOD:
            break;
    }
    return rule;
}

RiskConfig parseRisk(const json& node) {
    const std::string path = "risk";
    requireObject(node, path);
    rejectUnknownKeys(node, path, {"initial_capital", "position_size_fraction", "max_concurrent_positions",
                                   "commission_per_contract", "max_contracts", "entry_frequency_days"});
    RiskConfig cfg;
    cfg.initial_capital = readNumber(node, "initial_capital", path, cfg.initial_capital);
    cfg.position_size_fraction = readNumber(node, "position_size_fraction", path, cfg.position_size_fraction);
    cfg.max_concurrent_positions = readInt(node, "max_concurrent_positions", path, cfg.max_concurrent_positions);
    cfg.commission_per_contract = readNumber(node, "commission_per_contract", path, cfg.commission_per_contract);
    cfg.max_contracts = readInt(node, "max_contracts", path, cfg.max_contracts);
    cfg.entry_frequency_days = readInt(node, "entry_frequency_days", path, cfg.entry_frequency_days);
    return cfg;
}

MarketFilterConfig parseMarketFilters(const json& node) {
    const std::string path = "market_filters";
    requireObject(node, path);
    rejectUnknownKeys(node, path, {"trend_filter", "volatility_regime", "iv_regime",
                                   "rsi_filter", "bollinger_bands", "or_groups"});
    MarketFilterConfig cfg;

    if (node.contains("trend_filter")) {
        const auto& n = node.at("trend_filter");
        const std::string p = path + ".trend_filter";
        requireObject(n, p);
        rejectUnknownKeys(n, p, {"enabled", "period", "require_above_ma"});
        cfg.trend.enabled = readBool(n, "enabled", p, true);
        cfg.trend.period = readInt(n, "period", p, cfg.trend.period);
        cfg.trend.require_above_ma = readBool(n, "require_above_ma", p, cfg.trend.require_above_ma);
    }

    if (node.contains("volatility_regime")) {
        const auto& n = node.at("volatility_regime");
        const std::string p = path + ".volatility_regime";
        requireObject(n, p);
        rejectUnknownKeys(n, p, {"enabled", "lookback", "method", "ewma_alpha",
                                 "low_percentile", "high_percentile", "allowed"});
        auto& v = cfg.volatility_regime;
        v.enabled = readBool(n, "enabled", p, true);
        v.params.lookback = readInt(n, "lookback", p, v.params.lookback);
        const std::string method = readString(n, "method", p, "percentile");
        if (method == "percentile") v.params.method = analytics::RegimeMethod::PERCENTILE;
        else if (method == "ewma") v.params.method = analytics::RegimeMethod::EWMA;
        else throw ConfigValidationError(p + ".method", "expected percentile or ewma, got '" + method + "'");
        v.params.ewma_alpha = readNumber(n, "ewma_alpha", p, v.params.ewma_alpha);
        v.params.low_percentile = readNumber(n, "low_percentile", p, v.params.low_percentile);
        v.params.high_percentile = readNumber(n, "high_percentile", p, v.params.high_percentile);
        if (n.contains("allowed")) {
            const auto& allowed = n.at("allowed");
            if (!allowed.is_array()) {
                throw ConfigValidationError(p + ".allowed", "expected an array");
            }
            v.allowed.clear();
            for (const auto& item : allowed) {
                analytics::VolatilityRegime regime = analytics::VolatilityRegime::UNKNOWN;
                if (!item.is_string() || !analytics::volatilityRegimeFromString(item.get<std::string>(), regime)) {
                    throw ConfigValidationError(p + ".allowed", "expected low, normal or high");
                }
                v.allowed.push_back(regime);
            }
        }
    }

    if (node.contains("iv_regime")) {
        const auto& n = node.at("iv_regime");
        const std::string p = path + ".iv_regime";
        requireObject(n, p);
        rejectUnknownKeys(n, p, {"enabled", "min_iv", "max_iv"});
        cfg.iv_regime.enabled = readBool(n, "enabled", p, true);
        cfg.iv_regime.min_iv = readNumber(n, "min_iv", p, cfg.iv_regime.min_iv);
        cfg.iv_regime.max_iv = readNumber(n, "max_iv", p, cfg.iv_regime.max_iv);
    }

    if (node.contains("rsi_filter")) {
        const auto& n = node.at("rsi_filter");
        const std::string p = path + ".rsi_filter";
        requireObject(n, p);
        rejectUnknownKeys(n, p, {"enabled", "period", "oversold", "overbought"});
        cfg.rsi.enabled = readBool(n, "enabled", p, true);
        cfg.rsi.period = readInt(n, "period", p, cfg.rsi.period);
        cfg.rsi.oversold = readNumber(n, "oversold", p, cfg.rsi.oversold);
        cfg.rsi.overbought = readNumber(n, "overbought", p, cfg.rsi.overbought);
    }

    if (node.contains("bollinger_bands")) {
        const auto& n = node.at("bollinger_bands");
        const std::string p = path + ".bollinger_bands";
        requireObject(n, p);
        rejectUnknownKeys(n, p, {"enabled", "period", "std_dev", "lower_band_threshold", "upper_band_threshold"});
        cfg.bollinger.enabled = readBool(n, "enabled", p, true);
        cfg.bollinger.period = readInt(n, "period", p, cfg.bollinger.period);
        cfg.bollinger.std_dev = readNumber(n, "std_dev", p, cfg.bollinger.std_dev);
        cfg.bollinger.lower_band_threshold = readNumber(n, "lower_band_threshold", p, cfg.bollinger.lower_band_threshold);
        cfg.bollinger.upper_band_threshold = readNumber(n, "upper_band_threshold", p, cfg.bollinger.upper_band_threshold);
    }

    if (node.contains("or_groups")) {
        const auto& groups = node.at("or_groups");
        const std::string p = path + ".or_groups";
        requireObject(groups, p);
        for (auto it = groups.begin(); it != groups.end(); ++it) {
            if (!it.value().is_array()) {
                throw ConfigValidationError(joinPath(p, it.key()), "expected an array of filter names");
            }
            std::vector<std::string> members;
            for (const auto& member : it.value()) {
                if (!member.is_string()) {
                    throw ConfigValidationError(joinPath(p, it.key()), "expected an array of filter names");
                }
                members.push_back(member.get<std::string>());
            }
            cfg.or_groups[it.key()] = members;
        }
    }

    return cfg;
}
}

const std::vector<std::string>& StrategyConfigLoader::filterNames() {
    static const std::vector<std::string> kNames = {
        "trend_filter", "volatility_regime", "iv_regime", "rsi_filter", "bollinger_bands"
    };
    return kNames;
}

StrategyConfig StrategyConfigLoader::fromJson(const nlohmann::json& document) {
    requireObject(document, "");
    rejectUnknownKeys(document, "", {"name", "symbol", "option_selection", "exit_rules",
                                     "risk", "market_filters"});

    StrategyConfig config;
    config.name = readString(document, "name", "", config.name);
    config.symbol = readString(document, "symbol", "", config.symbol);

    if (!document.contains("option_selection")) {
        throw ConfigValidationError("option_selection", "missing");
    }
    config.option_selection = parseOptionSelection(document.at("option_selection"));

    if (document.contains("exit_rules")) {
        const auto& rules = document.at("exit_rules");
        if (!rules.is_array()) {
            throw ConfigValidationError("exit_rules", "expected an array");
        }
        for (size_t i = 0; i < rules.size(); ++i) {
            config.exit_rules.push_back(parseExitRule(rules.at(i), "exit_rules[" + std::to_string(i) + "]"));
        }
    }
    sortExitRules(config.exit_rules);

    if (document.contains("risk")) {
        config.risk = parseRisk(document.at("risk"));
    }
    if (document.contains("market_filters")) {
        config.market_filters = parseMarketFilters(document.at("market_filters"));
    }

    validate(config);
    return config;
}

StrategyConfig StrategyConfigLoader::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigValidationError(path, "cannot open strategy file");
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigValidationError(path, std::string("malformed JSON: ") + e.what());
    }

    StrategyConfig config = fromJson(document);
    LOG_INFO("Strategy '{}' loaded from {} ({} exit rules)", config.name, path, config.exit_rules.size());
    return config;
}

void StrategyConfigLoader::validate(const StrategyConfig& config) {
    if (config.symbol.empty()) {
        throw ConfigValidationError("symbol", "must not be empty");
    }

    const auto& sel = config.option_selection;
    if (!(sel.delta.target > 0.0 && sel.delta.target <= 1.0)) {
        throw ConfigValidationError("option_selection.delta.target", "must be within (0, 1]");
    }
    if (sel.delta.tolerance && *sel.delta.tolerance < 0.0) {
        throw ConfigValidationError("option_selection.delta.tolerance", "must not be negative");
    }
    requireRange(sel.delta.min, 0.0, 1.0, "option_selection.delta.min");
    requireRange(sel.delta.max, 0.0, 1.0, "option_selection.delta.max");
    if (sel.delta.min > sel.delta.max) {
        throw ConfigValidationError("option_selection.delta", "min greater than max");
    }
    if (sel.dte.min < 0) {
        throw ConfigValidationError("option_selection.dte.min", "must not be negative");
    }
    if (sel.dte.min > sel.dte.max) {
        throw ConfigValidationError("option_selection.dte", "min_dte greater than max_dte");
    }
    if (sel.dte.target < 0) {
        throw ConfigValidationError("option_selection.dte.target", "must not be negative");
    }
    if (sel.liquidity.min_volume < 0) {
        throw ConfigValidationError("option_selection.liquidity.min_volume", "must not be negative");
    }
    if (sel.liquidity.max_volume && *sel.liquidity.max_volume < 0) {
        throw ConfigValidationError("option_selection.liquidity.max_volume", "must not be negative");
    }
    requirePositive(sel.liquidity.max_spread_pct, "option_selection.liquidity.max_spread_pct");
    if (sel.liquidity.max_volume && *sel.liquidity.max_volume < sel.liquidity.min_volume) {
        LOG_WARN("Liquidity max_volume {} is below min_volume {}; no contract can qualify",
                 *sel.liquidity.max_volume, sel.liquidity.min_volume);
    }

    for (size_t i = 0; i < config.exit_rules.size(); ++i) {
        const auto& rule = config.exit_rules[i];
        const std::string path = "exit_rules[" + std::to_string(i) + "]";
        switch (rule.condition) {
            case ExitCondition::PROFIT_TARGET:
                requirePositive(rule.target_pct, path + ".target_pct");
                break;
            case ExitCondition::STOP_LOSS:
                if (!(rule.stop_pct > 0.0 && rule.stop_pct <= 1.0)) {
                    throw ConfigValidationError(path + ".stop_pct", "must be within (0, 1]");
                }
                break;
            case ExitCondition::DELTA_STOP:
                if (!(rule.min_delta > 0.0 && rule.min_delta < 1.0)) {
                    throw ConfigValidationError(path + ".min_delta", "must be within (0, 1)");
                }
                break;
            case ExitCondition::INDICATOR_EXIT:
                if (rule.period < 2) {
                    throw ConfigValidationError(path + ".period", "must be at least 2");
                }
                requireRange(rule.exit_level, 0.0, 100.0, path + ".exit_level");
                requirePositive(rule.std_dev, path + ".std_dev");
                if (rule.band_pct) {
                    requireRange(*rule.band_pct, 0.0, 1.0, path + ".band_pct");
                }
                break;
            case ExitCondition::TIME_STOP:
                if (rule.max_days < 1) {
                    throw ConfigValidationError(path + ".max_days", "must be at least 1");
                }
                break;
            case ExitCondition::DTE_STOP:
                if (rule.min_dte < 0) {
                    throw ConfigValidationError(path + ".min_dte", "must not be negative");
                }
                break;
            case ExitCondition::EXPIRATION:
            case ExitCondition::END_OF_PERIOD:
                throw ConfigValidationError(path + ".condition", "implicit exit cannot be configured");
        }
    }

    const auto& risk = config.risk;
    requirePositive(risk.initial_capital, "risk.initial_capital");
    if (!(risk.position_size_fraction > 0.0 && risk.position_size_fraction <= 1.0)) {
        throw ConfigValidationError("risk.position_size_fraction", "must be within (0, 1]");
    }
    if (risk.max_concurrent_positions < 1) {
        throw ConfigValidationError("risk.max_concurrent_positions", "must be at least 1");
    }
    if (risk.commission_per_contract < 0.0) {
        throw ConfigValidationError("risk.commission_per_contract", "must not be negative");
    }
    if (risk.max_contracts < 1) {
        throw ConfigValidationError("risk.max_contracts", "must be at least 1");
    }
    if (risk.entry_frequency_days < 0) {
        throw ConfigValidationError("risk.entry_frequency_days", "must not be negative");
    }

    const auto& f = config.market_filters;
    if (f.trend.enabled && f.trend.period < 1) {
        throw ConfigValidationError("market_filters.trend_filter.period", "must be at least 1");
    }
    if (f.volatility_regime.enabled) {
        const auto& p = f.volatility_regime.params;
        if (p.lookback < 2) {
            throw ConfigValidationError("market_filters.volatility_regime.lookback", "must be at least 2");
        }
        if (!(p.ewma_alpha > 0.0 && p.ewma_alpha <= 1.0)) {
            throw ConfigValidationError("market_filters.volatility_regime.ewma_alpha", "must be within (0, 1]");
        }
        requireRange(p.low_percentile, 0.0, 100.0, "market_filters.volatility_regime.low_percentile");
        requireRange(p.high_percentile, 0.0, 100.0, "market_filters.volatility_regime.high_percentile");
        if (p.low_percentile > p.high_percentile) {
            throw ConfigValidationError("market_filters.volatility_regime", "low_percentile greater than high_percentile");
        }
        if (f.volatility_regime.allowed.empty()) {
            throw ConfigValidationError("market_filters.volatility_regime.allowed", "must not be empty");
        }
    }
    if (f.iv_regime.enabled) {
        if (f.iv_regime.min_iv < 0.0) {
            throw ConfigValidationError("market_filters.iv_regime.min_iv", "must not be negative");
        }
        if (f.iv_regime.min_iv > f.iv_regime.max_iv) {
            throw ConfigValidationError("market_filters.iv_regime", "min_iv greater than max_iv");
        }
    }
    if (f.rsi.enabled) {
        if (f.rsi.period < 2) {
            throw ConfigValidationError("market_filters.rsi_filter.period", "must be at least 2");
        }
        requireRange(f.rsi.oversold, 0.0, 100.0, "market_filters.rsi_filter.oversold");
        requireRange(f.rsi.overbought, 0.0, 100.0, "market_filters.rsi_filter.overbought");
        if (f.rsi.oversold >= f.rsi.overbought) {
            throw ConfigValidationError("market_filters.rsi_filter", "oversold must be below overbought");
        }
    }
    if (f.bollinger.enabled) {
        if (f.bollinger.period < 2) {
            throw ConfigValidationError("market_filters.bollinger_bands.period", "must be at least 2");
        }
        requirePositive(f.bollinger.std_dev, "market_filters.bollinger_bands.std_dev");
        requireRange(f.bollinger.lower_band_threshold, 0.0, 1.0, "market_filters.bollinger_bands.lower_band_threshold");
        requireRange(f.bollinger.upper_band_threshold, 0.0, 1.0, "market_filters.bollinger_bands.upper_band_threshold");
        if (f.bollinger.lower_band_threshold > f.bollinger.upper_band_threshold) {
            throw ConfigValidationError("market_filters.bollinger_bands", "lower threshold above upper threshold");
        }
    }

    std::set<std::string> grouped;
    const auto& names = filterNames();
    for (const auto& [group, members] : f.or_groups) {
        const std::string path = "market_filters.or_groups." + group;
        if (members.empty()) {
            throw ConfigValidationError(path, "must list at least one filter");
        }
        for (const auto& member : members) {
            if (std::find(names.begin(), names.end(), member) == names.end()) {
                throw ConfigValidationError(path, "unknown filter '" + member + "'");
            }
            if (!grouped.insert(member).second) {
                throw ConfigValidationError(path, "filter '" + member + "' belongs to more than one group");
            }
        }
    }
}

void StrategyConfigLoader::sortExitRules(std::vector<ExitRule>& rules) {
    std::stable_sort(rules.begin(), rules.end(), [](const ExitRule& a, const ExitRule& b) {
        return exitPriorityClass(a.condition) < exitPriorityClass(b.condition);
    });
}

} // namespace strategy
} // namespace optionlab
