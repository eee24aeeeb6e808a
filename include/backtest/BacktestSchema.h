#pragma once

#include <nlohmann/json.hpp>

#include "backtest/BacktestTypes.h"
#include "backtest/PerformanceMetrics.h"

namespace optionlab {
namespace backtest {

nlohmann::json toJson(const Greeks& greeks);
nlohmann::json toJson(const ContractKey& contract);
nlohmann::json toJson(const SelectionFunnel& funnel);
nlohmann::json toJson(const Position& position);
nlohmann::json toJson(const ClosedTrade& trade);
nlohmann::json toJson(const EquityPoint& point);
nlohmann::json toJson(const Metrics& metrics);

// Inverse of toJson; missing fields keep their defaults
Greeks greeksFromJson(const nlohmann::json& j);
ContractKey contractFromJson(const nlohmann::json& j);
Position positionFromJson(const nlohmann::json& j);
ClosedTrade closedTradeFromJson(const nlohmann::json& j);
EquityPoint equityPointFromJson(const nlohmann::json& j);

} // namespace backtest
} // namespace optionlab
