#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Errors.h"
#include "strategy/StrategyConfig.h"

namespace optionlab {
namespace strategy {

// Builds a StrategyConfig from a JSON document. Unknown keys, wrong types and
// inconsistent values raise ConfigValidationError naming the field path.
class StrategyConfigLoader {
public:
    static StrategyConfig fromJson(const nlohmann::json& document);
    static StrategyConfig loadFile(const std::string& path);

    // Consistency checks, also applied to configs built in code
    static void validate(const StrategyConfig& config);

    // Stable sort by exit priority class
    static void sortExitRules(std::vector<ExitRule>& rules);

    static const std::vector<std::string>& filterNames();
};

} // namespace strategy
} // namespace optionlab
