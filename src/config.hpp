#ifndef ROOKMATE_CONFIG_HPP
#define ROOKMATE_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "profile.hpp"
#include "search.hpp"

namespace rookmate {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EngineConfig {
    EvalProfile profile = EvalProfile::attackerWithRook();
    AISettings settings;
};

/**
 * Reads an engine configuration. Missing keys keep their defaults.
 *
 * {
 *   "profile": "attacker_with_rook" | { "attacker": "white", "edge_weight": 15, ... },
 *   "max_depth": 3,
 *   "time_budget_ms": 2000,
 *   "use_transposition_table": true,
 *   "transposition_capacity": 1048576,
 *   "verbose": false
 * }
 *
 * Throws ConfigError on malformed input.
 */
EngineConfig configFromJson(const nlohmann::json& json);
EngineConfig loadConfig(const std::string& path);

nlohmann::json configToJson(const EngineConfig& config);
nlohmann::json profileToJson(const EvalProfile& profile);
EvalProfile profileFromJson(const nlohmann::json& json);

} // namespace rookmate

#endif // ROOKMATE_CONFIG_HPP
