#include "config.hpp"
#include <fstream>

using json = nlohmann::json;

namespace rookmate {

namespace {

template <typename T>
void readField(const json& object, const char* key, T& target) {
    auto it = object.find(key);
    if (it == object.end()) return;
    try {
        target = it->get<T>();
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("field '") + key + "': " + e.what());
    }
}

chess::Color colorFromName(const std::string& name) {
    if (name == "white") return chess::Color::WHITE;
    if (name == "black") return chess::Color::BLACK;
    throw ConfigError("attacker must be \"white\" or \"black\", got \"" + name + "\"");
}

} // namespace

EvalProfile profileFromJson(const json& object) {
    if (object.is_string()) {
        try {
            return EvalProfile::byName(object.get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }
    if (!object.is_object()) {
        throw ConfigError("profile must be a preset name or an object");
    }

    EvalProfile profile;
    std::string base;
    readField(object, "base", base);
    if (!base.empty()) {
        try {
            profile = EvalProfile::byName(base);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(e.what());
        }
    }

    readField(object, "name", profile.name);
    std::string attacker;
    readField(object, "attacker", attacker);
    if (!attacker.empty()) profile.attacker = colorFromName(attacker);

    readField(object, "edge_weight", profile.edgeWeight);
    readField(object, "rook_aligned_bonus", profile.rookAlignedBonus);
    readField(object, "rook_safe_bonus", profile.rookSafeBonus);
    readField(object, "king_adjacent_penalty", profile.kingAdjacentPenalty);
    readField(object, "opposition_bonus", profile.oppositionBonus);
    readField(object, "rook_centrality_weight", profile.rookCentralityWeight);
    readField(object, "check_bonus", profile.checkBonus);

    try {
        profile.validate();
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return profile;
}

EngineConfig configFromJson(const json& object) {
    if (!object.is_object()) throw ConfigError("configuration must be a JSON object");

    EngineConfig config;
    auto profile = object.find("profile");
    if (profile != object.end()) config.profile = profileFromJson(*profile);

    readField(object, "max_depth", config.settings.depth);
    if (config.settings.depth < 1) throw ConfigError("max_depth must be at least 1");

    long long budgetMs = config.settings.timeBudget.count();
    readField(object, "time_budget_ms", budgetMs);
    if (budgetMs < 0) throw ConfigError("time_budget_ms must not be negative");
    config.settings.timeBudget = std::chrono::milliseconds(budgetMs);

    readField(object, "use_transposition_table", config.settings.useTranspositionTable);
    readField(object, "transposition_capacity", config.settings.transpositionCapacity);
    readField(object, "verbose", config.settings.verbose);
    return config;
}

EngineConfig loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ConfigError("cannot open config file " + path);

    json object;
    try {
        object = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
    return configFromJson(object);
}

json profileToJson(const EvalProfile& profile) {
    return {
        {"name", profile.name},
        {"attacker", profile.attacker == chess::Color::WHITE ? "white" : "black"},
        {"edge_weight", profile.edgeWeight},
        {"rook_aligned_bonus", profile.rookAlignedBonus},
        {"rook_safe_bonus", profile.rookSafeBonus},
        {"king_adjacent_penalty", profile.kingAdjacentPenalty},
        {"opposition_bonus", profile.oppositionBonus},
        {"rook_centrality_weight", profile.rookCentralityWeight},
        {"check_bonus", profile.checkBonus},
    };
}

json configToJson(const EngineConfig& config) {
    return {
        {"profile", profileToJson(config.profile)},
        {"max_depth", config.settings.depth},
        {"time_budget_ms", config.settings.timeBudget.count()},
        {"use_transposition_table", config.settings.useTranspositionTable},
        {"transposition_capacity", config.settings.transpositionCapacity},
        {"verbose", config.settings.verbose},
    };
}

} // namespace rookmate
