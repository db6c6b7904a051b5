#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "config.hpp"

using namespace rookmate;
using json = nlohmann::json;

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    EngineConfig config = configFromJson(json::object());
    EXPECT_EQ(config.profile.name, "attacker_with_rook");
    EXPECT_EQ(config.settings.depth, 3);
    EXPECT_EQ(config.settings.timeBudget.count(), 2000);
    EXPECT_TRUE(config.settings.useTranspositionTable);
    EXPECT_FALSE(config.settings.verbose);
}

TEST(ConfigTest, ReadsPresetAndLimits) {
    EngineConfig config = configFromJson(json::parse(R"({
        "profile": "defender_with_rook",
        "max_depth": 5,
        "time_budget_ms": 750,
        "use_transposition_table": false,
        "transposition_capacity": 4096,
        "verbose": true
    })"));

    EXPECT_EQ(config.profile.attacker, chess::Color::BLACK);
    EXPECT_EQ(config.settings.depth, 5);
    EXPECT_EQ(config.settings.timeBudget.count(), 750);
    EXPECT_FALSE(config.settings.useTranspositionTable);
    EXPECT_EQ(config.settings.transpositionCapacity, 4096u);
    EXPECT_TRUE(config.settings.verbose);
}

TEST(ConfigTest, CustomProfileOverridesBaseWeights) {
    EngineConfig config = configFromJson(json::parse(R"({
        "profile": { "base": "attacker_with_rook", "name": "tuned", "edge_weight": 20, "check_bonus": 0 }
    })"));

    EXPECT_EQ(config.profile.name, "tuned");
    EXPECT_EQ(config.profile.attacker, chess::Color::WHITE);
    EXPECT_EQ(config.profile.edgeWeight, 20);
    EXPECT_EQ(config.profile.checkBonus, 0);
    EXPECT_EQ(config.profile.oppositionBonus, EvalProfile::attackerWithRook().oppositionBonus);
}

TEST(ConfigTest, RejectsBadInput) {
    EXPECT_THROW(configFromJson(json::array()), ConfigError);
    EXPECT_THROW(configFromJson(json::parse(R"({"profile": "queen_vs_king"})")), ConfigError);
    EXPECT_THROW(configFromJson(json::parse(R"({"profile": {"attacker": "green"}})")), ConfigError);
    EXPECT_THROW(configFromJson(json::parse(R"({"profile": {"edge_weight": -3}})")), ConfigError);
    EXPECT_THROW(configFromJson(json::parse(R"({"profile": {"check_bonus": 9000}})")), ConfigError);
    EXPECT_THROW(configFromJson(json::parse(R"({"max_depth": 0})")), ConfigError);
    EXPECT_THROW(configFromJson(json::parse(R"({"max_depth": "deep"})")), ConfigError);
    EXPECT_THROW(configFromJson(json::parse(R"({"time_budget_ms": -1})")), ConfigError);
}

TEST(ConfigTest, LoadsShippedFiles) {
    EngineConfig engine = loadConfig(std::string(ROOKMATE_CONFIG_DIR) + "/engine.json");
    EXPECT_EQ(engine.profile.name, "attacker_with_rook");
    EXPECT_EQ(engine.settings.depth, 3);

    EngineConfig defender = loadConfig(std::string(ROOKMATE_CONFIG_DIR) + "/defender_with_rook.json");
    EXPECT_EQ(defender.profile.name, "defender_with_rook_tuned");
    EXPECT_EQ(defender.profile.attacker, chess::Color::BLACK);
    EXPECT_EQ(defender.settings.depth, 4);
}

TEST(ConfigTest, MissingFileIsAConfigError) {
    EXPECT_THROW(loadConfig("/nonexistent/rookmate.json"), ConfigError);
}

TEST(ConfigTest, WrittenConfigReadsBack) {
    EngineConfig original;
    original.profile = EvalProfile::defenderWithRook();
    original.profile.oppositionBonus = 40;
    original.settings.depth = 4;

    EngineConfig copy = configFromJson(configToJson(original));
    EXPECT_EQ(copy.profile.attacker, chess::Color::BLACK);
    EXPECT_EQ(copy.profile.oppositionBonus, 40);
    EXPECT_EQ(copy.settings.depth, 4);
}
