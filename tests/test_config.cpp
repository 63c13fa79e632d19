/**
 * Tests for Configuration Loading
 */

#include "test_fixtures.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

// ============================================================================
// DIFFICULTY TESTS
// ============================================================================

TEST(Config, DifficultyToDepth) {
    TEST_ASSERT(depth_for_difficulty("easy") == 2);
    TEST_ASSERT(depth_for_difficulty("Normal") == 4);
    TEST_ASSERT(depth_for_difficulty("HARD") == 6);
    TEST_ASSERT(depth_for_difficulty("expert") == 8);
    TEST_ASSERT_FALSE(depth_for_difficulty("nightmare").has_value());
}

TEST(Config, DepthToDifficultyName) {
    TEST_ASSERT_EQ(std::string("Easy"), std::string(difficulty_name(1)));
    TEST_ASSERT_EQ(std::string("Normal"), std::string(difficulty_name(3)));
    TEST_ASSERT_EQ(std::string("Hard"), std::string(difficulty_name(6)));
    TEST_ASSERT_EQ(std::string("Expert"), std::string(difficulty_name(12)));
}

TEST(Config, DeckSizeClamped) {
    GameConfig config;
    TEST_ASSERT_EQ(20, config.clamped_deck_size());
    config.deck_size = 4;
    TEST_ASSERT_EQ(10, config.clamped_deck_size());
    config.deck_size = 99;
    TEST_ASSERT_EQ(40, config.clamped_deck_size());
}

// ============================================================================
// JSON OVERRIDE TESTS
// ============================================================================

TEST(Config, JsonOverridesSubset) {
    GameConfig config;
    nlohmann::json data = {
        {"deck_size", 30},
        {"random_seed", 99u},
        {"search", {
            {"max_depth", 3},
            {"difficulty", "hard"},
            {"use_alpha_beta", false},
            {"weights", {{"life_diff", 2.0}}}
        }}
    };

    apply_config_json(data, config);

    TEST_ASSERT_EQ(30, config.deck_size);
    TEST_ASSERT_EQ(8000, config.starting_life);
    TEST_ASSERT(config.random_seed.has_value());
    TEST_ASSERT_EQ(99u, *config.random_seed);
    TEST_ASSERT_EQ(6, config.search.max_depth);
    TEST_ASSERT_FALSE(config.search.use_alpha_beta);
    TEST_ASSERT_EQ(2.0, config.search.weights.life_diff);
    TEST_ASSERT_EQ(0.5, config.search.weights.field_margin);
}

TEST(Config, UnknownDifficultyKeepsDepth) {
    GameConfig config;
    nlohmann::json data = {{"search", {{"max_depth", 5}, {"difficulty", "impossible"}}}};

    apply_config_json(data, config);
    TEST_ASSERT_EQ(5, config.search.max_depth);
}

TEST(Config, LoadFromFile) {
    auto dir = std::filesystem::temp_directory_path() / "duel_config_test";
    std::filesystem::create_directories(dir);
    auto path = (dir / "config.json").string();
    {
        std::ofstream out(path);
        out << R"({"starting_life": 4000, "xray_enabled": true, "search": {"difficulty": "easy"}})";
    }

    GameConfig config;
    TEST_ASSERT(load_config_from_json(path, config));
    TEST_ASSERT_EQ(4000, config.starting_life);
    TEST_ASSERT(config.xray_enabled);
    TEST_ASSERT_EQ(2, config.search.max_depth);

    std::filesystem::remove_all(dir);
}

TEST(Config, BadFileLeavesConfigUntouched) {
    auto dir = std::filesystem::temp_directory_path() / "duel_config_bad_test";
    std::filesystem::create_directories(dir);
    auto broken = (dir / "broken.json").string();
    auto mistyped = (dir / "mistyped.json").string();
    {
        std::ofstream out(broken);
        out << "{\"deck_size\": ";
    }
    {
        std::ofstream out(mistyped);
        out << R"({"deck_size": 12, "starting_life": "lots"})";
    }

    GameConfig config;
    TEST_ASSERT_FALSE(load_config_from_json((dir / "missing.json").string(), config));
    TEST_ASSERT_FALSE(load_config_from_json(broken, config));
    TEST_ASSERT_FALSE(load_config_from_json(mistyped, config));
    TEST_ASSERT_EQ(20, config.deck_size);
    TEST_ASSERT_EQ(8000, config.starting_life);

    std::filesystem::remove_all(dir);
}

TEST(Config, BundledConfigLoads) {
    GameConfig config;
    TEST_ASSERT(load_config_from_json("data/duel_config.json", config));
    TEST_ASSERT_EQ(4, config.search.max_depth);
    TEST_ASSERT(config.search.verbose);
}
