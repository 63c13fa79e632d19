/**
 * Fusion Duel Engine - Configuration Implementation
 */

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace duel {

int GameConfig::clamped_deck_size() const {
    return std::max(MIN_DECK_SIZE, std::min(deck_size, MAX_DECK_SIZE));
}

std::optional<int> depth_for_difficulty(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "easy") return 2;
    if (lower == "normal") return 4;
    if (lower == "hard") return 6;
    if (lower == "expert") return 8;
    return std::nullopt;
}

const char* difficulty_name(int depth) {
    if (depth <= 2) return "Easy";
    if (depth <= 4) return "Normal";
    if (depth <= 6) return "Hard";
    return "Expert";
}

namespace {

void apply_weights_json(const json& data, EvalWeights& w) {
    w.life_diff = data.value("life_diff", w.life_diff);
    w.lone_field_atk = data.value("lone_field_atk", w.lone_field_atk);
    w.field_margin = data.value("field_margin", w.field_margin);
    w.field_stance_bonus = data.value("field_stance_bonus", w.field_stance_bonus);
    w.hand_power = data.value("hand_power", w.hand_power);
    w.hand_best_atk = data.value("hand_best_atk", w.hand_best_atk);
    w.hand_count = data.value("hand_count", w.hand_count);
    w.deck_count = data.value("deck_count", w.deck_count);
    w.fusion_potential = data.value("fusion_potential", w.fusion_potential);
    w.next_draw = data.value("next_draw", w.next_draw);
    w.low_life = data.value("low_life", w.low_life);
}

void apply_search_json(const json& data, SearchConfig& s) {
    s.max_depth = data.value("max_depth", s.max_depth);

    // "difficulty" wins over "max_depth" when both are present
    if (data.contains("difficulty") && data["difficulty"].is_string()) {
        auto depth = depth_for_difficulty(data["difficulty"].get<std::string>());
        if (depth.has_value()) {
            s.max_depth = *depth;
        } else {
            std::cerr << "[Config] Unknown difficulty: "
                      << data["difficulty"].get<std::string>() << std::endl;
        }
    }

    s.use_alpha_beta = data.value("use_alpha_beta", s.use_alpha_beta);
    s.verbose = data.value("verbose", s.verbose);
    s.win_score = data.value("win_score", s.win_score);
    s.low_life_threshold = data.value("low_life_threshold", s.low_life_threshold);
    s.fusion_divisor = data.value("fusion_divisor", s.fusion_divisor);
    s.valuable_fusion_margin = data.value("valuable_fusion_margin", s.valuable_fusion_margin);
    s.valuable_fusion_atk = data.value("valuable_fusion_atk", s.valuable_fusion_atk);
    s.attack_stance_threshold = data.value("attack_stance_threshold", s.attack_stance_threshold);

    if (data.contains("weights") && data["weights"].is_object()) {
        apply_weights_json(data["weights"], s.weights);
    }
}

} // namespace

void apply_config_json(const json& data, GameConfig& config) {
    config.deck_size = data.value("deck_size", config.deck_size);
    config.starting_life = data.value("starting_life", config.starting_life);
    config.max_hand_size = data.value("max_hand_size", config.max_hand_size);
    config.initial_hand_size = data.value("initial_hand_size", config.initial_hand_size);
    config.catalog_path = data.value("catalog_path", config.catalog_path);
    config.xray_enabled = data.value("xray_enabled", config.xray_enabled);
    config.xray_dir = data.value("xray_dir", config.xray_dir);

    if (data.contains("random_seed") && data["random_seed"].is_number_unsigned()) {
        config.random_seed = data["random_seed"].get<uint64_t>();
    }

    if (data.contains("search") && data["search"].is_object()) {
        apply_search_json(data["search"], config.search);
    }
}

bool load_config_from_json(const std::string& filepath, GameConfig& config) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        if (!data.is_object()) {
            std::cerr << "[Config] Expected a JSON object in " << filepath << std::endl;
            return false;
        }

        // Apply to a copy so a type error leaves the caller's config intact
        GameConfig updated = config;
        apply_config_json(data, updated);
        config = updated;

        std::cout << "[Config] Loaded " << filepath << std::endl;
        return true;
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;
        return false;
    }
}

} // namespace duel
