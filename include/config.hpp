/**
 * Fusion Duel Engine - Configuration
 *
 * Game setup and search parameters. Everything here has a working default;
 * an optional JSON file can override any subset of fields.
 */

#pragma once

#include "types.hpp"
#include <nlohmann/json_fwd.hpp>

namespace duel {

constexpr int MIN_DECK_SIZE = 10;
constexpr int MAX_DECK_SIZE = 40;

/**
 * Weights of the heuristic evaluation.
 *
 * Life difference dominates, resource counts come next, hand quality and
 * lookahead are minor refinements.
 */
struct EvalWeights {
    double life_diff = 1.5;
    double lone_field_atk = 0.3;        // Only one side has a field card
    double field_margin = 0.5;          // Both sides on the field
    double field_stance_bonus = 200.0;  // Loser of the prospective clash is in ATTACK
    double hand_power = 0.1;
    double hand_best_atk = 0.15;
    double hand_count = 75.0;
    double deck_count = 25.0;
    double fusion_potential = 150.0;
    double next_draw = 0.05;
    double low_life = 0.5;
};

/**
 * Configuration for minimax search.
 */
struct SearchConfig {
    /**
     * Search depth in plies. Fusions do not consume depth.
     * 2 = easy, 4 = normal, 6 = hard, 8+ = expert.
     */
    int max_depth = 4;

    /**
     * Alpha-beta pruning. Disabling it explores the full tree and must
     * produce the same move; it only exists for verification.
     */
    bool use_alpha_beta = true;

    /**
     * Print search statistics after every move.
     */
    bool verbose = false;

    EvalWeights weights;

    double win_score = 100000.0;
    int low_life_threshold = 2000;
    int fusion_divisor = 500;           // Improvement units for fusion potential

    // Shortcut: take a fusion immediately if it beats the better material by
    // more than this margin, or reaches the absolute ATK threshold
    int valuable_fusion_margin = 500;
    int valuable_fusion_atk = 2500;

    // Refinement: with an empty enemy field, play ATTACK at or above this ATK
    int attack_stance_threshold = 1500;
};

/**
 * Configuration for a whole match.
 */
struct GameConfig {
    int deck_size = 20;
    int starting_life = 8000;
    int max_hand_size = 5;
    int initial_hand_size = 5;
    std::optional<uint64_t> random_seed;

    std::string catalog_path = "data/catalog.json";

    bool xray_enabled = false;
    std::string xray_dir = "xrays";

    SearchConfig search;

    int clamped_deck_size() const;
};

/**
 * Search depth for a difficulty name ("easy", "normal", "hard", "expert").
 * Returns nullopt for unknown names.
 */
std::optional<int> depth_for_difficulty(const std::string& name);

/**
 * Display name for a search depth.
 */
const char* difficulty_name(int depth);

/**
 * Load overrides from a JSON file into config.
 *
 * Returns false (config untouched) if the file cannot be read or parsed.
 */
bool load_config_from_json(const std::string& filepath, GameConfig& config);

/**
 * Apply overrides from an already-parsed JSON object.
 */
void apply_config_json(const nlohmann::json& data, GameConfig& config);

} // namespace duel
