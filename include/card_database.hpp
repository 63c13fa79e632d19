/**
 * Fusion Duel Engine - Card Database
 *
 * Stores immutable monster definitions and fusion recipes loaded from JSON.
 * Provides fast lookup by id and name, and order-independent fusion lookup.
 */

#pragma once

#include "card_instance.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace duel {

constexpr CardDefID FUSION_ID_BASE = 9000;
constexpr int FUSION_RESULT_LEVEL = 7;

/**
 * Card definition (immutable).
 */
struct CardDef {
    CardDefID card_id = 0;
    std::string name;
    std::string card_type;
    int atk = 0;
    int def = 0;
    std::string attribute;
    int level = 0;

    // Derived at registration from attribute and type
    GuardianStar star1 = GuardianStar::SUN;
    GuardianStar star2 = GuardianStar::MOON;

    /**
     * Create a fresh instance: star 1 selected, ATTACK stance.
     */
    CardInstance materialize() const {
        return CardInstance(card_id, name, card_type, attribute, atk, def, level, star1, star2);
    }
};

/**
 * Fusion recipe: unordered pair of material names plus the result's stats.
 */
struct FusionRecipe {
    std::string material1;
    std::string material2;
    std::string result_name;
    int result_atk = 0;
    int result_def = 0;
    std::string result_attribute;
    std::string result_type;
};

/**
 * CardDatabase - Central card lookup.
 *
 * Built once at startup and injected into the engine and the AI.
 * Read-only after loading; safe to share between game states.
 */
class CardDatabase {
public:
    CardDatabase();
    ~CardDatabase() = default;

    /**
     * Load cards and fusion recipes from a JSON file.
     *
     * Format: {"cards": [...], "fusions": [...]}. Malformed entries are
     * skipped. Returns false if the file cannot be read or parsed.
     */
    bool load_from_json(const std::string& filepath);

    /**
     * Load from an in-memory JSON document (same format as the file).
     */
    bool load_from_json_string(const std::string& content);

    /**
     * Register a card definition. Guardian stars are assigned here.
     * Returns false if the id is already registered.
     */
    bool add_card(CardDef card);

    /**
     * Register a fusion recipe.
     */
    void add_fusion(FusionRecipe recipe);

    /**
     * Get a card definition by ID.
     *
     * Returns nullptr if card not found.
     */
    const CardDef* get_card(CardDefID card_id) const;

    /**
     * Get a card definition by exact name (case-insensitive).
     *
     * Returns nullptr if card not found.
     */
    const CardDef* find_by_name(const std::string& name) const;

    bool has_card(CardDefID card_id) const;

    /**
     * Materialize a catalog card into a fresh instance.
     */
    std::optional<CardInstance> create_instance(CardDefID card_id) const;

    /**
     * Look up a fusion result for two material names (either order).
     *
     * Returns the result card (star 1, ATTACK stance) or nullopt.
     */
    std::optional<CardInstance> check_fusion(const std::string& name_a,
                                             const std::string& name_b) const;

    std::optional<CardInstance> check_fusion(const CardInstance& a,
                                             const CardInstance& b) const {
        return check_fusion(a.name, b.name);
    }

    /**
     * Get all card IDs in registration order.
     */
    std::vector<CardDefID> get_all_card_ids() const;

    /**
     * Materialize every catalog card once, in registration order.
     */
    std::vector<CardInstance> create_all_instances() const;

    size_t card_count() const { return cards_.size(); }
    size_t fusion_count() const { return fusions_.size(); }

private:
    std::unordered_map<CardDefID, CardDef> cards_;
    std::vector<CardDefID> card_order_;
    std::unordered_map<std::string, CardDefID> ids_by_name_;  // lowercase name -> id
    std::vector<FusionRecipe> fusions_;
    std::unordered_map<std::string, size_t> fusion_index_;   // sorted lowercase pair -> recipe

    static std::string fusion_key(const std::string& name_a, const std::string& name_b);

    // Parse helpers
    bool load_document(const nlohmann::json& data);
    CardDef parse_card(const nlohmann::json& card_json) const;
    FusionRecipe parse_fusion(const nlohmann::json& fusion_json) const;
};

std::string to_lower(const std::string& s);

} // namespace duel
