/**
 * Fusion Duel Engine - Card Database Implementation
 *
 * Loads monster definitions and fusion recipes using nlohmann/json.
 */

#include "card_database.hpp"
#include "guardian_stars.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace duel {

std::string to_lower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

CardDatabase::CardDatabase() {}

bool CardDatabase::load_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[CardDatabase] Failed to open: " << filepath << std::endl;
        return false;
    }

    try {
        json data = json::parse(file);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[CardDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool CardDatabase::load_from_json_string(const std::string& content) {
    try {
        json data = json::parse(content);
        return load_document(data);
    } catch (const json::parse_error& e) {
        std::cerr << "[CardDatabase] JSON parse error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[CardDatabase] Error: " << e.what() << std::endl;
        return false;
    }
}

bool CardDatabase::load_document(const json& data) {
    if (!data.contains("cards") || !data["cards"].is_array()) {
        std::cerr << "[CardDatabase] No 'cards' array found" << std::endl;
        return false;
    }

    int card_count = 0;
    for (const auto& card_json : data["cards"]) {
        try {
            CardDef card = parse_card(card_json);
            if (card.card_id > 0 && !card.name.empty() && add_card(std::move(card))) {
                card_count++;
            }
        } catch (const json::type_error& e) {
            std::cerr << "[CardDatabase] Skipping malformed card: " << e.what() << std::endl;
        }
    }

    int fusion_count = 0;
    if (data.contains("fusions") && data["fusions"].is_array()) {
        for (const auto& fusion_json : data["fusions"]) {
            try {
                FusionRecipe recipe = parse_fusion(fusion_json);
                if (!recipe.material1.empty() && !recipe.material2.empty() &&
                    !recipe.result_name.empty()) {
                    add_fusion(std::move(recipe));
                    fusion_count++;
                }
            } catch (const json::type_error& e) {
                std::cerr << "[CardDatabase] Skipping malformed fusion: " << e.what() << std::endl;
            }
        }
    }

    std::cout << "[CardDatabase] Loaded " << card_count << " cards, "
              << fusion_count << " fusions" << std::endl;
    return true;
}

CardDef CardDatabase::parse_card(const json& card_json) const {
    CardDef card;

    if (!card_json.is_object()) {
        return card;  // Invalid card (id 0)
    }

    // Required fields
    card.card_id = card_json.value("id", 0);
    card.name = card_json.value("name", "");

    card.card_type = card_json.value("type", "");
    card.attribute = card_json.value("attribute", "");
    card.atk = card_json.value("atk", 0);
    card.def = card_json.value("def", 0);
    card.level = card_json.value("level", 0);

    return card;
}

FusionRecipe CardDatabase::parse_fusion(const json& fusion_json) const {
    FusionRecipe recipe;

    if (!fusion_json.is_object()) {
        return recipe;
    }

    recipe.material1 = fusion_json.value("material1", "");
    recipe.material2 = fusion_json.value("material2", "");

    // Result block
    if (fusion_json.contains("result") && fusion_json["result"].is_object()) {
        const auto& result = fusion_json["result"];
        recipe.result_name = result.value("name", "");
        recipe.result_atk = result.value("atk", 0);
        recipe.result_def = result.value("def", 0);
        recipe.result_attribute = result.value("attribute", "");
        recipe.result_type = result.value("type", "");
    }

    return recipe;
}

bool CardDatabase::add_card(CardDef card) {
    if (cards_.count(card.card_id) > 0) {
        return false;
    }

    auto stars = assign_guardian_stars(card.attribute, card.card_type);
    card.star1 = stars.first;
    card.star2 = stars.second;

    ids_by_name_.emplace(to_lower(card.name), card.card_id);
    card_order_.push_back(card.card_id);
    cards_.emplace(card.card_id, std::move(card));
    return true;
}

void CardDatabase::add_fusion(FusionRecipe recipe) {
    // First registered recipe wins for a given pair
    fusion_index_.emplace(fusion_key(recipe.material1, recipe.material2), fusions_.size());
    fusions_.push_back(std::move(recipe));
}

std::string CardDatabase::fusion_key(const std::string& name_a, const std::string& name_b) {
    std::string a = to_lower(name_a);
    std::string b = to_lower(name_b);
    if (b < a) {
        std::swap(a, b);
    }
    return a + '\n' + b;
}

const CardDef* CardDatabase::get_card(CardDefID card_id) const {
    auto it = cards_.find(card_id);
    if (it == cards_.end()) {
        return nullptr;
    }
    return &it->second;
}

const CardDef* CardDatabase::find_by_name(const std::string& name) const {
    auto it = ids_by_name_.find(to_lower(name));
    if (it == ids_by_name_.end()) {
        return nullptr;
    }
    return get_card(it->second);
}

bool CardDatabase::has_card(CardDefID card_id) const {
    return cards_.find(card_id) != cards_.end();
}

std::optional<CardInstance> CardDatabase::create_instance(CardDefID card_id) const {
    const CardDef* def = get_card(card_id);
    if (!def) {
        return std::nullopt;
    }
    return def->materialize();
}

std::optional<CardInstance> CardDatabase::check_fusion(const std::string& name_a,
                                                       const std::string& name_b) const {
    auto it = fusion_index_.find(fusion_key(name_a, name_b));
    if (it == fusion_index_.end()) {
        return std::nullopt;
    }

    const FusionRecipe& recipe = fusions_[it->second];
    auto stars = assign_guardian_stars(recipe.result_attribute, recipe.result_type);
    return CardInstance(FUSION_ID_BASE + static_cast<CardDefID>(it->second),
                        recipe.result_name,
                        recipe.result_type,
                        recipe.result_attribute,
                        recipe.result_atk,
                        recipe.result_def,
                        FUSION_RESULT_LEVEL,
                        stars.first,
                        stars.second);
}

std::vector<CardDefID> CardDatabase::get_all_card_ids() const {
    return card_order_;
}

std::vector<CardInstance> CardDatabase::create_all_instances() const {
    std::vector<CardInstance> instances;
    instances.reserve(card_order_.size());
    for (CardDefID id : card_order_) {
        instances.push_back(cards_.at(id).materialize());
    }
    return instances;
}

} // namespace duel
