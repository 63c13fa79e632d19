/**
 * Fusion Duel Engine - Card Instance
 *
 * Represents a physical monster card in a zone with mutable runtime state.
 * This is the core data structure that gets cloned on every search node.
 */

#pragma once

#include "types.hpp"
#include <algorithm>
#include <utility>

namespace duel {

/**
 * CardInstance - A monster card in the game.
 *
 * Carries a full copy of its base stats (fusion results are not catalog
 * entries) plus stance and star choice. Pure value type: copying an
 * instance never shares state with the original.
 */
struct CardInstance {
    // Identity and base stats (immutable after creation)
    CardDefID card_id = 0;
    std::string name;
    std::string card_type;        // Monster type, e.g. "Dragon"
    std::string attribute;        // Elemental attribute, e.g. "Light"
    int atk = 0;
    int def = 0;
    int level = 0;

    // Guardian stars (always distinct)
    GuardianStar star1 = GuardianStar::SUN;
    GuardianStar star2 = GuardianStar::MOON;

    // Mutable state
    GuardianStar selected_star = GuardianStar::SUN;
    Stance stance = Stance::ATTACK;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    CardInstance() = default;

    CardInstance(CardDefID card_id_, std::string name_, std::string card_type_,
                 std::string attribute_, int atk_, int def_, int level_,
                 GuardianStar star1_, GuardianStar star2_)
        : card_id(card_id_)
        , name(std::move(name_))
        , card_type(std::move(card_type_))
        , attribute(std::move(attribute_))
        , atk(atk_)
        , def(def_)
        , level(level_)
        , star1(star1_)
        , star2(star2_)
        , selected_star(star1_)
    {}

    // ========================================================================
    // BATTLE HELPERS
    // ========================================================================

    /**
     * Stat contributed when defending: ATK in attack stance, DEF in defense.
     */
    int stance_value() const {
        return stance == Stance::ATTACK ? atk : def;
    }

    int best_stat() const {
        return std::max(atk, def);
    }

    bool is_attack_stance() const {
        return stance == Stance::ATTACK;
    }

    /**
     * Select star 1 or 2. Any other value selects star 1.
     */
    void select_star(int star_num) {
        selected_star = (star_num == 2) ? star2 : star1;
    }

    GuardianStar star(int star_num) const {
        return (star_num == 2) ? star2 : star1;
    }

    // ========================================================================
    // CLONING
    // ========================================================================

    CardInstance clone() const {
        return *this;  // All members are values
    }

    std::string to_string() const {
        return name + " (ATK:" + std::to_string(atk) + "/DEF:" + std::to_string(def) +
               ") [" + duel::to_string(star1) + "/" + duel::to_string(star2) + "]";
    }

    bool operator==(const CardInstance& other) const {
        return card_id == other.card_id
            && name == other.name
            && atk == other.atk
            && def == other.def
            && star1 == other.star1
            && star2 == other.star2
            && selected_star == other.selected_star
            && stance == other.stance;
    }

    bool operator!=(const CardInstance& other) const {
        return !(*this == other);
    }
};

} // namespace duel
