/**
 * Fusion Duel Engine - Battle Math Implementation
 */

#include "battle.hpp"
#include "guardian_stars.hpp"

namespace duel {

BattleValues compute_battle_values(const CardInstance& attacker, const CardInstance& defender) {
    BattleValues v;

    v.attacker_base = attacker.atk;
    v.attacker_bonus = combat_bonus(attacker.selected_star, defender.selected_star);
    v.attacker_value = v.attacker_base + v.attacker_bonus;

    v.defender_base = defender.stance_value();
    v.defender_bonus = combat_bonus(defender.selected_star, attacker.selected_star);
    v.defender_value = v.defender_base + v.defender_bonus;

    return v;
}

int stance_battle_value(const CardInstance& card, const CardInstance& opponent) {
    return card.stance_value() + combat_bonus(card.selected_star, opponent.selected_star);
}

} // namespace duel
