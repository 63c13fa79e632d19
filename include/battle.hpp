/**
 * Fusion Duel Engine - Battle Math
 *
 * Pure confrontation values between two field cards and the record
 * appended to the battle log after a resolution.
 */

#pragma once

#include "card_instance.hpp"

namespace duel {

/**
 * Values of one confrontation, computed without touching any state.
 *
 * The attacker always fights with ATK; the defender contributes ATK or DEF
 * depending on its stance. Each side's bonus uses its own star first.
 */
struct BattleValues {
    int attacker_base = 0;
    int attacker_bonus = 0;
    int attacker_value = 0;
    int defender_base = 0;
    int defender_bonus = 0;
    int defender_value = 0;
};

BattleValues compute_battle_values(const CardInstance& attacker, const CardInstance& defender);

/**
 * Value a card would contribute from its current stance against an opponent,
 * star bonus included.
 */
int stance_battle_value(const CardInstance& card, const CardInstance& opponent);

/**
 * BattleResult - One entry of the battle log.
 */
struct BattleResult {
    PlayerID attacker_id = HUMAN_PLAYER;

    std::string human_card;
    std::string ai_card;

    int attacker_value = 0;
    int defender_value = 0;
    int attacker_bonus = 0;
    int defender_bonus = 0;
    int human_value = 0;
    int ai_value = 0;

    GuardianStar human_star = GuardianStar::SUN;
    GuardianStar ai_star = GuardianStar::SUN;
    Stance human_stance = Stance::ATTACK;
    Stance ai_stance = Stance::ATTACK;
    Stance defender_stance = Stance::ATTACK;

    int damage = 0;                        // Life lost by damaged_player
    std::optional<PlayerID> damaged_player;
    BattleOutcome outcome = BattleOutcome::STANDOFF;
    std::optional<PlayerID> winner;        // nullopt on a tie

    bool attacker_destroyed = false;
    bool defender_destroyed = false;

    std::string description;
};

} // namespace duel
