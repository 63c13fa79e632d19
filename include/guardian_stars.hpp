/**
 * Fusion Duel Engine - Guardian Star Table
 *
 * Fixed dominance relations between the ten guardian stars and the
 * combat bonus derived from them.
 */

#pragma once

#include "types.hpp"
#include <utility>

namespace duel {

constexpr int STAR_BONUS = 500;

/**
 * Dominance entry for one star.
 */
struct StarRelation {
    GuardianStar strong;   // Star this one dominates
    GuardianStar weak;     // Star that dominates this one
};

/**
 * Get the dominance entry for a star.
 */
StarRelation star_relation(GuardianStar star);

/**
 * Combat bonus for an attacker's star against a defender's star.
 *
 * +500 if attacker dominates defender, -500 if defender dominates attacker,
 * 0 otherwise. Not symmetric: call once per side.
 */
int combat_bonus(GuardianStar attacker_star, GuardianStar defender_star);

/**
 * Assign the two guardian stars for a card.
 *
 * Star 1 comes from the attribute table, star 2 from the monster type
 * table. If they coincide, star 2 falls back to the attribute table's
 * alternate, so the pair is always distinct.
 */
std::pair<GuardianStar, GuardianStar> assign_guardian_stars(const std::string& attribute,
                                                            const std::string& card_type);

/**
 * Parse a star name ("Sun", "moon", ...). Returns nullopt when unknown.
 */
std::optional<GuardianStar> parse_guardian_star(const std::string& name);

} // namespace duel
