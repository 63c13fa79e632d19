/**
 * Fusion Duel Engine - Core Type Definitions
 *
 * This file defines all enums and basic types used throughout the engine.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <memory>

namespace duel {

// ============================================================================
// ENUMS
// ============================================================================

/**
 * Guardian stars - the ten affinity tokens.
 *
 * Two dominance cycles:
 *   SUN > MOON > VENUS > MERCURY > SUN
 *   MARS > JUPITER > SATURN > URANUS > PLUTO > NEPTUNE > MARS
 */
enum class GuardianStar : uint8_t {
    SUN,
    MOON,
    VENUS,
    MERCURY,
    MARS,
    JUPITER,
    SATURN,
    URANUS,
    PLUTO,
    NEPTUNE
};

constexpr int GUARDIAN_STAR_COUNT = 10;

enum class Stance : uint8_t {
    ATTACK,
    DEFENSE
};

enum class GamePhase : uint8_t {
    DRAW,
    MAIN,
    BATTLE,
    END
};

enum class GameResult : uint8_t {
    ONGOING,
    HUMAN_WIN,
    AI_WIN,
    DRAW
};

enum class ActionType : uint8_t {
    PLAY,
    FUSE,
    PASS
};

enum class BattleOutcome : uint8_t {
    ATTACKER_WINS,        // Defender destroyed (life loss only if defender was in ATTACK)
    DEFENDER_WINS,        // Defender in ATTACK beat the attacker, attacker destroyed
    REBOUND,              // Defender in DEFENSE held, attacker's owner takes the difference
    MUTUAL_DESTRUCTION,   // Equal values, defender in ATTACK
    STANDOFF              // Equal values, defender in DEFENSE
};

// ============================================================================
// TYPE ALIASES
// ============================================================================

using CardDefID = int;        // Catalog id (fusion results use 9000 + recipe index)
using PlayerID = uint8_t;     // 0 or 1

constexpr PlayerID HUMAN_PLAYER = 0;
constexpr PlayerID AI_PLAYER = 1;

inline PlayerID opponent_of(PlayerID id) {
    return static_cast<PlayerID>(1 - id);
}

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

inline const char* to_string(GuardianStar star) {
    switch (star) {
        case GuardianStar::SUN: return "Sun";
        case GuardianStar::MOON: return "Moon";
        case GuardianStar::VENUS: return "Venus";
        case GuardianStar::MERCURY: return "Mercury";
        case GuardianStar::MARS: return "Mars";
        case GuardianStar::JUPITER: return "Jupiter";
        case GuardianStar::SATURN: return "Saturn";
        case GuardianStar::URANUS: return "Uranus";
        case GuardianStar::PLUTO: return "Pluto";
        case GuardianStar::NEPTUNE: return "Neptune";
        default: return "Unknown";
    }
}

inline const char* to_string(Stance stance) {
    switch (stance) {
        case Stance::ATTACK: return "ATK";
        case Stance::DEFENSE: return "DEF";
        default: return "unknown";
    }
}

inline const char* to_string(GamePhase phase) {
    switch (phase) {
        case GamePhase::DRAW: return "draw";
        case GamePhase::MAIN: return "main";
        case GamePhase::BATTLE: return "battle";
        case GamePhase::END: return "end";
        default: return "unknown";
    }
}

inline const char* to_string(GameResult result) {
    switch (result) {
        case GameResult::ONGOING: return "ongoing";
        case GameResult::HUMAN_WIN: return "human_win";
        case GameResult::AI_WIN: return "ai_win";
        case GameResult::DRAW: return "draw";
        default: return "unknown";
    }
}

inline const char* to_string(ActionType type) {
    switch (type) {
        case ActionType::PLAY: return "PLAY";
        case ActionType::FUSE: return "FUSE";
        case ActionType::PASS: return "PASS";
        default: return "UNKNOWN";
    }
}

inline const char* to_string(BattleOutcome outcome) {
    switch (outcome) {
        case BattleOutcome::ATTACKER_WINS: return "attacker_wins";
        case BattleOutcome::DEFENDER_WINS: return "defender_wins";
        case BattleOutcome::REBOUND: return "rebound";
        case BattleOutcome::MUTUAL_DESTRUCTION: return "mutual_destruction";
        case BattleOutcome::STANDOFF: return "standoff";
        default: return "unknown";
    }
}

} // namespace duel
