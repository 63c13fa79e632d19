/**
 * Fusion Duel Engine - C++ Implementation
 *
 * Two-player fusion card duel with a minimax opponent.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "guardian_stars.hpp"

// Data structures
#include "card_instance.hpp"
#include "zone.hpp"
#include "player_state.hpp"
#include "action.hpp"
#include "battle.hpp"
#include "game_state.hpp"

// Card database
#include "card_database.hpp"

// Configuration
#include "config.hpp"

// Engine
#include "engine.hpp"

// Search
#include "minimax_ai.hpp"

namespace duel {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace duel
