/**
 * Fusion Duel Engine - Game State
 *
 * The root state object representing the complete match snapshot.
 * Must be fast to clone: the search copies it on every explored node.
 */

#pragma once

#include "player_state.hpp"
#include "battle.hpp"
#include <array>

namespace duel {

/**
 * GameInfo - Flat summary for display layers.
 */
struct GameInfo {
    int turn = 1;
    std::string current_player;
    int human_lp = 0;
    int ai_lp = 0;
    int human_hand = 0;
    int ai_hand = 0;
    int human_deck = 0;
    int ai_deck = 0;
    std::optional<std::string> human_field;
    std::optional<std::string> ai_field;
    bool game_over = false;
    std::optional<std::string> winner;
};

/**
 * GameState - The complete match snapshot.
 *
 * players[HUMAN_PLAYER] moves first; players[AI_PLAYER] is driven by search.
 * Perfect information: every zone is visible to both sides.
 */
struct GameState {
    // Players (always exactly 2)
    std::array<PlayerState, 2> players;

    // Turn tracking
    int turn_count = 1;
    PlayerID current_player_index = HUMAN_PLAYER;
    GamePhase current_phase = GamePhase::DRAW;

    // Game result
    GameResult result = GameResult::ONGOING;
    std::optional<PlayerID> winner_id;

    // Battle history (append-only)
    std::vector<BattleResult> battle_log;
    std::optional<BattleResult> last_battle;

    // Search copies leave the history empty and skip battle descriptions
    bool record_battles = true;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    GameState() {
        players[HUMAN_PLAYER] = PlayerState(HUMAN_PLAYER, "Player", false);
        players[AI_PLAYER] = PlayerState(AI_PLAYER, "AI", true);
    }

    // ========================================================================
    // PLAYER ACCESS
    // ========================================================================

    PlayerState& get_current_player() {
        return players[current_player_index];
    }

    const PlayerState& get_current_player() const {
        return players[current_player_index];
    }

    PlayerState& get_player(PlayerID id) {
        return players[id];
    }

    const PlayerState& get_player(PlayerID id) const {
        return players[id];
    }

    PlayerState& human() { return players[HUMAN_PLAYER]; }
    const PlayerState& human() const { return players[HUMAN_PLAYER]; }
    PlayerState& ai() { return players[AI_PLAYER]; }
    const PlayerState& ai() const { return players[AI_PLAYER]; }

    bool both_fields_occupied() const {
        return players[0].field.has_value() && players[1].field.has_value();
    }

    // ========================================================================
    // GAME STATUS
    // ========================================================================

    bool is_game_over() const {
        return result != GameResult::ONGOING;
    }

    const PlayerState* get_winner() const {
        if (!winner_id.has_value()) {
            return nullptr;
        }
        return &players[*winner_id];
    }

    GameInfo get_info() const {
        GameInfo info;
        info.turn = turn_count;
        info.current_player = get_current_player().name;
        info.human_lp = human().life_points;
        info.ai_lp = ai().life_points;
        info.human_hand = human().hand.count();
        info.ai_hand = ai().hand.count();
        info.human_deck = human().deck.count();
        info.ai_deck = ai().deck.count();
        if (human().field.has_value()) info.human_field = human().field->name;
        if (ai().field.has_value()) info.ai_field = ai().field->name;
        info.game_over = is_game_over();
        if (const PlayerState* w = get_winner()) info.winner = w->name;
        return info;
    }

    // ========================================================================
    // CLONING (Critical for search performance)
    // ========================================================================

    GameState clone() const {
        GameState copy = clone_for_search();
        copy.record_battles = record_battles;

        // Battle records hold names and numbers only
        copy.battle_log = battle_log;
        copy.last_battle = last_battle;

        return copy;
    }

    /**
     * Copy for search nodes: rules state only, no battle history.
     */
    GameState clone_for_search() const {
        GameState copy;
        copy.record_battles = false;

        // Clone players
        copy.players[0] = players[0].clone();
        copy.players[1] = players[1].clone();

        // Copy turn tracking
        copy.turn_count = turn_count;
        copy.current_player_index = current_player_index;
        copy.current_phase = current_phase;

        // Copy result
        copy.result = result;
        copy.winner_id = winner_id;

        return copy;
    }
};

} // namespace duel
