/**
 * Fusion Duel Engine - Main Engine Interface
 *
 * This is the primary interface for the duel rules.
 * Provides get_legal_actions() and apply_action() for the search and the
 * presentation layer.
 */

#pragma once

#include "game_state.hpp"
#include "card_database.hpp"
#include "action.hpp"
#include "config.hpp"
#include <random>

namespace duel {

/**
 * DuelEngine - The rules engine.
 *
 * Holds a reference to an immutable catalog; the catalog must outlive the
 * engine. Read operations are const and safe to share; mutations work on
 * the state passed in, so callers needing rollback operate on a clone.
 */
class DuelEngine {
public:
    explicit DuelEngine(const CardDatabase& card_db);
    ~DuelEngine() = default;

    // ========================================================================
    // CORE API
    // ========================================================================

    /**
     * Get all legal actions for a player.
     *
     * Per hand card, four plays in the order (ATK,1) (ATK,2) (DEF,1) (DEF,2);
     * then one fusion per fusable pair; then PASS if nothing else was
     * generated or the player already holds the field. Empty once the game
     * is over.
     */
    std::vector<Action> get_legal_actions(const GameState& state, PlayerID player) const;

    /**
     * Apply an action in place.
     *
     * Returns false (state unchanged) if the game is over, the action
     * targets an invalid index, or the fusion does not match a recipe.
     */
    bool apply_action(GameState& state, PlayerID player, const Action& action) const;

    /**
     * Apply an action to a clone and return it. The original is untouched.
     */
    GameState step(const GameState& state, PlayerID player, const Action& action) const;

    // ========================================================================
    // BATTLE
    // ========================================================================

    /**
     * Resolve a confrontation between the two field cards.
     *
     * No-op returning nullopt if either field is empty or the game is over.
     * Appends the record to the battle log (unless the state is a search
     * copy) and re-checks the win conditions.
     */
    std::optional<BattleResult> resolve_battle(GameState& state, PlayerID attacker) const;

    // ========================================================================
    // TURN FLOW
    // ========================================================================

    /**
     * Hand control to the other player, bump the turn counter when control
     * returns to the human, draw for the new current player, enter MAIN.
     *
     * Returns false if the game is over.
     */
    bool next_turn(GameState& state) const;

    /**
     * Draw one card for a player (bounded by hand size and pile).
     */
    std::optional<CardInstance> draw(GameState& state, PlayerID player) const;

    /**
     * Single-level undo of a player's most recent play.
     */
    bool undo_last_play(GameState& state, PlayerID player) const;

    /**
     * Next n cards of a player's draw pile. Both piles are public.
     */
    std::vector<CardInstance> upcoming_cards(const GameState& state, PlayerID player,
                                             int num_cards = 3) const;

    // ========================================================================
    // WIN CONDITION CHECKS
    // ========================================================================

    /**
     * Check if the game has ended and update the result.
     *
     * Human life first, then AI life, then human deck-out, then AI deck-out.
     * A simultaneous double knockout therefore goes to the AI.
     */
    void check_win_conditions(GameState& state) const;

    // ========================================================================
    // GAME SETUP
    // ========================================================================

    /**
     * Deal a fresh match from the whole catalog.
     *
     * Uses config.random_seed when present, otherwise the engine's own RNG.
     */
    GameState create_game(const GameConfig& config) const;

    // ========================================================================
    // CARD DATABASE ACCESS
    // ========================================================================

    const CardDatabase& get_card_database() const { return card_db_; }

private:
    const CardDatabase& card_db_;
    mutable std::mt19937 rng_;  // For dealing when no seed is given

    // ========================================================================
    // ACTION APPLICATION
    // ========================================================================

    bool apply_play(PlayerState& player, const Action& action) const;
    bool apply_fuse(PlayerState& player, const Action& action) const;

    // ========================================================================
    // BATTLE OUTCOMES
    // ========================================================================

    void destroy_field_card(PlayerState& owner) const;
    std::string describe_battle(const BattleResult& result) const;
};

} // namespace duel
