/**
 * Fusion Duel Engine - Player State
 *
 * Represents a single player's complete state: life, zones, field slot.
 */

#pragma once

#include "zone.hpp"

namespace duel {

class CardDatabase;

constexpr int DEFAULT_STARTING_LIFE = 8000;
constexpr int DEFAULT_MAX_HAND_SIZE = 5;

/**
 * A fusable pair of hand indices (first < second) and the prospective result.
 */
struct FusionOption {
    int first = 0;
    int second = 0;
    CardInstance result;
};

/**
 * PlayerState - Complete state for one player.
 *
 * Owns every card instance it holds. Operations that fail (bad index,
 * full hand, empty pile) leave the state unchanged and report it through
 * their return value.
 */
struct PlayerState {
    PlayerID player_id = HUMAN_PLAYER;
    std::string name = "Player";
    bool is_ai = false;

    int life_points = DEFAULT_STARTING_LIFE;
    int max_hand_size = DEFAULT_MAX_HAND_SIZE;

    // Zones
    Zone deck;       // Draw pile, index 0 is drawn next
    Zone hand;
    Zone discard;

    // Battlefield slot (0 or 1 card)
    std::optional<CardInstance> field;

    // Card replaced by the most recent play; one level of undo only
    std::optional<CardInstance> last_sacrificed;

    // Discard size right after the sacrifice; any later discard buries it
    int sacrifice_discard_size = 0;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    PlayerState() = default;

    PlayerState(PlayerID id, std::string name_, bool is_ai_)
        : player_id(id)
        , name(std::move(name_))
        , is_ai(is_ai_)
    {}

    // ========================================================================
    // CARD OPERATIONS
    // ========================================================================

    /**
     * Move the top of the draw pile into the hand.
     *
     * No-op returning nullopt if the pile is empty or the hand is full.
     */
    std::optional<CardInstance> draw();

    /**
     * Put a hand card on the field with the given stance and star (1 or 2).
     *
     * An occupied field is sacrificed to the discard first and remembered
     * for undo. Returns false if hand_index is out of range.
     */
    bool play_to_field(int hand_index, Stance stance, int star_num);

    /**
     * Return the field card to the end of the hand and restore the
     * sacrificed card if nothing has been discarded on top of it since.
     *
     * Returns false (state unchanged) if the field is empty or the hand
     * is already full.
     */
    bool undo_last_play();

    /**
     * Prospective fusion result for hand cards i and j (either order).
     *
     * nullopt if i == j, either index is out of range, or no recipe matches.
     */
    std::optional<CardInstance> can_fuse(const CardDatabase& db, int i, int j) const;

    /**
     * Fuse hand cards i and j: both go to the discard, the result is
     * appended to the hand. State is unchanged when the fusion is invalid.
     */
    std::optional<CardInstance> fuse(const CardDatabase& db, int i, int j);

    /**
     * Every fusable unordered pair in the hand, in (i, j) lexicographic order.
     */
    std::vector<FusionOption> possible_fusions(const CardDatabase& db) const;

    // ========================================================================
    // QUERIES
    // ========================================================================

    bool has_field_card() const {
        return field.has_value();
    }

    bool hand_full() const {
        return hand.count() >= max_hand_size;
    }

    // Draw pile, hand, and field all empty
    bool is_decked_out() const {
        return deck.is_empty() && hand.is_empty() && !field.has_value();
    }

    int best_hand_atk() const;

    // ========================================================================
    // CLONING
    // ========================================================================

    PlayerState clone() const {
        PlayerState copy;
        copy.player_id = player_id;
        copy.name = name;
        copy.is_ai = is_ai;
        copy.life_points = life_points;
        copy.max_hand_size = max_hand_size;

        // Clone zones
        copy.deck = deck.clone();
        copy.hand = hand.clone();
        copy.discard = discard.clone();

        if (field.has_value()) {
            copy.field = field->clone();
        }
        if (last_sacrificed.has_value()) {
            copy.last_sacrificed = last_sacrificed->clone();
        }
        copy.sacrifice_discard_size = sacrifice_discard_size;

        return copy;
    }
};

} // namespace duel
