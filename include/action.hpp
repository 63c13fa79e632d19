/**
 * Fusion Duel Engine - Action Representation
 *
 * Defines the Action struct used by get_legal_actions() and apply_action().
 */

#pragma once

#include "types.hpp"
#include <functional>

namespace duel {

/**
 * Action - A single game action.
 *
 * PLAY uses hand_index/stance/star_num, FUSE uses fuse_first/fuse_second,
 * PASS carries no parameters.
 */
struct Action {
    ActionType action_type = ActionType::PASS;
    PlayerID player_id = HUMAN_PLAYER;

    // PLAY parameters
    int hand_index = -1;
    Stance stance = Stance::ATTACK;
    int star_num = 1;             // 1 or 2

    // FUSE parameters
    int fuse_first = -1;
    int fuse_second = -1;

    // Card played, or fusion result, for UI/logging
    std::string card_name;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Action() = default;

    Action(ActionType type, PlayerID player)
        : action_type(type)
        , player_id(player)
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static Action play(PlayerID player, int index, Stance stance, int star_num,
                       const std::string& card_name = "") {
        Action a(ActionType::PLAY, player);
        a.hand_index = index;
        a.stance = stance;
        a.star_num = star_num;
        a.card_name = card_name;
        return a;
    }

    static Action fuse(PlayerID player, int first, int second,
                       const std::string& result_name = "") {
        Action a(ActionType::FUSE, player);
        a.fuse_first = first;
        a.fuse_second = second;
        a.card_name = result_name;
        return a;
    }

    static Action pass(PlayerID player) {
        return Action(ActionType::PASS, player);
    }

    bool is_play() const { return action_type == ActionType::PLAY; }
    bool is_fuse() const { return action_type == ActionType::FUSE; }
    bool is_pass() const { return action_type == ActionType::PASS; }

    // ========================================================================
    // STRING REPRESENTATION
    // ========================================================================

    std::string to_string() const {
        std::string result = duel::to_string(action_type);
        result += "(P" + std::to_string(static_cast<int>(player_id));

        if (action_type == ActionType::PLAY) {
            result += ", index=" + std::to_string(hand_index);
            result += ", " + std::string(duel::to_string(stance));
            result += ", star=" + std::to_string(star_num);
        } else if (action_type == ActionType::FUSE) {
            result += ", " + std::to_string(fuse_first) + "+" + std::to_string(fuse_second);
        }
        if (!card_name.empty()) {
            result += ", " + card_name;
        }
        result += ")";
        return result;
    }

    // ========================================================================
    // COMPARISON
    // ========================================================================

    bool operator==(const Action& other) const {
        return action_type == other.action_type
            && player_id == other.player_id
            && hand_index == other.hand_index
            && stance == other.stance
            && star_num == other.star_num
            && fuse_first == other.fuse_first
            && fuse_second == other.fuse_second;
    }

    bool operator!=(const Action& other) const {
        return !(*this == other);
    }
};

} // namespace duel

// Hash function for Action (for use in unordered_set/map)
namespace std {
    template<>
    struct hash<duel::Action> {
        size_t operator()(const duel::Action& a) const {
            size_t h = hash<int>()(static_cast<int>(a.action_type));
            h ^= hash<int>()(a.player_id) << 1;
            h ^= hash<int>()(a.hand_index) << 2;
            h ^= hash<int>()(static_cast<int>(a.stance)) << 3;
            h ^= hash<int>()(a.star_num) << 4;
            h ^= hash<int>()(a.fuse_first) << 5;
            h ^= hash<int>()(a.fuse_second) << 6;
            return h;
        }
    };
}
