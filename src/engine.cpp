/**
 * Fusion Duel Engine - Engine Implementation
 *
 * Core duel rules: action generation, application, battle resolution,
 * turn flow and win conditions.
 */

#include "engine.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace duel {

DuelEngine::DuelEngine(const CardDatabase& card_db)
    : card_db_(card_db)
{
    // Seed RNG with current time
    auto seed = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    rng_.seed(static_cast<std::mt19937::result_type>(seed));
}

// ============================================================================
// CORE API
// ============================================================================

std::vector<Action> DuelEngine::get_legal_actions(const GameState& state, PlayerID player_id) const {
    if (state.is_game_over()) {
        return {};
    }

    std::vector<Action> actions;
    const PlayerState& player = state.get_player(player_id);

    // 1. Four play variants per hand card
    for (int i = 0; i < player.hand.count(); ++i) {
        const std::string& name = player.hand.cards[i].name;
        actions.push_back(Action::play(player_id, i, Stance::ATTACK, 1, name));
        actions.push_back(Action::play(player_id, i, Stance::ATTACK, 2, name));
        actions.push_back(Action::play(player_id, i, Stance::DEFENSE, 1, name));
        actions.push_back(Action::play(player_id, i, Stance::DEFENSE, 2, name));
    }

    // 2. One fusion per fusable pair
    for (const auto& option : player.possible_fusions(card_db_)) {
        actions.push_back(Action::fuse(player_id, option.first, option.second, option.result.name));
    }

    // 3. Pass: forced when nothing else is possible, optional when holding the field
    if (actions.empty() || player.has_field_card()) {
        actions.push_back(Action::pass(player_id));
    }

    return actions;
}

bool DuelEngine::apply_action(GameState& state, PlayerID player_id, const Action& action) const {
    if (state.is_game_over()) {
        return false;
    }

    PlayerState& player = state.get_player(player_id);
    bool applied = false;

    switch (action.action_type) {
        case ActionType::PLAY:
            applied = apply_play(player, action);
            break;
        case ActionType::FUSE:
            applied = apply_fuse(player, action);
            break;
        case ActionType::PASS:
            // Keep the current field card
            applied = true;
            break;
    }

    if (applied) {
        check_win_conditions(state);
    }
    return applied;
}

GameState DuelEngine::step(const GameState& state, PlayerID player, const Action& action) const {
    GameState new_state = state.clone();
    apply_action(new_state, player, action);
    return new_state;
}

bool DuelEngine::apply_play(PlayerState& player, const Action& action) const {
    return player.play_to_field(action.hand_index, action.stance, action.star_num);
}

bool DuelEngine::apply_fuse(PlayerState& player, const Action& action) const {
    return player.fuse(card_db_, action.fuse_first, action.fuse_second).has_value();
}

// ============================================================================
// BATTLE
// ============================================================================

std::optional<BattleResult> DuelEngine::resolve_battle(GameState& state, PlayerID attacker_id) const {
    if (state.is_game_over() || !state.both_fields_occupied()) {
        return std::nullopt;
    }

    state.current_phase = GamePhase::BATTLE;

    PlayerID defender_id = opponent_of(attacker_id);
    PlayerState& attacker_player = state.get_player(attacker_id);
    PlayerState& defender_player = state.get_player(defender_id);
    const CardInstance& attacker = *attacker_player.field;
    const CardInstance& defender = *defender_player.field;

    BattleValues values = compute_battle_values(attacker, defender);

    // Record everything before any card leaves the field
    BattleResult result;
    result.attacker_id = attacker_id;
    result.human_card = state.human().field->name;
    result.ai_card = state.ai().field->name;
    result.attacker_value = values.attacker_value;
    result.defender_value = values.defender_value;
    result.attacker_bonus = values.attacker_bonus;
    result.defender_bonus = values.defender_bonus;
    result.human_value = (attacker_id == HUMAN_PLAYER) ? values.attacker_value : values.defender_value;
    result.ai_value = (attacker_id == AI_PLAYER) ? values.attacker_value : values.defender_value;
    result.human_star = state.human().field->selected_star;
    result.ai_star = state.ai().field->selected_star;
    result.human_stance = state.human().field->stance;
    result.ai_stance = state.ai().field->stance;
    result.defender_stance = defender.stance;

    const bool defender_in_attack = defender.is_attack_stance();

    if (values.attacker_value > values.defender_value) {
        // Attacker wins: defender is destroyed, its owner only bleeds from ATTACK
        if (defender_in_attack) {
            result.damage = values.attacker_value - values.defender_value;
            result.damaged_player = defender_id;
            defender_player.life_points -= result.damage;
        }
        result.outcome = BattleOutcome::ATTACKER_WINS;
        result.winner = attacker_id;
        result.defender_destroyed = true;
        destroy_field_card(defender_player);

    } else if (values.defender_value > values.attacker_value) {
        result.damage = values.defender_value - values.attacker_value;
        result.damaged_player = attacker_id;
        attacker_player.life_points -= result.damage;
        result.winner = defender_id;

        if (defender_in_attack) {
            result.outcome = BattleOutcome::DEFENDER_WINS;
            result.attacker_destroyed = true;
            destroy_field_card(attacker_player);
        } else {
            // Rebound: both cards stay
            result.outcome = BattleOutcome::REBOUND;
        }

    } else {
        if (defender_in_attack) {
            result.outcome = BattleOutcome::MUTUAL_DESTRUCTION;
            result.attacker_destroyed = true;
            result.defender_destroyed = true;
            destroy_field_card(attacker_player);
            destroy_field_card(defender_player);
        } else {
            result.outcome = BattleOutcome::STANDOFF;
        }
    }

    if (state.record_battles) {
        result.description = describe_battle(result);
        state.battle_log.push_back(result);
        state.last_battle = result;
    }
    state.current_phase = GamePhase::END;

    check_win_conditions(state);

    return result;
}

void DuelEngine::destroy_field_card(PlayerState& owner) const {
    if (!owner.field.has_value()) {
        return;
    }
    owner.discard.add_card(std::move(*owner.field));
    owner.field.reset();
}

std::string DuelEngine::describe_battle(const BattleResult& result) const {
    const std::string attacker_card = (result.attacker_id == HUMAN_PLAYER) ? result.human_card : result.ai_card;
    const std::string defender_card = (result.attacker_id == HUMAN_PLAYER) ? result.ai_card : result.human_card;
    const std::string attacker_name = (result.attacker_id == HUMAN_PLAYER) ? "Player" : "AI";
    const std::string defender_name = (result.attacker_id == HUMAN_PLAYER) ? "AI" : "Player";

    switch (result.outcome) {
        case BattleOutcome::ATTACKER_WINS:
            if (result.damage > 0) {
                return attacker_card + " destroys " + defender_card + ". "
                    + defender_name + " takes " + std::to_string(result.damage) + " damage.";
            }
            return attacker_card + " destroys " + defender_card + " in DEF. No damage.";

        case BattleOutcome::DEFENDER_WINS:
            return defender_card + " destroys " + attacker_card + ". "
                + attacker_name + " takes " + std::to_string(result.damage) + " damage.";

        case BattleOutcome::REBOUND:
            return defender_card + " holds in DEF. "
                + attacker_name + " takes " + std::to_string(result.damage) + " rebound damage.";

        case BattleOutcome::MUTUAL_DESTRUCTION:
            return "Tie! " + attacker_card + " and " + defender_card + " are both destroyed.";

        case BattleOutcome::STANDOFF:
            return "Tie! ATK equals DEF, nothing happens.";
    }
    return "";
}

// ============================================================================
// TURN FLOW
// ============================================================================

bool DuelEngine::next_turn(GameState& state) const {
    if (state.is_game_over()) {
        return false;
    }

    state.current_player_index = opponent_of(state.current_player_index);
    if (state.current_player_index == HUMAN_PLAYER) {
        state.turn_count++;
    }

    state.current_phase = GamePhase::DRAW;
    state.get_current_player().draw();
    state.current_phase = GamePhase::MAIN;

    check_win_conditions(state);
    return true;
}

std::optional<CardInstance> DuelEngine::draw(GameState& state, PlayerID player) const {
    if (state.is_game_over()) {
        return std::nullopt;
    }
    return state.get_player(player).draw();
}

bool DuelEngine::undo_last_play(GameState& state, PlayerID player) const {
    if (state.is_game_over()) {
        return false;
    }
    return state.get_player(player).undo_last_play();
}

std::vector<CardInstance> DuelEngine::upcoming_cards(const GameState& state, PlayerID player,
                                                     int num_cards) const {
    return state.get_player(player).deck.peek(num_cards);
}

// ============================================================================
// WIN CONDITION CHECKS
// ============================================================================

void DuelEngine::check_win_conditions(GameState& state) const {
    if (state.is_game_over()) return;

    // Life points, human checked first
    if (state.human().life_points <= 0) {
        state.result = GameResult::AI_WIN;
        state.winner_id = AI_PLAYER;
        return;
    }
    if (state.ai().life_points <= 0) {
        state.result = GameResult::HUMAN_WIN;
        state.winner_id = HUMAN_PLAYER;
        return;
    }

    // Deck-out: no draw pile, no hand, no field
    if (state.human().is_decked_out()) {
        state.result = GameResult::AI_WIN;
        state.winner_id = AI_PLAYER;
    } else if (state.ai().is_decked_out()) {
        state.result = GameResult::HUMAN_WIN;
        state.winner_id = HUMAN_PLAYER;
    }
}

// ============================================================================
// GAME SETUP
// ============================================================================

GameState DuelEngine::create_game(const GameConfig& config) const {
    std::mt19937 rng(config.random_seed.has_value()
                         ? static_cast<std::mt19937::result_type>(*config.random_seed)
                         : rng_());

    const int deck_size = config.clamped_deck_size();

    std::vector<CardInstance> pool = card_db_.create_all_instances();
    std::shuffle(pool.begin(), pool.end(), rng);

    if (static_cast<int>(pool.size()) < deck_size * 2) {
        std::vector<CardInstance> doubled = pool;
        doubled.insert(doubled.end(), pool.begin(), pool.end());
        pool = std::move(doubled);
        std::shuffle(pool.begin(), pool.end(), rng);
    }

    GameState state;
    for (auto& player : state.players) {
        player.life_points = config.starting_life;
        player.max_hand_size = config.max_hand_size;
    }

    // First half to the human, second half to the AI
    const int pool_size = static_cast<int>(pool.size());
    for (int i = 0; i < deck_size && i < pool_size; ++i) {
        state.human().deck.add_card(pool[i]);
    }
    for (int i = deck_size; i < deck_size * 2 && i < pool_size; ++i) {
        state.ai().deck.add_card(pool[i]);
    }

    state.human().deck.shuffle(rng);
    state.ai().deck.shuffle(rng);

    for (int i = 0; i < config.initial_hand_size; ++i) {
        state.human().draw();
        state.ai().draw();
    }

    state.current_phase = GamePhase::MAIN;
    check_win_conditions(state);

    std::cout << "[Engine] Game created: " << deck_size << " cards per deck" << std::endl;
    return state;
}

} // namespace duel
