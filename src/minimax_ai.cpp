/**
 * Fusion Duel Engine - Minimax AI Implementation
 */

#include "minimax_ai.hpp"
#include "guardian_stars.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <limits>

namespace duel {

MinimaxAI::MinimaxAI(const DuelEngine& engine, SearchConfig config)
    : engine_(engine)
    , config_(std::move(config))
{}

void MinimaxAI::reset_stats() {
    nodes_evaluated_ = 0;
    pruning_count_ = 0;
    used_shortcut_ = false;
    last_score_ = 0.0;
}

// ============================================================================
// MOVE SELECTION
// ============================================================================

std::optional<Action> MinimaxAI::get_best_move(const GameState& state) {
    reset_stats();

    if (state.is_game_over()) {
        return std::nullopt;
    }

    // Step 1: Valuable fusion shortcut
    if (auto fusion = find_valuable_fusion(state)) {
        used_shortcut_ = true;
        if (config_.verbose) {
            std::cout << "[MinimaxAI] Valuable fusion found: " << fusion->card_name << std::endl;
        }
        return fusion;
    }

    // Step 2: Full search, AI to move
    const double inf = std::numeric_limits<double>::infinity();
    SearchResult result = minimax(state, config_.max_depth, -inf, inf, true);
    last_score_ = result.score;

    if (config_.verbose) {
        std::cout << "[MinimaxAI] Nodes evaluated: " << nodes_evaluated_ << std::endl;
        std::cout << "[MinimaxAI] Branches pruned: " << pruning_count_ << std::endl;
        std::cout << "[MinimaxAI] Expected score: " << std::fixed << std::setprecision(1)
                  << result.score << std::endl;
    }

    // Step 3: Stance and star come from local rules, not from the search
    if (result.action.has_value() && result.action->is_play()) {
        return refine_play_action(state, *result.action);
    }
    return result.action;
}

std::vector<Action> MinimaxAI::play_turn(GameState& state) {
    std::vector<Action> taken;

    std::optional<Action> move = get_best_move(state);

    // Each applied fusion shrinks the hand, so this terminates
    while (move.has_value() && move->is_fuse()) {
        if (!engine_.apply_action(state, AI_PLAYER, *move)) {
            break;
        }
        taken.push_back(*move);
        move = get_best_move(state);
    }

    if (move.has_value() && !move->is_fuse()) {
        if (engine_.apply_action(state, AI_PLAYER, *move)) {
            taken.push_back(*move);
        }
    }

    if (state.both_fields_occupied()) {
        engine_.resolve_battle(state, AI_PLAYER);
    }

    return taken;
}

// ============================================================================
// SEARCH
// ============================================================================

SearchResult MinimaxAI::minimax(const GameState& state, int depth, double alpha, double beta,
                                bool maximizing) {
    nodes_evaluated_++;

    if (depth <= 0 || state.is_game_over()) {
        return {evaluate(state), std::nullopt};
    }

    const PlayerID mover = maximizing ? AI_PLAYER : HUMAN_PLAYER;
    std::vector<Action> actions = engine_.get_legal_actions(state, mover);
    if (actions.empty()) {
        return {evaluate(state), std::nullopt};
    }

    SearchResult best;
    best.score = maximizing ? -std::numeric_limits<double>::infinity()
                            : std::numeric_limits<double>::infinity();
    best.action = actions.front();

    for (const auto& action : actions) {
        GameState child = state.clone_for_search();
        engine_.apply_action(child, mover, action);

        // The mover attacks whenever both fields are occupied
        if (child.both_fields_occupied()) {
            engine_.resolve_battle(child, mover);
        }

        double score;
        if (action.is_fuse()) {
            // Same side, same depth: it still gets to play this turn
            score = minimax(child, depth, alpha, beta, maximizing).score;
        } else {
            score = minimax(child, depth - 1, alpha, beta, !maximizing).score;
        }

        if (maximizing) {
            if (score > best.score) {
                best.score = score;
                best.action = action;
            }
            alpha = std::max(alpha, score);
        } else {
            if (score < best.score) {
                best.score = score;
                best.action = action;
            }
            beta = std::min(beta, score);
        }

        if (config_.use_alpha_beta && beta <= alpha) {
            pruning_count_++;
            break;
        }
    }

    return best;
}

// ============================================================================
// EVALUATION
// ============================================================================

double MinimaxAI::evaluate(const GameState& state) const {
    const EvalWeights& w = config_.weights;

    if (state.is_game_over()) {
        if (state.winner_id == AI_PLAYER) return config_.win_score;
        if (state.winner_id == HUMAN_PLAYER) return -config_.win_score;
        return 0.0;
    }

    const PlayerState& ai = state.ai();
    const PlayerState& human = state.human();
    double score = 0.0;

    // 1. Life difference
    score += (ai.life_points - human.life_points) * w.life_diff;

    // 2. Field control
    score += evaluate_field(ai, human);

    // 3. Hand quality
    int ai_power = 0;
    int human_power = 0;
    for (const auto& card : ai.hand.cards) ai_power += card.best_stat();
    for (const auto& card : human.hand.cards) human_power += card.best_stat();
    score += (ai_power - human_power) * w.hand_power;
    score += (ai.best_hand_atk() - human.best_hand_atk()) * w.hand_best_atk;

    // 4. Resources
    score += (ai.hand.count() - human.hand.count()) * w.hand_count;
    score += (ai.deck.count() - human.deck.count()) * w.deck_count;

    // 5. Fusion potential
    score += (fusion_potential(ai) - fusion_potential(human)) * w.fusion_potential;

    // 6. Next draws (both piles are visible)
    if (const CardInstance* next = ai.deck.peek_top()) {
        score += next->best_stat() * w.next_draw;
    }
    if (const CardInstance* next = human.deck.peek_top()) {
        score -= next->best_stat() * w.next_draw;
    }

    // 7. Low-life urgency
    if (ai.life_points < config_.low_life_threshold) {
        score -= (config_.low_life_threshold - ai.life_points) * w.low_life;
    }
    if (human.life_points < config_.low_life_threshold) {
        score += (config_.low_life_threshold - human.life_points) * w.low_life;
    }

    return score;
}

double MinimaxAI::evaluate_field(const PlayerState& ai, const PlayerState& human) const {
    const EvalWeights& w = config_.weights;

    if (ai.field.has_value() && !human.field.has_value()) {
        return ai.field->atk * w.lone_field_atk;
    }
    if (human.field.has_value() && !ai.field.has_value()) {
        return -human.field->atk * w.lone_field_atk;
    }
    if (!ai.field.has_value()) {
        return 0.0;
    }

    int ai_value = stance_battle_value(*ai.field, *human.field);
    int human_value = stance_battle_value(*human.field, *ai.field);

    double score = 0.0;
    if (ai_value > human_value) {
        score += (ai_value - human_value) * w.field_margin;
        if (human.field->is_attack_stance()) {
            score += w.field_stance_bonus;
        }
    } else {
        // Equal values fall here too
        score -= (human_value - ai_value) * w.field_margin;
        if (ai.field->is_attack_stance()) {
            score -= w.field_stance_bonus;
        }
    }
    return score;
}

double MinimaxAI::fusion_potential(const PlayerState& player) const {
    const CardDatabase& db = engine_.get_card_database();
    double value = 0.0;

    for (const auto& option : player.possible_fusions(db)) {
        int original_best = std::max(player.hand.cards[option.first].atk,
                                     player.hand.cards[option.second].atk);
        int improvement = std::max(0, option.result.atk - original_best);
        value += 1.0 + static_cast<double>(improvement) / config_.fusion_divisor;
    }
    return value;
}

// ============================================================================
// HEURISTICS
// ============================================================================

std::optional<Action> MinimaxAI::find_valuable_fusion(const GameState& state) const {
    const PlayerState& ai = state.ai();
    const CardDatabase& db = engine_.get_card_database();

    std::optional<Action> best;
    int best_improvement = 0;

    for (const auto& option : ai.possible_fusions(db)) {
        int original_best = std::max(ai.hand.cards[option.first].atk,
                                     ai.hand.cards[option.second].atk);
        int improvement = option.result.atk - original_best;

        bool valuable = improvement > config_.valuable_fusion_margin
                     || option.result.atk >= config_.valuable_fusion_atk;
        if (!valuable) {
            continue;
        }

        if (!best.has_value() || improvement > best_improvement) {
            best_improvement = improvement;
            best = Action::fuse(AI_PLAYER, option.first, option.second, option.result.name);
        }
    }

    return best;
}

Action MinimaxAI::refine_play_action(const GameState& state, const Action& action) const {
    const CardInstance* card = state.ai().hand.at(action.hand_index);
    if (card == nullptr) {
        return action;
    }

    const CardInstance* opponent = state.human().field.has_value() ? &*state.human().field : nullptr;

    Action refined = action;
    refined.star_num = select_best_star(*card, opponent);
    refined.stance = select_best_stance(*card, opponent);
    refined.card_name = card->name;
    return refined;
}

int MinimaxAI::select_best_star(const CardInstance& card, const CardInstance* opponent) const {
    if (opponent == nullptr) {
        return 1;
    }

    int bonus1 = combat_bonus(card.star1, opponent->selected_star);
    int bonus2 = combat_bonus(card.star2, opponent->selected_star);
    return (bonus2 > bonus1) ? 2 : 1;
}

Stance MinimaxAI::select_best_stance(const CardInstance& card, const CardInstance* opponent) const {
    if (opponent == nullptr) {
        return card.atk >= config_.attack_stance_threshold ? Stance::ATTACK : Stance::DEFENSE;
    }

    // Guaranteed win
    if (card.atk > opponent->atk) {
        return Stance::ATTACK;
    }
    // Safe block
    if (card.def >= opponent->atk) {
        return Stance::DEFENSE;
    }
    return card.def > card.atk ? Stance::DEFENSE : Stance::ATTACK;
}

} // namespace duel
