/**
 * Fusion Duel Engine - Minimax AI
 *
 * Depth-limited minimax with alpha-beta pruning over perfect-information
 * duel states. The AI maximizes, the human minimizes.
 *
 * Usage:
 *   MinimaxAI ai(engine, config.search);
 *   std::optional<Action> move = ai.get_best_move(state);
 */

#pragma once

#include "engine.hpp"
#include "config.hpp"

namespace duel {

/**
 * Score and chosen action of one search node.
 *
 * action is nullopt at leaves and when no action was available.
 */
struct SearchResult {
    double score = 0.0;
    std::optional<Action> action;
};

/**
 * MinimaxAI - Search-based opponent.
 *
 * Holds a reference to the engine; every explored node works on its own
 * clone of the state, so sibling branches never share mutable data.
 */
class MinimaxAI {
public:
    MinimaxAI(const DuelEngine& engine, SearchConfig config = SearchConfig());

    // ========================================================================
    // MOVE SELECTION
    // ========================================================================

    /**
     * Best move for the AI in this state.
     *
     * Takes a valuable fusion immediately if one exists, otherwise runs the
     * full search and re-derives stance and star of a chosen play.
     * nullopt only if the AI has no legal action (game over).
     */
    std::optional<Action> get_best_move(const GameState& state);

    /**
     * Play the AI's whole main phase in place.
     *
     * Fusions are applied one at a time with a fresh decision after each;
     * then the chosen play or pass is applied and, if both fields are
     * occupied, the AI attacks. The caller advances the turn.
     * Returns the actions that were applied.
     */
    std::vector<Action> play_turn(GameState& state);

    // ========================================================================
    // SEARCH
    // ========================================================================

    /**
     * Minimax over the state.
     *
     * Fusions keep the depth and the mover; plays and passes consume one
     * level and hand the move over. Ties keep the first action found.
     */
    SearchResult minimax(const GameState& state, int depth, double alpha, double beta,
                         bool maximizing);

    // ========================================================================
    // EVALUATION
    // ========================================================================

    /**
     * Heuristic value of a state from the AI's point of view.
     *
     * Decided states score +/-win_score (0 on a tie). Otherwise a weighted
     * sum of life difference, field control, hand quality, resource counts,
     * fusion potential, next draws and low-life urgency.
     */
    double evaluate(const GameState& state) const;

    /**
     * Sum over every fusable pair in a hand of 1 + max(0, improvement) / divisor,
     * where improvement is the result's ATK over the better material's ATK.
     */
    double fusion_potential(const PlayerState& player) const;

    // ========================================================================
    // HEURISTICS
    // ========================================================================

    /**
     * Fusion in the AI's hand whose result beats the better material by more
     * than the margin or reaches the absolute ATK threshold. Among several,
     * the greatest improvement wins; ties keep the first pair.
     */
    std::optional<Action> find_valuable_fusion(const GameState& state) const;

    /**
     * Re-derive stance and star of a play action from local rules.
     */
    Action refine_play_action(const GameState& state, const Action& action) const;

    /**
     * 1 or 2: the star with the strictly greater bonus against the opponent's
     * active star; star 1 on a tie or with no opponent.
     */
    int select_best_star(const CardInstance& card, const CardInstance* opponent) const;

    Stance select_best_stance(const CardInstance& card, const CardInstance* opponent) const;

    // ========================================================================
    // CONFIGURATION AND STATISTICS
    // ========================================================================

    const SearchConfig& config() const { return config_; }
    void set_max_depth(int depth) { config_.max_depth = depth; }
    void set_verbose(bool verbose) { config_.verbose = verbose; }

    const char* get_difficulty_name() const { return difficulty_name(config_.max_depth); }

    // Statistics of the most recent get_best_move()
    int nodes_evaluated() const { return nodes_evaluated_; }
    int pruning_count() const { return pruning_count_; }
    bool used_shortcut() const { return used_shortcut_; }
    double last_score() const { return last_score_; }

private:
    const DuelEngine& engine_;
    SearchConfig config_;

    int nodes_evaluated_ = 0;
    int pruning_count_ = 0;
    bool used_shortcut_ = false;
    double last_score_ = 0.0;

    void reset_stats();
    double evaluate_field(const PlayerState& ai, const PlayerState& human) const;
};

} // namespace duel
