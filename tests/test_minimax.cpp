/**
 * Tests for Minimax Search and AI Heuristics
 */

#include "test_fixtures.hpp"
#include <limits>

namespace {

const double INF = std::numeric_limits<double>::infinity();

SearchConfig shallow_config(int depth) {
    SearchConfig config;
    config.max_depth = depth;
    return config;
}

} // namespace

// ============================================================================
// EVALUATION TESTS
// ============================================================================

TEST(MinimaxEval, DecidedStatesScoreWinValue) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state;
    state.result = GameResult::AI_WIN;
    state.winner_id = AI_PLAYER;
    TEST_ASSERT_EQ(100000.0, ai.evaluate(state));

    state.result = GameResult::HUMAN_WIN;
    state.winner_id = HUMAN_PLAYER;
    TEST_ASSERT_EQ(-100000.0, ai.evaluate(state));

    state.result = GameResult::DRAW;
    state.winner_id.reset();
    TEST_ASSERT_EQ(0.0, ai.evaluate(state));
}

TEST(MinimaxEval, SymmetricStateIsNeutral) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state;
    TEST_ASSERT_EQ(0.0, ai.evaluate(state));
}

TEST(MinimaxEval, LifeLeadCounts) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state;
    state.human().life_points = 7000;
    TEST_ASSERT_EQ(1500.0, ai.evaluate(state));
}

TEST(MinimaxEval, LowLifeUrgency) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state;
    state.human().life_points = 1000;
    // 7000 * 1.5 + (2000 - 1000) * 0.5
    TEST_ASSERT_EQ(11000.0, ai.evaluate(state));

    GameState mirrored;
    mirrored.ai().life_points = 1000;
    TEST_ASSERT_EQ(-11000.0, ai.evaluate(mirrored));
}

TEST(MinimaxEval, LoneFieldCardCounts) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state;
    state.ai().field = make_card("Holder", 1500, 1000);
    TEST_ASSERT(near(450.0, ai.evaluate(state)));

    GameState mirrored;
    mirrored.human().field = make_card("Holder", 1500, 1000);
    TEST_ASSERT(near(-450.0, ai.evaluate(mirrored)));
}

TEST(MinimaxEval, FieldMarginAndStanceBonus) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    // AI 2000 vs human 1200 in ATK: 800 * 0.5 + 200
    GameState state;
    state.ai().field = make_card("Big", 2000, 1000, GuardianStar::SUN);
    state.human().field = make_card("Small", 1200, 1000, GuardianStar::MARS);
    TEST_ASSERT(near(600.0, ai.evaluate(state)));

    // Equal values count against the AI when it stands in ATK
    GameState even;
    even.ai().field = make_card("Left", 1200, 1000, GuardianStar::SUN);
    even.human().field = make_card("Right", 1200, 1000, GuardianStar::MARS);
    TEST_ASSERT(near(-200.0, ai.evaluate(even)));
}

TEST(MinimaxEval, FusionPotential) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    PlayerState strong;
    strong.hand.add_card(instance_of(db, "Alpha"));
    strong.hand.add_card(instance_of(db, "Beta"));
    TEST_ASSERT(near(6.0, ai.fusion_potential(strong)));

    // A fusion that does not improve still counts once
    PlayerState weak;
    weak.hand.add_card(instance_of(db, "Gamma"));
    weak.hand.add_card(instance_of(db, "Zeta"));
    TEST_ASSERT(near(1.0, ai.fusion_potential(weak)));

    PlayerState none;
    none.hand.add_card(instance_of(db, "Alpha"));
    none.hand.add_card(instance_of(db, "Gamma"));
    TEST_ASSERT(near(0.0, ai.fusion_potential(none)));
}

// ============================================================================
// SEARCH TESTS
// ============================================================================

TEST(Minimax, LeafReturnsEvaluation) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state = make_stocked_state();
    state.ai().hand.add_card(instance_of(db, "Gamma"));

    SearchResult result = ai.minimax(state, 0, -INF, INF, true);
    TEST_ASSERT_FALSE(result.action.has_value());
    TEST_ASSERT_EQ(ai.evaluate(state), result.score);
}

TEST(Minimax, FusionDoesNotConsumeDepth) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine, shallow_config(1));

    GameState state = make_stocked_state();
    state.human().field = make_card("Guard", 2000, 1500, GuardianStar::MARS, GuardianStar::JUPITER);
    state.ai().hand.add_card(instance_of(db, "Alpha"));
    state.ai().hand.add_card(instance_of(db, "Beta"));

    SearchResult result = ai.minimax(state, 1, -INF, INF, true);
    TEST_ASSERT(result.action.has_value());
    TEST_ASSERT(result.action->is_fuse());

    // The fused card was played and fought within the same ply
    GameState line = state.clone();
    engine.apply_action(line, AI_PLAYER, Action::fuse(AI_PLAYER, 0, 1));
    engine.apply_action(line, AI_PLAYER, Action::play(AI_PLAYER, 0, Stance::ATTACK, 1));
    engine.resolve_battle(line, AI_PLAYER);
    TEST_ASSERT_EQ(6500, line.human().life_points);
    TEST_ASSERT_EQ(ai.evaluate(line), result.score);
}

TEST(Minimax, AlphaBetaMatchesPlainSearch) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);

    GameState state = make_stocked_state();
    state.human().hand.add_card(instance_of(db, "Gamma"));
    state.human().hand.add_card(instance_of(db, "Delta"));
    state.human().hand.add_card(instance_of(db, "Zeta"));
    state.ai().hand.add_card(instance_of(db, "Alpha"));
    state.ai().hand.add_card(instance_of(db, "Epsilon"));
    state.ai().hand.add_card(instance_of(db, "Gamma"));
    state.ai().hand.add_card(instance_of(db, "Zeta"));

    SearchConfig pruned_config = shallow_config(3);
    SearchConfig plain_config = shallow_config(3);
    plain_config.use_alpha_beta = false;

    MinimaxAI pruned(engine, pruned_config);
    MinimaxAI plain(engine, plain_config);

    SearchResult a = pruned.minimax(state, 3, -INF, INF, true);
    SearchResult b = plain.minimax(state, 3, -INF, INF, true);

    TEST_ASSERT_EQ(b.score, a.score);
    TEST_ASSERT(a.action.has_value());
    TEST_ASSERT(b.action.has_value());
    TEST_ASSERT(*a.action == *b.action);

    TEST_ASSERT_EQ(0, plain.pruning_count());
    TEST_ASSERT(pruned.nodes_evaluated() <= plain.nodes_evaluated());
}

TEST(Minimax, SearchDoesNotMutateInput) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine, shallow_config(2));

    GameState state = make_stocked_state();
    state.human().field = make_card("Guard", 1600, 1500, GuardianStar::MARS);
    state.ai().hand.add_card(instance_of(db, "Gamma"));
    state.ai().hand.add_card(instance_of(db, "Delta"));

    ai.get_best_move(state);

    TEST_ASSERT_EQ(2, state.ai().hand.count());
    TEST_ASSERT_FALSE(state.ai().has_field_card());
    TEST_ASSERT_EQ(8000, state.human().life_points);
    TEST_ASSERT(state.battle_log.empty());
}

// ============================================================================
// MOVE SELECTION TESTS
// ============================================================================

TEST(MinimaxMove, NoMoveWhenGameOver) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state = make_stocked_state();
    state.ai().hand.add_card(instance_of(db, "Gamma"));
    state.result = GameResult::HUMAN_WIN;
    state.winner_id = HUMAN_PLAYER;

    TEST_ASSERT_FALSE(ai.get_best_move(state).has_value());
}

TEST(MinimaxMove, ValuableFusionShortcut) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state = make_stocked_state();
    state.ai().hand.add_card(instance_of(db, "Alpha"));
    state.ai().hand.add_card(instance_of(db, "Beta"));

    auto move = ai.get_best_move(state);
    TEST_ASSERT(move.has_value());
    TEST_ASSERT(*move == Action::fuse(AI_PLAYER, 0, 1));
    TEST_ASSERT(ai.used_shortcut());
    TEST_ASSERT_EQ(0, ai.nodes_evaluated());
}

TEST(MinimaxMove, ShortcutPrefersGreatestImprovement) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state = make_stocked_state();
    state.ai().hand.add_card(instance_of(db, "Delta"));
    state.ai().hand.add_card(instance_of(db, "Zeta"));
    state.ai().hand.add_card(instance_of(db, "Alpha"));
    state.ai().hand.add_card(instance_of(db, "Beta"));

    auto fusion = ai.find_valuable_fusion(state);
    TEST_ASSERT(fusion.has_value());
    TEST_ASSERT_EQ(2, fusion->fuse_first);
    TEST_ASSERT_EQ(3, fusion->fuse_second);
    TEST_ASSERT_EQ(std::string("Omega"), fusion->card_name);
}

TEST(MinimaxMove, ShortcutAcceptsStrongResultWithoutImprovement) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state = make_stocked_state();
    state.ai().hand.add_card(instance_of(db, "Titan"));
    state.ai().hand.add_card(instance_of(db, "Pebble"));

    auto fusion = ai.find_valuable_fusion(state);
    TEST_ASSERT(fusion.has_value());
    TEST_ASSERT_EQ(std::string("Titan Shard"), fusion->card_name);
}

TEST(MinimaxMove, MinorFusionIsNotShortcut) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state = make_stocked_state();
    state.ai().hand.add_card(instance_of(db, "Gamma"));
    state.ai().hand.add_card(instance_of(db, "Epsilon"));

    TEST_ASSERT_FALSE(ai.find_valuable_fusion(state).has_value());
}

TEST(MinimaxMove, SearchedPlayIsRefined) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine, shallow_config(2));

    GameState state = make_stocked_state();
    state.ai().hand.add_card(instance_of(db, "Gamma"));
    state.ai().hand.add_card(instance_of(db, "Delta"));
    state.human().hand.add_card(instance_of(db, "Zeta"));

    auto move = ai.get_best_move(state);
    TEST_ASSERT(move.has_value());
    TEST_ASSERT(move->is_play());
    TEST_ASSERT_FALSE(ai.used_shortcut());
    TEST_ASSERT(ai.nodes_evaluated() > 0);

    // No opponent on the field: star 1, ATK for 1500 and up
    TEST_ASSERT_EQ(1, move->star_num);
    TEST_ASSERT(move->stance == Stance::ATTACK);
    TEST_ASSERT_EQ(state.ai().hand.at(move->hand_index)->name, move->card_name);
}

TEST(MinimaxMove, RefineAgainstOpponent) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    GameState state = make_stocked_state();
    state.human().field = make_card("Sun Guard", 2200, 1000, GuardianStar::SUN);
    state.ai().hand.add_card(make_card("Wall", 800, 2500, GuardianStar::MOON, GuardianStar::MERCURY));

    Action refined = ai.refine_play_action(state, Action::play(AI_PLAYER, 0, Stance::ATTACK, 1));
    TEST_ASSERT_EQ(2, refined.star_num);
    TEST_ASSERT(refined.stance == Stance::DEFENSE);
    TEST_ASSERT_EQ(std::string("Wall"), refined.card_name);
}

TEST(MinimaxMove, StarSelection) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    CardInstance card = make_card("Dual", 1000, 1000, GuardianStar::SUN, GuardianStar::MERCURY);

    CardInstance sun = make_card("Sun", 1000, 1000, GuardianStar::SUN);
    CardInstance moon = make_card("Moon", 1000, 1000, GuardianStar::MOON);
    CardInstance mars = make_card("Mars", 1000, 1000, GuardianStar::MARS);

    TEST_ASSERT_EQ(1, ai.select_best_star(card, nullptr));
    TEST_ASSERT_EQ(2, ai.select_best_star(card, &sun));
    TEST_ASSERT_EQ(1, ai.select_best_star(card, &moon));
    TEST_ASSERT_EQ(1, ai.select_best_star(card, &mars));

    // Opponent's active star is what counts
    CardInstance switched = make_card("Switched", 1000, 1000, GuardianStar::MOON, GuardianStar::SUN);
    switched.select_star(2);
    TEST_ASSERT_EQ(2, ai.select_best_star(card, &switched));
}

TEST(MinimaxMove, StanceSelection) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    TEST_ASSERT(ai.select_best_stance(make_card("A", 1500, 100), nullptr) == Stance::ATTACK);
    TEST_ASSERT(ai.select_best_stance(make_card("B", 1400, 2000), nullptr) == Stance::DEFENSE);

    CardInstance opponent = make_card("Opp", 1200, 1000);
    TEST_ASSERT(ai.select_best_stance(make_card("C", 1300, 100), &opponent) == Stance::ATTACK);
    TEST_ASSERT(ai.select_best_stance(make_card("D", 1000, 1200), &opponent) == Stance::DEFENSE);

    CardInstance strong = make_card("Strong", 1500, 1000);
    TEST_ASSERT(ai.select_best_stance(make_card("E", 1000, 900), &strong) == Stance::ATTACK);
    TEST_ASSERT(ai.select_best_stance(make_card("F", 500, 1000), &strong) == Stance::DEFENSE);
}

TEST(MinimaxMove, DifficultyName) {
    CardDatabase db;
    DuelEngine engine(db);
    MinimaxAI ai(engine);

    TEST_ASSERT_EQ(std::string("Normal"), std::string(ai.get_difficulty_name()));
    ai.set_max_depth(8);
    TEST_ASSERT_EQ(std::string("Expert"), std::string(ai.get_difficulty_name()));
    ai.set_max_depth(2);
    TEST_ASSERT_EQ(std::string("Easy"), std::string(ai.get_difficulty_name()));
}

// ============================================================================
// TURN PLAY TESTS
// ============================================================================

TEST(MinimaxTurn, FusesThenPlaysThenAttacks) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine, shallow_config(2));

    GameState state = make_stocked_state();
    state.human().field = make_card("Bait", 500, 500, GuardianStar::MARS, GuardianStar::JUPITER);
    state.ai().hand.add_card(instance_of(db, "Alpha"));
    state.ai().hand.add_card(instance_of(db, "Beta"));
    state.ai().hand.add_card(instance_of(db, "Epsilon"));

    std::vector<Action> taken = ai.play_turn(state);

    TEST_ASSERT_EQ(2u, taken.size());
    TEST_ASSERT(taken[0].is_fuse());
    TEST_ASSERT(taken[1].is_play());
    TEST_ASSERT_EQ(1, state.ai().hand.count());
    TEST_ASSERT_EQ(2, state.ai().discard.count());

    TEST_ASSERT_EQ(1u, state.battle_log.size());
    TEST_ASSERT(state.battle_log[0].attacker_id == AI_PLAYER);
}

TEST(MinimaxTurn, PassesWhenHandIsEmpty) {
    CardDatabase db;
    fill_test_database(db);
    DuelEngine engine(db);
    MinimaxAI ai(engine, shallow_config(2));

    GameState state = make_stocked_state();
    state.ai().field = make_card("Keeper", 1000, 1000, GuardianStar::SUN);

    std::vector<Action> taken = ai.play_turn(state);
    TEST_ASSERT_EQ(1u, taken.size());
    TEST_ASSERT(taken[0].is_pass());
    TEST_ASSERT(state.ai().has_field_card());
    TEST_ASSERT(state.battle_log.empty());
}
