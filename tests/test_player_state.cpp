/**
 * Tests for Player State Operations
 */

#include "test_fixtures.hpp"

// ============================================================================
// DRAW TESTS
// ============================================================================

TEST(PlayerState, DrawTakesTopOfPile) {
    PlayerState player;
    player.deck.add_card(make_card("First", 100, 100));
    player.deck.add_card(make_card("Second", 200, 200));

    auto drawn = player.draw();
    TEST_ASSERT(drawn.has_value());
    TEST_ASSERT_EQ(std::string("First"), drawn->name);
    TEST_ASSERT_EQ(1, player.hand.count());
    TEST_ASSERT_EQ(1, player.deck.count());
}

TEST(PlayerState, DrawStopsAtHandLimit) {
    PlayerState player;
    stock_deck(player, 12);

    for (int i = 0; i < 10; i++) {
        player.draw();
    }

    TEST_ASSERT_EQ(5, player.hand.count());
    TEST_ASSERT_EQ(7, player.deck.count());
    TEST_ASSERT(player.hand_full());
    TEST_ASSERT_FALSE(player.draw().has_value());
}

TEST(PlayerState, DrawFromEmptyPile) {
    PlayerState player;
    TEST_ASSERT_FALSE(player.draw().has_value());
    TEST_ASSERT_EQ(0, player.hand.count());
}

// ============================================================================
// PLAY / UNDO TESTS
// ============================================================================

TEST(PlayerState, PlaySetsStanceAndStar) {
    PlayerState player;
    player.hand.add_card(make_card("Knight", 1400, 1200, GuardianStar::MARS, GuardianStar::SUN));

    TEST_ASSERT(player.play_to_field(0, Stance::DEFENSE, 2));
    TEST_ASSERT(player.has_field_card());
    TEST_ASSERT(player.field->stance == Stance::DEFENSE);
    TEST_ASSERT(player.field->selected_star == GuardianStar::SUN);
    TEST_ASSERT_EQ(1200, player.field->stance_value());
    TEST_ASSERT_EQ(0, player.hand.count());
}

TEST(PlayerState, PlayInvalidIndexLeavesStateUnchanged) {
    PlayerState player;
    player.hand.add_card(make_card("Knight", 1400, 1200));

    TEST_ASSERT_FALSE(player.play_to_field(3, Stance::ATTACK, 1));
    TEST_ASSERT_FALSE(player.play_to_field(-1, Stance::ATTACK, 1));
    TEST_ASSERT_EQ(1, player.hand.count());
    TEST_ASSERT_FALSE(player.has_field_card());
}

TEST(PlayerState, PlayOverOccupiedFieldSacrifices) {
    PlayerState player;
    player.hand.add_card(make_card("Old", 500, 500));
    player.hand.add_card(make_card("New", 1500, 1500));

    TEST_ASSERT(player.play_to_field(0, Stance::ATTACK, 1));
    TEST_ASSERT(player.play_to_field(0, Stance::ATTACK, 1));

    TEST_ASSERT_EQ(std::string("New"), player.field->name);
    TEST_ASSERT_EQ(1, player.discard.count());
    TEST_ASSERT_EQ(std::string("Old"), player.discard.back()->name);
    TEST_ASSERT(player.last_sacrificed.has_value());
}

TEST(PlayerState, UndoRestoresSacrificedCard) {
    PlayerState player;
    player.hand.add_card(make_card("Old", 500, 500));
    player.hand.add_card(make_card("New", 1500, 1500));

    player.play_to_field(0, Stance::DEFENSE, 2);
    player.play_to_field(0, Stance::ATTACK, 1);

    TEST_ASSERT(player.undo_last_play());
    TEST_ASSERT(player.has_field_card());
    TEST_ASSERT_EQ(std::string("Old"), player.field->name);
    TEST_ASSERT(player.field->stance == Stance::DEFENSE);
    TEST_ASSERT_EQ(0, player.discard.count());
    TEST_ASSERT_EQ(1, player.hand.count());
    TEST_ASSERT_EQ(std::string("New"), player.hand.back()->name);
    TEST_ASSERT_FALSE(player.last_sacrificed.has_value());
}

TEST(PlayerState, UndoWithoutSacrificeEmptiesField) {
    PlayerState player;
    player.hand.add_card(make_card("Only", 500, 500));
    player.play_to_field(0, Stance::ATTACK, 1);

    TEST_ASSERT(player.undo_last_play());
    TEST_ASSERT_FALSE(player.has_field_card());
    TEST_ASSERT_EQ(1, player.hand.count());
}

TEST(PlayerState, UndoOnEmptyFieldFails) {
    PlayerState player;
    TEST_ASSERT_FALSE(player.undo_last_play());
}

TEST(PlayerState, UndoRefusedWhenHandRefilled) {
    PlayerState player;
    stock_deck(player, 6);
    for (int i = 0; i < 5; i++) {
        player.draw();
    }

    TEST_ASSERT(player.play_to_field(0, Stance::ATTACK, 1));
    TEST_ASSERT(player.draw().has_value());
    TEST_ASSERT_EQ(5, player.hand.count());

    TEST_ASSERT_FALSE(player.undo_last_play());
    TEST_ASSERT_EQ(5, player.hand.count());
    TEST_ASSERT(player.has_field_card());
}

TEST(PlayerState, UndoIgnoresEqualCardDiscardedLater) {
    CardDatabase db;
    fill_test_database(db);

    PlayerState player;
    player.field = instance_of(db, "Alpha");
    player.hand.add_card(instance_of(db, "Gamma"));
    player.hand.add_card(instance_of(db, "Alpha"));
    player.hand.add_card(instance_of(db, "Beta"));

    // Gamma replaces Alpha, then the hand's own Alpha is fused away
    TEST_ASSERT(player.play_to_field(0, Stance::ATTACK, 1));
    TEST_ASSERT(player.fuse(db, 0, 1).has_value());
    TEST_ASSERT_EQ(3, player.discard.count());
    TEST_ASSERT_EQ(std::string("Alpha"), player.discard.back()->name);

    TEST_ASSERT(player.undo_last_play());
    TEST_ASSERT_FALSE(player.has_field_card());
    TEST_ASSERT_EQ(3, player.discard.count());
    TEST_ASSERT_EQ(std::string("Gamma"), player.hand.back()->name);
}

// ============================================================================
// FUSION TESTS
// ============================================================================

TEST(PlayerState, FuseMovesMaterialsToDiscard) {
    CardDatabase db;
    fill_test_database(db);

    PlayerState player;
    player.hand.add_card(instance_of(db, "Gamma"));
    player.hand.add_card(instance_of(db, "Alpha"));
    player.hand.add_card(instance_of(db, "Delta"));
    player.hand.add_card(instance_of(db, "Beta"));

    auto result = player.fuse(db, 1, 3);
    TEST_ASSERT(result.has_value());
    TEST_ASSERT_EQ(std::string("Omega"), result->name);

    // Remaining hand keeps its order, result appended
    TEST_ASSERT_EQ(3, player.hand.count());
    TEST_ASSERT_EQ(std::string("Gamma"), player.hand.at(0)->name);
    TEST_ASSERT_EQ(std::string("Delta"), player.hand.at(1)->name);
    TEST_ASSERT_EQ(std::string("Omega"), player.hand.at(2)->name);

    // Higher index discarded first
    TEST_ASSERT_EQ(2, player.discard.count());
    TEST_ASSERT_EQ(std::string("Beta"), player.discard.at(0)->name);
    TEST_ASSERT_EQ(std::string("Alpha"), player.discard.at(1)->name);
}

TEST(PlayerState, FuseAcceptsEitherIndexOrder) {
    CardDatabase db;
    fill_test_database(db);

    PlayerState player;
    player.hand.add_card(instance_of(db, "Alpha"));
    player.hand.add_card(instance_of(db, "Beta"));

    auto result = player.fuse(db, 1, 0);
    TEST_ASSERT(result.has_value());
    TEST_ASSERT_EQ(1, player.hand.count());
    TEST_ASSERT_EQ(3500, player.hand.at(0)->atk);
}

TEST(PlayerState, InvalidFuseLeavesStateUnchanged) {
    CardDatabase db;
    fill_test_database(db);

    PlayerState player;
    player.hand.add_card(instance_of(db, "Alpha"));
    player.hand.add_card(instance_of(db, "Gamma"));

    TEST_ASSERT_FALSE(player.fuse(db, 0, 0).has_value());
    TEST_ASSERT_FALSE(player.fuse(db, 0, 5).has_value());
    TEST_ASSERT_FALSE(player.fuse(db, -1, 1).has_value());
    TEST_ASSERT_FALSE(player.fuse(db, 0, 1).has_value());  // no recipe

    TEST_ASSERT_EQ(2, player.hand.count());
    TEST_ASSERT_EQ(0, player.discard.count());
    TEST_ASSERT_EQ(std::string("Alpha"), player.hand.at(0)->name);
}

TEST(PlayerState, PossibleFusionsEnumeratesPairs) {
    CardDatabase db;
    fill_test_database(db);

    PlayerState player;
    player.hand.add_card(instance_of(db, "Gamma"));
    player.hand.add_card(instance_of(db, "Alpha"));
    player.hand.add_card(instance_of(db, "Epsilon"));
    player.hand.add_card(instance_of(db, "Beta"));

    auto options = player.possible_fusions(db);
    TEST_ASSERT_EQ(2u, options.size());

    TEST_ASSERT_EQ(0, options[0].first);
    TEST_ASSERT_EQ(2, options[0].second);
    TEST_ASSERT_EQ(std::string("Ember"), options[0].result.name);

    TEST_ASSERT_EQ(1, options[1].first);
    TEST_ASSERT_EQ(3, options[1].second);
    TEST_ASSERT_EQ(std::string("Omega"), options[1].result.name);
}

// ============================================================================
// QUERY TESTS
// ============================================================================

TEST(PlayerState, DeckedOutRequiresEverythingEmpty) {
    PlayerState player;
    TEST_ASSERT(player.is_decked_out());

    player.field = make_card("Last Stand", 100, 100);
    TEST_ASSERT_FALSE(player.is_decked_out());

    player.field.reset();
    player.hand.add_card(make_card("Card", 100, 100));
    TEST_ASSERT_FALSE(player.is_decked_out());
}

TEST(PlayerState, BestHandAtk) {
    PlayerState player;
    TEST_ASSERT_EQ(0, player.best_hand_atk());
    player.hand.add_card(make_card("A", 1200, 100));
    player.hand.add_card(make_card("B", 1900, 100));
    player.hand.add_card(make_card("C", 300, 2500));
    TEST_ASSERT_EQ(1900, player.best_hand_atk());
}

TEST(PlayerState, CloneIsIndependent) {
    PlayerState player;
    player.hand.add_card(make_card("Kept", 1000, 1000));
    player.field = make_card("Guard", 800, 1500);

    PlayerState copy = player.clone();
    copy.hand.take_at(0);
    copy.field->atk = 9999;
    copy.life_points = 1;

    TEST_ASSERT_EQ(1, player.hand.count());
    TEST_ASSERT_EQ(800, player.field->atk);
    TEST_ASSERT_EQ(8000, player.life_points);
}
