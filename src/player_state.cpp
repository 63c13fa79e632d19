/**
 * Fusion Duel Engine - Player State Implementation
 */

#include "player_state.hpp"
#include "card_database.hpp"

namespace duel {

std::optional<CardInstance> PlayerState::draw() {
    if (deck.is_empty() || hand_full()) {
        return std::nullopt;
    }

    std::optional<CardInstance> card = deck.draw_top();
    hand.add_card(*card);
    return card;
}

bool PlayerState::play_to_field(int hand_index, Stance stance, int star_num) {
    if (!hand.valid_index(hand_index)) {
        return false;
    }

    last_sacrificed.reset();
    if (field.has_value()) {
        last_sacrificed = *field;
        discard.add_card(std::move(*field));
        field.reset();
        sacrifice_discard_size = discard.count();
    }

    std::optional<CardInstance> card = hand.take_at(hand_index);
    card->stance = stance;
    card->select_star(star_num);
    field = std::move(card);
    return true;
}

bool PlayerState::undo_last_play() {
    if (!field.has_value() || hand_full()) {
        return false;
    }

    hand.add_card(std::move(*field));
    field.reset();

    if (last_sacrificed.has_value()) {
        if (discard.count() == sacrifice_discard_size) {
            field = discard.take_back();
        }
        last_sacrificed.reset();
    }
    return true;
}

std::optional<CardInstance> PlayerState::can_fuse(const CardDatabase& db, int i, int j) const {
    if (i == j || !hand.valid_index(i) || !hand.valid_index(j)) {
        return std::nullopt;
    }
    return db.check_fusion(hand.cards[i], hand.cards[j]);
}

std::optional<CardInstance> PlayerState::fuse(const CardDatabase& db, int i, int j) {
    std::optional<CardInstance> result = can_fuse(db, i, j);
    if (!result.has_value()) {
        return std::nullopt;
    }

    // Remove the higher index first so the lower one stays valid
    int high = std::max(i, j);
    int low = std::min(i, j);
    discard.add_card(*hand.take_at(high));
    discard.add_card(*hand.take_at(low));

    hand.add_card(*result);
    return result;
}

std::vector<FusionOption> PlayerState::possible_fusions(const CardDatabase& db) const {
    std::vector<FusionOption> options;
    const int n = hand.count();
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            auto result = db.check_fusion(hand.cards[i], hand.cards[j]);
            if (result.has_value()) {
                options.push_back({i, j, std::move(*result)});
            }
        }
    }
    return options;
}

int PlayerState::best_hand_atk() const {
    int best = 0;
    for (const auto& card : hand.cards) {
        best = std::max(best, card.atk);
    }
    return best;
}

} // namespace duel
