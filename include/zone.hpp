/**
 * Fusion Duel Engine - Zone Container
 *
 * Represents a card zone (draw pile, hand, discard).
 * Optimized for fast operations and cloning.
 */

#pragma once

#include "card_instance.hpp"
#include <algorithm>
#include <random>

namespace duel {

/**
 * Zone - Ordered container for cards.
 *
 * Index 0 is the top of a draw pile. Hands and discards append at the back.
 */
struct Zone {
    std::vector<CardInstance> cards;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Zone() = default;

    explicit Zone(std::vector<CardInstance> cards_)
        : cards(std::move(cards_))
    {}

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    void add_card(CardInstance card, int position = -1) {
        if (position < 0 || position >= static_cast<int>(cards.size())) {
            cards.push_back(std::move(card));
        } else {
            cards.insert(cards.begin() + position, std::move(card));
        }
    }

    // Remove and return card at index (move semantics)
    std::optional<CardInstance> take_at(int index) {
        if (!valid_index(index)) {
            return std::nullopt;
        }
        CardInstance removed = std::move(cards[index]);
        cards.erase(cards.begin() + index);
        return removed;
    }

    std::optional<CardInstance> take_back() {
        if (cards.empty()) {
            return std::nullopt;
        }
        CardInstance last = std::move(cards.back());
        cards.pop_back();
        return last;
    }

    CardInstance* at(int index) {
        return valid_index(index) ? &cards[index] : nullptr;
    }

    const CardInstance* at(int index) const {
        return valid_index(index) ? &cards[index] : nullptr;
    }

    const CardInstance* back() const {
        return cards.empty() ? nullptr : &cards.back();
    }

    bool valid_index(int index) const {
        return index >= 0 && index < static_cast<int>(cards.size());
    }

    int count() const {
        return static_cast<int>(cards.size());
    }

    bool is_empty() const {
        return cards.empty();
    }

    void clear() {
        cards.clear();
    }

    // ========================================================================
    // DRAW PILE OPERATIONS
    // ========================================================================

    // Draw from top of pile (index 0)
    std::optional<CardInstance> draw_top() {
        return take_at(0);
    }

    // Peek at top card without removing
    const CardInstance* peek_top() const {
        if (cards.empty()) {
            return nullptr;
        }
        return &cards.front();
    }

    // Next n cards in draw order
    std::vector<CardInstance> peek(int n) const {
        int limit = std::min(std::max(n, 0), count());
        return std::vector<CardInstance>(cards.begin(), cards.begin() + limit);
    }

    template<typename RNG>
    void shuffle(RNG& rng) {
        std::shuffle(cards.begin(), cards.end(), rng);
    }

    // ========================================================================
    // CLONING
    // ========================================================================

    Zone clone() const {
        Zone copy;
        copy.cards.reserve(cards.size());
        for (const auto& card : cards) {
            copy.cards.push_back(card.clone());
        }
        return copy;
    }
};

} // namespace duel
