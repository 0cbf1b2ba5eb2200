/**
 * CardForge Engine - Zone Container
 *
 * Represents a card zone (deck, hand, discard pile, play area, stack, or
 * any designer-defined region). A zone stores card identifiers only; the
 * Card values themselves live in the Game.
 *
 * The top of an ordered zone is the END of the card list.
 */

#pragma once

#include "id_factory.hpp"
#include "types.hpp"
#include <algorithm>
#include <random>

namespace cardforge {

struct DrawResult;

/**
 * ZoneParams - Input to create_zone. An empty id gets a fresh one.
 */
struct ZoneParams {
    ZoneId id;
    std::string name;
    std::optional<PlayerId> owner;   // nullopt = shared zone
    std::vector<CardId> cards;
    Visibility visibility = Visibility::PUBLIC;
    ZoneOrder order = ZoneOrder::ORDERED;
    std::optional<int> max_size;
    ZoneKind kind = ZoneKind::ZONE;
};

/**
 * Zone - Immutable container of card identifiers.
 */
struct Zone {
    ZoneId id;
    std::string name;
    std::optional<PlayerId> owner;
    std::vector<CardId> cards;
    Visibility visibility = Visibility::PUBLIC;
    ZoneOrder order = ZoneOrder::ORDERED;
    std::optional<int> max_size;
    ZoneKind kind = ZoneKind::ZONE;

    // ========================================================================
    // BASIC OPERATIONS
    // ========================================================================

    /**
     * Insert a card. No position appends (places on top).
     *
     * Throws ActionError when the zone is full or the position is outside
     * [0, size].
     */
    Zone with_card_added(const CardId& card_id,
                         std::optional<int> position = std::nullopt) const;

    /** Throws ActionError("Card not found in zone"). */
    Zone with_card_removed(const CardId& card_id) const;

    /** Reorder a card already in the zone. Position must be in [0, size). */
    Zone with_card_moved(const CardId& card_id, int new_position) const;

    Zone insert_at_top(const CardId& card_id) const {
        return with_card_added(card_id);
    }

    Zone insert_at_bottom(const CardId& card_id) const {
        return with_card_added(card_id, 0);
    }

    // ========================================================================
    // DECK OPERATIONS
    // ========================================================================

    /**
     * Uniformly permute the cards. Unordered zones cannot be shuffled.
     */
    template <typename RNG>
    Zone shuffled(RNG& rng) const {
        require_shufflable();
        Zone copy = *this;
        std::shuffle(copy.cards.begin(), copy.cards.end(), rng);
        return copy;
    }

    Zone shuffled() const {
        return shuffled(engine_rng());
    }

    /**
     * Take count cards from the top (or bottom). Drawn ids keep list order.
     */
    DrawResult draw(int count, bool from_top = true) const;

    /** Top count cards in list order, without removing them. */
    std::vector<CardId> peek(int count) const;

    std::optional<CardId> top_card() const;
    std::optional<CardId> bottom_card() const;
    std::optional<CardId> card_at(int index) const;

    /** Returns -1 when the card is not in the zone. */
    int index_of(const CardId& card_id) const;

    // ========================================================================
    // QUERIES
    // ========================================================================

    bool contains(const CardId& card_id) const {
        return std::find(cards.begin(), cards.end(), card_id) != cards.end();
    }

    int size() const {
        return static_cast<int>(cards.size());
    }

    bool is_empty() const {
        return cards.empty();
    }

    bool is_full() const {
        return max_size.has_value() && size() >= *max_size;
    }

    /** nullopt for unbounded zones. */
    std::optional<int> remaining_capacity() const {
        if (!max_size) {
            return std::nullopt;
        }
        return std::max(0, *max_size - size());
    }

    bool is_ordered() const { return order == ZoneOrder::ORDERED; }
    bool is_private() const { return visibility == Visibility::PRIVATE; }
    bool is_owned_by(const PlayerId& player_id) const {
        return owner.has_value() && *owner == player_id;
    }

    bool operator==(const Zone& other) const;
    bool operator!=(const Zone& other) const { return !(*this == other); }

private:
    void require_shufflable() const;
};

struct DrawResult {
    std::vector<CardId> drawn_cards;
    Zone zone;
};

// ============================================================================
// FACTORIES
// ============================================================================

/** Build and validate a zone. Throws ValidationError. */
Zone create_zone(ZoneParams params);

Zone create_deck(const ZoneId& id, const PlayerId& owner,
                 std::vector<CardId> cards = {},
                 std::optional<int> max_size = std::nullopt);

Zone create_hand(const ZoneId& id, const PlayerId& owner,
                 std::vector<CardId> cards = {},
                 std::optional<int> max_size = std::nullopt);

Zone create_discard_pile(const ZoneId& id, const PlayerId& owner,
                         std::vector<CardId> cards = {});

Zone create_play_area(const ZoneId& id, const PlayerId& owner,
                      std::vector<CardId> cards = {},
                      std::optional<int> max_size = std::nullopt);

/** The shared stack: no owner, public, ordered. */
Zone create_stack(const ZoneId& id, std::vector<CardId> cards = {});

void validate_zone(const Zone& zone);

} // namespace cardforge
