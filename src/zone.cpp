/**
 * CardForge Engine - Zone Implementation
 */

#include "zone.hpp"
#include "errors.hpp"
#include <set>

namespace cardforge {

Zone Zone::with_card_added(const CardId& card_id, std::optional<int> position) const {
    if (!card_id.is_valid()) {
        throw ValidationError("Card ID must be valid");
    }
    if (is_full()) {
        throw ActionError("Zone is at maximum capacity");
    }
    if (position && (*position < 0 || *position > size())) {
        throw ActionError("Invalid position");
    }

    Zone result = *this;
    if (position) {
        result.cards.insert(result.cards.begin() + *position, card_id);
    } else {
        result.cards.push_back(card_id);
    }
    return result;
}

Zone Zone::with_card_removed(const CardId& card_id) const {
    auto it = std::find(cards.begin(), cards.end(), card_id);
    if (it == cards.end()) {
        throw ActionError("Card not found in zone");
    }

    Zone result = *this;
    result.cards.erase(result.cards.begin() + (it - cards.begin()));
    return result;
}

Zone Zone::with_card_moved(const CardId& card_id, int new_position) const {
    int current = index_of(card_id);
    if (current < 0) {
        throw ActionError("Card not found in zone");
    }
    if (new_position < 0 || new_position >= size()) {
        throw ActionError("Invalid position");
    }

    Zone result = *this;
    result.cards.erase(result.cards.begin() + current);
    result.cards.insert(result.cards.begin() + new_position, card_id);
    return result;
}

void Zone::require_shufflable() const {
    if (order == ZoneOrder::UNORDERED) {
        throw ActionError("Cannot shuffle unordered zone");
    }
}

DrawResult Zone::draw(int count, bool from_top) const {
    if (count < 0) {
        throw ActionError("Cannot draw negative number of cards");
    }
    if (count > size()) {
        throw ActionError("Not enough cards in zone");
    }

    DrawResult result{{}, *this};
    if (from_top) {
        auto split = result.zone.cards.end() - count;
        result.drawn_cards.assign(split, result.zone.cards.end());
        result.zone.cards.erase(split, result.zone.cards.end());
    } else {
        auto split = result.zone.cards.begin() + count;
        result.drawn_cards.assign(result.zone.cards.begin(), split);
        result.zone.cards.erase(result.zone.cards.begin(), split);
    }
    return result;
}

std::vector<CardId> Zone::peek(int count) const {
    int n = std::max(0, std::min(count, size()));
    return std::vector<CardId>(cards.end() - n, cards.end());
}

std::optional<CardId> Zone::top_card() const {
    if (cards.empty()) {
        return std::nullopt;
    }
    return cards.back();
}

std::optional<CardId> Zone::bottom_card() const {
    if (cards.empty()) {
        return std::nullopt;
    }
    return cards.front();
}

std::optional<CardId> Zone::card_at(int index) const {
    if (index < 0 || index >= size()) {
        return std::nullopt;
    }
    return cards[index];
}

int Zone::index_of(const CardId& card_id) const {
    auto it = std::find(cards.begin(), cards.end(), card_id);
    if (it == cards.end()) {
        return -1;
    }
    return static_cast<int>(it - cards.begin());
}

bool Zone::operator==(const Zone& other) const {
    return id == other.id &&
           name == other.name &&
           owner == other.owner &&
           cards == other.cards &&
           visibility == other.visibility &&
           order == other.order &&
           max_size == other.max_size &&
           kind == other.kind;
}

// ============================================================================
// FACTORIES
// ============================================================================

Zone create_zone(ZoneParams params) {
    Zone zone;
    zone.id = params.id.is_valid() ? std::move(params.id) : create_zone_id();
    zone.name = std::move(params.name);
    zone.owner = std::move(params.owner);
    zone.cards = std::move(params.cards);
    zone.visibility = params.visibility;
    zone.order = params.order;
    zone.max_size = params.max_size;
    zone.kind = params.kind;

    validate_zone(zone);
    return zone;
}

namespace {

Zone create_kind(ZoneKind kind, const char* name, const ZoneId& id,
                 std::optional<PlayerId> owner, std::vector<CardId> cards,
                 Visibility visibility, ZoneOrder order, std::optional<int> max_size) {
    ZoneParams params;
    params.id = id;
    params.name = name;
    params.owner = std::move(owner);
    params.cards = std::move(cards);
    params.visibility = visibility;
    params.order = order;
    params.max_size = max_size;
    params.kind = kind;
    return create_zone(std::move(params));
}

} // anonymous namespace

Zone create_deck(const ZoneId& id, const PlayerId& owner,
                 std::vector<CardId> cards, std::optional<int> max_size) {
    return create_kind(ZoneKind::DECK, "Deck", id, owner, std::move(cards),
                       Visibility::PRIVATE, ZoneOrder::ORDERED, max_size);
}

Zone create_hand(const ZoneId& id, const PlayerId& owner,
                 std::vector<CardId> cards, std::optional<int> max_size) {
    return create_kind(ZoneKind::HAND, "Hand", id, owner, std::move(cards),
                       Visibility::PRIVATE, ZoneOrder::UNORDERED, max_size);
}

Zone create_discard_pile(const ZoneId& id, const PlayerId& owner,
                         std::vector<CardId> cards) {
    return create_kind(ZoneKind::DISCARD, "Discard Pile", id, owner, std::move(cards),
                       Visibility::PUBLIC, ZoneOrder::ORDERED, std::nullopt);
}

Zone create_play_area(const ZoneId& id, const PlayerId& owner,
                      std::vector<CardId> cards, std::optional<int> max_size) {
    return create_kind(ZoneKind::PLAY_AREA, "Play Area", id, owner, std::move(cards),
                       Visibility::PUBLIC, ZoneOrder::UNORDERED, max_size);
}

Zone create_stack(const ZoneId& id, std::vector<CardId> cards) {
    return create_kind(ZoneKind::STACK, "Stack", id, std::nullopt, std::move(cards),
                       Visibility::PUBLIC, ZoneOrder::ORDERED, std::nullopt);
}

void validate_zone(const Zone& zone) {
    if (!zone.id.is_valid()) {
        throw ValidationError("Zone ID must be valid");
    }
    if (zone.name.empty()) {
        throw ValidationError("Zone name cannot be empty");
    }
    if (zone.owner && !zone.owner->is_valid()) {
        throw ValidationError("Zone owner must be a valid player ID");
    }
    if (zone.max_size && *zone.max_size < 0) {
        throw ValidationError("Zone max size cannot be negative");
    }
    if (zone.max_size && zone.size() > *zone.max_size) {
        throw ValidationError("Zone exceeds maximum size");
    }

    std::set<CardId> seen;
    for (const auto& card_id : zone.cards) {
        if (!card_id.is_valid()) {
            throw ValidationError("Zone contains an invalid card ID");
        }
        if (!seen.insert(card_id).second) {
            throw ValidationError("Duplicate card ID in zone: " + card_id.value);
        }
    }
}

} // namespace cardforge
