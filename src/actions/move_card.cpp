/**
 * CardForge Engine - Move Card
 *
 * Also hosts the card transfer and zone helpers the other handlers share.
 */

#include "action_handlers.hpp"
#include "event_types.hpp"
#include "id_factory.hpp"

namespace cardforge {
namespace actions {

// ============================================================================
// SHARED HELPERS
// ============================================================================

Game transfer_card(const Game& game, const CardId& card_id, const ZoneId& from,
                   const ZoneId& to, std::optional<int> position) {
    const Card* card = game.find_card(card_id);
    const Zone* source = game.find_zone(from);
    const Zone* destination = game.find_zone(to);
    if (!card || !source || !destination) {
        throw ActionError("Card or zone not found");
    }

    if (from == to) {
        Zone reordered = position
            ? source->with_card_moved(card_id, *position)
            : source->with_card_removed(card_id).with_card_added(card_id);
        return game.with_zone(reordered);
    }

    Zone updated_source = source->with_card_removed(card_id);
    Zone updated_destination = destination->with_card_added(card_id, position);

    return game.with_zone(updated_source)
               .with_zone(updated_destination)
               .with_card(card->moved_to(to));
}

Game ensure_player_zone(const Game& game, const PlayerId& player_id, ZoneKind kind,
                        ZoneId& zone_id) {
    if (const Zone* existing = game.find_player_zone(player_id, kind)) {
        zone_id = existing->id;
        return game;
    }

    Zone created;
    switch (kind) {
        case ZoneKind::DISCARD:
            created = create_discard_pile(create_zone_id(), player_id);
            break;
        case ZoneKind::PLAY_AREA:
            created = create_play_area(create_zone_id(), player_id);
            break;
        case ZoneKind::DECK:
            created = create_deck(create_zone_id(), player_id);
            break;
        case ZoneKind::HAND:
            created = create_hand(create_zone_id(), player_id);
            break;
        default:
            throw ActionError("Cannot create a zone of kind " + to_string(kind));
    }

    zone_id = created.id;
    return add_zone_to_game(game, created);
}

GameEvent raise(const std::string& type, nlohmann::json payload,
                const Actor& actor, const Actor& fallback) {
    return create_game_event(type, std::move(payload), actor ? actor : fallback);
}

nlohmann::json target_json(const TargetId& target) {
    if (const CardId* card = std::get_if<CardId>(&target)) {
        return {{"card", card->value}};
    }
    return {{"player", std::get<PlayerId>(target).value}};
}

bool target_exists(const Game& game, const TargetId& target) {
    if (const CardId* card = std::get_if<CardId>(&target)) {
        return game.find_card(*card) != nullptr;
    }
    return game.find_player(std::get<PlayerId>(target)) != nullptr;
}

// ============================================================================
// MOVE CARD
// ============================================================================

std::optional<std::string> check_move_card(const Game& game, const MoveCardPayload& p, const Actor&) {
    if (!game.find_card(p.card_id)) {
        return "Card not found";
    }
    const Zone* from = game.find_zone(p.from_zone);
    if (!from) {
        return "Source zone not found";
    }
    const Zone* to = game.find_zone(p.to_zone);
    if (!to) {
        return "Destination zone not found";
    }
    if (!from->contains(p.card_id)) {
        return "Card not found in source zone";
    }

    if (p.from_zone == p.to_zone) {
        if (p.position && (*p.position < 0 || *p.position >= from->size())) {
            return "Invalid position";
        }
        return std::nullopt;
    }

    if (to->is_full()) {
        return "Zone is at maximum capacity";
    }
    if (p.position && (*p.position < 0 || *p.position > to->size())) {
        return "Invalid position";
    }
    return std::nullopt;
}

ActionOutcome apply_move_card(const Game& game, const MoveCardPayload& p, const Actor& actor) {
    ActionOutcome outcome{transfer_card(game, p.card_id, p.from_zone, p.to_zone, p.position), {}};

    nlohmann::json payload = {
        {"cardId", p.card_id.value},
        {"fromZone", p.from_zone.value},
        {"toZone", p.to_zone.value}
    };
    if (p.position) {
        payload["position"] = *p.position;
    }
    outcome.events.push_back(raise(event_types::CARD_MOVED, std::move(payload), actor));
    return outcome;
}

} // namespace actions
} // namespace cardforge
