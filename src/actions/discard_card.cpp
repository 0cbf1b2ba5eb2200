/**
 * CardForge Engine - Discard Card
 *
 * Moves a card from its owner's hand to the top of their discard pile.
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

std::optional<std::string> check_discard_card(const Game& game, const DiscardCardPayload& p, const Actor&) {
    if (!game.find_player(p.player_id)) {
        return "Player not found";
    }
    const Card* card = game.find_card(p.card_id);
    if (!card) {
        return "Card not found";
    }
    if (card->owner != p.player_id) {
        return "Player does not own this card";
    }

    const Zone* hand = game.find_player_zone(p.player_id, ZoneKind::HAND);
    if (!hand) {
        return "Player hand not found";
    }
    if (!hand->contains(p.card_id)) {
        return "Card not in hand";
    }

    const Zone* discard = game.find_player_zone(p.player_id, ZoneKind::DISCARD);
    if (discard && discard->is_full()) {
        return "Zone is at maximum capacity";
    }
    return std::nullopt;
}

ActionOutcome apply_discard_card(const Game& game, const DiscardCardPayload& p, const Actor& actor) {
    const Zone* hand = game.find_player_zone(p.player_id, ZoneKind::HAND);
    ZoneId hand_id = hand->id;

    ZoneId discard_id;
    Game next = ensure_player_zone(game, p.player_id, ZoneKind::DISCARD, discard_id);
    next = transfer_card(next, p.card_id, hand_id, discard_id);

    ActionOutcome outcome{std::move(next), {}};
    outcome.events.push_back(raise(event_types::CARD_DISCARDED,
                                   {{"cardId", p.card_id.value},
                                    {"playerId", p.player_id.value},
                                    {"fromZone", hand_id.value},
                                    {"toZone", discard_id.value}},
                                   actor, p.player_id));
    return outcome;
}

} // namespace actions
} // namespace cardforge
