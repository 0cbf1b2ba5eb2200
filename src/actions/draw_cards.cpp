/**
 * CardForge Engine - Draw Cards
 *
 * Moves cards from the top of a player's deck to their hand. Drawn cards
 * keep their deck order in the hand.
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

std::optional<std::string> check_draw_cards(const Game& game, const DrawCardsPayload& p, const Actor&) {
    if (p.count < 0) {
        return "Cannot draw negative number of cards";
    }
    if (!game.find_player(p.player_id)) {
        return "Player not found";
    }

    const Zone* deck = game.find_player_zone(p.player_id, ZoneKind::DECK);
    const Zone* hand = game.find_player_zone(p.player_id, ZoneKind::HAND);
    if (!deck || !hand) {
        return "Player deck or hand not found";
    }
    if (deck->size() < p.count) {
        return "Not enough cards in deck";
    }

    auto room = hand->remaining_capacity();
    if (room && *room < p.count) {
        return "Zone is at maximum capacity";
    }
    return std::nullopt;
}

ActionOutcome apply_draw_cards(const Game& game, const DrawCardsPayload& p, const Actor& actor) {
    const Zone* deck = game.find_player_zone(p.player_id, ZoneKind::DECK);
    const Zone* hand = game.find_player_zone(p.player_id, ZoneKind::HAND);

    DrawResult drawn = deck->draw(p.count);

    Zone updated_hand = *hand;
    Game next = game;
    for (const auto& card_id : drawn.drawn_cards) {
        updated_hand = updated_hand.with_card_added(card_id);
        const Card* card = game.find_card(card_id);
        if (!card) {
            throw ActionError("Card not found");
        }
        next = next.with_card(card->moved_to(hand->id));
    }

    next = next.with_zone(drawn.zone).with_zone(updated_hand);

    nlohmann::json card_ids = nlohmann::json::array();
    for (const auto& card_id : drawn.drawn_cards) {
        card_ids.push_back(card_id.value);
    }

    ActionOutcome outcome{std::move(next), {}};
    outcome.events.push_back(raise(event_types::CARDS_DRAWN,
                                   {{"playerId", p.player_id.value},
                                    {"count", p.count},
                                    {"cardIds", card_ids}},
                                   actor, p.player_id));
    return outcome;
}

} // namespace actions
} // namespace cardforge
