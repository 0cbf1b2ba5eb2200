/**
 * CardForge Engine - Play Card
 *
 * Moves a card from its owner's hand to their play area and pays the
 * card's "manaCost" property. A card without a cost is free.
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

namespace {

// nullopt when the cost property is present but not an int >= 0
std::optional<int> mana_cost(const Card& card) {
    const nlohmann::json* cost = card.property(kManaCostProperty);
    if (!cost) {
        return 0;
    }
    std::optional<int> value = json_to_int(*cost);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

std::optional<std::string> check_play_card(const Game& game, const PlayCardPayload& p, const Actor&) {
    const Player* player = game.find_player(p.player_id);
    if (!player) {
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

    std::optional<int> cost = mana_cost(*card);
    if (!cost) {
        return "Invalid mana cost";
    }
    if (player->mana() < *cost) {
        return "Insufficient mana";
    }

    for (const auto& target : p.targets) {
        if (!target_exists(game, target)) {
            return "Target not found";
        }
    }

    const Zone* play_area = game.find_player_zone(p.player_id, ZoneKind::PLAY_AREA);
    if (play_area && play_area->is_full()) {
        return "Zone is at maximum capacity";
    }
    return std::nullopt;
}

ActionOutcome apply_play_card(const Game& game, const PlayCardPayload& p, const Actor& actor) {
    const Card* card = game.find_card(p.card_id);
    const Zone* hand = game.find_player_zone(p.player_id, ZoneKind::HAND);
    int cost = mana_cost(*card).value_or(0);

    ZoneId play_area_id;
    Game next = ensure_player_zone(game, p.player_id, ZoneKind::PLAY_AREA, play_area_id);
    next = transfer_card(next, p.card_id, hand->id, play_area_id);

    if (cost > 0) {
        next = next.with_player(next.find_player(p.player_id)->with_mana_spent(cost));
    }

    nlohmann::json targets = nlohmann::json::array();
    for (const auto& target : p.targets) {
        targets.push_back(target_json(target));
    }

    ActionOutcome outcome{std::move(next), {}};
    outcome.events.push_back(raise(event_types::CARD_PLAYED,
                                   {{"cardId", p.card_id.value},
                                    {"playerId", p.player_id.value},
                                    {"cardName", card->name},
                                    {"cardType", card->type},
                                    {"manaCost", cost},
                                    {"zoneId", play_area_id.value},
                                    {"targets", targets}},
                                   actor, p.player_id));
    return outcome;
}

} // namespace actions
} // namespace cardforge
