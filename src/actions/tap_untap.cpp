/**
 * CardForge Engine - Tap / Untap
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

std::optional<std::string> check_tap_card(const Game& game, const TapCardPayload& p, const Actor& actor) {
    const Card* card = game.find_card(p.card_id);
    if (!card) {
        return "Card not found";
    }
    if (actor && card->owner != *actor) {
        return "Player does not own this card";
    }
    return std::nullopt;
}

ActionOutcome apply_tap_card(const Game& game, const TapCardPayload& p, const Actor& actor, bool tap) {
    const Card* card = game.find_card(p.card_id);
    Card updated = tap ? card->tapped() : card->untapped();

    ActionOutcome outcome{game.with_card(updated), {}};
    outcome.events.push_back(raise(tap ? event_types::CARD_TAPPED : event_types::CARD_UNTAPPED,
                                   {{"cardId", p.card_id.value},
                                    {"wasTapped", card->is_tapped}},
                                   actor));
    return outcome;
}

} // namespace actions
} // namespace cardforge
