/**
 * CardForge Engine - Shuffle Zone
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

std::optional<std::string> check_shuffle_zone(const Game& game, const ShuffleZonePayload& p, const Actor& actor) {
    const Zone* zone = game.find_zone(p.zone_id);
    if (!zone) {
        return "Zone not found";
    }
    if (!zone->is_ordered()) {
        return "Cannot shuffle unordered zone";
    }
    if (actor && zone->owner && *zone->owner != *actor) {
        return "Player does not own this zone";
    }
    return std::nullopt;
}

ActionOutcome apply_shuffle_zone(const Game& game, const ShuffleZonePayload& p, const Actor& actor) {
    const Zone* zone = game.find_zone(p.zone_id);

    ActionOutcome outcome{game.with_zone(zone->shuffled()), {}};
    outcome.events.push_back(raise(event_types::ZONE_SHUFFLED,
                                   {{"zoneId", p.zone_id.value},
                                    {"cardCount", zone->size()}},
                                   actor));
    return outcome;
}

} // namespace actions
} // namespace cardforge
