/**
 * CardForge Engine - Identifier Factory
 *
 * Generates fresh random identifiers and owns the engine's shared random
 * engine (used by zone shuffles when the caller does not inject one).
 */

#pragma once

#include "types.hpp"
#include <random>

namespace cardforge {

/**
 * Generate a random RFC 4122 version 4 style identifier string.
 */
std::string generate_uuid();

inline GameId create_game_id() { return GameId(generate_uuid()); }
inline PlayerId create_player_id() { return PlayerId(generate_uuid()); }
inline CardId create_card_id() { return CardId(generate_uuid()); }
inline ZoneId create_zone_id() { return ZoneId(generate_uuid()); }
inline ListenerId create_listener_id() { return ListenerId(generate_uuid()); }
inline EventId create_event_id() { return EventId(generate_uuid()); }

/**
 * Thread-local engine, seeded once from std::random_device.
 */
std::mt19937& engine_rng();

} // namespace cardforge
