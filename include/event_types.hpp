/**
 * CardForge Engine - Well-Known Event Types
 *
 * Event types are free-form strings; these are the ones the action library
 * raises and the rule compiler emits.
 */

#pragma once

namespace cardforge {
namespace event_types {

// Raised by the action library
constexpr const char* CARD_MOVED = "CARD_MOVED";
constexpr const char* CARDS_DRAWN = "CARDS_DRAWN";
constexpr const char* CARD_PLAYED = "CARD_PLAYED";
constexpr const char* STAT_MODIFIED = "STAT_MODIFIED";
constexpr const char* CARD_TAPPED = "CARD_TAPPED";
constexpr const char* CARD_UNTAPPED = "CARD_UNTAPPED";
constexpr const char* CARD_DISCARDED = "CARD_DISCARDED";
constexpr const char* ZONE_SHUFFLED = "ZONE_SHUFFLED";
constexpr const char* COUNTER_ADDED = "COUNTER_ADDED";
constexpr const char* COUNTER_REMOVED = "COUNTER_REMOVED";
constexpr const char* PHASE_CHANGED = "PHASE_CHANGED";

// Emitted by compiled rules
constexpr const char* ACTION_REQUESTED = "ACTION_REQUESTED";
constexpr const char* ACTION_ERROR = "ACTION_ERROR";

// Conventional game-level events
constexpr const char* DAMAGE_DEALT = "DAMAGE_DEALT";
constexpr const char* TURN_STARTED = "TURN_STARTED";
constexpr const char* TURN_ENDED = "TURN_ENDED";

} // namespace event_types
} // namespace cardforge
