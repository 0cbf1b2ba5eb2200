/**
 * CardForge Engine - Game Events
 *
 * A GameEvent is a typed, timestamped notification with a loosely-typed
 * payload. Events are values; they live for one processing pass.
 */

#pragma once

#include "types.hpp"
#include <chrono>

namespace cardforge {

using EventClock = std::chrono::system_clock;

struct GameEvent {
    EventId id;
    std::string type;
    nlohmann::json payload = nlohmann::json::object();
    EventClock::time_point timestamp;
    std::optional<PlayerId> triggered_by;   // nullopt = system

    /** Player id, or "system" when nothing triggered the event. */
    std::string trigger_name() const {
        return triggered_by ? triggered_by->value : kSystemTrigger;
    }

    bool operator==(const GameEvent& other) const {
        return id == other.id &&
               type == other.type &&
               payload == other.payload &&
               timestamp == other.timestamp &&
               triggered_by == other.triggered_by;
    }
    bool operator!=(const GameEvent& other) const { return !(*this == other); }
};

/**
 * Create an event with a fresh id and the current time.
 *
 * Throws ValidationError("Event type cannot be empty").
 */
GameEvent create_game_event(const std::string& type,
                            nlohmann::json payload = nlohmann::json::object(),
                            std::optional<PlayerId> triggered_by = std::nullopt);

} // namespace cardforge
