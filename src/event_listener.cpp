/**
 * CardForge Engine - Event Listener Implementation
 */

#include "event_listener.hpp"
#include "errors.hpp"
#include "id_factory.hpp"

namespace cardforge {

GameEvent create_game_event(const std::string& type,
                            nlohmann::json payload,
                            std::optional<PlayerId> triggered_by) {
    if (type.empty()) {
        throw ValidationError("Event type cannot be empty");
    }
    if (payload.is_null()) {
        payload = nlohmann::json::object();
    }

    GameEvent event;
    event.id = create_event_id();
    event.type = type;
    event.payload = std::move(payload);
    event.timestamp = EventClock::now();
    event.triggered_by = std::move(triggered_by);
    return event;
}

EventListener create_event_listener(ListenerParams params) {
    if (params.event_type.empty()) {
        throw ValidationError("Event type cannot be empty");
    }
    if (!params.reaction) {
        throw ValidationError("Listener reaction is required");
    }

    EventListener listener;
    listener.id = params.id.is_valid() ? std::move(params.id) : create_listener_id();
    listener.event_type = std::move(params.event_type);
    listener.condition = std::move(params.condition);
    listener.priority = params.priority;
    listener.reaction = std::move(params.reaction);
    return listener;
}

EventListener create_event_listener(const std::string& event_type,
                                    ReactionCallback callback,
                                    int priority,
                                    EventCondition condition) {
    if (!callback) {
        throw ValidationError("Listener reaction is required");
    }

    ListenerParams params;
    params.event_type = event_type;
    params.reaction = make_reaction(std::move(callback));
    params.condition = std::move(condition);
    params.priority = priority;
    return create_event_listener(std::move(params));
}

bool validate_event_listener(const EventListener& listener) {
    return listener.id.is_valid() &&
           !listener.event_type.empty() &&
           listener.reaction != nullptr;
}

} // namespace cardforge
