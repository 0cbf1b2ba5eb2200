/**
 * CardForge Engine - Event Manager
 *
 * Priority-ordered listener registry plus a queue of pending events.
 * The manager is a value embedded in every Game snapshot; every operation
 * returns a new manager.
 *
 * Processing lives in event_processor.hpp because its result carries a Game.
 */

#pragma once

#include "event_listener.hpp"

namespace cardforge {

struct EventManagerConfig {
    std::optional<int> max_queue_size = kDefaultMaxQueueSize;  // nullopt = unbounded
    bool enable_logging = false;
};

struct EventManager {
    std::vector<EventListener> listeners;   // ascending priority, stable
    std::vector<GameEvent> event_queue;
    bool is_processing = false;
    std::optional<int> max_queue_size = kDefaultMaxQueueSize;
    bool enable_logging = false;

    /** Listeners for an event type, in dispatch order. */
    std::vector<EventListener> listeners_for(const std::string& event_type) const;

    const EventListener* find_listener(const ListenerId& listener_id) const;

    /** Structural equality: listener ids, types and priorities plus queue contents. */
    bool operator==(const EventManager& other) const;
    bool operator!=(const EventManager& other) const { return !(*this == other); }
};

EventManager create_event_manager(const EventManagerConfig& config = {});

// ============================================================================
// QUEUE
// ============================================================================

/** Throws EventSystemError("Event queue is full"). */
EventManager publish_event(const EventManager& manager, const GameEvent& event);

EventManager clear_event_queue(const EventManager& manager);

// ============================================================================
// LISTENER REGISTRY
// ============================================================================

/**
 * Insert a listener, keeping ascending priority order. Equal priorities
 * stay in registration order.
 *
 * Throws ValidationError("Listener with this ID already exists").
 */
EventManager subscribe_to_event(const EventManager& manager, const EventListener& listener);

/** Throws ValidationError("Listener not found"). */
EventManager unsubscribe_from_event(const EventManager& manager, const ListenerId& listener_id);

EventManager clear_all_listeners(const EventManager& manager);

} // namespace cardforge
