/**
 * CardForge Engine - Event Manager Implementation
 *
 * Queue, registry, and the batch loop that drains the queue.
 */

#include "event_manager.hpp"
#include "errors.hpp"
#include "event_processor.hpp"
#include <algorithm>
#include <iostream>

namespace cardforge {

std::vector<EventListener> EventManager::listeners_for(const std::string& event_type) const {
    std::vector<EventListener> result;
    for (const auto& listener : listeners) {
        if (listener.event_type == event_type) {
            result.push_back(listener);
        }
    }
    return result;
}

const EventListener* EventManager::find_listener(const ListenerId& listener_id) const {
    for (const auto& listener : listeners) {
        if (listener.id == listener_id) {
            return &listener;
        }
    }
    return nullptr;
}

bool EventManager::operator==(const EventManager& other) const {
    if (listeners.size() != other.listeners.size()) {
        return false;
    }
    for (size_t i = 0; i < listeners.size(); ++i) {
        const auto& a = listeners[i];
        const auto& b = other.listeners[i];
        if (a.id != b.id || a.event_type != b.event_type || a.priority != b.priority ||
            a.reaction != b.reaction) {
            return false;
        }
    }
    return event_queue == other.event_queue &&
           is_processing == other.is_processing &&
           max_queue_size == other.max_queue_size &&
           enable_logging == other.enable_logging;
}

EventManager create_event_manager(const EventManagerConfig& config) {
    if (config.max_queue_size && *config.max_queue_size < 0) {
        throw ValidationError("Max queue size cannot be negative");
    }
    EventManager manager;
    manager.max_queue_size = config.max_queue_size;
    manager.enable_logging = config.enable_logging;
    return manager;
}

// ============================================================================
// QUEUE
// ============================================================================

EventManager publish_event(const EventManager& manager, const GameEvent& event) {
    if (manager.max_queue_size &&
        static_cast<int>(manager.event_queue.size()) >= *manager.max_queue_size) {
        throw EventSystemError("Event queue is full");
    }
    EventManager result = manager;
    result.event_queue.push_back(event);
    return result;
}

EventManager clear_event_queue(const EventManager& manager) {
    EventManager result = manager;
    result.event_queue.clear();
    return result;
}

// ============================================================================
// LISTENER REGISTRY
// ============================================================================

EventManager subscribe_to_event(const EventManager& manager, const EventListener& listener) {
    if (!validate_event_listener(listener)) {
        throw ValidationError("Invalid event listener");
    }
    if (manager.find_listener(listener.id)) {
        throw ValidationError("Listener with this ID already exists");
    }

    EventManager result = manager;
    // upper_bound keeps equal priorities in registration order
    auto pos = std::upper_bound(result.listeners.begin(), result.listeners.end(), listener.priority,
                                [](int priority, const EventListener& existing) {
                                    return priority < existing.priority;
                                });
    result.listeners.insert(pos, listener);
    return result;
}

EventManager unsubscribe_from_event(const EventManager& manager, const ListenerId& listener_id) {
    EventManager result = manager;
    auto it = std::find_if(result.listeners.begin(), result.listeners.end(),
                           [&](const EventListener& l) { return l.id == listener_id; });
    if (it == result.listeners.end()) {
        throw ValidationError("Listener not found");
    }
    result.listeners.erase(it);
    return result;
}

EventManager clear_all_listeners(const EventManager& manager) {
    EventManager result = manager;
    result.listeners.clear();
    return result;
}

// ============================================================================
// PROCESSING
// ============================================================================

EventProcessingResult process_events(const EventManager& manager, const Game& game) {
    EventProcessingResult result{game, manager, {}, {}, {}};

    if (manager.is_processing) {
        result.errors.push_back("Event processing already in progress");
        return result;
    }

    EventManager working = manager;
    std::vector<GameEvent> batch = std::move(working.event_queue);
    working.event_queue.clear();
    working.is_processing = true;

    int depth = 0;
    while (!batch.empty()) {
        if (depth >= kMaxRecursionDepth) {
            result.errors.push_back("Maximum event recursion depth reached");
            if (working.enable_logging) {
                std::clog << "[EventManager] Recursion limit hit with "
                          << batch.size() << " events pending" << std::endl;
            }
            break;
        }
        ++depth;

        if (working.enable_logging) {
            std::clog << "[EventManager] Depth " << depth << ": processing "
                      << batch.size() << " events" << std::endl;
        }

        std::vector<GameEvent> next_batch;
        for (const auto& event : batch) {
            result.processed_events.push_back(event);

            for (const auto& listener : working.listeners_for(event.type)) {
                try {
                    if (listener.condition && !listener.condition(event)) {
                        continue;
                    }
                    std::vector<GameEvent> yielded = listener.reaction->invoke(event, game);
                    for (auto& generated : yielded) {
                        result.generated_events.push_back(generated);
                        next_batch.push_back(std::move(generated));
                    }
                } catch (const std::exception& e) {
                    result.errors.push_back(std::string("Callback error: ") + e.what());
                    if (working.enable_logging) {
                        std::clog << "[EventManager] Listener " << listener.id
                                  << " failed on " << event.type << ": " << e.what() << std::endl;
                    }
                } catch (...) {
                    result.errors.push_back("Callback error: Unknown error");
                    if (working.enable_logging) {
                        std::clog << "[EventManager] Listener " << listener.id
                                  << " failed on " << event.type << ": unknown exception" << std::endl;
                    }
                }
            }
        }
        batch = std::move(next_batch);
    }

    working.is_processing = false;
    result.manager = std::move(working);
    return result;
}

} // namespace cardforge
