/**
 * CardForge Engine - Event Listeners
 *
 * A listener pairs an event type with a reaction. Reactions are immutable
 * objects shared between game snapshots; they receive the triggering event
 * and a read-only view of the game, and yield follow-up events.
 */

#pragma once

#include "event.hpp"
#include <functional>
#include <memory>

namespace cardforge {

struct Game;

/**
 * ListenerReaction - Interface for the body of a listener.
 *
 * Implementations must not keep references to the game past the call.
 * Throwing a std::exception reports a listener failure; the event manager
 * records it and keeps going.
 */
class ListenerReaction {
public:
    virtual ~ListenerReaction() = default;

    virtual std::vector<GameEvent> invoke(const GameEvent& event, const Game& game) const = 0;
};

using ReactionCallback = std::function<std::vector<GameEvent>(const GameEvent&, const Game&)>;
using EventCondition = std::function<bool(const GameEvent&)>;

/**
 * CallbackReaction - Adapts a plain callable to ListenerReaction.
 */
class CallbackReaction : public ListenerReaction {
public:
    explicit CallbackReaction(ReactionCallback callback)
        : callback_(std::move(callback)) {}

    std::vector<GameEvent> invoke(const GameEvent& event, const Game& game) const override {
        return callback_(event, game);
    }

private:
    ReactionCallback callback_;
};

inline std::shared_ptr<const ListenerReaction> make_reaction(ReactionCallback callback) {
    return std::make_shared<const CallbackReaction>(std::move(callback));
}

struct EventListener {
    ListenerId id;
    std::string event_type;
    EventCondition condition;   // empty = always
    int priority = 0;           // lower runs first
    std::shared_ptr<const ListenerReaction> reaction;

    bool accepts(const GameEvent& event) const {
        return event.type == event_type && (!condition || condition(event));
    }
};

struct ListenerParams {
    ListenerId id;              // empty = generate
    std::string event_type;
    std::shared_ptr<const ListenerReaction> reaction;
    EventCondition condition;
    int priority = 0;
};

/**
 * Build a listener. Throws ValidationError on an empty event type or a
 * missing reaction.
 */
EventListener create_event_listener(ListenerParams params);

/** Convenience overload for callable reactions. */
EventListener create_event_listener(const std::string& event_type,
                                    ReactionCallback callback,
                                    int priority = 0,
                                    EventCondition condition = nullptr);

bool validate_event_listener(const EventListener& listener);

} // namespace cardforge
