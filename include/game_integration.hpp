/**
 * CardForge Engine - Game / Event Integration
 *
 * Glue between a Game snapshot and its embedded event manager: attach and
 * detach listeners, publish and drain the game's queue, and run an action
 * through the full reactive cascade.
 */

#pragma once

#include "action_library.hpp"
#include "event_processor.hpp"

namespace cardforge {

/** Throws ValidationError("Listener with this ID already exists"). */
Game add_event_listener_to_game(const Game& game, const EventListener& listener);

/** Throws ValidationError("Listener not found"). */
Game remove_event_listener_from_game(const Game& game, const ListenerId& listener_id);

/**
 * Copies of the game's listeners, optionally filtered by event type, in
 * dispatch order. Changing them does not affect the game.
 */
std::vector<EventListener> get_active_listeners(const Game& game,
                                                const std::optional<std::string>& event_type = std::nullopt);

/** Throws EventSystemError("Event queue is full"). */
Game publish_game_event(const Game& game, const GameEvent& event);

/**
 * Drain the game's queue. Listeners see the game with its event manager
 * marked as processing, so a listener that calls back in here is refused.
 */
EventProcessingResult process_game_events(const Game& game);

// ============================================================================
// ACTION CASCADE
// ============================================================================

struct DispatchResult {
    Game game;
    std::vector<Action> applied_actions;
    std::vector<GameEvent> processed_events;
    std::vector<GameEvent> generated_events;
    std::vector<std::string> errors;

    bool has_errors() const { return !errors.empty(); }
};

/**
 * Execute an action, publish the events it raised, process them, then apply
 * the action carried by every ACTION_REQUESTED event. Repeats for at most
 * kMaxRecursionDepth rounds.
 *
 * The first action throws ActionError when illegal. Failures further down
 * the cascade are collected in errors.
 */
DispatchResult dispatch_action(const Game& game, const Action& action);

} // namespace cardforge
