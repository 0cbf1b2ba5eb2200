/**
 * CardForge Engine - Event Processing
 *
 * Drains an event manager's queue against a game snapshot. Listeners may
 * yield further events, which are processed as the next batch, up to
 * kMaxRecursionDepth batches.
 */

#pragma once

#include "game.hpp"

namespace cardforge {

struct EventProcessingResult {
    Game game;
    EventManager manager;
    std::vector<GameEvent> processed_events;
    std::vector<GameEvent> generated_events;
    std::vector<std::string> errors;

    bool has_errors() const { return !errors.empty(); }
};

/**
 * Process the manager's queued events.
 *
 * Returns immediately with "Event processing already in progress" when the
 * manager is already processing. Listener failures and depth exhaustion are
 * reported in errors; nothing is thrown for them.
 */
EventProcessingResult process_events(const EventManager& manager, const Game& game);

} // namespace cardforge
