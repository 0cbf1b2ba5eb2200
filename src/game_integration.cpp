/**
 * CardForge Engine - Game / Event Integration Implementation
 */

#include "game_integration.hpp"
#include "errors.hpp"
#include "event_types.hpp"
#include "game_loader.hpp"
#include <iostream>

namespace cardforge {

Game add_event_listener_to_game(const Game& game, const EventListener& listener) {
    Game result = game;
    result.event_manager = subscribe_to_event(game.event_manager, listener);
    return result;
}

Game remove_event_listener_from_game(const Game& game, const ListenerId& listener_id) {
    Game result = game;
    result.event_manager = unsubscribe_from_event(game.event_manager, listener_id);
    return result;
}

std::vector<EventListener> get_active_listeners(const Game& game,
                                                const std::optional<std::string>& event_type) {
    if (event_type) {
        return game.event_manager.listeners_for(*event_type);
    }
    return game.event_manager.listeners;
}

Game publish_game_event(const Game& game, const GameEvent& event) {
    Game result = game;
    result.event_manager = publish_event(game.event_manager, event);
    return result;
}

EventProcessingResult process_game_events(const Game& game) {
    if (game.event_manager.is_processing) {
        return EventProcessingResult{game, game.event_manager, {}, {},
                                     {"Event processing already in progress"}};
    }

    // What listeners see: the same game, mid-processing
    Game view = game;
    view.event_manager.is_processing = true;
    view.event_manager.event_queue.clear();

    EventProcessingResult result = process_events(game.event_manager, view);
    result.game = game;
    result.game.event_manager = result.manager;
    return result;
}

// ============================================================================
// ACTION CASCADE
// ============================================================================

namespace {

void append(std::vector<GameEvent>& into, const std::vector<GameEvent>& from) {
    into.insert(into.end(), from.begin(), from.end());
}

} // anonymous namespace

DispatchResult dispatch_action(const Game& game, const Action& action) {
    ActionOutcome first = execute_action_with_events(game, action);

    DispatchResult result{std::move(first.game), {action}, {}, {}, {}};
    std::vector<GameEvent> pending = std::move(first.events);

    for (int round = 0; !pending.empty(); ++round) {
        if (round >= kMaxRecursionDepth) {
            result.errors.push_back("Maximum action cascade depth reached");
            break;
        }

        try {
            for (const auto& event : pending) {
                result.game = publish_game_event(result.game, event);
            }
        } catch (const EventSystemError& e) {
            result.errors.push_back(e.what());
            break;
        }
        pending.clear();

        EventProcessingResult processed = process_game_events(result.game);
        result.game = processed.game;
        append(result.processed_events, processed.processed_events);
        append(result.generated_events, processed.generated_events);
        result.errors.insert(result.errors.end(), processed.errors.begin(), processed.errors.end());

        for (const auto& generated : processed.generated_events) {
            if (generated.type != event_types::ACTION_REQUESTED) {
                continue;
            }
            try {
                Action requested = action_from_json(generated.payload.at("action"));
                ActionOutcome outcome = execute_action_with_events(result.game, requested);
                result.game = std::move(outcome.game);
                result.applied_actions.push_back(requested);
                append(pending, outcome.events);
            } catch (const GameError& e) {
                result.errors.push_back(std::string("Requested action failed: ") + e.what());
            } catch (const nlohmann::json::exception& e) {
                result.errors.push_back(std::string("Malformed action request: ") + e.what());
            }
        }

        if (result.game.event_manager.enable_logging) {
            std::clog << "[EventManager] Cascade round " << (round + 1) << ": "
                      << processed.processed_events.size() << " processed, "
                      << pending.size() << " pending" << std::endl;
        }
    }

    return result;
}

} // namespace cardforge
