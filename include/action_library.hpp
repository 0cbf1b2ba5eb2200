/**
 * CardForge Engine - Action Library
 *
 * Validates and applies actions against a Game snapshot. Every action is
 * checked in full before anything is built, so a rejected action never
 * leaves a partially-applied game behind.
 *
 * Usage:
 *   Game next = execute_action(game, Action::draw_cards(alice, 2));
 *
 *   ActionOutcome outcome = execute_action_with_events(game, action);
 *   // outcome.events describes what happened (CARDS_DRAWN, ...)
 */

#pragma once

#include "action.hpp"
#include "event.hpp"
#include "game.hpp"

namespace cardforge {

/**
 * ActionOutcome - Next snapshot plus the domain events the transition raised.
 */
struct ActionOutcome {
    Game game;
    std::vector<GameEvent> events;
};

/** Apply an action. Throws ActionError and leaves game untouched. */
Game execute_action(const Game& game, const Action& action);

/** Apply an action and report the events it raised. Throws ActionError. */
ActionOutcome execute_action_with_events(const Game& game, const Action& action);

/**
 * The reason an action would be rejected, or nullopt when it is legal.
 * Never throws.
 */
std::optional<std::string> check_action(const Game& game, const Action& action);

/** Dry run. Never throws. */
bool validate_action(const Game& game, const Action& action);

inline bool can_execute_action(const Game& game, const Action& action) {
    return validate_action(game, action);
}

// ============================================================================
// ZONE VISIBILITY
// ============================================================================

/** Private zones are visible to their owner only. */
bool can_view_zone(const Game& game, const PlayerId& viewer, const ZoneId& zone_id);

/**
 * Cards a player may see in a zone, top count when given.
 *
 * Throws ActionError("Cannot view private zone") or when the player or zone
 * is unknown.
 */
std::vector<CardId> view_zone(const Game& game, const PlayerId& viewer, const ZoneId& zone_id,
                              std::optional<int> count = std::nullopt);

} // namespace cardforge
