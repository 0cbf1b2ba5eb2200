/**
 * CardForge Engine - Game Loader
 *
 * Rehydrates entities, games, actions and rules from loosely-typed JSON
 * documents and serializes snapshots back. Every document is re-validated
 * through the entity factories; a malformed shape throws ValidationError.
 *
 * Field names are camelCase: currentZone, maxSize, isTapped, turnNumber, ...
 *
 * Authoring shortcuts in game documents:
 * - a zone without a "cards" field is filled from the cards whose
 *   currentZone names it, in document order;
 * - a player without a "zones" field gets every zone it owns.
 */

#pragma once

#include "action.hpp"
#include "game.hpp"
#include "rule_compiler.hpp"

namespace cardforge {

// ============================================================================
// ENTITIES
// ============================================================================

Card card_from_json(const nlohmann::json& doc);
nlohmann::json card_to_json(const Card& card);

Zone zone_from_json(const nlohmann::json& doc);
nlohmann::json zone_to_json(const Zone& zone);

Player player_from_json(const nlohmann::json& doc);
nlohmann::json player_to_json(const Player& player);

Game game_from_json(const nlohmann::json& doc);

/** Listeners are summarized (id, eventType, priority) and not reloaded. */
nlohmann::json game_to_json(const Game& game);

nlohmann::json event_to_json(const GameEvent& event);

// ============================================================================
// ACTIONS
// ============================================================================

/**
 * Accepts UPPER_SNAKE ("DRAW_CARDS") or camelCase ("drawCards") names.
 * "SET_PHASE" / "setPhase" name SET_TURN_PHASE.
 */
std::optional<ActionType> parse_action_name(const std::string& name);

/**
 * { "type": "DRAW_CARDS", "playerId": "...", "count": 2, "actor": "..." }
 *
 * Targets are { "card": id } or { "player": id }.
 */
Action action_from_json(const nlohmann::json& doc);
nlohmann::json action_to_json(const Action& action);

// ============================================================================
// RULES
// ============================================================================

RuleDefinition rule_from_json(const nlohmann::json& doc);
nlohmann::json rule_to_json(const RuleDefinition& rule);

/** Accepts a bare array or an object with a "rules" array. */
std::vector<RuleDefinition> rules_from_json(const nlohmann::json& doc);

// ============================================================================
// FILES
// ============================================================================

/** Throws ValidationError when the file is missing or malformed. */
Game load_game_file(const std::string& filepath);

std::vector<RuleDefinition> load_rules_file(const std::string& filepath);

} // namespace cardforge
