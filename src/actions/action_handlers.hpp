/**
 * CardForge Engine - Action Handlers (internal)
 *
 * One check/apply pair per action kind. check_* never throws and returns the
 * rejection reason. apply_* assumes its check passed.
 */

#pragma once

#include "action_library.hpp"
#include "errors.hpp"

namespace cardforge {
namespace actions {

using Actor = std::optional<PlayerId>;

// ============================================================================
// SHARED HELPERS (move_card.cpp)
// ============================================================================

/**
 * Take a card out of one zone and put it in another (or reorder within
 * one zone), updating the card's current_zone.
 */
Game transfer_card(const Game& game, const CardId& card_id, const ZoneId& from,
                   const ZoneId& to, std::optional<int> position = std::nullopt);

/**
 * Find the player's zone of a kind, creating and registering one when the
 * player has none. zone_id receives the zone's id.
 */
Game ensure_player_zone(const Game& game, const PlayerId& player_id, ZoneKind kind,
                        ZoneId& zone_id);

/** Attribute an event to the actor, falling back to a payload player. */
GameEvent raise(const std::string& type, nlohmann::json payload,
                const Actor& actor, const Actor& fallback = std::nullopt);

nlohmann::json target_json(const TargetId& target);

bool target_exists(const Game& game, const TargetId& target);

// ============================================================================
// HANDLERS
// ============================================================================

std::optional<std::string> check_move_card(const Game& game, const MoveCardPayload& p, const Actor& actor);
ActionOutcome apply_move_card(const Game& game, const MoveCardPayload& p, const Actor& actor);

std::optional<std::string> check_draw_cards(const Game& game, const DrawCardsPayload& p, const Actor& actor);
ActionOutcome apply_draw_cards(const Game& game, const DrawCardsPayload& p, const Actor& actor);

std::optional<std::string> check_play_card(const Game& game, const PlayCardPayload& p, const Actor& actor);
ActionOutcome apply_play_card(const Game& game, const PlayCardPayload& p, const Actor& actor);

std::optional<std::string> check_modify_stat(const Game& game, const ModifyStatPayload& p, const Actor& actor);
ActionOutcome apply_modify_stat(const Game& game, const ModifyStatPayload& p, const Actor& actor);

std::optional<std::string> check_tap_card(const Game& game, const TapCardPayload& p, const Actor& actor);
ActionOutcome apply_tap_card(const Game& game, const TapCardPayload& p, const Actor& actor, bool tap);

std::optional<std::string> check_discard_card(const Game& game, const DiscardCardPayload& p, const Actor& actor);
ActionOutcome apply_discard_card(const Game& game, const DiscardCardPayload& p, const Actor& actor);

std::optional<std::string> check_shuffle_zone(const Game& game, const ShuffleZonePayload& p, const Actor& actor);
ActionOutcome apply_shuffle_zone(const Game& game, const ShuffleZonePayload& p, const Actor& actor);

std::optional<std::string> check_counter(const Game& game, const CounterPayload& p, const Actor& actor, bool add);
ActionOutcome apply_counter(const Game& game, const CounterPayload& p, const Actor& actor, bool add);

std::optional<std::string> check_set_phase(const Game& game, const SetPhasePayload& p, const Actor& actor);
ActionOutcome apply_set_phase(const Game& game, const SetPhasePayload& p, const Actor& actor);

} // namespace actions
} // namespace cardforge
