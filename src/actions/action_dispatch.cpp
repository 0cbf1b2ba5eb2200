/**
 * CardForge Engine - Action Dispatch
 *
 * Routes an Action to its handler pair. Validation goes through the same
 * check_* functions the executor uses, so validate_action and
 * execute_action can never disagree.
 */

#include "action_handlers.hpp"

namespace cardforge {

using namespace actions;

std::optional<std::string> check_action(const Game& game, const Action& action) {
    if (!action.is_well_formed()) {
        return "Malformed action payload";
    }
    if (action.player_id && !game.find_player(*action.player_id)) {
        return "Acting player not found";
    }

    const Actor& actor = action.player_id;
    switch (action.action_type) {
        case ActionType::MOVE_CARD:
            return check_move_card(game, *action.get<MoveCardPayload>(), actor);
        case ActionType::DRAW_CARDS:
            return check_draw_cards(game, *action.get<DrawCardsPayload>(), actor);
        case ActionType::PLAY_CARD:
            return check_play_card(game, *action.get<PlayCardPayload>(), actor);
        case ActionType::MODIFY_STAT:
            return check_modify_stat(game, *action.get<ModifyStatPayload>(), actor);
        case ActionType::TAP_CARD:
        case ActionType::UNTAP_CARD:
            return check_tap_card(game, *action.get<TapCardPayload>(), actor);
        case ActionType::DISCARD_CARD:
            return check_discard_card(game, *action.get<DiscardCardPayload>(), actor);
        case ActionType::SHUFFLE_ZONE:
            return check_shuffle_zone(game, *action.get<ShuffleZonePayload>(), actor);
        case ActionType::ADD_COUNTER:
            return check_counter(game, *action.get<CounterPayload>(), actor, true);
        case ActionType::REMOVE_COUNTER:
            return check_counter(game, *action.get<CounterPayload>(), actor, false);
        case ActionType::SET_TURN_PHASE:
            return check_set_phase(game, *action.get<SetPhasePayload>(), actor);
    }
    return "Unknown action type";
}

bool validate_action(const Game& game, const Action& action) {
    return !check_action(game, action).has_value();
}

ActionOutcome execute_action_with_events(const Game& game, const Action& action) {
    if (auto reason = check_action(game, action)) {
        throw ActionError(*reason);
    }

    const Actor& actor = action.player_id;
    switch (action.action_type) {
        case ActionType::MOVE_CARD:
            return apply_move_card(game, *action.get<MoveCardPayload>(), actor);
        case ActionType::DRAW_CARDS:
            return apply_draw_cards(game, *action.get<DrawCardsPayload>(), actor);
        case ActionType::PLAY_CARD:
            return apply_play_card(game, *action.get<PlayCardPayload>(), actor);
        case ActionType::MODIFY_STAT:
            return apply_modify_stat(game, *action.get<ModifyStatPayload>(), actor);
        case ActionType::TAP_CARD:
            return apply_tap_card(game, *action.get<TapCardPayload>(), actor, true);
        case ActionType::UNTAP_CARD:
            return apply_tap_card(game, *action.get<TapCardPayload>(), actor, false);
        case ActionType::DISCARD_CARD:
            return apply_discard_card(game, *action.get<DiscardCardPayload>(), actor);
        case ActionType::SHUFFLE_ZONE:
            return apply_shuffle_zone(game, *action.get<ShuffleZonePayload>(), actor);
        case ActionType::ADD_COUNTER:
            return apply_counter(game, *action.get<CounterPayload>(), actor, true);
        case ActionType::REMOVE_COUNTER:
            return apply_counter(game, *action.get<CounterPayload>(), actor, false);
        case ActionType::SET_TURN_PHASE:
            return apply_set_phase(game, *action.get<SetPhasePayload>(), actor);
    }
    throw ActionError("Unknown action type: " + to_string(action.action_type));
}

Game execute_action(const Game& game, const Action& action) {
    return execute_action_with_events(game, action).game;
}

// ============================================================================
// ZONE VISIBILITY
// ============================================================================

bool can_view_zone(const Game& game, const PlayerId& viewer, const ZoneId& zone_id) {
    const Zone* zone = game.find_zone(zone_id);
    if (!zone || !game.find_player(viewer)) {
        return false;
    }
    return !zone->is_private() || zone->is_owned_by(viewer);
}

std::vector<CardId> view_zone(const Game& game, const PlayerId& viewer, const ZoneId& zone_id,
                              std::optional<int> count) {
    const Zone* zone = game.find_zone(zone_id);
    if (!zone || !game.find_player(viewer)) {
        throw ActionError("Player or zone not found");
    }
    if (!can_view_zone(game, viewer, zone_id)) {
        throw ActionError("Cannot view private zone");
    }
    return count ? zone->peek(*count) : zone->cards;
}

} // namespace cardforge
