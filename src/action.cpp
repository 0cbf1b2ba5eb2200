/**
 * CardForge Engine - Action Representation Implementation
 */

#include "action.hpp"
#include <sstream>

namespace cardforge {

std::string target_to_string(const TargetId& target) {
    if (const CardId* card = std::get_if<CardId>(&target)) {
        return "card:" + card->value;
    }
    return "player:" + std::get<PlayerId>(target).value;
}

bool Action::is_well_formed() const {
    switch (action_type) {
        case ActionType::MOVE_CARD: return std::holds_alternative<MoveCardPayload>(payload);
        case ActionType::DRAW_CARDS: return std::holds_alternative<DrawCardsPayload>(payload);
        case ActionType::PLAY_CARD: return std::holds_alternative<PlayCardPayload>(payload);
        case ActionType::MODIFY_STAT: return std::holds_alternative<ModifyStatPayload>(payload);
        case ActionType::TAP_CARD:
        case ActionType::UNTAP_CARD: return std::holds_alternative<TapCardPayload>(payload);
        case ActionType::DISCARD_CARD: return std::holds_alternative<DiscardCardPayload>(payload);
        case ActionType::SHUFFLE_ZONE: return std::holds_alternative<ShuffleZonePayload>(payload);
        case ActionType::ADD_COUNTER:
        case ActionType::REMOVE_COUNTER: return std::holds_alternative<CounterPayload>(payload);
        case ActionType::SET_TURN_PHASE: return std::holds_alternative<SetPhasePayload>(payload);
    }
    return false;
}

std::string Action::to_string() const {
    if (!display_label.empty()) {
        return display_label;
    }

    std::ostringstream oss;
    oss << cardforge::to_string(action_type) << "(";

    if (const auto* move = get<MoveCardPayload>()) {
        oss << "card=" << move->card_id << ", from=" << move->from_zone << ", to=" << move->to_zone;
        if (move->position) {
            oss << ", position=" << *move->position;
        }
    } else if (const auto* draw = get<DrawCardsPayload>()) {
        oss << "player=" << draw->player_id << ", count=" << draw->count;
    } else if (const auto* play = get<PlayCardPayload>()) {
        oss << "player=" << play->player_id << ", card=" << play->card_id;
        for (const auto& target : play->targets) {
            oss << ", target=" << target_to_string(target);
        }
    } else if (const auto* stat = get<ModifyStatPayload>()) {
        oss << "target=" << target_to_string(stat->target) << ", stat=" << stat->stat
            << ", value=" << stat->value.dump();
    } else if (const auto* tap = get<TapCardPayload>()) {
        oss << "card=" << tap->card_id;
    } else if (const auto* discard = get<DiscardCardPayload>()) {
        oss << "player=" << discard->player_id << ", card=" << discard->card_id;
    } else if (const auto* shuffle = get<ShuffleZonePayload>()) {
        oss << "zone=" << shuffle->zone_id;
    } else if (const auto* counter = get<CounterPayload>()) {
        oss << "target=" << target_to_string(counter->target) << ", type=" << counter->counter_type
            << ", count=" << counter->count;
    } else if (const auto* phase = get<SetPhasePayload>()) {
        oss << "phase=" << phase->phase;
    }

    if (player_id) {
        oss << ", by=" << *player_id;
    }
    oss << ")";
    return oss.str();
}

} // namespace cardforge
