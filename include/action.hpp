/**
 * CardForge Engine - Action Representation
 *
 * An Action is one requested state transition: a type tag, the payload for
 * that type, and optionally the player asking for it. Build actions with the
 * static factories; execute them with the action library.
 */

#pragma once

#include "types.hpp"
#include <variant>

namespace cardforge {

/** A play or stat target: either a card or a player. */
using TargetId = std::variant<CardId, PlayerId>;

std::string target_to_string(const TargetId& target);

// ============================================================================
// PAYLOADS
// ============================================================================

struct MoveCardPayload {
    CardId card_id;
    ZoneId from_zone;
    ZoneId to_zone;
    std::optional<int> position;    // nullopt = append
};

struct DrawCardsPayload {
    PlayerId player_id;
    int count = 1;
};

struct PlayCardPayload {
    CardId card_id;
    PlayerId player_id;
    std::vector<TargetId> targets;
};

struct ModifyStatPayload {
    TargetId target;
    std::string stat;
    nlohmann::json value = 0;       // numeric delta
};

struct TapCardPayload {
    CardId card_id;
};

struct DiscardCardPayload {
    CardId card_id;
    PlayerId player_id;
};

struct ShuffleZonePayload {
    ZoneId zone_id;
};

struct CounterPayload {
    TargetId target;
    std::string counter_type;
    int count = 1;
};

struct SetPhasePayload {
    std::string phase;
};

using ActionPayload = std::variant<
    MoveCardPayload,
    DrawCardsPayload,
    PlayCardPayload,
    ModifyStatPayload,
    TapCardPayload,         // TAP_CARD and UNTAP_CARD
    DiscardCardPayload,
    ShuffleZonePayload,
    CounterPayload,         // ADD_COUNTER and REMOVE_COUNTER
    SetPhasePayload
>;

/**
 * Action - A single requested state transition.
 */
struct Action {
    ActionType action_type = ActionType::SET_TURN_PHASE;
    ActionPayload payload = SetPhasePayload{};

    // Acting player, when the caller knows who is asking
    std::optional<PlayerId> player_id;

    // Display label for UI/logging
    std::string display_label;

    // ========================================================================
    // CONSTRUCTORS
    // ========================================================================

    Action() = default;

    Action(ActionType type, ActionPayload data)
        : action_type(type)
        , payload(std::move(data))
    {}

    // ========================================================================
    // FACTORY METHODS
    // ========================================================================

    static Action move_card(const CardId& card, const ZoneId& from, const ZoneId& to,
                            std::optional<int> position = std::nullopt) {
        return Action(ActionType::MOVE_CARD, MoveCardPayload{card, from, to, position});
    }

    static Action draw_cards(const PlayerId& player, int count = 1) {
        Action a(ActionType::DRAW_CARDS, DrawCardsPayload{player, count});
        a.player_id = player;
        return a;
    }

    static Action play_card(const PlayerId& player, const CardId& card,
                            std::vector<TargetId> targets = {}) {
        Action a(ActionType::PLAY_CARD, PlayCardPayload{card, player, std::move(targets)});
        a.player_id = player;
        return a;
    }

    static Action modify_stat(const TargetId& target, const std::string& stat,
                              nlohmann::json value) {
        return Action(ActionType::MODIFY_STAT, ModifyStatPayload{target, stat, std::move(value)});
    }

    static Action tap_card(const CardId& card) {
        return Action(ActionType::TAP_CARD, TapCardPayload{card});
    }

    static Action untap_card(const CardId& card) {
        return Action(ActionType::UNTAP_CARD, TapCardPayload{card});
    }

    static Action discard_card(const PlayerId& player, const CardId& card) {
        Action a(ActionType::DISCARD_CARD, DiscardCardPayload{card, player});
        a.player_id = player;
        return a;
    }

    static Action shuffle_zone(const ZoneId& zone) {
        return Action(ActionType::SHUFFLE_ZONE, ShuffleZonePayload{zone});
    }

    static Action add_counter(const TargetId& target, const std::string& counter_type,
                              int count = 1) {
        return Action(ActionType::ADD_COUNTER, CounterPayload{target, counter_type, count});
    }

    static Action remove_counter(const TargetId& target, const std::string& counter_type,
                                 int count = 1) {
        return Action(ActionType::REMOVE_COUNTER, CounterPayload{target, counter_type, count});
    }

    static Action set_phase(const std::string& phase) {
        return Action(ActionType::SET_TURN_PHASE, SetPhasePayload{phase});
    }

    /** Copy of this action attributed to the given player. */
    Action by(const PlayerId& actor) const {
        Action a = *this;
        a.player_id = actor;
        return a;
    }

    // ========================================================================
    // PAYLOAD ACCESS
    // ========================================================================

    /** nullptr when the payload holds another alternative. */
    template <typename T>
    const T* get() const {
        return std::get_if<T>(&payload);
    }

    /** True when action_type and the payload alternative agree. */
    bool is_well_formed() const;

    std::string to_string() const;
};

} // namespace cardforge
