/**
 * CardForge Engine - Enum Conversions
 */

#include "types.hpp"
#include "errors.hpp"
#include <limits>

namespace cardforge {

// ============================================================================
// ENUM <-> STRING
// ============================================================================

std::string to_string(Visibility visibility) {
    return visibility == Visibility::PRIVATE ? "private" : "public";
}

std::string to_string(ZoneOrder order) {
    return order == ZoneOrder::UNORDERED ? "unordered" : "ordered";
}

std::string to_string(ZoneKind kind) {
    switch (kind) {
        case ZoneKind::ZONE: return "zone";
        case ZoneKind::DECK: return "deck";
        case ZoneKind::HAND: return "hand";
        case ZoneKind::DISCARD: return "discard";
        case ZoneKind::PLAY_AREA: return "playarea";
        case ZoneKind::STACK: return "stack";
    }
    return "zone";
}

std::string to_string(ActionType type) {
    switch (type) {
        case ActionType::MOVE_CARD: return "MOVE_CARD";
        case ActionType::DRAW_CARDS: return "DRAW_CARDS";
        case ActionType::PLAY_CARD: return "PLAY_CARD";
        case ActionType::MODIFY_STAT: return "MODIFY_STAT";
        case ActionType::TAP_CARD: return "TAP_CARD";
        case ActionType::UNTAP_CARD: return "UNTAP_CARD";
        case ActionType::DISCARD_CARD: return "DISCARD_CARD";
        case ActionType::SHUFFLE_ZONE: return "SHUFFLE_ZONE";
        case ActionType::ADD_COUNTER: return "ADD_COUNTER";
        case ActionType::REMOVE_COUNTER: return "REMOVE_COUNTER";
        case ActionType::SET_TURN_PHASE: return "SET_TURN_PHASE";
    }
    return "UNKNOWN";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::ACTION: return "action";
        case ErrorKind::EVENT_SYSTEM: return "event_system";
    }
    return "unknown";
}

std::optional<Visibility> parse_visibility(const std::string& s) {
    if (s == "public") return Visibility::PUBLIC;
    if (s == "private") return Visibility::PRIVATE;
    return std::nullopt;
}

std::optional<ZoneOrder> parse_zone_order(const std::string& s) {
    if (s == "ordered") return ZoneOrder::ORDERED;
    if (s == "unordered") return ZoneOrder::UNORDERED;
    return std::nullopt;
}

std::optional<ZoneKind> parse_zone_kind(const std::string& s) {
    if (s == "zone") return ZoneKind::ZONE;
    if (s == "deck") return ZoneKind::DECK;
    if (s == "hand") return ZoneKind::HAND;
    if (s == "discard") return ZoneKind::DISCARD;
    if (s == "playarea") return ZoneKind::PLAY_AREA;
    if (s == "stack") return ZoneKind::STACK;
    return std::nullopt;
}

std::optional<ActionType> parse_action_type(const std::string& s) {
    static const ActionType all[] = {
        ActionType::MOVE_CARD, ActionType::DRAW_CARDS, ActionType::PLAY_CARD,
        ActionType::MODIFY_STAT, ActionType::TAP_CARD, ActionType::UNTAP_CARD,
        ActionType::DISCARD_CARD, ActionType::SHUFFLE_ZONE, ActionType::ADD_COUNTER,
        ActionType::REMOVE_COUNTER, ActionType::SET_TURN_PHASE
    };
    for (ActionType type : all) {
        if (to_string(type) == s) {
            return type;
        }
    }
    return std::nullopt;
}

// ============================================================================
// CHECKED INTEGERS
// ============================================================================

std::optional<int> json_to_int(const nlohmann::json& value) {
    constexpr int64_t lo = std::numeric_limits<int>::min();
    constexpr int64_t hi = std::numeric_limits<int>::max();

    if (value.is_number_unsigned()) {
        uint64_t u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(hi)) {
            return std::nullopt;
        }
        return static_cast<int>(u);
    }
    if (value.is_number_integer()) {
        int64_t i = value.get<int64_t>();
        if (i < lo || i > hi) {
            return std::nullopt;
        }
        return static_cast<int>(i);
    }
    return std::nullopt;
}

std::optional<int> checked_add(int a, int b) {
    int64_t sum = static_cast<int64_t>(a) + b;
    if (sum < std::numeric_limits<int>::min() || sum > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(sum);
}

} // namespace cardforge
