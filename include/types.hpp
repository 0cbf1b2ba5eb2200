/**
 * CardForge Engine - Core Type Definitions
 *
 * This file defines the enums, typed identifiers and value aliases used
 * throughout the engine. Property bags hold loosely-typed JSON values so a
 * card can carry whatever attributes a game designer gives it.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <ostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cardforge {

// ============================================================================
// ENUMS
// ============================================================================

enum class Visibility : uint8_t {
    PUBLIC,
    PRIVATE
};

enum class ZoneOrder : uint8_t {
    ORDERED,
    UNORDERED
};

enum class ZoneKind : uint8_t {
    ZONE,
    DECK,
    HAND,
    DISCARD,
    PLAY_AREA,
    STACK
};

enum class ActionType : uint8_t {
    MOVE_CARD,
    DRAW_CARDS,
    PLAY_CARD,
    MODIFY_STAT,
    TAP_CARD,
    UNTAP_CARD,
    DISCARD_CARD,
    SHUFFLE_ZONE,
    ADD_COUNTER,
    REMOVE_COUNTER,
    SET_TURN_PHASE
};

// ============================================================================
// TYPED IDENTIFIERS
// ============================================================================

/**
 * Identifier - Opaque string identifier tagged with the entity kind.
 *
 * Two identifiers of the same kind are equal when their values are equal.
 * Identifiers of different kinds are unrelated types, so a CardId can never
 * be passed where a ZoneId is expected.
 */
template <typename Tag>
struct Identifier {
    std::string value;

    Identifier() = default;
    explicit Identifier(std::string v) : value(std::move(v)) {}

    bool is_valid() const { return !value.empty(); }

    bool operator==(const Identifier& other) const { return value == other.value; }
    bool operator!=(const Identifier& other) const { return value != other.value; }
    bool operator<(const Identifier& other) const { return value < other.value; }
};

struct GameTag {};
struct PlayerTag {};
struct CardTag {};
struct ZoneTag {};
struct ListenerTag {};
struct EventTag {};

using GameId = Identifier<GameTag>;
using PlayerId = Identifier<PlayerTag>;
using CardId = Identifier<CardTag>;
using ZoneId = Identifier<ZoneTag>;
using ListenerId = Identifier<ListenerTag>;
using EventId = Identifier<EventTag>;

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const Identifier<Tag>& id) {
    return os << id.value;
}

// ============================================================================
// VALUE ALIASES
// ============================================================================

using PropertyMap = std::map<std::string, nlohmann::json>;
using ResourceMap = std::map<std::string, int>;

// Well-known resource and property names
constexpr const char* kManaResource = "mana";
constexpr const char* kLifeResource = "life";
constexpr const char* kManaCostProperty = "manaCost";
constexpr const char* kPowerProperty = "power";
constexpr const char* kToughnessProperty = "toughness";
constexpr const char* kPlusOneCounter = "+1/+1";

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr int kMaxRecursionDepth = 10;
constexpr int kDefaultMaxQueueSize = 1000;

constexpr const char* kSetupPhase = "setup";
constexpr const char* kSystemTrigger = "system";

/** Phase cycle used by advance_game_phase. */
inline const std::vector<std::string>& phase_cycle() {
    static const std::vector<std::string> phases = {"upkeep", "main", "combat", "end"};
    return phases;
}

// ============================================================================
// ENUM <-> STRING
// ============================================================================

std::string to_string(Visibility visibility);
std::string to_string(ZoneOrder order);
std::string to_string(ZoneKind kind);
std::string to_string(ActionType type);

std::optional<Visibility> parse_visibility(const std::string& s);
std::optional<ZoneOrder> parse_zone_order(const std::string& s);
std::optional<ZoneKind> parse_zone_kind(const std::string& s);
std::optional<ActionType> parse_action_type(const std::string& s);

// ============================================================================
// CHECKED INTEGERS
// ============================================================================

/** nullopt unless the value is a JSON integer that fits in an int. */
std::optional<int> json_to_int(const nlohmann::json& value);

/** nullopt when a + b overflows an int. */
std::optional<int> checked_add(int a, int b);

} // namespace cardforge

namespace std {

template <typename Tag>
struct hash<cardforge::Identifier<Tag>> {
    size_t operator()(const cardforge::Identifier<Tag>& id) const noexcept {
        return hash<string>()(id.value);
    }
};

} // namespace std
