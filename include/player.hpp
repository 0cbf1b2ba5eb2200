/**
 * CardForge Engine - Player Primitive
 *
 * A named participant with a resource bag (mana, life, or anything the game
 * defines), counters, and the list of zones it owns.
 */

#pragma once

#include "counter.hpp"
#include "types.hpp"

namespace cardforge {

struct PlayerParams {
    PlayerId id;
    std::string name;
    ResourceMap resources;
    std::vector<ZoneId> zones;
    CounterList counters;
};

/**
 * Player - Immutable player record.
 */
struct Player {
    PlayerId id;
    std::string name;
    ResourceMap resources;
    std::vector<ZoneId> zones;
    CounterList counters;

    // ========================================================================
    // RESOURCES
    // ========================================================================

    /** 0 when the resource is absent. */
    int resource(const std::string& resource_name) const;

    bool has_resource(const std::string& resource_name, int amount) const {
        return resource(resource_name) >= amount;
    }

    Player with_resource(const std::string& resource_name, int value) const;
    /** Throws ActionError("Resource overflow: ...") when the result leaves int range. */
    Player with_resource_modified(const std::string& resource_name, int delta) const;
    Player with_resource_reset(const std::string& resource_name) const;

    int mana() const { return resource(kManaResource); }
    int life() const { return resource(kLifeResource); }

    /** Throws ActionError("Insufficient mana"). */
    Player with_mana_spent(int amount) const;

    Player healed(int amount) const;
    Player damaged(int amount) const;

    bool is_alive() const { return life() > 0; }

    // ========================================================================
    // COUNTERS
    // ========================================================================

    Player with_counter_added(const std::string& counter_type, int count = 1) const;
    Player with_counter_removed(const std::string& counter_type, int count = 1) const;

    int counter_count(const std::string& counter_type) const {
        return counters::count_of(counters, counter_type);
    }

    // ========================================================================
    // ZONES
    // ========================================================================

    bool owns_zone(const ZoneId& zone_id) const;

    /** Throws ActionError when the player already owns the zone. */
    Player with_zone_added(const ZoneId& zone_id) const;

    /** Throws ActionError when the player does not own the zone. */
    Player with_zone_removed(const ZoneId& zone_id) const;

    bool operator==(const Player& other) const;
    bool operator!=(const Player& other) const { return !(*this == other); }
};

/** Build and validate a player. Throws ValidationError. */
Player create_player(PlayerParams params);

void validate_player(const Player& player);

} // namespace cardforge
