/**
 * CardForge Engine - Player Implementation
 */

#include "player.hpp"
#include "errors.hpp"
#include "id_factory.hpp"
#include <algorithm>
#include <cstdlib>
#include <set>

namespace cardforge {

int Player::resource(const std::string& resource_name) const {
    auto it = resources.find(resource_name);
    return it != resources.end() ? it->second : 0;
}

Player Player::with_resource(const std::string& resource_name, int value) const {
    if (resource_name.empty()) {
        throw ValidationError("Resource name cannot be empty");
    }
    Player result = *this;
    result.resources[resource_name] = value;
    return result;
}

Player Player::with_resource_modified(const std::string& resource_name, int delta) const {
    std::optional<int> value = checked_add(resource(resource_name), delta);
    if (!value) {
        throw ActionError("Resource overflow: " + resource_name);
    }
    return with_resource(resource_name, *value);
}

Player Player::with_resource_reset(const std::string& resource_name) const {
    return with_resource(resource_name, 0);
}

Player Player::with_mana_spent(int amount) const {
    if (mana() < amount) {
        throw ActionError("Insufficient mana");
    }
    return with_resource_modified(kManaResource, -amount);
}

Player Player::healed(int amount) const {
    return with_resource_modified(kLifeResource, std::abs(amount));
}

Player Player::damaged(int amount) const {
    return with_resource_modified(kLifeResource, -std::abs(amount));
}

Player Player::with_counter_added(const std::string& counter_type, int count) const {
    Player result = *this;
    result.counters = counters::added(counters, Counter{counter_type, count});
    return result;
}

Player Player::with_counter_removed(const std::string& counter_type, int count) const {
    Player result = *this;
    result.counters = counters::removed(counters, Counter{counter_type, count});
    return result;
}

bool Player::owns_zone(const ZoneId& zone_id) const {
    return std::find(zones.begin(), zones.end(), zone_id) != zones.end();
}

Player Player::with_zone_added(const ZoneId& zone_id) const {
    if (!zone_id.is_valid()) {
        throw ValidationError("Zone ID must be valid");
    }
    if (owns_zone(zone_id)) {
        throw ActionError("Player already has this zone");
    }
    Player result = *this;
    result.zones.push_back(zone_id);
    return result;
}

Player Player::with_zone_removed(const ZoneId& zone_id) const {
    if (!owns_zone(zone_id)) {
        throw ActionError("Player does not have this zone");
    }
    Player result = *this;
    result.zones.erase(std::find(result.zones.begin(), result.zones.end(), zone_id));
    return result;
}

bool Player::operator==(const Player& other) const {
    return id == other.id &&
           name == other.name &&
           resources == other.resources &&
           zones == other.zones &&
           counters == other.counters;
}

// ============================================================================
// FACTORY / VALIDATION
// ============================================================================

Player create_player(PlayerParams params) {
    Player player;
    player.id = params.id.is_valid() ? std::move(params.id) : create_player_id();
    player.name = std::move(params.name);
    player.resources = std::move(params.resources);
    player.zones = std::move(params.zones);
    player.counters = std::move(params.counters);

    validate_player(player);
    return player;
}

void validate_player(const Player& player) {
    if (!player.id.is_valid()) {
        throw ValidationError("Player ID must be valid");
    }
    if (player.name.empty()) {
        throw ValidationError("Player name cannot be empty");
    }
    for (const auto& entry : player.resources) {
        if (entry.first.empty()) {
            throw ValidationError("Resource name cannot be empty");
        }
    }

    std::set<ZoneId> seen;
    for (const auto& zone_id : player.zones) {
        if (!zone_id.is_valid()) {
            throw ValidationError("Player zone ID must be valid");
        }
        if (!seen.insert(zone_id).second) {
            throw ValidationError("Duplicate zone ID for player: " + zone_id.value);
        }
    }
    counters::validate(player.counters);
}

} // namespace cardforge
