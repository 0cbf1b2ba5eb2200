/**
 * CardForge Engine - Card Primitive
 *
 * An immutable card value. Every helper returns a new Card and leaves the
 * receiver untouched, so snapshots held by callers stay valid.
 */

#pragma once

#include "counter.hpp"
#include "types.hpp"

namespace cardforge {

/**
 * CardParams - Input to create_card. An empty id gets a fresh one.
 */
struct CardParams {
    CardId id;
    std::string name;
    std::string text;
    std::string type;
    PlayerId owner;
    ZoneId current_zone;
    PropertyMap properties;
    CounterList counters;
    bool is_tapped = false;
};

/**
 * Card - A single card instance.
 *
 * current_zone must name a zone that lists this card. The Card type does not
 * enforce that on its own; actions and create_game do.
 */
struct Card {
    CardId id;
    std::string name;
    std::string text;
    std::string type;
    PlayerId owner;
    ZoneId current_zone;
    PropertyMap properties;
    CounterList counters;
    bool is_tapped = false;

    // ========================================================================
    // TAP STATE
    // ========================================================================

    Card tapped() const;
    Card untapped() const;

    // ========================================================================
    // PROPERTIES
    // ========================================================================

    Card with_property(const std::string& key, nlohmann::json value) const;
    Card without_property(const std::string& key) const;

    /** Returns nullptr when the property is absent. */
    const nlohmann::json* property(const std::string& key) const;

    bool has_property(const std::string& key) const {
        return properties.count(key) > 0;
    }

    // ========================================================================
    // COUNTERS
    // ========================================================================

    Card with_counter_added(const std::string& counter_type, int count = 1) const;
    Card with_counter_removed(const std::string& counter_type, int count = 1) const;

    int counter_count(const std::string& counter_type) const {
        return counters::count_of(counters, counter_type);
    }

    bool has_counter(const std::string& counter_type) const {
        return counter_count(counter_type) > 0;
    }

    // ========================================================================
    // DERIVED STATS
    // ========================================================================

    /**
     * Base "power" property plus +1/+1 counters. A fractional base rounds
     * to the nearest whole number; the result saturates at the int range.
     */
    int power() const;

    /** Base "toughness" property plus +1/+1 counters, rounded like power(). */
    int toughness() const;

    /** Case-insensitive substring match against the type line. */
    bool is_type(const std::string& type_name) const;

    // ========================================================================
    // IDENTITY / LOCATION
    // ========================================================================

    Card copy_with_id(const CardId& new_id) const;
    Card moved_to(const ZoneId& zone_id) const;

    bool operator==(const Card& other) const;
    bool operator!=(const Card& other) const { return !(*this == other); }
};

/**
 * Build and validate a card. Throws ValidationError.
 */
Card create_card(CardParams params);

/**
 * Check every field of an existing card. Throws ValidationError.
 */
void validate_card(const Card& card);

} // namespace cardforge
