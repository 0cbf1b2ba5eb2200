/**
 * CardForge Engine - Card Implementation
 */

#include "card.hpp"
#include "errors.hpp"
#include "id_factory.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

namespace cardforge {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int clamp_to_int(double value) {
    return static_cast<int>(std::clamp(value,
                                       static_cast<double>(std::numeric_limits<int>::min()),
                                       static_cast<double>(std::numeric_limits<int>::max())));
}

// Fractional stats round to the nearest whole number; out-of-range values saturate
int integer_property(const Card& card, const std::string& key) {
    const nlohmann::json* value = card.property(key);
    if (!value || !value->is_number()) {
        return 0;
    }
    if (std::optional<int> exact = json_to_int(*value)) {
        return *exact;
    }
    return clamp_to_int(std::round(value->get<double>()));
}

} // anonymous namespace

Card Card::tapped() const {
    Card result = *this;
    result.is_tapped = true;
    return result;
}

Card Card::untapped() const {
    Card result = *this;
    result.is_tapped = false;
    return result;
}

Card Card::with_property(const std::string& key, nlohmann::json value) const {
    if (key.empty()) {
        throw ValidationError("Property name cannot be empty");
    }
    Card result = *this;
    result.properties[key] = std::move(value);
    return result;
}

Card Card::without_property(const std::string& key) const {
    Card result = *this;
    result.properties.erase(key);
    return result;
}

const nlohmann::json* Card::property(const std::string& key) const {
    auto it = properties.find(key);
    return it != properties.end() ? &it->second : nullptr;
}

Card Card::with_counter_added(const std::string& counter_type, int count) const {
    Card result = *this;
    result.counters = counters::added(counters, Counter{counter_type, count});
    return result;
}

Card Card::with_counter_removed(const std::string& counter_type, int count) const {
    Card result = *this;
    result.counters = counters::removed(counters, Counter{counter_type, count});
    return result;
}

int Card::power() const {
    return clamp_to_int(static_cast<double>(integer_property(*this, kPowerProperty)) +
                        counter_count(kPlusOneCounter));
}

int Card::toughness() const {
    return clamp_to_int(static_cast<double>(integer_property(*this, kToughnessProperty)) +
                        counter_count(kPlusOneCounter));
}

bool Card::is_type(const std::string& type_name) const {
    return lowercase(type).find(lowercase(type_name)) != std::string::npos;
}

Card Card::copy_with_id(const CardId& new_id) const {
    if (!new_id.is_valid()) {
        throw ValidationError("Card ID must be valid");
    }
    Card result = *this;
    result.id = new_id;
    return result;
}

Card Card::moved_to(const ZoneId& zone_id) const {
    if (!zone_id.is_valid()) {
        throw ValidationError("Zone ID must be valid");
    }
    Card result = *this;
    result.current_zone = zone_id;
    return result;
}

bool Card::operator==(const Card& other) const {
    return id == other.id &&
           name == other.name &&
           text == other.text &&
           type == other.type &&
           owner == other.owner &&
           current_zone == other.current_zone &&
           properties == other.properties &&
           counters == other.counters &&
           is_tapped == other.is_tapped;
}

// ============================================================================
// FACTORY / VALIDATION
// ============================================================================

Card create_card(CardParams params) {
    Card card;
    card.id = params.id.is_valid() ? std::move(params.id) : create_card_id();
    card.name = std::move(params.name);
    card.text = std::move(params.text);
    card.type = std::move(params.type);
    card.owner = std::move(params.owner);
    card.current_zone = std::move(params.current_zone);
    card.properties = std::move(params.properties);
    card.counters = std::move(params.counters);
    card.is_tapped = params.is_tapped;

    validate_card(card);
    return card;
}

void validate_card(const Card& card) {
    if (!card.id.is_valid()) {
        throw ValidationError("Card ID must be valid");
    }
    if (card.name.empty()) {
        throw ValidationError("Card name cannot be empty");
    }
    if (card.type.empty()) {
        throw ValidationError("Card type cannot be empty");
    }
    if (!card.owner.is_valid()) {
        throw ValidationError("Card owner must be a valid player ID");
    }
    if (!card.current_zone.is_valid()) {
        throw ValidationError("Card current zone must be a valid zone ID");
    }
    for (const auto& entry : card.properties) {
        if (entry.first.empty()) {
            throw ValidationError("Property name cannot be empty");
        }
    }
    counters::validate(card.counters);
}

} // namespace cardforge
