/**
 * CardForge Engine - Modify Stat
 *
 * Adds a numeric delta to a player resource or a card property. A card
 * property that does not exist yet starts at zero.
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

std::optional<std::string> check_modify_stat(const Game& game, const ModifyStatPayload& p, const Actor&) {
    if (p.stat.empty()) {
        return "Stat name cannot be empty";
    }
    if (!p.value.is_number()) {
        return "Stat value must be numeric";
    }

    if (const PlayerId* player_id = std::get_if<PlayerId>(&p.target)) {
        if (!game.find_player(*player_id)) {
            return "Target not found";
        }
        if (!p.value.is_number_integer()) {
            return "Player resources must be whole numbers";
        }
        std::optional<int> delta = json_to_int(p.value);
        if (!delta) {
            return "Stat value out of range";
        }
        if (!checked_add(game.find_player(*player_id)->resource(p.stat), *delta)) {
            return "Resource overflow: " + p.stat;
        }
        return std::nullopt;
    }

    const Card* card = game.find_card(std::get<CardId>(p.target));
    if (!card) {
        return "Target not found";
    }
    const nlohmann::json* current = card->property(p.stat);
    if (current && !current->is_number()) {
        return "Card property is not numeric";
    }

    // Whole-number card stats stay ints; fractional ones are summed as doubles
    nlohmann::json old_value = current ? *current : nlohmann::json(0);
    if (old_value.is_number_integer() && p.value.is_number_integer()) {
        std::optional<int> base = json_to_int(old_value);
        std::optional<int> delta = json_to_int(p.value);
        if (!base || !delta || !checked_add(*base, *delta)) {
            return "Stat value out of range";
        }
    }
    return std::nullopt;
}

ActionOutcome apply_modify_stat(const Game& game, const ModifyStatPayload& p, const Actor& actor) {
    nlohmann::json old_value;
    nlohmann::json new_value;
    Game next = game;

    if (const PlayerId* player_id = std::get_if<PlayerId>(&p.target)) {
        const Player* player = game.find_player(*player_id);
        Player updated = player->with_resource_modified(p.stat, *json_to_int(p.value));
        old_value = player->resource(p.stat);
        new_value = updated.resource(p.stat);
        next = game.with_player(updated);
    } else {
        const Card* card = game.find_card(std::get<CardId>(p.target));
        const nlohmann::json* current = card->property(p.stat);
        old_value = current ? *current : nlohmann::json(0);

        if (old_value.is_number_integer() && p.value.is_number_integer()) {
            new_value = *json_to_int(old_value) + *json_to_int(p.value);
        } else {
            new_value = old_value.get<double>() + p.value.get<double>();
        }
        next = game.with_card(card->with_property(p.stat, new_value));
    }

    ActionOutcome outcome{std::move(next), {}};
    outcome.events.push_back(raise(event_types::STAT_MODIFIED,
                                   {{"target", target_json(p.target)},
                                    {"stat", p.stat},
                                    {"delta", p.value},
                                    {"oldValue", old_value},
                                    {"newValue", new_value}},
                                   actor));
    return outcome;
}

} // namespace actions
} // namespace cardforge
