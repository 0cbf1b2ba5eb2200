/**
 * CardForge Engine - Game Implementation
 */

#include "game.hpp"
#include "errors.hpp"
#include "id_factory.hpp"
#include <algorithm>
#include <limits>
#include <map>
#include <set>

namespace cardforge {

namespace {

template <typename T, typename Id>
const T* find_by_id(const std::vector<T>& items, const Id& id) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const T& item) { return item.id == id; });
    return it != items.end() ? &(*it) : nullptr;
}

template <typename T>
bool replace_by_id(std::vector<T>& items, const T& replacement) {
    for (auto& item : items) {
        if (item.id == replacement.id) {
            item = replacement;
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// LOOKUPS
// ============================================================================

const Player* Game::find_player(const PlayerId& player_id) const {
    return find_by_id(players, player_id);
}

const Card* Game::find_card(const CardId& card_id) const {
    return find_by_id(cards, card_id);
}

const Zone* Game::find_zone(const ZoneId& zone_id) const {
    if (stack.id == zone_id) {
        return &stack;
    }
    return find_by_id(zones, zone_id);
}

const Zone* Game::find_player_zone(const PlayerId& player_id, ZoneKind kind) const {
    for (const auto& zone : zones) {
        if (zone.kind == kind && zone.is_owned_by(player_id)) {
            return &zone;
        }
    }
    return nullptr;
}

std::vector<const Card*> Game::cards_in_zone(const ZoneId& zone_id) const {
    std::vector<const Card*> result;
    const Zone* zone = find_zone(zone_id);
    if (!zone) {
        return result;
    }
    for (const auto& card_id : zone->cards) {
        if (const Card* card = find_card(card_id)) {
            result.push_back(card);
        }
    }
    return result;
}

// ============================================================================
// REPLACEMENT
// ============================================================================

Game Game::with_player(const Player& player) const {
    Game result = *this;
    if (!replace_by_id(result.players, player)) {
        throw ActionError("Player not found");
    }
    return result;
}

Game Game::with_card(const Card& card) const {
    Game result = *this;
    if (!replace_by_id(result.cards, card)) {
        throw ActionError("Card not found");
    }
    return result;
}

Game Game::with_zone(const Zone& zone) const {
    Game result = *this;
    if (result.stack.id == zone.id) {
        result.stack = zone;
        return result;
    }
    if (!replace_by_id(result.zones, zone)) {
        throw ActionError("Zone not found");
    }
    return result;
}

bool Game::operator==(const Game& other) const {
    return id == other.id &&
           players == other.players &&
           zones == other.zones &&
           cards == other.cards &&
           current_player == other.current_player &&
           phase == other.phase &&
           turn_number == other.turn_number &&
           stack == other.stack &&
           global_properties == other.global_properties &&
           event_manager == other.event_manager;
}

// ============================================================================
// CONSTRUCTION / VALIDATION
// ============================================================================

Game create_game(GameParams params) {
    Game game;
    game.id = params.id.is_valid() ? std::move(params.id) : create_game_id();
    game.players = std::move(params.players);
    game.zones = std::move(params.zones);
    game.cards = std::move(params.cards);
    game.current_player = std::move(params.current_player);
    game.phase = std::move(params.phase);
    game.turn_number = params.turn_number;
    game.stack = params.stack ? std::move(*params.stack) : create_stack(create_zone_id());
    game.global_properties = std::move(params.global_properties);
    game.event_manager = params.event_manager
        ? std::move(*params.event_manager)
        : create_event_manager(params.event_config);

    validate_game(game);
    return game;
}

void validate_game(const Game& game) {
    if (!game.id.is_valid()) {
        throw ValidationError("Invalid game ID");
    }
    if (game.phase.empty()) {
        throw ValidationError("Game phase cannot be empty");
    }
    if (game.turn_number < 0) {
        throw ValidationError("Turn number cannot be negative");
    }

    std::set<PlayerId> player_ids;
    for (const auto& player : game.players) {
        validate_player(player);
        if (!player_ids.insert(player.id).second) {
            throw ValidationError("Duplicate player ID: " + player.id.value);
        }
    }

    if (game.current_player && !player_ids.count(*game.current_player)) {
        throw ValidationError("Current player not found in game");
    }

    validate_zone(game.stack);
    if (game.stack.kind != ZoneKind::STACK) {
        throw ValidationError("Game stack must be a stack zone");
    }

    std::set<ZoneId> zone_ids = {game.stack.id};
    for (const auto& zone : game.zones) {
        validate_zone(zone);
        if (!zone_ids.insert(zone.id).second) {
            throw ValidationError("Duplicate zone ID: " + zone.id.value);
        }
        if (zone.owner && !player_ids.count(*zone.owner)) {
            throw ValidationError("Zone owner not found in game: " + zone.id.value);
        }
    }

    for (const auto& player : game.players) {
        for (const auto& zone_id : player.zones) {
            if (!zone_ids.count(zone_id)) {
                throw ValidationError("Player zone not found in game: " + zone_id.value);
            }
        }
    }

    // Every listed card appears in exactly one zone
    std::map<CardId, ZoneId> listed_in;
    auto collect = [&](const Zone& zone) {
        for (const auto& card_id : zone.cards) {
            if (!listed_in.emplace(card_id, zone.id).second) {
                throw ValidationError("Card listed in more than one zone: " + card_id.value);
            }
        }
    };
    collect(game.stack);
    for (const auto& zone : game.zones) {
        collect(zone);
    }

    std::set<CardId> card_ids;
    for (const auto& card : game.cards) {
        validate_card(card);
        if (!card_ids.insert(card.id).second) {
            throw ValidationError("Duplicate card ID: " + card.id.value);
        }
        if (!player_ids.count(card.owner)) {
            throw ValidationError("Card owner not found in game: " + card.id.value);
        }
        auto it = listed_in.find(card.id);
        if (it == listed_in.end() || it->second != card.current_zone) {
            throw ValidationError("Card is not listed in its current zone: " + card.id.value);
        }
    }

    for (const auto& entry : listed_in) {
        if (!card_ids.count(entry.first)) {
            throw ValidationError("Zone lists unknown card: " + entry.first.value);
        }
    }
}

Game copy_game(const Game& game, const GameId& new_id) {
    if (!new_id.is_valid()) {
        throw ValidationError("Invalid game ID");
    }
    Game result = game;
    result.id = new_id;
    return result;
}

Game reset_game(const Game& game) {
    Game result = game;
    result.players.clear();
    result.zones.clear();
    result.cards.clear();
    result.current_player.reset();
    result.phase = kSetupPhase;
    result.turn_number = 0;
    result.stack = create_stack(create_zone_id());
    result.global_properties.clear();
    result.event_manager = clear_event_queue(game.event_manager);
    return result;
}

// ============================================================================
// ENTITY MANAGEMENT
// ============================================================================

Game add_player_to_game(const Game& game, const Player& player) {
    if (game.find_player(player.id)) {
        throw ValidationError("Player already in game");
    }
    Game result = game;
    result.players.push_back(player);
    validate_game(result);
    return result;
}

Game remove_player_from_game(const Game& game, const PlayerId& player_id) {
    if (!game.find_player(player_id)) {
        throw ValidationError("Player not found in game");
    }
    for (const auto& card : game.cards) {
        if (card.owner == player_id) {
            throw ValidationError("Player still owns cards in the game");
        }
    }
    for (const auto& zone : game.zones) {
        if (zone.is_owned_by(player_id)) {
            throw ValidationError("Player still owns zones in the game");
        }
    }

    Game result = game;
    result.players.erase(std::find_if(result.players.begin(), result.players.end(),
                                      [&](const Player& p) { return p.id == player_id; }));
    if (result.current_player == player_id) {
        result.current_player.reset();
    }
    return result;
}

Game add_zone_to_game(const Game& game, const Zone& zone) {
    if (game.find_zone(zone.id)) {
        throw ValidationError("Zone already in game");
    }
    Game result = game;
    result.zones.push_back(zone);

    // Register the zone with its owner
    if (zone.owner) {
        for (auto& player : result.players) {
            if (player.id == *zone.owner && !player.owns_zone(zone.id)) {
                player = player.with_zone_added(zone.id);
            }
        }
    }

    validate_game(result);
    return result;
}

Game remove_zone_from_game(const Game& game, const ZoneId& zone_id) {
    if (game.stack.id == zone_id) {
        throw ValidationError("Cannot remove the game stack");
    }
    const Zone* zone = game.find_zone(zone_id);
    if (!zone) {
        throw ValidationError("Zone not found in game");
    }
    if (!zone->is_empty()) {
        throw ValidationError("Cannot remove a zone that still holds cards");
    }

    Game result = game;
    result.zones.erase(std::find_if(result.zones.begin(), result.zones.end(),
                                    [&](const Zone& z) { return z.id == zone_id; }));
    for (auto& player : result.players) {
        if (player.owns_zone(zone_id)) {
            player = player.with_zone_removed(zone_id);
        }
    }
    return result;
}

Game add_card_to_game(const Game& game, const Card& card) {
    validate_card(card);
    if (game.find_card(card.id)) {
        throw ValidationError("Card already in game");
    }
    if (!game.find_player(card.owner)) {
        throw ValidationError("Card owner not found in game");
    }
    const Zone* zone = game.find_zone(card.current_zone);
    if (!zone) {
        throw ValidationError("Card zone not found in game");
    }

    Game result = game.with_zone(zone->with_card_added(card.id));
    result.cards.push_back(card);
    return result;
}

Game remove_card_from_game(const Game& game, const CardId& card_id) {
    const Card* card = game.find_card(card_id);
    if (!card) {
        throw ValidationError("Card not found in game");
    }

    Game result = game;
    if (const Zone* zone = game.find_zone(card->current_zone)) {
        result = result.with_zone(zone->with_card_removed(card_id));
    }
    result.cards.erase(std::find_if(result.cards.begin(), result.cards.end(),
                                    [&](const Card& c) { return c.id == card_id; }));
    return result;
}

bool is_player_in_game(const Game& game, const PlayerId& player_id) {
    return game.find_player(player_id) != nullptr;
}

// ============================================================================
// TURN CONTROL
// ============================================================================

Game set_current_player(const Game& game, const PlayerId& player_id) {
    if (!game.find_player(player_id)) {
        throw ValidationError("Player not found in game");
    }
    Game result = game;
    result.current_player = player_id;
    return result;
}

Game next_player(const Game& game) {
    if (game.players.empty()) {
        return game;
    }

    Game result = game;
    auto it = game.current_player
        ? std::find_if(game.players.begin(), game.players.end(),
                       [&](const Player& p) { return p.id == *game.current_player; })
        : game.players.end();

    if (it == game.players.end()) {
        result.current_player = game.players.front().id;
    } else {
        size_t next = (static_cast<size_t>(it - game.players.begin()) + 1) % game.players.size();
        result.current_player = game.players[next].id;
    }
    return result;
}

Game set_game_phase(const Game& game, const std::string& phase) {
    if (phase.empty()) {
        throw ValidationError("Game phase cannot be empty");
    }
    Game result = game;
    result.phase = phase;
    return result;
}

Game advance_game_phase(const Game& game) {
    const auto& phases = phase_cycle();
    auto it = std::find(phases.begin(), phases.end(), game.phase);
    if (it == phases.end()) {
        return set_game_phase(game, phases.front());
    }
    size_t next = (static_cast<size_t>(it - phases.begin()) + 1) % phases.size();
    return set_game_phase(game, phases[next]);
}

Game increment_turn_number(const Game& game) {
    if (game.turn_number == std::numeric_limits<int>::max()) {
        throw ActionError("Turn number overflow");
    }
    Game result = game;
    result.turn_number += 1;
    return result;
}

Game start_game(const Game& game) {
    if (game.players.empty()) {
        throw ActionError("Cannot start game with no players");
    }
    Game result = game;
    result.phase = "main";
    result.turn_number = 1;
    result.current_player = game.players.front().id;
    return result;
}

// ============================================================================
// GLOBAL PROPERTIES
// ============================================================================

Game set_global_property(const Game& game, const std::string& key, nlohmann::json value) {
    if (key.empty()) {
        throw ValidationError("Property name cannot be empty");
    }
    Game result = game;
    result.global_properties[key] = std::move(value);
    return result;
}

Game remove_global_property(const Game& game, const std::string& key) {
    Game result = game;
    result.global_properties.erase(key);
    return result;
}

const nlohmann::json* get_global_property(const Game& game, const std::string& key) {
    auto it = game.global_properties.find(key);
    return it != game.global_properties.end() ? &it->second : nullptr;
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<Player> players_in_turn_order(const Game& game) {
    if (!game.current_player) {
        return game.players;
    }
    auto it = std::find_if(game.players.begin(), game.players.end(),
                           [&](const Player& p) { return p.id == *game.current_player; });
    if (it == game.players.end()) {
        return game.players;
    }

    std::vector<Player> ordered(it, game.players.end());
    ordered.insert(ordered.end(), game.players.begin(), it);
    return ordered;
}

bool is_game_active(const Game& game) {
    if (game.players.empty() || !game.current_player) {
        return false;
    }
    return game.phase != kSetupPhase && game.phase != "ended";
}

GameSummary game_summary(const Game& game) {
    GameSummary summary;
    summary.player_count = static_cast<int>(game.players.size());
    summary.card_count = static_cast<int>(game.cards.size());
    summary.zone_count = static_cast<int>(game.zones.size());
    summary.phase = game.phase;
    summary.turn_number = game.turn_number;
    summary.is_active = is_game_active(game);
    return summary;
}

} // namespace cardforge
