/**
 * CardForge Engine - Game Aggregate
 *
 * The root state object representing a complete game snapshot: players,
 * zones, cards, turn state, the shared stack, global properties, and the
 * embedded event manager.
 *
 * Snapshots are plain values. Every function here returns a new Game and
 * never modifies its input, so older snapshots stay valid for undo, replay
 * and comparison.
 */

#pragma once

#include "card.hpp"
#include "event_manager.hpp"
#include "player.hpp"
#include "zone.hpp"

namespace cardforge {

struct GameParams {
    GameId id;                          // empty = generate
    std::vector<Player> players;
    std::vector<Zone> zones;
    std::vector<Card> cards;
    std::optional<PlayerId> current_player;
    std::string phase = kSetupPhase;
    int turn_number = 0;
    std::optional<Zone> stack;          // nullopt = fresh empty stack
    PropertyMap global_properties;
    std::optional<EventManager> event_manager;
    EventManagerConfig event_config;    // used when event_manager is empty
};

/**
 * Game - Complete game snapshot.
 *
 * Invariant: every identifier referenced anywhere in the snapshot resolves
 * to an entity in the snapshot.
 */
struct Game {
    GameId id;
    std::vector<Player> players;
    std::vector<Zone> zones;
    std::vector<Card> cards;
    std::optional<PlayerId> current_player;
    std::string phase = kSetupPhase;
    int turn_number = 0;
    Zone stack;
    PropertyMap global_properties;
    EventManager event_manager;

    // ========================================================================
    // LOOKUPS (nullptr when absent)
    // ========================================================================

    const Player* find_player(const PlayerId& player_id) const;
    const Card* find_card(const CardId& card_id) const;

    /** Includes the stack. */
    const Zone* find_zone(const ZoneId& zone_id) const;

    /** First zone of the given kind owned by the player. */
    const Zone* find_player_zone(const PlayerId& player_id, ZoneKind kind) const;

    const Player* get_current_player() const {
        return current_player ? find_player(*current_player) : nullptr;
    }

    /** Cards listed in a zone, in zone order. */
    std::vector<const Card*> cards_in_zone(const ZoneId& zone_id) const;

    // ========================================================================
    // REPLACEMENT (entity must already exist, matched by id)
    // ========================================================================

    Game with_player(const Player& player) const;
    Game with_card(const Card& card) const;

    /** Replaces the stack when the id matches it. */
    Game with_zone(const Zone& zone) const;

    bool operator==(const Game& other) const;
    bool operator!=(const Game& other) const { return !(*this == other); }
};

/**
 * GameSummary - Counts and turn state for display.
 */
struct GameSummary {
    int player_count = 0;
    int card_count = 0;
    int zone_count = 0;
    std::string phase;
    int turn_number = 0;
    bool is_active = false;
};

// ============================================================================
// CONSTRUCTION / VALIDATION
// ============================================================================

/**
 * Build a game and run the full referential check. Throws ValidationError.
 */
Game create_game(GameParams params);

/**
 * Full check: entity validity, unique ids, owner and zone references, and
 * card/zone membership agreement (each card listed exactly once, in the
 * zone its current_zone names).
 */
void validate_game(const Game& game);

Game copy_game(const Game& game, const GameId& new_id);

/** Empty the game back to setup, keeping its id and listeners. */
Game reset_game(const Game& game);

// ============================================================================
// ENTITY MANAGEMENT
// ============================================================================

Game add_player_to_game(const Game& game, const Player& player);

/** Rejected while the player still owns cards or zones. */
Game remove_player_from_game(const Game& game, const PlayerId& player_id);

Game add_zone_to_game(const Game& game, const Zone& zone);

/** Rejected while the zone still holds cards. */
Game remove_zone_from_game(const Game& game, const ZoneId& zone_id);

/** Places the card into the zone its current_zone names. */
Game add_card_to_game(const Game& game, const Card& card);

/** Also removes the card from its zone. */
Game remove_card_from_game(const Game& game, const CardId& card_id);

bool is_player_in_game(const Game& game, const PlayerId& player_id);

// ============================================================================
// TURN CONTROL
// ============================================================================

Game set_current_player(const Game& game, const PlayerId& player_id);

/** Rotate to the next player (or the first when none is current). */
Game next_player(const Game& game);

Game set_game_phase(const Game& game, const std::string& phase);

/** upkeep -> main -> combat -> end -> upkeep; unknown phases go to upkeep. */
Game advance_game_phase(const Game& game);

Game increment_turn_number(const Game& game);

/** Phase "main", turn 1, first player current. Needs at least one player. */
Game start_game(const Game& game);

// ============================================================================
// GLOBAL PROPERTIES
// ============================================================================

Game set_global_property(const Game& game, const std::string& key, nlohmann::json value);
Game remove_global_property(const Game& game, const std::string& key);

/** nullptr when absent. */
const nlohmann::json* get_global_property(const Game& game, const std::string& key);

// ============================================================================
// QUERIES
// ============================================================================

/** Players starting from the current one. */
std::vector<Player> players_in_turn_order(const Game& game);

/** Has players, a current player, and is past setup and not ended. */
bool is_game_active(const Game& game);

GameSummary game_summary(const Game& game);

} // namespace cardforge
