/**
 * CardForge Engine - Test Fixtures
 *
 * A small two-player table with fixed ids so tests can name every entity.
 *
 *   alice-deck    [a-deck-1, a-deck-2, a-deck-3]   (a-deck-3 on top)
 *   alice-hand    [a-bolt, a-bear, a-giant]
 *   alice-discard []
 *   alice-play    [a-wall]
 *   bob-deck      [b-deck-1, b-deck-2]
 *   bob-hand      [b-wolf]
 *
 * Both players start with 3 mana and 20 life. The game is started, so
 * Alice is the current player in the "main" phase of turn 1.
 */

#pragma once

#include "cardforge_engine.hpp"

namespace cardforge {
namespace testing {

inline Card make_card(const std::string& id, const std::string& name, const std::string& type,
                      const std::string& owner, const std::string& zone,
                      PropertyMap properties = {}) {
    CardParams params;
    params.id = CardId(id);
    params.name = name;
    params.type = type;
    params.owner = PlayerId(owner);
    params.current_zone = ZoneId(zone);
    params.properties = std::move(properties);
    return create_card(std::move(params));
}

inline std::vector<CardId> card_ids(std::initializer_list<const char*> ids) {
    std::vector<CardId> result;
    for (const char* id : ids) {
        result.emplace_back(id);
    }
    return result;
}

struct Table {
    Game game;

    PlayerId alice{"alice"};
    PlayerId bob{"bob"};

    ZoneId alice_deck{"alice-deck"};
    ZoneId alice_hand{"alice-hand"};
    ZoneId alice_discard{"alice-discard"};
    ZoneId alice_play{"alice-play"};
    ZoneId bob_deck{"bob-deck"};
    ZoneId bob_hand{"bob-hand"};

    CardId bolt{"a-bolt"};
    CardId bear{"a-bear"};
    CardId giant{"a-giant"};
    CardId wall{"a-wall"};
    CardId wolf{"b-wolf"};
};

inline Player make_player(const std::string& id, const std::string& name,
                          std::vector<ZoneId> zones) {
    PlayerParams params;
    params.id = PlayerId(id);
    params.name = name;
    params.resources = {{kManaResource, 3}, {kLifeResource, 20}};
    params.zones = std::move(zones);
    return create_player(std::move(params));
}

inline Table make_table(const EventManagerConfig& event_config = {}) {
    Table t;

    GameParams params;
    params.id = GameId("game-1");
    params.event_config = event_config;

    params.players = {
        make_player("alice", "Alice", {t.alice_deck, t.alice_hand, t.alice_discard, t.alice_play}),
        make_player("bob", "Bob", {t.bob_deck, t.bob_hand}),
    };

    params.zones = {
        create_deck(t.alice_deck, t.alice, card_ids({"a-deck-1", "a-deck-2", "a-deck-3"})),
        create_hand(t.alice_hand, t.alice, card_ids({"a-bolt", "a-bear", "a-giant"})),
        create_discard_pile(t.alice_discard, t.alice),
        create_play_area(t.alice_play, t.alice, card_ids({"a-wall"})),
        create_deck(t.bob_deck, t.bob, card_ids({"b-deck-1", "b-deck-2"})),
        create_hand(t.bob_hand, t.bob, card_ids({"b-wolf"})),
    };

    params.cards = {
        make_card("a-deck-1", "Forest", "Land", "alice", "alice-deck"),
        make_card("a-deck-2", "Island", "Land", "alice", "alice-deck"),
        make_card("a-deck-3", "Mountain", "Land", "alice", "alice-deck"),
        make_card("a-bolt", "Lightning Bolt", "Instant", "alice", "alice-hand",
                  {{kManaCostProperty, 1}}),
        make_card("a-bear", "Forest Bear", "Creature - Bear", "alice", "alice-hand",
                  {{kManaCostProperty, 2}, {kPowerProperty, 2}, {kToughnessProperty, 2}}),
        make_card("a-giant", "Hill Giant", "Creature - Giant", "alice", "alice-hand",
                  {{kManaCostProperty, 5}, {kPowerProperty, 4}, {kToughnessProperty, 4}}),
        make_card("a-wall", "Stone Wall", "Creature - Wall", "alice", "alice-play",
                  {{kPowerProperty, 0}, {kToughnessProperty, 4}}),
        make_card("b-deck-1", "Swamp", "Land", "bob", "bob-deck"),
        make_card("b-deck-2", "Plains", "Land", "bob", "bob-deck"),
        make_card("b-wolf", "Grey Wolf", "Creature - Wolf", "bob", "bob-hand",
                  {{kManaCostProperty, 1}, {kPowerProperty, 2}, {kToughnessProperty, 1}}),
    };

    t.game = start_game(create_game(std::move(params)));
    return t;
}

inline const Zone& zone_of(const Game& game, const ZoneId& zone_id) {
    const Zone* zone = game.find_zone(zone_id);
    if (!zone) {
        throw std::runtime_error("Test zone missing: " + zone_id.value);
    }
    return *zone;
}

inline const Card& card_of(const Game& game, const CardId& card_id) {
    const Card* card = game.find_card(card_id);
    if (!card) {
        throw std::runtime_error("Test card missing: " + card_id.value);
    }
    return *card;
}

inline const Player& player_of(const Game& game, const PlayerId& player_id) {
    const Player* player = game.find_player(player_id);
    if (!player) {
        throw std::runtime_error("Test player missing: " + player_id.value);
    }
    return *player;
}

// Cards listed across every zone, stack included
inline size_t listed_card_count(const Game& game) {
    size_t total = game.stack.cards.size();
    for (const auto& zone : game.zones) {
        total += zone.cards.size();
    }
    return total;
}

} // namespace testing
} // namespace cardforge
