/**
 * Tests for the Game Aggregate
 */

#include "cardforge_engine.hpp"

using namespace cardforge;
using namespace cardforge::testing;

// ============================================================================
// CONSTRUCTION TESTS
// ============================================================================

TEST(Game, TableIsValid) {
    Table t = make_table();
    validate_game(t.game);

    TEST_ASSERT_EQ(2u, t.game.players.size());
    TEST_ASSERT_EQ(10u, t.game.cards.size());
    TEST_ASSERT_EQ(10u, listed_card_count(t.game));
    TEST_ASSERT_EQ(std::string("main"), t.game.phase);
    TEST_ASSERT_EQ(1, t.game.turn_number);
    TEST_ASSERT_EQ(t.alice, *t.game.current_player);
}

TEST(Game, EmptyGameDefaults) {
    Game game = create_game(GameParams{});
    TEST_ASSERT_TRUE(game.id.is_valid());
    TEST_ASSERT_EQ(std::string(kSetupPhase), game.phase);
    TEST_ASSERT_EQ(0, game.turn_number);
    TEST_ASSERT_TRUE(game.stack.is_empty());
    TEST_ASSERT_TRUE(game.stack.kind == ZoneKind::STACK);
    TEST_ASSERT_FALSE(is_game_active(game));
}

TEST(Game, RejectsCardOutsideItsZone) {
    GameParams params;
    params.players = {make_player("p1", "Alice", {ZoneId("d")})};
    params.zones = {create_deck(ZoneId("d"), PlayerId("p1"))};
    params.cards = {make_card("c1", "Goblin", "Creature", "p1", "d")};
    TEST_ASSERT_THROWS_MSG(create_game(params), ValidationError, "not listed in its current zone");
}

TEST(Game, RejectsCardInTwoZones) {
    GameParams params;
    params.players = {make_player("p1", "Alice", {ZoneId("d"), ZoneId("h")})};
    params.zones = {create_deck(ZoneId("d"), PlayerId("p1"), card_ids({"c1"})),
                    create_hand(ZoneId("h"), PlayerId("p1"), card_ids({"c1"}))};
    params.cards = {make_card("c1", "Goblin", "Creature", "p1", "d")};
    TEST_ASSERT_THROWS_MSG(create_game(params), ValidationError, "more than one zone");
}

TEST(Game, RejectsUnknownReferences) {
    GameParams params;
    params.players = {make_player("p1", "Alice", {ZoneId("missing")})};
    TEST_ASSERT_THROWS_MSG(create_game(params), ValidationError, "Player zone not found");

    GameParams current;
    current.current_player = PlayerId("ghost");
    TEST_ASSERT_THROWS_MSG(create_game(current), ValidationError, "Current player");
}

// ============================================================================
// ENTITY MANAGEMENT TESTS
// ============================================================================

TEST(Game, AddZoneRegistersWithOwner) {
    Table t = make_table();
    Zone graveyard = create_discard_pile(ZoneId("bob-discard"), t.bob);
    Game next = add_zone_to_game(t.game, graveyard);

    TEST_ASSERT_TRUE(player_of(next, t.bob).owns_zone(graveyard.id));
    TEST_ASSERT_FALSE(player_of(t.game, t.bob).owns_zone(graveyard.id));
    TEST_ASSERT_THROWS(add_zone_to_game(next, graveyard), ValidationError);
}

TEST(Game, AddAndRemoveCard) {
    Table t = make_table();
    Card token = make_card("token", "Spirit", "Token", "bob", "bob-hand");
    Game next = add_card_to_game(t.game, token);

    TEST_ASSERT_TRUE(zone_of(next, t.bob_hand).contains(token.id));
    TEST_ASSERT_EQ(11u, listed_card_count(next));
    validate_game(next);

    Game removed = remove_card_from_game(next, token.id);
    TEST_ASSERT_NULL(removed.find_card(token.id));
    TEST_ASSERT_FALSE(zone_of(removed, t.bob_hand).contains(token.id));
    validate_game(removed);
}

TEST(Game, RemovePlayerRequiresNoOwnedEntities) {
    Table t = make_table();
    TEST_ASSERT_THROWS_MSG(remove_player_from_game(t.game, t.bob), ValidationError, "owns cards");

    Game game = add_player_to_game(t.game, make_player("carol", "Carol", {}));
    game = set_current_player(game, PlayerId("carol"));
    Game removed = remove_player_from_game(game, PlayerId("carol"));
    TEST_ASSERT_FALSE(is_player_in_game(removed, PlayerId("carol")));
    TEST_ASSERT_FALSE(removed.current_player.has_value());
}

TEST(Game, RemoveZoneRules) {
    Table t = make_table();
    TEST_ASSERT_THROWS_MSG(remove_zone_from_game(t.game, t.alice_hand), ValidationError, "still holds cards");
    TEST_ASSERT_THROWS(remove_zone_from_game(t.game, t.game.stack.id), ValidationError);

    Game removed = remove_zone_from_game(t.game, t.alice_discard);
    TEST_ASSERT_NULL(removed.find_zone(t.alice_discard));
    TEST_ASSERT_FALSE(player_of(removed, t.alice).owns_zone(t.alice_discard));
}

TEST(Game, WithEntityRequiresExisting) {
    Table t = make_table();
    Card stranger = make_card("stranger", "Nobody", "Creature", "bob", "bob-hand");
    TEST_ASSERT_THROWS(t.game.with_card(stranger), ActionError);
    TEST_ASSERT_THROWS(t.game.with_zone(create_deck(ZoneId("nowhere"), t.bob)), ActionError);
}

// ============================================================================
// TURN CONTROL TESTS
// ============================================================================

TEST(Game, NextPlayerWrapsAround) {
    Table t = make_table();
    Game game = next_player(t.game);
    TEST_ASSERT_EQ(t.bob, *game.current_player);
    game = next_player(game);
    TEST_ASSERT_EQ(t.alice, *game.current_player);
}

TEST(Game, PlayersInTurnOrderStartAtCurrent) {
    Table t = make_table();
    std::vector<Player> order = players_in_turn_order(next_player(t.game));
    TEST_ASSERT_EQ(t.bob, order[0].id);
    TEST_ASSERT_EQ(t.alice, order[1].id);
}

TEST(Game, AdvancePhaseCycles) {
    Table t = make_table();
    Game game = advance_game_phase(t.game);
    TEST_ASSERT_EQ(std::string("combat"), game.phase);
    game = advance_game_phase(advance_game_phase(game));
    TEST_ASSERT_EQ(std::string("upkeep"), game.phase);

    // Phases outside the cycle restart it
    game = advance_game_phase(set_game_phase(game, "mulligan"));
    TEST_ASSERT_EQ(std::string("upkeep"), game.phase);
    TEST_ASSERT_THROWS(set_game_phase(game, ""), ValidationError);
}

TEST(Game, TurnNumberAndStart) {
    Table t = make_table();
    TEST_ASSERT_EQ(2, increment_turn_number(t.game).turn_number);
    TEST_ASSERT_EQ(1, t.game.turn_number);
    TEST_ASSERT_THROWS_MSG(start_game(create_game(GameParams{})), ActionError, "no players");
}

TEST(Game, SetCurrentPlayerRequiresMember) {
    Table t = make_table();
    TEST_ASSERT_THROWS(set_current_player(t.game, PlayerId("ghost")), ValidationError);
    TEST_ASSERT_EQ(t.bob, *set_current_player(t.game, t.bob).current_player);
}

// ============================================================================
// GLOBAL PROPERTY / COPY TESTS
// ============================================================================

TEST(Game, GlobalProperties) {
    Table t = make_table();
    Game game = set_global_property(t.game, "weather", "rain");
    TEST_ASSERT_EQ(std::string("rain"), get_global_property(game, "weather")->get<std::string>());
    TEST_ASSERT_NULL(get_global_property(t.game, "weather"));
    TEST_ASSERT_NULL(get_global_property(remove_global_property(game, "weather"), "weather"));
}

TEST(Game, CopyAndReset) {
    Table t = make_table();
    Game copy = copy_game(t.game, GameId("game-2"));
    TEST_ASSERT_EQ(GameId("game-2"), copy.id);
    TEST_ASSERT_TRUE(copy.players == t.game.players);

    Game reset = reset_game(t.game);
    TEST_ASSERT_EQ(t.game.id, reset.id);
    TEST_ASSERT_TRUE(reset.players.empty());
    TEST_ASSERT_TRUE(reset.cards.empty());
    TEST_ASSERT_EQ(0, reset.turn_number);
    TEST_ASSERT_EQ(std::string(kSetupPhase), reset.phase);
}

TEST(Game, Summary) {
    Table t = make_table();
    GameSummary summary = game_summary(t.game);
    TEST_ASSERT_EQ(2, summary.player_count);
    TEST_ASSERT_EQ(10, summary.card_count);
    TEST_ASSERT_EQ(6, summary.zone_count);
    TEST_ASSERT_TRUE(summary.is_active);
}
