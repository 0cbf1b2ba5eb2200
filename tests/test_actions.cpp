/**
 * Tests for the Action Library
 */

#include <algorithm>
#include <limits>
#include "cardforge_engine.hpp"

using namespace cardforge;
using namespace cardforge::testing;

// ============================================================================
// DRAW TESTS
// ============================================================================

TEST(DrawCards, DeckOrderIsKeptInHand) {
    GameParams params;
    params.players = {make_player("p1", "Alice", {ZoneId("deck"), ZoneId("hand")})};
    params.zones = {create_deck(ZoneId("deck"), PlayerId("p1"), card_ids({"A", "B"})),
                    create_hand(ZoneId("hand"), PlayerId("p1"))};
    params.cards = {make_card("A", "Card A", "Land", "p1", "deck"),
                    make_card("B", "Card B", "Land", "p1", "deck")};
    Game game = create_game(params);

    Game next = execute_action(game, Action::draw_cards(PlayerId("p1"), 2));

    TEST_ASSERT_TRUE(zone_of(next, ZoneId("deck")).is_empty());
    TEST_ASSERT_TRUE(zone_of(next, ZoneId("hand")).cards == card_ids({"A", "B"}));
    TEST_ASSERT_EQ(ZoneId("hand"), card_of(next, CardId("A")).current_zone);
    TEST_ASSERT_EQ(ZoneId("hand"), card_of(next, CardId("B")).current_zone);

    // Input snapshot is untouched
    TEST_ASSERT_EQ(2, zone_of(game, ZoneId("deck")).size());
    TEST_ASSERT_TRUE(zone_of(game, ZoneId("hand")).is_empty());
}

TEST(DrawCards, RaisesCardsDrawn) {
    Table t = make_table();
    ActionOutcome outcome = execute_action_with_events(t.game, Action::draw_cards(t.alice, 2));

    TEST_ASSERT_EQ(1u, outcome.events.size());
    const GameEvent& event = outcome.events[0];
    TEST_ASSERT_EQ(std::string(event_types::CARDS_DRAWN), event.type);
    TEST_ASSERT_EQ(2, event.payload["count"].get<int>());
    TEST_ASSERT_EQ(std::string("a-deck-2"), event.payload["cardIds"][0].get<std::string>());
    TEST_ASSERT_EQ(std::string("a-deck-3"), event.payload["cardIds"][1].get<std::string>());
    TEST_ASSERT_EQ(t.alice, *event.triggered_by);
}

TEST(DrawCards, Rejections) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Not enough cards in deck"),
                   *check_action(t.game, Action::draw_cards(t.alice, 4)));
    TEST_ASSERT_EQ(std::string("Cannot draw negative number of cards"),
                   *check_action(t.game, Action::draw_cards(t.alice, -1)));
    TEST_ASSERT_THROWS_MSG(execute_action(t.game, Action::draw_cards(t.alice, 4)),
                           ActionError, "Not enough cards in deck");
}

TEST(DrawCards, FullHandRejects) {
    Table t = make_table();
    Zone small_hand = zone_of(t.game, t.bob_hand);
    small_hand.max_size = 1;
    Game game = t.game.with_zone(small_hand);
    TEST_ASSERT_FALSE(validate_action(game, Action::draw_cards(t.bob, 1)));
}

// ============================================================================
// PLAY TESTS
// ============================================================================

TEST(PlayCard, PaysCostAndMovesToPlayArea) {
    Table t = make_table();
    ActionOutcome outcome = execute_action_with_events(t.game, Action::play_card(t.alice, t.bear));

    TEST_ASSERT_TRUE(zone_of(outcome.game, t.alice_play).contains(t.bear));
    TEST_ASSERT_FALSE(zone_of(outcome.game, t.alice_hand).contains(t.bear));
    TEST_ASSERT_EQ(t.alice_play, card_of(outcome.game, t.bear).current_zone);
    TEST_ASSERT_EQ(1, player_of(outcome.game, t.alice).mana());

    const GameEvent& event = outcome.events.at(0);
    TEST_ASSERT_EQ(std::string(event_types::CARD_PLAYED), event.type);
    TEST_ASSERT_EQ(std::string("Forest Bear"), event.payload["cardName"].get<std::string>());
    TEST_ASSERT_EQ(2, event.payload["manaCost"].get<int>());
    TEST_ASSERT_EQ(t.alice_play.value, event.payload["zoneId"].get<std::string>());
}

TEST(PlayCard, InsufficientManaLeavesGameUnchanged) {
    Table t = make_table();
    Game before = t.game;
    Action play = Action::play_card(t.alice, t.giant);

    TEST_ASSERT_FALSE(validate_action(t.game, play));
    TEST_ASSERT_THROWS_MSG(execute_action(t.game, play), ActionError, "Insufficient mana");
    TEST_ASSERT_TRUE(before == t.game);
    TEST_ASSERT_EQ(3, player_of(t.game, t.alice).mana());
}

TEST(PlayCard, TargetsAreReported) {
    Table t = make_table();
    Action play = Action::play_card(t.alice, t.bolt, {TargetId(t.bob), TargetId(t.wall)});
    ActionOutcome outcome = execute_action_with_events(t.game, play);

    const nlohmann::json& targets = outcome.events.at(0).payload["targets"];
    TEST_ASSERT_EQ(2u, targets.size());
    TEST_ASSERT_EQ(std::string("bob"), targets[0]["player"].get<std::string>());
    TEST_ASSERT_EQ(std::string("a-wall"), targets[1]["card"].get<std::string>());

    Action missing = Action::play_card(t.alice, t.bolt, {TargetId(PlayerId("ghost"))});
    TEST_ASSERT_EQ(std::string("Target not found"), *check_action(t.game, missing));
}

TEST(PlayCard, OwnershipAndLocationChecks) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Player does not own this card"),
                   *check_action(t.game, Action::play_card(t.alice, t.wolf)));
    TEST_ASSERT_EQ(std::string("Card not in hand"),
                   *check_action(t.game, Action::play_card(t.alice, t.wall)));
    TEST_ASSERT_EQ(std::string("Player not found"),
                   *check_action(t.game, Action::play_card(PlayerId("ghost"), t.bolt).by(t.alice)));
}

TEST(PlayCard, CreatesMissingPlayArea) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::play_card(t.bob, t.wolf));

    const Zone* play_area = game.find_player_zone(t.bob, ZoneKind::PLAY_AREA);
    TEST_ASSERT_NOT_NULL(play_area);
    TEST_ASSERT_TRUE(play_area->contains(t.wolf));
    TEST_ASSERT_TRUE(player_of(game, t.bob).owns_zone(play_area->id));
    TEST_ASSERT_EQ(2, player_of(game, t.bob).mana());
    validate_game(game);
}

TEST(PlayCard, InvalidCostRejected) {
    Table t = make_table();
    Game game = t.game.with_card(card_of(t.game, t.bolt).with_property(kManaCostProperty, "one"));
    TEST_ASSERT_EQ(std::string("Invalid mana cost"),
                   *check_action(game, Action::play_card(t.alice, t.bolt)));

    // Costs beyond int range must not wrap into an affordable cost
    Game huge = t.game.with_card(card_of(t.game, t.giant).with_property(kManaCostProperty, 4294967298LL));
    TEST_ASSERT_EQ(std::string("Invalid mana cost"),
                   *check_action(huge, Action::play_card(t.alice, t.giant)));
    TEST_ASSERT_THROWS_MSG(execute_action(huge, Action::play_card(t.alice, t.giant)),
                           ActionError, "Invalid mana cost");
    TEST_ASSERT_EQ(3, player_of(huge, t.alice).mana());

    Game negative = t.game.with_card(card_of(t.game, t.bolt).with_property(kManaCostProperty, -1));
    TEST_ASSERT_FALSE(validate_action(negative, Action::play_card(t.alice, t.bolt)));
}

TEST(PlayCard, CostlessCardIsFree) {
    Table t = make_table();
    Game game = t.game.with_card(card_of(t.game, t.bolt).without_property(kManaCostProperty));
    game = execute_action(game, Action::play_card(t.alice, t.bolt));
    TEST_ASSERT_EQ(3, player_of(game, t.alice).mana());
}

// ============================================================================
// MOVE / DISCARD TESTS
// ============================================================================

TEST(MoveCard, BetweenZones) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::move_card(t.bolt, t.alice_hand, t.game.stack.id));

    TEST_ASSERT_EQ(t.bolt, *game.stack.top_card());
    TEST_ASSERT_EQ(game.stack.id, card_of(game, t.bolt).current_zone);
    TEST_ASSERT_EQ(2, zone_of(game, t.alice_hand).size());
    validate_game(game);
}

TEST(MoveCard, ToPosition) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::move_card(t.bolt, t.alice_hand, t.alice_deck, 0));
    TEST_ASSERT_EQ(t.bolt, *zone_of(game, t.alice_deck).bottom_card());

    TEST_ASSERT_EQ(std::string("Invalid position"),
                   *check_action(t.game, Action::move_card(t.bolt, t.alice_hand, t.alice_deck, 4)));
}

TEST(MoveCard, WithinZoneReorders) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::move_card(CardId("a-deck-1"), t.alice_deck, t.alice_deck, 2));
    TEST_ASSERT_EQ(CardId("a-deck-1"), *zone_of(game, t.alice_deck).top_card());
    TEST_ASSERT_EQ(3, zone_of(game, t.alice_deck).size());
}

TEST(MoveCard, Rejections) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Card not found in source zone"),
                   *check_action(t.game, Action::move_card(t.bolt, t.alice_deck, t.alice_discard)));
    TEST_ASSERT_EQ(std::string("Destination zone not found"),
                   *check_action(t.game, Action::move_card(t.bolt, t.alice_hand, ZoneId("nowhere"))));
    TEST_ASSERT_EQ(std::string("Card not found"),
                   *check_action(t.game, Action::move_card(CardId("ghost"), t.alice_hand, t.alice_discard)));

    Zone full = zone_of(t.game, t.bob_hand);
    full.max_size = 1;
    Game game = t.game.with_zone(full);
    TEST_ASSERT_EQ(std::string("Zone is at maximum capacity"),
                   *check_action(game, Action::move_card(t.bolt, t.alice_hand, t.bob_hand)));
}

TEST(DiscardCard, GoesOnTopOfDiscardPile) {
    Table t = make_table();
    ActionOutcome outcome = execute_action_with_events(t.game, Action::discard_card(t.alice, t.bolt));

    TEST_ASSERT_EQ(t.bolt, *zone_of(outcome.game, t.alice_discard).top_card());
    TEST_ASSERT_EQ(std::string(event_types::CARD_DISCARDED), outcome.events.at(0).type);
    TEST_ASSERT_EQ(t.alice_hand.value, outcome.events.at(0).payload["fromZone"].get<std::string>());
}

TEST(DiscardCard, CreatesMissingDiscardPile) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::discard_card(t.bob, t.wolf));
    const Zone* discard = game.find_player_zone(t.bob, ZoneKind::DISCARD);
    TEST_ASSERT_NOT_NULL(discard);
    TEST_ASSERT_TRUE(discard->contains(t.wolf));
    validate_game(game);
}

TEST(DiscardCard, MustBeInHand) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Card not in hand"),
                   *check_action(t.game, Action::discard_card(t.alice, t.wall)));
}

// ============================================================================
// STAT / TAP / COUNTER / SHUFFLE / PHASE TESTS
// ============================================================================

TEST(ModifyStat, PlayerResource) {
    Table t = make_table();
    ActionOutcome outcome = execute_action_with_events(
        t.game, Action::modify_stat(TargetId(t.bob), kLifeResource, -3));

    TEST_ASSERT_EQ(17, player_of(outcome.game, t.bob).life());
    const nlohmann::json& payload = outcome.events.at(0).payload;
    TEST_ASSERT_EQ(20, payload["oldValue"].get<int>());
    TEST_ASSERT_EQ(17, payload["newValue"].get<int>());
    TEST_ASSERT_EQ(std::string("bob"), payload["target"]["player"].get<std::string>());
}

TEST(ModifyStat, CardProperty) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::modify_stat(TargetId(t.wall), kPowerProperty, 2));
    TEST_ASSERT_EQ(2, card_of(game, t.wall).power());

    // Missing properties start at zero
    game = execute_action(game, Action::modify_stat(TargetId(t.wall), "shield", 3));
    TEST_ASSERT_EQ(3, card_of(game, t.wall).property("shield")->get<int>());
}

TEST(ModifyStat, Rejections) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Stat value must be numeric"),
                   *check_action(t.game, Action::modify_stat(TargetId(t.bob), kLifeResource, "lots")));
    TEST_ASSERT_EQ(std::string("Player resources must be whole numbers"),
                   *check_action(t.game, Action::modify_stat(TargetId(t.bob), kLifeResource, 1.5)));
    TEST_ASSERT_EQ(std::string("Target not found"),
                   *check_action(t.game, Action::modify_stat(TargetId(CardId("ghost")), "power", 1)));

    Game game = t.game.with_card(card_of(t.game, t.wall).with_property("name_tag", "wall"));
    TEST_ASSERT_EQ(std::string("Card property is not numeric"),
                   *check_action(game, Action::modify_stat(TargetId(t.wall), "name_tag", 1)));
}

TEST(ModifyStat, OutOfRangeValues) {
    Table t = make_table();
    Action huge = Action::modify_stat(TargetId(t.alice), kLifeResource, 4294967296LL);
    TEST_ASSERT_EQ(std::string("Stat value out of range"), *check_action(t.game, huge));
    TEST_ASSERT_THROWS_MSG(execute_action(t.game, huge), ActionError, "Stat value out of range");

    TEST_ASSERT_EQ(std::string("Stat value out of range"),
                   *check_action(t.game, Action::modify_stat(TargetId(t.wall), kPowerProperty, 4294967296LL)));

    Game rich = t.game.with_player(player_of(t.game, t.bob).with_resource(kLifeResource,
                                                                          std::numeric_limits<int>::max()));
    Action heal = Action::modify_stat(TargetId(t.bob), kLifeResource, 1);
    TEST_ASSERT_EQ(std::string("Resource overflow: life"), *check_action(rich, heal));
    TEST_ASSERT_THROWS(execute_action(rich, heal), ActionError);
    TEST_ASSERT_EQ(std::numeric_limits<int>::max(), player_of(rich, t.bob).life());

    Game strong = t.game.with_card(card_of(t.game, t.wall).with_property(kPowerProperty,
                                                                         std::numeric_limits<int>::max()));
    TEST_ASSERT_EQ(std::string("Stat value out of range"),
                   *check_action(strong, Action::modify_stat(TargetId(t.wall), kPowerProperty, 1)));
}

TEST(TapCard, TapAndUntap) {
    Table t = make_table();
    ActionOutcome tapped = execute_action_with_events(t.game, Action::tap_card(t.wall));
    TEST_ASSERT_TRUE(card_of(tapped.game, t.wall).is_tapped);
    TEST_ASSERT_FALSE(card_of(t.game, t.wall).is_tapped);
    TEST_ASSERT_EQ(std::string(kSystemTrigger), tapped.events.at(0).trigger_name());

    Game untapped = execute_action(tapped.game, Action::untap_card(t.wall));
    TEST_ASSERT_FALSE(card_of(untapped, t.wall).is_tapped);
}

TEST(TapCard, ActorMustOwnCard) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Player does not own this card"),
                   *check_action(t.game, Action::tap_card(t.wall).by(t.bob)));
    TEST_ASSERT_TRUE(validate_action(t.game, Action::tap_card(t.wall).by(t.alice)));
}

TEST(CounterActions, AddAndRemoveOnCard) {
    Table t = make_table();
    ActionOutcome outcome = execute_action_with_events(
        t.game, Action::add_counter(TargetId(t.wall), kPlusOneCounter, 2));

    TEST_ASSERT_EQ(2, card_of(outcome.game, t.wall).counter_count(kPlusOneCounter));
    TEST_ASSERT_EQ(2, card_of(outcome.game, t.wall).power());
    TEST_ASSERT_EQ(2, outcome.events.at(0).payload["total"].get<int>());

    TEST_ASSERT_EQ(std::string("Cannot remove more counters than exist"),
                   *check_action(outcome.game, Action::remove_counter(TargetId(t.wall), kPlusOneCounter, 3)));

    Game game = execute_action(outcome.game, Action::remove_counter(TargetId(t.wall), kPlusOneCounter, 2));
    TEST_ASSERT_FALSE(card_of(game, t.wall).has_counter(kPlusOneCounter));
}

TEST(CounterActions, CountOverflowRejected) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::add_counter(TargetId(t.alice), "poison",
                                                           std::numeric_limits<int>::max()));
    Action one_more = Action::add_counter(TargetId(t.alice), "poison", 1);

    TEST_ASSERT_EQ(std::string("Counter count overflow"), *check_action(game, one_more));
    TEST_ASSERT_FALSE(validate_action(game, one_more));
    TEST_ASSERT_THROWS_MSG(execute_action(game, one_more), ActionError, "Counter count overflow");
    TEST_ASSERT_EQ(std::numeric_limits<int>::max(), player_of(game, t.alice).counter_count("poison"));
}

TEST(CounterActions, PlayerCounters) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::add_counter(TargetId(t.bob), "poison", 3));
    TEST_ASSERT_EQ(3, player_of(game, t.bob).counter_count("poison"));
    TEST_ASSERT_EQ(std::string("Cannot remove counters that do not exist"),
                   *check_action(t.game, Action::remove_counter(TargetId(t.bob), "poison")));
}

TEST(ShuffleZone, PermutesDeck) {
    Table t = make_table();
    Game game = execute_action(t.game, Action::shuffle_zone(t.alice_deck));

    std::vector<CardId> before = zone_of(t.game, t.alice_deck).cards;
    std::vector<CardId> after = zone_of(game, t.alice_deck).cards;
    std::sort(before.begin(), before.end());
    std::sort(after.begin(), after.end());
    TEST_ASSERT_TRUE(before == after);
}

TEST(ShuffleZone, Rejections) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Cannot shuffle unordered zone"),
                   *check_action(t.game, Action::shuffle_zone(t.alice_hand)));
    TEST_ASSERT_EQ(std::string("Player does not own this zone"),
                   *check_action(t.game, Action::shuffle_zone(t.alice_deck).by(t.bob)));
    TEST_ASSERT_THROWS(execute_action(t.game, Action::shuffle_zone(t.alice_hand)), ActionError);
}

TEST(SetPhase, ChangesPhase) {
    Table t = make_table();
    ActionOutcome outcome = execute_action_with_events(t.game, Action::set_phase("combat"));
    TEST_ASSERT_EQ(std::string("combat"), outcome.game.phase);
    TEST_ASSERT_EQ(std::string("main"), outcome.events.at(0).payload["previousPhase"].get<std::string>());
    TEST_ASSERT_FALSE(validate_action(t.game, Action::set_phase("")));
}

// ============================================================================
// DISPATCH / VISIBILITY TESTS
// ============================================================================

TEST(ActionLibrary, MalformedActionRejected) {
    Table t = make_table();
    Action broken(ActionType::DRAW_CARDS, SetPhasePayload{"main"});
    TEST_ASSERT_FALSE(broken.is_well_formed());
    TEST_ASSERT_EQ(std::string("Malformed action payload"), *check_action(t.game, broken));
}

TEST(ActionLibrary, UnknownActorRejected) {
    Table t = make_table();
    TEST_ASSERT_EQ(std::string("Acting player not found"),
                   *check_action(t.game, Action::set_phase("end").by(PlayerId("ghost"))));
}

TEST(ActionLibrary, ValidateMatchesExecute) {
    Table t = make_table();
    std::vector<Action> actions = {
        Action::draw_cards(t.alice, 3),
        Action::draw_cards(t.alice, 4),
        Action::play_card(t.alice, t.bear),
        Action::play_card(t.alice, t.giant),
        Action::discard_card(t.bob, t.wolf),
        Action::tap_card(t.wolf).by(t.alice),
        Action::shuffle_zone(t.bob_hand),
        Action::remove_counter(TargetId(t.wall), "charge"),
    };

    for (const auto& action : actions) {
        bool valid = validate_action(t.game, action);
        bool threw = false;
        try {
            execute_action(t.game, action);
        } catch (const ActionError&) {
            threw = true;
        }
        TEST_ASSERT_MSG(valid != threw, action.to_string());
    }
}

TEST(ActionLibrary, CardsAreConserved) {
    Table t = make_table();
    Game game = t.game;
    game = execute_action(game, Action::draw_cards(t.alice, 2));
    game = execute_action(game, Action::play_card(t.alice, t.bolt));
    game = execute_action(game, Action::discard_card(t.alice, t.bear));
    game = execute_action(game, Action::move_card(t.wall, t.alice_play, game.stack.id));
    game = execute_action(game, Action::play_card(t.bob, t.wolf).by(t.bob));

    TEST_ASSERT_EQ(game.cards.size(), listed_card_count(game));
    validate_game(game);
}

TEST(ZoneVisibility, PrivateZonesHiddenFromOthers) {
    Table t = make_table();
    TEST_ASSERT_TRUE(can_view_zone(t.game, t.alice, t.alice_hand));
    TEST_ASSERT_FALSE(can_view_zone(t.game, t.bob, t.alice_hand));
    TEST_ASSERT_TRUE(can_view_zone(t.game, t.bob, t.alice_play));
    TEST_ASSERT_FALSE(can_view_zone(t.game, PlayerId("ghost"), t.alice_play));

    TEST_ASSERT_THROWS_MSG(view_zone(t.game, t.bob, t.alice_hand), ActionError, "Cannot view private zone");
    TEST_ASSERT_THROWS(view_zone(t.game, t.bob, ZoneId("nowhere")), ActionError);

    std::vector<CardId> top = view_zone(t.game, t.alice, t.alice_deck, 1);
    TEST_ASSERT_EQ(1u, top.size());
    TEST_ASSERT_EQ(CardId("a-deck-3"), top[0]);
}

TEST(ActionRepresentation, FactoriesSetActor) {
    Table t = make_table();
    TEST_ASSERT_EQ(t.alice, *Action::draw_cards(t.alice).player_id);
    TEST_ASSERT_FALSE(Action::tap_card(t.wall).player_id.has_value());

    const auto* payload = Action::draw_cards(t.alice, 2).get<DrawCardsPayload>();
    TEST_ASSERT_NOT_NULL(payload);
    TEST_ASSERT_EQ(2, payload->count);
    TEST_ASSERT_NULL(Action::draw_cards(t.alice).get<MoveCardPayload>());
}
