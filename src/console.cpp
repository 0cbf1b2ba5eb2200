/**
 * CardForge Engine - Interactive Simulator Console
 *
 * Simple REPL for manual testing of actions and rules.
 * Loads a game document and a rules document (or builds a two-player demo
 * game), then applies actions through the full rule cascade.
 *
 * Usage: cardforge_console [game.json] [rules.json] [--no-trace] [--trace-dir DIR]
 */

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "cardforge_engine.hpp"
#include "trace_logger.hpp"

using namespace cardforge;

// ============================================================================
// HELPERS
// ============================================================================

std::vector<std::string> split(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string short_id(const std::string& id) {
    return id.length() > 8 ? id.substr(id.length() - 8) : id;
}

// Exact id, trailing short id, or case-insensitive name
bool matches(const std::string& token, const std::string& id, const std::string& name) {
    if (token == id || lowercase(token) == lowercase(name)) {
        return true;
    }
    return token.length() >= 4 && id.length() >= token.length() &&
           id.compare(id.length() - token.length(), token.length(), token) == 0;
}

bool parse_int(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

void print_help() {
    std::cout << R"(
=== CardForge Simulator Console ===

Commands:
  help                         - Show this help
  quit / exit                  - Exit console

State:
  show [player]                - Show the game (as seen by player, or everything)
  dump                         - Print the game as JSON
  listeners                    - Show active listeners in dispatch order

Actions (run through the rule cascade):
  draw <player> [n]            - Draw n cards (default 1)
  play <player> <card> [t...]  - Play a card; targets are cards or players
  move <card> <from> <to> [i]  - Move a card between zones
  discard <player> <card>      - Discard a card from hand
  tap <card> / untap <card>    - Tap or untap a card
  shuffle <zone>               - Shuffle an ordered zone
  stat <target> <stat> <delta> - Modify a player resource or card property
  counter add|remove <target> <type> [n]
  phase [name]                 - Set the phase (or advance the phase cycle)
  next                         - Pass the turn to the next player

Events:
  emit <TYPE> [json payload]   - Publish an event and process the queue

Names:
  Players and cards match by id, last 8 id characters, or name.
  Zones also match as <player>.<kind>, e.g. alice.hand, or "stack".
)" << std::endl;
}

// ============================================================================
// DEMO GAME
// ============================================================================

struct DemoCard {
    const char* name;
    const char* type;
    int mana_cost;
    int power;
    int toughness;
};

const DemoCard DEMO_DECK[] = {
    {"Goblin Raider", "Creature", 1, 2, 1},
    {"Lightning Bolt", "Instant", 1, 0, 0},
    {"Forest Bear", "Creature", 2, 2, 2},
    {"Healing Salve", "Instant", 0, 0, 0},
    {"Sky Drake", "Creature", 3, 3, 3},
    {"Stone Wall", "Creature", 1, 0, 4},
};

Game build_demo_game() {
    Game game = create_game(GameParams{});

    for (const char* name : {"Alice", "Bob"}) {
        PlayerParams player_params;
        player_params.name = name;
        player_params.resources = {{kManaResource, 3}, {kLifeResource, 20}};
        Player player = create_player(std::move(player_params));
        game = add_player_to_game(game, player);

        Zone deck = create_deck(create_zone_id(), player.id);
        game = add_zone_to_game(game, deck);
        game = add_zone_to_game(game, create_hand(create_zone_id(), player.id, {}, 7));
        game = add_zone_to_game(game, create_discard_pile(create_zone_id(), player.id));
        game = add_zone_to_game(game, create_play_area(create_zone_id(), player.id));

        for (const auto& demo : DEMO_DECK) {
            CardParams card_params;
            card_params.name = demo.name;
            card_params.type = demo.type;
            card_params.owner = player.id;
            card_params.current_zone = deck.id;
            card_params.properties = {{kManaCostProperty, demo.mana_cost}};
            if (std::string(demo.type) == "Creature") {
                card_params.properties[kPowerProperty] = demo.power;
                card_params.properties[kToughnessProperty] = demo.toughness;
            }
            game = add_card_to_game(game, create_card(std::move(card_params)));
        }

        game = game.with_zone(game.find_zone(deck.id)->shuffled());
    }

    return start_game(game);
}

std::vector<RuleDefinition> build_demo_rules() {
    RuleDefinition creature_draw;
    creature_draw.id = "creature-draw";
    creature_draw.name = "Creatures draw a card";
    creature_draw.event_type = event_types::CARD_PLAYED;
    creature_draw.condition = RuleCondition{"payload.cardType", ConditionOp::EQ, "Creature"};
    creature_draw.actions.push_back({"DRAW_CARDS", {{"playerId", "$event.payload.playerId"}, {"count", 1}}});

    RuleDefinition upkeep_mana;
    upkeep_mana.id = "upkeep-mana";
    upkeep_mana.name = "Gain one mana each upkeep";
    upkeep_mana.event_type = event_types::PHASE_CHANGED;
    upkeep_mana.condition = RuleCondition{"payload.phase", ConditionOp::EQ, "upkeep"};
    upkeep_mana.actions.push_back({"MODIFY_STAT", {{"target", {{"player", "$game.currentPlayer"}}},
                                                   {"stat", kManaResource},
                                                   {"value", 1}}});

    return {creature_draw, upkeep_mana};
}

// ============================================================================
// CONSOLE
// ============================================================================

class Console {
public:
    Game game;
    std::unique_ptr<TraceLogger> trace_logger;

    Console(Game initial, std::unique_ptr<TraceLogger> logger)
        : game(std::move(initial))
        , trace_logger(std::move(logger))
    {
        if (trace_logger) {
            trace_logger->log_message("Initial state");
            trace_logger->log_state(game);
        }
    }

    // ========================================================================
    // NAME RESOLUTION
    // ========================================================================

    const Player* find_player(const std::string& token) const {
        for (const auto& player : game.players) {
            if (matches(token, player.id.value, player.name)) {
                return &player;
            }
        }
        return nullptr;
    }

    const Card* find_card(const std::string& token) const {
        // Prefer the current player's hand for name matches
        if (const Player* current = game.get_current_player()) {
            if (const Zone* hand = game.find_player_zone(current->id, ZoneKind::HAND)) {
                for (const Card* card : game.cards_in_zone(hand->id)) {
                    if (matches(token, card->id.value, card->name)) {
                        return card;
                    }
                }
            }
        }
        for (const auto& card : game.cards) {
            if (matches(token, card.id.value, card.name)) {
                return &card;
            }
        }
        return nullptr;
    }

    const Zone* find_zone(const std::string& token) const {
        if (lowercase(token) == "stack") {
            return &game.stack;
        }

        auto dot = token.find('.');
        if (dot != std::string::npos) {
            const Player* player = find_player(token.substr(0, dot));
            auto kind = parse_zone_kind(lowercase(token.substr(dot + 1)));
            if (player && kind) {
                return game.find_player_zone(player->id, *kind);
            }
        }

        for (const auto& zone : game.zones) {
            if (matches(token, zone.id.value, zone.name)) {
                return &zone;
            }
        }
        return nullptr;
    }

    std::optional<TargetId> find_target(const std::string& token) const {
        if (const Player* player = find_player(token)) {
            return TargetId(player->id);
        }
        if (const Card* card = find_card(token)) {
            return TargetId(card->id);
        }
        return std::nullopt;
    }

    // ========================================================================
    // DISPLAY
    // ========================================================================

    void show_zone(const Zone& zone, const std::optional<PlayerId>& viewer) const {
        std::cout << "  " << zone.name << " (" << zone.size();
        if (zone.max_size) {
            std::cout << "/" << *zone.max_size;
        }
        std::cout << ")";

        if (viewer && !can_view_zone(game, *viewer, zone.id)) {
            std::cout << " [hidden]" << std::endl;
            return;
        }
        std::cout << ":" << std::endl;

        for (const Card* card : game.cards_in_zone(zone.id)) {
            std::cout << "    " << card->name << " (" << short_id(card->id.value) << ")";
            if (card->is_tapped) {
                std::cout << " [T]";
            }
            if (const auto* cost = card->property(kManaCostProperty)) {
                std::cout << " cost=" << cost->dump();
            }
            if (card->is_type("creature")) {
                std::cout << " " << card->power() << "/" << card->toughness();
            }
            for (const auto& counter : card->counters) {
                std::cout << " {" << counter.type << " x" << counter.count << "}";
            }
            std::cout << std::endl;
        }
    }

    void show_state(const std::optional<PlayerId>& viewer) const {
        GameSummary summary = game_summary(game);
        std::cout << "\n=== Turn " << summary.turn_number << " | Phase: " << summary.phase;
        if (const Player* current = game.get_current_player()) {
            std::cout << " | Current: " << current->name;
        }
        std::cout << " ===" << std::endl;

        for (const auto& player : players_in_turn_order(game)) {
            std::cout << "\n[" << player.name << "] (" << short_id(player.id.value) << ")"
                      << " mana=" << player.mana() << " life=" << player.life();
            if (!player.is_alive()) {
                std::cout << " [DEFEATED]";
            }
            std::cout << std::endl;
            for (const auto& zone_id : player.zones) {
                if (const Zone* zone = game.find_zone(zone_id)) {
                    show_zone(*zone, viewer);
                }
            }
        }

        std::cout << "\n[Shared]" << std::endl;
        show_zone(game.stack, viewer);
    }

    void show_listeners() const {
        auto listeners = get_active_listeners(game);
        if (listeners.empty()) {
            std::cout << "  (no listeners)" << std::endl;
            return;
        }
        for (const auto& listener : listeners) {
            std::cout << "  [" << listener.priority << "] " << listener.event_type
                      << " -> " << listener.id;
            if (auto rule = std::dynamic_pointer_cast<const RuleReaction>(listener.reaction)) {
                std::cout << " (" << rule->rule().name << ")";
            }
            std::cout << std::endl;
        }
    }

    // ========================================================================
    // EXECUTION
    // ========================================================================

    void run_action(const Action& action) {
        if (auto reason = check_action(game, action)) {
            std::cout << "  [!] " << *reason << std::endl;
            return;
        }

        if (trace_logger) {
            trace_logger->log_action(game, action);
        }

        DispatchResult result = dispatch_action(game, action);
        game = result.game;

        for (const auto& applied : result.applied_actions) {
            std::cout << "  + " << applied.to_string() << std::endl;
        }
        for (const auto& event : result.processed_events) {
            std::cout << "  * " << event.type << std::endl;
        }
        for (const auto& error : result.errors) {
            std::cout << "  [!] " << error << std::endl;
        }

        if (trace_logger) {
            trace_logger->log_dispatch(result);
            trace_logger->log_state(game);
        }
    }

    void cmd_emit(const std::vector<std::string>& args, const std::string& line) {
        if (args.size() < 2) {
            std::cout << "Usage: emit <TYPE> [json payload]" << std::endl;
            return;
        }

        nlohmann::json payload = nlohmann::json::object();
        auto brace = line.find('{');
        if (brace != std::string::npos) {
            try {
                payload = nlohmann::json::parse(line.substr(brace));
            } catch (const nlohmann::json::parse_error& e) {
                std::cout << "  [!] Invalid payload: " << e.what() << std::endl;
                return;
            }
        }

        try {
            game = publish_game_event(game, create_game_event(args[1], payload, game.current_player));
        } catch (const GameError& e) {
            std::cout << "  [!] " << e.what() << std::endl;
            return;
        }

        EventProcessingResult result = process_game_events(game);
        game = result.game;
        std::cout << "  Processed " << result.processed_events.size() << " events, generated "
                  << result.generated_events.size() << std::endl;
        for (const auto& error : result.errors) {
            std::cout << "  [!] " << error << std::endl;
        }
        if (trace_logger) {
            trace_logger->log_message("emit " + args[1]);
            trace_logger->log_events(result);
        }
    }

    void cmd_next() {
        game = increment_turn_number(next_player(game));
        const Player* current = game.get_current_player();
        std::cout << "  Turn " << game.turn_number << ": "
                  << (current ? current->name : std::string("?")) << std::endl;
        run_action(Action::set_phase(phase_cycle().front()));
    }

    // Builds the action for an action command; nullopt when the input is bad
    std::optional<Action> parse_action(const std::vector<std::string>& args) const {
        const std::string& cmd = args[0];

        if (cmd == "draw" && args.size() >= 2) {
            const Player* player = find_player(args[1]);
            int count = 1;
            if (!player || (args.size() >= 3 && !parse_int(args[2], count))) return std::nullopt;
            return Action::draw_cards(player->id, count);
        }
        if (cmd == "play" && args.size() >= 3) {
            const Player* player = find_player(args[1]);
            const Card* card = find_card(args[2]);
            if (!player || !card) return std::nullopt;
            std::vector<TargetId> targets;
            for (size_t i = 3; i < args.size(); ++i) {
                auto target = find_target(args[i]);
                if (!target) return std::nullopt;
                targets.push_back(*target);
            }
            return Action::play_card(player->id, card->id, targets);
        }
        if (cmd == "move" && args.size() >= 4) {
            const Card* card = find_card(args[1]);
            const Zone* from = find_zone(args[2]);
            const Zone* to = find_zone(args[3]);
            std::optional<int> position;
            int parsed = 0;
            if (args.size() >= 5) {
                if (!parse_int(args[4], parsed)) return std::nullopt;
                position = parsed;
            }
            if (!card || !from || !to) return std::nullopt;
            return Action::move_card(card->id, from->id, to->id, position);
        }
        if (cmd == "discard" && args.size() >= 3) {
            const Player* player = find_player(args[1]);
            const Card* card = find_card(args[2]);
            if (!player || !card) return std::nullopt;
            return Action::discard_card(player->id, card->id);
        }
        if ((cmd == "tap" || cmd == "untap") && args.size() >= 2) {
            const Card* card = find_card(args[1]);
            if (!card) return std::nullopt;
            return cmd == "tap" ? Action::tap_card(card->id) : Action::untap_card(card->id);
        }
        if (cmd == "shuffle" && args.size() >= 2) {
            const Zone* zone = find_zone(args[1]);
            if (!zone) return std::nullopt;
            return Action::shuffle_zone(zone->id);
        }
        if (cmd == "stat" && args.size() >= 4) {
            auto target = find_target(args[1]);
            int delta = 0;
            if (!target || !parse_int(args[3], delta)) return std::nullopt;
            return Action::modify_stat(*target, args[2], delta);
        }
        if (cmd == "counter" && args.size() >= 4) {
            auto target = find_target(args[2]);
            int count = 1;
            if (!target || (args.size() >= 5 && !parse_int(args[4], count))) return std::nullopt;
            if (args[1] == "add") return Action::add_counter(*target, args[3], count);
            if (args[1] == "remove") return Action::remove_counter(*target, args[3], count);
            return std::nullopt;
        }
        if (cmd == "phase") {
            if (args.size() >= 2) {
                return Action::set_phase(args[1]);
            }
            return Action::set_phase(advance_game_phase(game).phase);
        }
        return std::nullopt;
    }

    void run() {
        std::cout << "CardForge Simulator Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;
        std::cout << "Type 'help' for commands." << std::endl;

        show_state(std::nullopt);

        const std::vector<std::string> action_commands = {
            "draw", "play", "move", "discard", "tap", "untap", "shuffle", "stat", "counter", "phase"
        };

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "show" || cmd == "s") {
                std::optional<PlayerId> viewer;
                if (args.size() >= 2) {
                    const Player* player = find_player(args[1]);
                    if (!player) {
                        std::cout << "Unknown player: " << args[1] << std::endl;
                        continue;
                    }
                    viewer = player->id;
                }
                show_state(viewer);
            } else if (cmd == "dump") {
                std::cout << game_to_json(game).dump(2) << std::endl;
            } else if (cmd == "listeners" || cmd == "rules") {
                show_listeners();
            } else if (cmd == "emit") {
                cmd_emit(args, line);
            } else if (cmd == "next") {
                cmd_next();
            } else if (std::find(action_commands.begin(), action_commands.end(), cmd) != action_commands.end()) {
                auto action = parse_action(args);
                if (!action) {
                    std::cout << "Could not parse '" << line << "'. Type 'help' for usage." << std::endl;
                    continue;
                }
                run_action(*action);
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    bool trace = true;
    std::string trace_dir = "traces";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-trace") {
            trace = false;
        } else if (arg == "--trace-dir" && i + 1 < argc) {
            trace_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: cardforge_console [game.json] [rules.json] [--no-trace] [--trace-dir DIR]"
                      << std::endl;
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    try {
        Game game = positional.empty() ? build_demo_game() : load_game_file(positional[0]);
        std::vector<RuleDefinition> rules = positional.size() >= 2
            ? load_rules_file(positional[1])
            : (positional.empty() ? build_demo_rules() : std::vector<RuleDefinition>{});
        game = install_rules(game, rules);

        std::unique_ptr<TraceLogger> logger;
        if (trace) {
            logger = std::make_unique<TraceLogger>(trace_dir);
        }

        Console console(std::move(game), std::move(logger));
        console.run();
    } catch (const GameError& e) {
        std::cerr << "[Console] " << to_string(e.kind()) << " error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
