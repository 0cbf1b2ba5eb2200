/**
 * CardForge Engine - Game Loader Implementation
 *
 * Parses game, action and rule documents using nlohmann/json.
 */

#include "game_loader.hpp"
#include "errors.hpp"
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace cardforge {

namespace {

// ============================================================================
// FIELD HELPERS
// ============================================================================

void require_object(const json& doc, const std::string& what) {
    if (!doc.is_object()) {
        throw ValidationError(what + " document must be an object");
    }
}

std::string require_string(const json& doc, const char* key, const std::string& what) {
    if (!doc.contains(key) || !doc[key].is_string()) {
        throw ValidationError(what + " missing required field: " + key);
    }
    return doc[key].get<std::string>();
}

std::string optional_string(const json& doc, const char* key, const std::string& fallback,
                            const std::string& what) {
    if (!doc.contains(key) || doc[key].is_null()) {
        return fallback;
    }
    if (!doc[key].is_string()) {
        throw ValidationError(what + " field must be a string: " + key);
    }
    return doc[key].get<std::string>();
}

std::optional<int> optional_int(const json& doc, const char* key, const std::string& what) {
    if (!doc.contains(key) || doc[key].is_null()) {
        return std::nullopt;
    }
    if (!doc[key].is_number_integer()) {
        throw ValidationError(what + " field must be an integer: " + key);
    }
    std::optional<int> value = json_to_int(doc[key]);
    if (!value) {
        throw ValidationError(what + " field out of range: " + key);
    }
    return value;
}

bool optional_bool(const json& doc, const char* key, bool fallback, const std::string& what) {
    if (!doc.contains(key) || doc[key].is_null()) {
        return fallback;
    }
    if (!doc[key].is_boolean()) {
        throw ValidationError(what + " field must be a boolean: " + key);
    }
    return doc[key].get<bool>();
}

const json* optional_array(const json& doc, const char* key, const std::string& what) {
    if (!doc.contains(key) || doc[key].is_null()) {
        return nullptr;
    }
    if (!doc[key].is_array()) {
        throw ValidationError(what + " field must be an array: " + key);
    }
    return &doc[key];
}

const json* optional_object(const json& doc, const char* key, const std::string& what) {
    if (!doc.contains(key) || doc[key].is_null()) {
        return nullptr;
    }
    if (!doc[key].is_object()) {
        throw ValidationError(what + " field must be an object: " + key);
    }
    return &doc[key];
}

template <typename Id>
std::vector<Id> id_list(const json& doc, const char* key, const std::string& what) {
    std::vector<Id> ids;
    if (const json* arr = optional_array(doc, key, what)) {
        for (const auto& item : *arr) {
            if (!item.is_string()) {
                throw ValidationError(what + " " + key + " entries must be strings");
            }
            ids.emplace_back(item.get<std::string>());
        }
    }
    return ids;
}

CounterList parse_counters(const json& doc, const std::string& what) {
    CounterList result;
    if (const json* arr = optional_array(doc, "counters", what)) {
        for (const auto& item : *arr) {
            require_object(item, "Counter");
            Counter counter;
            counter.type = require_string(item, "type", "Counter");
            counter.count = optional_int(item, "count", "Counter").value_or(0);
            result.push_back(counter);
        }
    }
    return result;
}

json counters_to_json(const CounterList& list) {
    json arr = json::array();
    for (const auto& counter : list) {
        arr.push_back({{"type", counter.type}, {"count", counter.count}});
    }
    return arr;
}

template <typename Id>
json ids_to_json(const std::vector<Id>& ids) {
    json arr = json::array();
    for (const auto& id : ids) {
        arr.push_back(id.value);
    }
    return arr;
}

TargetId parse_target(const json& doc) {
    require_object(doc, "Target");
    if (doc.contains("card")) {
        return CardId(require_string(doc, "card", "Target"));
    }
    if (doc.contains("player")) {
        return PlayerId(require_string(doc, "player", "Target"));
    }
    throw ValidationError("Target must name a card or a player");
}

json target_to_json(const TargetId& target) {
    if (const CardId* card = std::get_if<CardId>(&target)) {
        return {{"card", card->value}};
    }
    return {{"player", std::get<PlayerId>(target).value}};
}

// Kind defaults mirror the zone factories
ZoneParams zone_defaults(ZoneKind kind) {
    ZoneParams params;
    params.kind = kind;
    switch (kind) {
        case ZoneKind::DECK:
            params.name = "Deck";
            params.visibility = Visibility::PRIVATE;
            params.order = ZoneOrder::ORDERED;
            break;
        case ZoneKind::HAND:
            params.name = "Hand";
            params.visibility = Visibility::PRIVATE;
            params.order = ZoneOrder::UNORDERED;
            break;
        case ZoneKind::DISCARD:
            params.name = "Discard Pile";
            break;
        case ZoneKind::PLAY_AREA:
            params.name = "Play Area";
            params.order = ZoneOrder::UNORDERED;
            break;
        case ZoneKind::STACK:
            params.name = "Stack";
            break;
        case ZoneKind::ZONE:
            break;
    }
    return params;
}

} // anonymous namespace

// ============================================================================
// ENTITIES
// ============================================================================

Card card_from_json(const json& doc) {
    require_object(doc, "Card");

    CardParams params;
    params.id = CardId(require_string(doc, "id", "Card"));
    params.name = require_string(doc, "name", "Card");
    params.text = optional_string(doc, "text", "", "Card");
    params.type = require_string(doc, "type", "Card");
    params.owner = PlayerId(require_string(doc, "owner", "Card"));
    params.current_zone = ZoneId(require_string(doc, "currentZone", "Card"));
    params.is_tapped = optional_bool(doc, "isTapped", false, "Card");
    params.counters = parse_counters(doc, "Card");

    if (const json* props = optional_object(doc, "properties", "Card")) {
        for (auto it = props->begin(); it != props->end(); ++it) {
            params.properties[it.key()] = it.value();
        }
    }

    return create_card(std::move(params));
}

json card_to_json(const Card& card) {
    json props = json::object();
    for (const auto& entry : card.properties) {
        props[entry.first] = entry.second;
    }
    return {
        {"id", card.id.value},
        {"name", card.name},
        {"text", card.text},
        {"type", card.type},
        {"owner", card.owner.value},
        {"currentZone", card.current_zone.value},
        {"properties", props},
        {"counters", counters_to_json(card.counters)},
        {"isTapped", card.is_tapped}
    };
}

Zone zone_from_json(const json& doc) {
    require_object(doc, "Zone");

    std::string kind_str = optional_string(doc, "type", "zone", "Zone");
    std::optional<ZoneKind> kind = parse_zone_kind(kind_str);
    if (!kind) {
        throw ValidationError("Invalid zone type: " + kind_str);
    }

    ZoneParams params = zone_defaults(*kind);
    params.id = ZoneId(require_string(doc, "id", "Zone"));
    params.name = optional_string(doc, "name", params.name, "Zone");
    params.cards = id_list<CardId>(doc, "cards", "Zone");
    params.max_size = optional_int(doc, "maxSize", "Zone");

    std::string owner = optional_string(doc, "owner", "", "Zone");
    if (!owner.empty()) {
        params.owner = PlayerId(owner);
    }

    if (doc.contains("visibility")) {
        std::string s = optional_string(doc, "visibility", "", "Zone");
        auto visibility = parse_visibility(s);
        if (!visibility) {
            throw ValidationError("Invalid zone visibility: " + s);
        }
        params.visibility = *visibility;
    }
    if (doc.contains("order")) {
        std::string s = optional_string(doc, "order", "", "Zone");
        auto order = parse_zone_order(s);
        if (!order) {
            throw ValidationError("Invalid zone order: " + s);
        }
        params.order = *order;
    }

    return create_zone(std::move(params));
}

json zone_to_json(const Zone& zone) {
    return {
        {"id", zone.id.value},
        {"name", zone.name},
        {"type", to_string(zone.kind)},
        {"owner", zone.owner ? json(zone.owner->value) : json(nullptr)},
        {"cards", ids_to_json(zone.cards)},
        {"visibility", to_string(zone.visibility)},
        {"order", to_string(zone.order)},
        {"maxSize", zone.max_size ? json(*zone.max_size) : json(nullptr)}
    };
}

Player player_from_json(const json& doc) {
    require_object(doc, "Player");

    PlayerParams params;
    params.id = PlayerId(require_string(doc, "id", "Player"));
    params.name = require_string(doc, "name", "Player");
    params.zones = id_list<ZoneId>(doc, "zones", "Player");
    params.counters = parse_counters(doc, "Player");

    if (const json* resources = optional_object(doc, "resources", "Player")) {
        for (auto it = resources->begin(); it != resources->end(); ++it) {
            if (!it.value().is_number_integer()) {
                throw ValidationError("Player resource must be an integer: " + it.key());
            }
            std::optional<int> value = json_to_int(it.value());
            if (!value) {
                throw ValidationError("Player resource out of range: " + it.key());
            }
            params.resources[it.key()] = *value;
        }
    }

    return create_player(std::move(params));
}

json player_to_json(const Player& player) {
    json resources = json::object();
    for (const auto& entry : player.resources) {
        resources[entry.first] = entry.second;
    }
    return {
        {"id", player.id.value},
        {"name", player.name},
        {"resources", resources},
        {"zones", ids_to_json(player.zones)},
        {"counters", counters_to_json(player.counters)}
    };
}

Game game_from_json(const json& doc) {
    require_object(doc, "Game");

    GameParams params;
    params.id = GameId(optional_string(doc, "id", "", "Game"));
    params.phase = optional_string(doc, "phase", kSetupPhase, "Game");
    params.turn_number = optional_int(doc, "turnNumber", "Game").value_or(0);

    std::string current = optional_string(doc, "currentPlayer", "", "Game");
    if (!current.empty()) {
        params.current_player = PlayerId(current);
    }

    if (const json* arr = optional_array(doc, "cards", "Game")) {
        for (const auto& item : *arr) {
            params.cards.push_back(card_from_json(item));
        }
    }

    // Zones without an explicit card list take the cards that name them
    if (const json* arr = optional_array(doc, "zones", "Game")) {
        for (const auto& item : *arr) {
            Zone zone = zone_from_json(item);
            if (!item.contains("cards")) {
                for (const auto& card : params.cards) {
                    if (card.current_zone == zone.id) {
                        if (zone.is_full()) {
                            throw ValidationError("Zone exceeds maximum size: " + zone.id.value);
                        }
                        zone = zone.with_card_added(card.id);
                    }
                }
            }
            params.zones.push_back(std::move(zone));
        }
    }

    if (const json* arr = optional_array(doc, "players", "Game")) {
        for (const auto& item : *arr) {
            Player player = player_from_json(item);
            if (!item.contains("zones")) {
                for (const auto& zone : params.zones) {
                    if (zone.is_owned_by(player.id)) {
                        player = player.with_zone_added(zone.id);
                    }
                }
            }
            params.players.push_back(std::move(player));
        }
    }

    if (const json* stack = optional_object(doc, "stack", "Game")) {
        json stack_doc = *stack;
        stack_doc["type"] = "stack";
        params.stack = zone_from_json(stack_doc);
    }

    if (const json* props = optional_object(doc, "globalProperties", "Game")) {
        for (auto it = props->begin(); it != props->end(); ++it) {
            params.global_properties[it.key()] = it.value();
        }
    }

    if (const json* config = optional_object(doc, "eventManager", "Game")) {
        if (config->contains("maxQueueSize")) {
            params.event_config.max_queue_size = optional_int(*config, "maxQueueSize", "Event manager");
        }
        params.event_config.enable_logging =
            optional_bool(*config, "enableLogging", false, "Event manager");
    }

    return create_game(std::move(params));
}

json game_to_json(const Game& game) {
    json players = json::array();
    for (const auto& player : game.players) {
        players.push_back(player_to_json(player));
    }
    json zones = json::array();
    for (const auto& zone : game.zones) {
        zones.push_back(zone_to_json(zone));
    }
    json cards = json::array();
    for (const auto& card : game.cards) {
        cards.push_back(card_to_json(card));
    }
    json props = json::object();
    for (const auto& entry : game.global_properties) {
        props[entry.first] = entry.second;
    }
    json listeners = json::array();
    for (const auto& listener : game.event_manager.listeners) {
        listeners.push_back({{"id", listener.id.value},
                             {"eventType", listener.event_type},
                             {"priority", listener.priority}});
    }

    const EventManager& manager = game.event_manager;
    return {
        {"id", game.id.value},
        {"players", players},
        {"zones", zones},
        {"cards", cards},
        {"currentPlayer", game.current_player ? json(game.current_player->value) : json(nullptr)},
        {"phase", game.phase},
        {"turnNumber", game.turn_number},
        {"stack", zone_to_json(game.stack)},
        {"globalProperties", props},
        {"eventManager", {
            {"maxQueueSize", manager.max_queue_size ? json(*manager.max_queue_size) : json(nullptr)},
            {"enableLogging", manager.enable_logging},
            {"queuedEvents", manager.event_queue.size()},
            {"listeners", listeners}
        }}
    };
}

json event_to_json(const GameEvent& event) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        event.timestamp.time_since_epoch()).count();
    return {
        {"id", event.id.value},
        {"type", event.type},
        {"payload", event.payload},
        {"timestamp", millis},
        {"triggeredBy", event.triggered_by ? json(event.triggered_by->value) : json(nullptr)}
    };
}

// ============================================================================
// ACTIONS
// ============================================================================

std::optional<ActionType> parse_action_name(const std::string& name) {
    // camelCase -> UPPER_SNAKE
    std::string normalized;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isupper(uc) && !normalized.empty() && normalized.back() != '_' &&
            std::islower(static_cast<unsigned char>(name[0]))) {
            normalized += '_';
        }
        normalized += static_cast<char>(std::toupper(uc));
    }
    if (normalized == "SET_PHASE") {
        return ActionType::SET_TURN_PHASE;
    }
    return parse_action_type(normalized);
}

Action action_from_json(const json& doc) {
    require_object(doc, "Action");

    std::string type_name = require_string(doc, "type", "Action");
    std::optional<ActionType> type = parse_action_name(type_name);
    if (!type) {
        throw ValidationError("Unknown action type: " + type_name);
    }

    Action action;
    switch (*type) {
        case ActionType::MOVE_CARD:
            action = Action::move_card(CardId(require_string(doc, "cardId", "Action")),
                                       ZoneId(require_string(doc, "fromZone", "Action")),
                                       ZoneId(require_string(doc, "toZone", "Action")),
                                       optional_int(doc, "position", "Action"));
            break;
        case ActionType::DRAW_CARDS:
            action = Action::draw_cards(PlayerId(require_string(doc, "playerId", "Action")),
                                        optional_int(doc, "count", "Action").value_or(1));
            break;
        case ActionType::PLAY_CARD: {
            std::vector<TargetId> targets;
            if (const json* arr = optional_array(doc, "targets", "Action")) {
                for (const auto& item : *arr) {
                    targets.push_back(parse_target(item));
                }
            }
            action = Action::play_card(PlayerId(require_string(doc, "playerId", "Action")),
                                       CardId(require_string(doc, "cardId", "Action")),
                                       std::move(targets));
            break;
        }
        case ActionType::MODIFY_STAT: {
            if (!doc.contains("target")) {
                throw ValidationError("Action missing required field: target");
            }
            json value = doc.contains("value") ? doc["value"] : json(0);
            if (!value.is_number()) {
                throw ValidationError("Action field must be numeric: value");
            }
            action = Action::modify_stat(parse_target(doc["target"]),
                                         require_string(doc, "stat", "Action"),
                                         value);
            break;
        }
        case ActionType::TAP_CARD:
            action = Action::tap_card(CardId(require_string(doc, "cardId", "Action")));
            break;
        case ActionType::UNTAP_CARD:
            action = Action::untap_card(CardId(require_string(doc, "cardId", "Action")));
            break;
        case ActionType::DISCARD_CARD:
            action = Action::discard_card(PlayerId(require_string(doc, "playerId", "Action")),
                                          CardId(require_string(doc, "cardId", "Action")));
            break;
        case ActionType::SHUFFLE_ZONE:
            action = Action::shuffle_zone(ZoneId(require_string(doc, "zoneId", "Action")));
            break;
        case ActionType::ADD_COUNTER:
        case ActionType::REMOVE_COUNTER: {
            if (!doc.contains("target")) {
                throw ValidationError("Action missing required field: target");
            }
            TargetId target = parse_target(doc["target"]);
            std::string counter_type = require_string(doc, "counterType", "Action");
            int count = optional_int(doc, "count", "Action").value_or(1);
            action = *type == ActionType::ADD_COUNTER
                ? Action::add_counter(target, counter_type, count)
                : Action::remove_counter(target, counter_type, count);
            break;
        }
        case ActionType::SET_TURN_PHASE:
            action = Action::set_phase(require_string(doc, "phase", "Action"));
            break;
    }

    std::string actor = optional_string(doc, "actor", "", "Action");
    if (!actor.empty()) {
        action.player_id = PlayerId(actor);
    }
    return action;
}

json action_to_json(const Action& action) {
    json doc = {{"type", to_string(action.action_type)}};

    if (const auto* move = action.get<MoveCardPayload>()) {
        doc["cardId"] = move->card_id.value;
        doc["fromZone"] = move->from_zone.value;
        doc["toZone"] = move->to_zone.value;
        if (move->position) {
            doc["position"] = *move->position;
        }
    } else if (const auto* draw = action.get<DrawCardsPayload>()) {
        doc["playerId"] = draw->player_id.value;
        doc["count"] = draw->count;
    } else if (const auto* play = action.get<PlayCardPayload>()) {
        doc["cardId"] = play->card_id.value;
        doc["playerId"] = play->player_id.value;
        json targets = json::array();
        for (const auto& target : play->targets) {
            targets.push_back(target_to_json(target));
        }
        doc["targets"] = targets;
    } else if (const auto* stat = action.get<ModifyStatPayload>()) {
        doc["target"] = target_to_json(stat->target);
        doc["stat"] = stat->stat;
        doc["value"] = stat->value;
    } else if (const auto* tap = action.get<TapCardPayload>()) {
        doc["cardId"] = tap->card_id.value;
    } else if (const auto* discard = action.get<DiscardCardPayload>()) {
        doc["cardId"] = discard->card_id.value;
        doc["playerId"] = discard->player_id.value;
    } else if (const auto* shuffle = action.get<ShuffleZonePayload>()) {
        doc["zoneId"] = shuffle->zone_id.value;
    } else if (const auto* counter = action.get<CounterPayload>()) {
        doc["target"] = target_to_json(counter->target);
        doc["counterType"] = counter->counter_type;
        doc["count"] = counter->count;
    } else if (const auto* phase = action.get<SetPhasePayload>()) {
        doc["phase"] = phase->phase;
    }

    if (action.player_id) {
        doc["actor"] = action.player_id->value;
    }
    return doc;
}

// ============================================================================
// RULES
// ============================================================================

RuleDefinition rule_from_json(const json& doc) {
    require_object(doc, "Rule");

    RuleDefinition rule;
    rule.id = require_string(doc, "id", "Rule");
    rule.name = optional_string(doc, "name", rule.id, "Rule");
    rule.description = optional_string(doc, "description", "", "Rule");
    rule.event_type = require_string(doc, "eventType", "Rule");
    rule.priority = optional_int(doc, "priority", "Rule").value_or(1);
    rule.active = optional_bool(doc, "active", true, "Rule");

    if (const json* cond = optional_object(doc, "condition", "Rule")) {
        RuleCondition condition;
        condition.field = require_string(*cond, "field", "Rule condition");
        std::string op = optional_string(*cond, "op", "eq", "Rule condition");
        auto parsed = parse_condition_op(op);
        if (!parsed) {
            throw ValidationError("Invalid condition operator: " + op);
        }
        condition.op = *parsed;
        condition.value = cond->contains("value") ? (*cond)["value"] : json(nullptr);
        rule.condition = condition;
    }

    if (const json* arr = optional_array(doc, "actions", "Rule")) {
        for (const auto& item : *arr) {
            require_object(item, "Rule action");
            RuleActionTemplate tmpl;
            tmpl.action = item.contains("action")
                ? require_string(item, "action", "Rule action")
                : require_string(item, "type", "Rule action");
            if (const json* params = optional_object(item, "parameters", "Rule action")) {
                tmpl.parameters = *params;
            }
            rule.actions.push_back(std::move(tmpl));
        }
    }

    validate_rule(rule);
    return rule;
}

json rule_to_json(const RuleDefinition& rule) {
    json actions = json::array();
    for (const auto& tmpl : rule.actions) {
        actions.push_back({{"action", tmpl.action}, {"parameters", tmpl.parameters}});
    }
    json doc = {
        {"id", rule.id},
        {"name", rule.name},
        {"description", rule.description},
        {"eventType", rule.event_type},
        {"priority", rule.priority},
        {"actions", actions},
        {"active", rule.active}
    };
    if (rule.condition) {
        doc["condition"] = {{"field", rule.condition->field},
                            {"op", to_string(rule.condition->op)},
                            {"value", rule.condition->value}};
    }
    return doc;
}

std::vector<RuleDefinition> rules_from_json(const json& doc) {
    const json* arr = &doc;
    if (doc.is_object()) {
        arr = optional_array(doc, "rules", "Rules");
        if (!arr) {
            throw ValidationError("No 'rules' array found");
        }
    } else if (!doc.is_array()) {
        throw ValidationError("Rules document must be an array or an object");
    }

    std::vector<RuleDefinition> rules;
    for (const auto& item : *arr) {
        rules.push_back(rule_from_json(item));
    }
    return rules;
}

// ============================================================================
// FILES
// ============================================================================

namespace {

json parse_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "[GameLoader] Failed to open: " << filepath << std::endl;
        throw ValidationError("Failed to open: " + filepath);
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        std::cerr << "[GameLoader] JSON parse error: " << e.what() << std::endl;
        throw ValidationError(std::string("JSON parse error: ") + e.what());
    }
}

} // anonymous namespace

Game load_game_file(const std::string& filepath) {
    Game game = game_from_json(parse_file(filepath));
    std::cout << "[GameLoader] Loaded game " << game.id << " ("
              << game.players.size() << " players, "
              << game.zones.size() << " zones, "
              << game.cards.size() << " cards)" << std::endl;
    return game;
}

std::vector<RuleDefinition> load_rules_file(const std::string& filepath) {
    std::vector<RuleDefinition> rules = rules_from_json(parse_file(filepath));
    std::cout << "[GameLoader] Loaded " << rules.size() << " rules" << std::endl;
    return rules;
}

} // namespace cardforge
