/**
 * CardForge Engine - Rule Compiler Implementation
 */

#include "rule_compiler.hpp"
#include "errors.hpp"
#include "event_types.hpp"
#include "game_integration.hpp"
#include "game_loader.hpp"
#include <regex>
#include <sstream>

namespace cardforge {

std::string to_string(ConditionOp op) {
    switch (op) {
        case ConditionOp::EQ: return "eq";
        case ConditionOp::NE: return "ne";
        case ConditionOp::GT: return "gt";
        case ConditionOp::GE: return "ge";
        case ConditionOp::LT: return "lt";
        case ConditionOp::LE: return "le";
        case ConditionOp::EXISTS: return "exists";
    }
    return "eq";
}

std::optional<ConditionOp> parse_condition_op(const std::string& s) {
    if (s == "eq" || s == "==") return ConditionOp::EQ;
    if (s == "ne" || s == "!=") return ConditionOp::NE;
    if (s == "gt" || s == ">") return ConditionOp::GT;
    if (s == "ge" || s == ">=") return ConditionOp::GE;
    if (s == "lt" || s == "<") return ConditionOp::LT;
    if (s == "le" || s == "<=") return ConditionOp::LE;
    if (s == "exists") return ConditionOp::EXISTS;
    return std::nullopt;
}

// ============================================================================
// CONDITIONS
// ============================================================================

namespace {

// null when the field is absent
nlohmann::json event_field(const GameEvent& event, const std::string& field) {
    if (field == "type") {
        return event.type;
    }
    if (field == "triggeredBy") {
        return event.trigger_name();
    }

    const std::string prefix = "payload";
    if (field.compare(0, prefix.size(), prefix) != 0) {
        return nullptr;
    }

    const nlohmann::json* node = &event.payload;
    std::istringstream path(field.substr(prefix.size()));
    std::string key;
    while (std::getline(path, key, '.')) {
        if (key.empty()) {
            continue;
        }
        if (!node->is_object() || !node->contains(key)) {
            return nullptr;
        }
        node = &(*node)[key];
    }
    return *node;
}

} // anonymous namespace

bool RuleCondition::evaluate(const GameEvent& event) const {
    nlohmann::json actual = event_field(event, field);

    switch (op) {
        case ConditionOp::EXISTS:
            return !actual.is_null();
        case ConditionOp::EQ:
            return actual == value;
        case ConditionOp::NE:
            return actual != value;
        default:
            break;
    }

    if (!actual.is_number() || !value.is_number()) {
        return false;
    }
    double lhs = actual.get<double>();
    double rhs = value.get<double>();
    switch (op) {
        case ConditionOp::GT: return lhs > rhs;
        case ConditionOp::GE: return lhs >= rhs;
        case ConditionOp::LT: return lhs < rhs;
        case ConditionOp::LE: return lhs <= rhs;
        default: return false;
    }
}

// ============================================================================
// TEMPLATES
// ============================================================================

namespace {

const std::regex& template_pattern() {
    static const std::regex pattern(
        R"(\$event\.payload\.(\w+)|\$event\.triggeredBy|\$event\.type|\$game\.currentPlayer)");
    return pattern;
}

nlohmann::json resolve_token(const std::smatch& match, const GameEvent& event, const Game& game) {
    const std::string token = match[0].str();

    if (match[1].matched) {
        const std::string key = match[1].str();
        if (!event.payload.is_object() || !event.payload.contains(key)) {
            throw ValidationError("Unresolved template: " + token);
        }
        return event.payload[key];
    }
    if (token == "$event.triggeredBy") {
        return event.trigger_name();
    }
    if (token == "$event.type") {
        return event.type;
    }
    if (!game.current_player) {
        throw ValidationError("Unresolved template: " + token + " (no current player)");
    }
    return game.current_player->value;
}

std::string as_text(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // anonymous namespace

nlohmann::json resolve_template(const nlohmann::json& value, const GameEvent& event, const Game& game) {
    if (value.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& item : value) {
            result.push_back(resolve_template(item, event, game));
        }
        return result;
    }
    if (value.is_object()) {
        nlohmann::json result = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            result[it.key()] = resolve_template(it.value(), event, game);
        }
        return result;
    }
    if (!value.is_string()) {
        return value;
    }

    const std::string text = value.get<std::string>();
    std::smatch match;

    // A lone template keeps the referenced value's JSON type
    if (std::regex_match(text, match, template_pattern())) {
        return resolve_token(match, event, game);
    }

    std::string out;
    auto begin = text.cbegin();
    while (std::regex_search(begin, text.cend(), match, template_pattern())) {
        out.append(begin, match[0].first);
        out += as_text(resolve_token(match, event, game));
        begin = match[0].second;
    }
    out.append(begin, text.cend());
    return out;
}

// ============================================================================
// COMPILATION
// ============================================================================

RuleReaction::RuleReaction(RuleDefinition rule)
    : rule_(std::move(rule)) {}

std::vector<GameEvent> RuleReaction::invoke(const GameEvent& event, const Game& game) const {
    std::vector<GameEvent> result;

    for (size_t i = 0; i < rule_.actions.size(); ++i) {
        const RuleActionTemplate& tmpl = rule_.actions[i];
        try {
            nlohmann::json document = resolve_template(tmpl.parameters, event, game);
            if (!document.is_object()) {
                throw ValidationError("Action parameters must be an object");
            }
            document["type"] = tmpl.action;

            // Round-trip through the loader so malformed requests fail here
            Action action = action_from_json(document);

            result.push_back(create_game_event(event_types::ACTION_REQUESTED,
                                               {{"ruleId", rule_.id},
                                                {"ruleName", rule_.name},
                                                {"sourceEventId", event.id.value},
                                                {"action", action_to_json(action)}},
                                               event.triggered_by));
        } catch (const GameError& e) {
            result.push_back(create_game_event(event_types::ACTION_ERROR,
                                               {{"ruleId", rule_.id},
                                                {"actionIndex", i},
                                                {"action", tmpl.action},
                                                {"error", e.what()}},
                                               event.triggered_by));
        } catch (const nlohmann::json::exception& e) {
            result.push_back(create_game_event(event_types::ACTION_ERROR,
                                               {{"ruleId", rule_.id},
                                                {"actionIndex", i},
                                                {"action", tmpl.action},
                                                {"error", e.what()}},
                                               event.triggered_by));
        }
    }
    return result;
}

void validate_rule(const RuleDefinition& rule) {
    if (rule.id.empty()) {
        throw ValidationError("Rule ID cannot be empty");
    }
    if (rule.event_type.empty()) {
        throw ValidationError("Rule event type cannot be empty");
    }
    if (rule.condition && rule.condition->field.empty()) {
        throw ValidationError("Rule condition field cannot be empty");
    }
    for (const auto& tmpl : rule.actions) {
        if (!parse_action_name(tmpl.action)) {
            throw ValidationError("Unknown action type in rule " + rule.id + ": " + tmpl.action);
        }
    }
}

EventListener compile_rule(const RuleDefinition& rule) {
    validate_rule(rule);

    ListenerParams params;
    params.id = ListenerId(rule.id);
    params.event_type = rule.event_type;
    params.priority = rule.priority;
    params.reaction = std::make_shared<const RuleReaction>(rule);
    if (rule.condition) {
        RuleCondition condition = *rule.condition;
        params.condition = [condition](const GameEvent& event) {
            return condition.evaluate(event);
        };
    }
    return create_event_listener(std::move(params));
}

std::vector<EventListener> compile_rules(const std::vector<RuleDefinition>& rules) {
    std::vector<EventListener> listeners;
    for (const auto& rule : rules) {
        if (rule.active) {
            listeners.push_back(compile_rule(rule));
        }
    }
    return listeners;
}

Game install_rules(const Game& game, const std::vector<RuleDefinition>& rules) {
    Game result = game;
    for (const auto& listener : compile_rules(rules)) {
        result = add_event_listener_to_game(result, listener);
    }
    return result;
}

} // namespace cardforge
