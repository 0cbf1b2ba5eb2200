/**
 * CardForge Engine - Rule Compiler
 *
 * Turns declarative rules ("when EVENT happens and CONDITION holds, do
 * ACTIONS") into event listeners. A compiled rule never touches the game
 * itself: it yields ACTION_REQUESTED events carrying action documents, and
 * dispatch_action applies them through the action library.
 *
 * Parameter templates:
 *   $event.payload.<key>   value from the triggering event's payload
 *   $event.triggeredBy     triggering player id, or "system"
 *   $event.type            triggering event type
 *   $game.currentPlayer    current player id
 *
 * A parameter that is exactly one template keeps the referenced JSON value
 * (numbers stay numbers). Templates embedded in longer strings are
 * substituted as text.
 */

#pragma once

#include "event_listener.hpp"
#include "game.hpp"

namespace cardforge {

enum class ConditionOp : uint8_t {
    EQ,
    NE,
    GT,
    GE,
    LT,
    LE,
    EXISTS
};

std::string to_string(ConditionOp op);
std::optional<ConditionOp> parse_condition_op(const std::string& s);

/**
 * RuleCondition - Compare one event field against a value.
 *
 * field is "type", "triggeredBy", or "payload.<key>[.<key>...]".
 * Ordering operators only hold between numbers.
 */
struct RuleCondition {
    std::string field;
    ConditionOp op = ConditionOp::EQ;
    nlohmann::json value;

    bool evaluate(const GameEvent& event) const;
};

struct RuleActionTemplate {
    std::string action;     // action type, e.g. "DRAW_CARDS" or "drawCards"
    nlohmann::json parameters = nlohmann::json::object();
};

struct RuleDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string event_type;
    std::optional<RuleCondition> condition;
    int priority = 1;
    std::vector<RuleActionTemplate> actions;
    bool active = true;
};

/**
 * RuleReaction - Listener body for a compiled rule.
 */
class RuleReaction : public ListenerReaction {
public:
    explicit RuleReaction(RuleDefinition rule);

    std::vector<GameEvent> invoke(const GameEvent& event, const Game& game) const override;

    const RuleDefinition& rule() const { return rule_; }

private:
    RuleDefinition rule_;
};

/**
 * Substitute templates in a JSON value (recursing into arrays and objects).
 * Throws ValidationError when a template cannot be resolved.
 */
nlohmann::json resolve_template(const nlohmann::json& value, const GameEvent& event, const Game& game);

/** Throws ValidationError on a missing id or event type, or an unknown action. */
void validate_rule(const RuleDefinition& rule);

/** The listener takes the rule's id and priority. */
EventListener compile_rule(const RuleDefinition& rule);

/** Inactive rules are skipped. */
std::vector<EventListener> compile_rules(const std::vector<RuleDefinition>& rules);

/** Compile and subscribe every active rule on the game. */
Game install_rules(const Game& game, const std::vector<RuleDefinition>& rules);

} // namespace cardforge
