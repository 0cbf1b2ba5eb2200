/**
 * CardForge Engine - Add / Remove Counter
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

std::optional<std::string> check_counter(const Game& game, const CounterPayload& p, const Actor&, bool add) {
    if (p.counter_type.empty()) {
        return "Counter type cannot be empty";
    }
    if (p.count < 0) {
        return "Counter count cannot be negative";
    }
    if (!target_exists(game, p.target)) {
        return "Target not found";
    }

    int held = 0;
    bool present = false;
    if (const CardId* card_id = std::get_if<CardId>(&p.target)) {
        const Card* card = game.find_card(*card_id);
        present = counters::find(card->counters, p.counter_type) != nullptr;
        held = card->counter_count(p.counter_type);
    } else {
        const Player* player = game.find_player(std::get<PlayerId>(p.target));
        present = counters::find(player->counters, p.counter_type) != nullptr;
        held = player->counter_count(p.counter_type);
    }

    if (add) {
        if (!checked_add(held, p.count)) {
            return "Counter count overflow";
        }
        return std::nullopt;
    }

    if (!present) {
        return "Cannot remove counters that do not exist";
    }
    if (held < p.count) {
        return "Cannot remove more counters than exist";
    }
    return std::nullopt;
}

ActionOutcome apply_counter(const Game& game, const CounterPayload& p, const Actor& actor, bool add) {
    Game next = game;
    int total = 0;

    if (const CardId* card_id = std::get_if<CardId>(&p.target)) {
        const Card* card = game.find_card(*card_id);
        Card updated = add ? card->with_counter_added(p.counter_type, p.count)
                           : card->with_counter_removed(p.counter_type, p.count);
        total = updated.counter_count(p.counter_type);
        next = game.with_card(updated);
    } else {
        const Player* player = game.find_player(std::get<PlayerId>(p.target));
        Player updated = add ? player->with_counter_added(p.counter_type, p.count)
                             : player->with_counter_removed(p.counter_type, p.count);
        total = updated.counter_count(p.counter_type);
        next = game.with_player(updated);
    }

    ActionOutcome outcome{std::move(next), {}};
    outcome.events.push_back(raise(add ? event_types::COUNTER_ADDED : event_types::COUNTER_REMOVED,
                                   {{"target", target_json(p.target)},
                                    {"counterType", p.counter_type},
                                    {"count", p.count},
                                    {"total", total}},
                                   actor));
    return outcome;
}

} // namespace actions
} // namespace cardforge
