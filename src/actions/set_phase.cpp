/**
 * CardForge Engine - Set Turn Phase
 */

#include "action_handlers.hpp"
#include "event_types.hpp"

namespace cardforge {
namespace actions {

std::optional<std::string> check_set_phase(const Game&, const SetPhasePayload& p, const Actor&) {
    if (p.phase.empty()) {
        return "Phase cannot be empty";
    }
    return std::nullopt;
}

ActionOutcome apply_set_phase(const Game& game, const SetPhasePayload& p, const Actor& actor) {
    ActionOutcome outcome{set_game_phase(game, p.phase), {}};
    outcome.events.push_back(raise(event_types::PHASE_CHANGED,
                                   {{"previousPhase", game.phase},
                                    {"phase", p.phase},
                                    {"turnNumber", game.turn_number}},
                                   actor));
    return outcome;
}

} // namespace actions
} // namespace cardforge
