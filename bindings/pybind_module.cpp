/**
 * CardForge Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Entities are exposed read-only; every operation returns a new snapshot.
 * JSON values (properties, payloads, documents) cross the boundary as strings.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>
#include <pybind11/functional.h>

#include "cardforge_engine.hpp"

namespace py = pybind11;

namespace {

template <typename Id>
void bind_identifier(py::module_& m, const char* name) {
    py::class_<Id>(m, name)
        .def(py::init<>())
        .def(py::init<std::string>())
        .def_readonly("value", &Id::value)
        .def("is_valid", &Id::is_valid)
        .def("__str__", [](const Id& id) { return id.value; })
        .def("__repr__", [name](const Id& id) { return std::string(name) + "('" + id.value + "')"; })
        .def("__hash__", [](const Id& id) { return std::hash<std::string>{}(id.value); })
        .def(py::self == py::self)
        .def(py::self != py::self);
}

nlohmann::json parse_json_arg(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw cardforge::ValidationError(std::string("Invalid JSON: ") + e.what());
    }
}

} // namespace

PYBIND11_MODULE(cardforge_engine, m) {
    m.doc() = "Immutable card-game state engine with reactive rules";

    // ========================================================================
    // ERRORS
    // ========================================================================

    auto game_error = py::register_exception<cardforge::GameError>(m, "GameError");
    py::register_exception<cardforge::ValidationError>(m, "ValidationError", game_error.ptr());
    py::register_exception<cardforge::ActionError>(m, "ActionError", game_error.ptr());
    py::register_exception<cardforge::EventSystemError>(m, "EventSystemError", game_error.ptr());

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<cardforge::Visibility>(m, "Visibility")
        .value("PUBLIC", cardforge::Visibility::PUBLIC)
        .value("PRIVATE", cardforge::Visibility::PRIVATE)
        .export_values();

    py::enum_<cardforge::ZoneOrder>(m, "ZoneOrder")
        .value("ORDERED", cardforge::ZoneOrder::ORDERED)
        .value("UNORDERED", cardforge::ZoneOrder::UNORDERED)
        .export_values();

    py::enum_<cardforge::ZoneKind>(m, "ZoneKind")
        .value("ZONE", cardforge::ZoneKind::ZONE)
        .value("DECK", cardforge::ZoneKind::DECK)
        .value("HAND", cardforge::ZoneKind::HAND)
        .value("DISCARD", cardforge::ZoneKind::DISCARD)
        .value("PLAY_AREA", cardforge::ZoneKind::PLAY_AREA)
        .value("STACK", cardforge::ZoneKind::STACK)
        .export_values();

    py::enum_<cardforge::ActionType>(m, "ActionType")
        .value("MOVE_CARD", cardforge::ActionType::MOVE_CARD)
        .value("DRAW_CARDS", cardforge::ActionType::DRAW_CARDS)
        .value("PLAY_CARD", cardforge::ActionType::PLAY_CARD)
        .value("MODIFY_STAT", cardforge::ActionType::MODIFY_STAT)
        .value("TAP_CARD", cardforge::ActionType::TAP_CARD)
        .value("UNTAP_CARD", cardforge::ActionType::UNTAP_CARD)
        .value("DISCARD_CARD", cardforge::ActionType::DISCARD_CARD)
        .value("SHUFFLE_ZONE", cardforge::ActionType::SHUFFLE_ZONE)
        .value("ADD_COUNTER", cardforge::ActionType::ADD_COUNTER)
        .value("REMOVE_COUNTER", cardforge::ActionType::REMOVE_COUNTER)
        .value("SET_TURN_PHASE", cardforge::ActionType::SET_TURN_PHASE)
        .export_values();

    // ========================================================================
    // IDENTIFIERS
    // ========================================================================

    bind_identifier<cardforge::GameId>(m, "GameId");
    bind_identifier<cardforge::PlayerId>(m, "PlayerId");
    bind_identifier<cardforge::CardId>(m, "CardId");
    bind_identifier<cardforge::ZoneId>(m, "ZoneId");
    bind_identifier<cardforge::ListenerId>(m, "ListenerId");
    bind_identifier<cardforge::EventId>(m, "EventId");

    // ========================================================================
    // PRIMITIVES
    // ========================================================================

    py::class_<cardforge::Counter>(m, "Counter")
        .def_readonly("type", &cardforge::Counter::type)
        .def_readonly("count", &cardforge::Counter::count);

    py::class_<cardforge::Card>(m, "Card")
        .def_readonly("id", &cardforge::Card::id)
        .def_readonly("name", &cardforge::Card::name)
        .def_readonly("text", &cardforge::Card::text)
        .def_readonly("type", &cardforge::Card::type)
        .def_readonly("owner", &cardforge::Card::owner)
        .def_readonly("current_zone", &cardforge::Card::current_zone)
        .def_readonly("counters", &cardforge::Card::counters)
        .def_readonly("is_tapped", &cardforge::Card::is_tapped)
        .def("property", [](const cardforge::Card& card, const std::string& key) -> py::object {
            const nlohmann::json* value = card.property(key);
            if (!value) return py::none();
            return py::str(value->dump());
        })
        .def("has_property", &cardforge::Card::has_property)
        .def("counter_count", &cardforge::Card::counter_count)
        .def("power", &cardforge::Card::power)
        .def("toughness", &cardforge::Card::toughness)
        .def("is_type", &cardforge::Card::is_type)
        .def("to_json", [](const cardforge::Card& card) { return cardforge::card_to_json(card).dump(); })
        .def(py::self == py::self);

    py::class_<cardforge::Zone>(m, "Zone")
        .def_readonly("id", &cardforge::Zone::id)
        .def_readonly("name", &cardforge::Zone::name)
        .def_readonly("owner", &cardforge::Zone::owner)
        .def_readonly("cards", &cardforge::Zone::cards)
        .def_readonly("visibility", &cardforge::Zone::visibility)
        .def_readonly("order", &cardforge::Zone::order)
        .def_readonly("max_size", &cardforge::Zone::max_size)
        .def_readonly("kind", &cardforge::Zone::kind)
        .def("size", &cardforge::Zone::size)
        .def("is_empty", &cardforge::Zone::is_empty)
        .def("is_full", &cardforge::Zone::is_full)
        .def("contains", &cardforge::Zone::contains)
        .def("index_of", &cardforge::Zone::index_of)
        .def("top_card", &cardforge::Zone::top_card)
        .def("peek", &cardforge::Zone::peek)
        .def("to_json", [](const cardforge::Zone& zone) { return cardforge::zone_to_json(zone).dump(); })
        .def(py::self == py::self);

    py::class_<cardforge::Player>(m, "Player")
        .def_readonly("id", &cardforge::Player::id)
        .def_readonly("name", &cardforge::Player::name)
        .def_readonly("resources", &cardforge::Player::resources)
        .def_readonly("zones", &cardforge::Player::zones)
        .def_readonly("counters", &cardforge::Player::counters)
        .def("resource", &cardforge::Player::resource)
        .def("mana", &cardforge::Player::mana)
        .def("life", &cardforge::Player::life)
        .def("is_alive", &cardforge::Player::is_alive)
        .def("counter_count", &cardforge::Player::counter_count)
        .def(py::self == py::self);

    // ========================================================================
    // GAME
    // ========================================================================

    py::class_<cardforge::Game>(m, "Game")
        .def_readonly("id", &cardforge::Game::id)
        .def_readonly("players", &cardforge::Game::players)
        .def_readonly("cards", &cardforge::Game::cards)
        .def_readonly("zones", &cardforge::Game::zones)
        .def_readonly("stack", &cardforge::Game::stack)
        .def_readonly("current_player", &cardforge::Game::current_player)
        .def_readonly("phase", &cardforge::Game::phase)
        .def_readonly("turn_number", &cardforge::Game::turn_number)
        .def("find_player", &cardforge::Game::find_player, py::return_value_policy::copy)
        .def("find_card", &cardforge::Game::find_card, py::return_value_policy::copy)
        .def("find_zone", &cardforge::Game::find_zone, py::return_value_policy::copy)
        .def("find_player_zone", &cardforge::Game::find_player_zone, py::return_value_policy::copy)
        .def("to_json", [](const cardforge::Game& game) { return cardforge::game_to_json(game).dump(); })
        .def(py::self == py::self);

    m.def("load_game", [](const std::string& text) {
        return cardforge::game_from_json(parse_json_arg(text));
    }, "Load a game from a JSON document string");
    m.def("load_game_file", &cardforge::load_game_file);
    m.def("validate_game", &cardforge::validate_game);
    m.def("set_current_player", &cardforge::set_current_player);
    m.def("next_player", &cardforge::next_player);
    m.def("set_game_phase", &cardforge::set_game_phase);
    m.def("advance_game_phase", &cardforge::advance_game_phase);
    m.def("increment_turn_number", &cardforge::increment_turn_number);
    m.def("start_game", &cardforge::start_game);

    // ========================================================================
    // ACTIONS
    // ========================================================================

    py::class_<cardforge::Action>(m, "Action")
        .def_readonly("action_type", &cardforge::Action::action_type)
        .def_readonly("player_id", &cardforge::Action::player_id)
        .def_readwrite("display_label", &cardforge::Action::display_label)
        .def_static("move_card", &cardforge::Action::move_card,
                    py::arg("card"), py::arg("from_zone"), py::arg("to_zone"),
                    py::arg("position") = py::none())
        .def_static("draw_cards", &cardforge::Action::draw_cards,
                    py::arg("player"), py::arg("count") = 1)
        .def_static("play_card", &cardforge::Action::play_card,
                    py::arg("player"), py::arg("card"),
                    py::arg("targets") = std::vector<cardforge::TargetId>{})
        .def_static("modify_stat", [](const cardforge::TargetId& target, const std::string& stat, int delta) {
            return cardforge::Action::modify_stat(target, stat, delta);
        })
        .def_static("tap_card", &cardforge::Action::tap_card)
        .def_static("untap_card", &cardforge::Action::untap_card)
        .def_static("discard_card", &cardforge::Action::discard_card)
        .def_static("shuffle_zone", &cardforge::Action::shuffle_zone)
        .def_static("add_counter", &cardforge::Action::add_counter,
                    py::arg("target"), py::arg("counter_type"), py::arg("count") = 1)
        .def_static("remove_counter", &cardforge::Action::remove_counter,
                    py::arg("target"), py::arg("counter_type"), py::arg("count") = 1)
        .def_static("set_phase", &cardforge::Action::set_phase)
        .def_static("from_json", [](const std::string& text) {
            return cardforge::action_from_json(parse_json_arg(text));
        })
        .def("by", &cardforge::Action::by)
        .def("to_json", [](const cardforge::Action& action) { return cardforge::action_to_json(action).dump(); })
        .def("__repr__", &cardforge::Action::to_string);

    m.def("execute_action", &cardforge::execute_action);
    m.def("validate_action", &cardforge::validate_action);
    m.def("check_action", &cardforge::check_action);
    m.def("can_view_zone", &cardforge::can_view_zone);
    m.def("view_zone", &cardforge::view_zone,
          py::arg("game"), py::arg("viewer"), py::arg("zone_id"), py::arg("count") = py::none());

    // ========================================================================
    // EVENTS
    // ========================================================================

    py::class_<cardforge::GameEvent>(m, "GameEvent")
        .def_readonly("id", &cardforge::GameEvent::id)
        .def_readonly("type", &cardforge::GameEvent::type)
        .def_readonly("triggered_by", &cardforge::GameEvent::triggered_by)
        .def_property_readonly("payload", [](const cardforge::GameEvent& event) {
            return event.payload.dump();
        })
        .def("to_json", [](const cardforge::GameEvent& event) { return cardforge::event_to_json(event).dump(); });

    m.def("create_game_event", [](const std::string& type, const std::string& payload,
                                  std::optional<cardforge::PlayerId> triggered_by) {
        return cardforge::create_game_event(type, parse_json_arg(payload), std::move(triggered_by));
    }, py::arg("type"), py::arg("payload") = "{}", py::arg("triggered_by") = py::none());

    py::class_<cardforge::EventListener>(m, "EventListener")
        .def_readonly("id", &cardforge::EventListener::id)
        .def_readonly("event_type", &cardforge::EventListener::event_type)
        .def_readonly("priority", &cardforge::EventListener::priority);

    m.def("create_event_listener",
          py::overload_cast<const std::string&, cardforge::ReactionCallback, int, cardforge::EventCondition>(
              &cardforge::create_event_listener),
          py::arg("event_type"), py::arg("reaction"), py::arg("priority") = 0,
          py::arg("condition") = nullptr);

    py::class_<cardforge::EventProcessingResult>(m, "EventProcessingResult")
        .def_readonly("game", &cardforge::EventProcessingResult::game)
        .def_readonly("processed_events", &cardforge::EventProcessingResult::processed_events)
        .def_readonly("generated_events", &cardforge::EventProcessingResult::generated_events)
        .def_readonly("errors", &cardforge::EventProcessingResult::errors);

    py::class_<cardforge::DispatchResult>(m, "DispatchResult")
        .def_readonly("game", &cardforge::DispatchResult::game)
        .def_readonly("applied_actions", &cardforge::DispatchResult::applied_actions)
        .def_readonly("processed_events", &cardforge::DispatchResult::processed_events)
        .def_readonly("generated_events", &cardforge::DispatchResult::generated_events)
        .def_readonly("errors", &cardforge::DispatchResult::errors);

    m.def("add_event_listener", &cardforge::add_event_listener_to_game);
    m.def("remove_event_listener", &cardforge::remove_event_listener_from_game);
    m.def("get_active_listeners", &cardforge::get_active_listeners,
          py::arg("game"), py::arg("event_type") = py::none());
    m.def("publish_event", &cardforge::publish_game_event);
    m.def("process_events", &cardforge::process_game_events);
    m.def("dispatch_action", &cardforge::dispatch_action);

    // ========================================================================
    // RULES
    // ========================================================================

    m.def("load_rules", [](const std::string& text) {
        return cardforge::rules_from_json(parse_json_arg(text));
    });
    m.def("load_rules_file", &cardforge::load_rules_file);
    m.def("install_rules", &cardforge::install_rules);

    py::class_<cardforge::RuleDefinition>(m, "RuleDefinition")
        .def_readonly("id", &cardforge::RuleDefinition::id)
        .def_readonly("name", &cardforge::RuleDefinition::name)
        .def_readonly("event_type", &cardforge::RuleDefinition::event_type)
        .def_readonly("priority", &cardforge::RuleDefinition::priority)
        .def_readonly("active", &cardforge::RuleDefinition::active)
        .def("to_json", [](const cardforge::RuleDefinition& rule) {
            return cardforge::rule_to_json(rule).dump();
        });

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = cardforge::get_version();
    m.attr("__version__") = cardforge::get_version();
}
