/**
 * CardForge Engine - C++ Implementation
 *
 * Immutable card-game state engine: entity primitives, an action library,
 * and a reactive event core that lets actions cascade through rules.
 *
 * Include this header to get access to the complete engine API.
 */

#pragma once

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "id_factory.hpp"

// Primitives
#include "counter.hpp"
#include "card.hpp"
#include "zone.hpp"
#include "player.hpp"
#include "game.hpp"

// Events
#include "event.hpp"
#include "event_types.hpp"
#include "event_listener.hpp"
#include "event_manager.hpp"
#include "event_processor.hpp"

// Actions
#include "action.hpp"
#include "action_library.hpp"
#include "game_integration.hpp"

// Rules and documents
#include "rule_compiler.hpp"
#include "game_loader.hpp"

namespace cardforge {

/**
 * Version information.
 */
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

inline std::string get_version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

} // namespace cardforge
