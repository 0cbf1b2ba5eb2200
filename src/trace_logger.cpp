/**
 * CardForge Engine - Trace Logger Implementation
 */

#include "trace_logger.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cardforge {

TraceLogger::TraceLogger(const std::string& output_dir) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[TraceLogger] Failed to create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream filename;
    filename << output_dir << "/trace_"
             << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    log_path_ = filename.str();

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[TraceLogger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "CARDFORGE TRACE - LINEAR STATE LOG\n";

    std::ostringstream timestamp;
    timestamp << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    log_file_ << "Started: " << timestamp.str() << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[TraceLogger] Logging to: " << log_path_ << std::endl;
}

TraceLogger::~TraceLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string TraceLogger::fmt_id(const std::string& id) {
    std::string short_id = id;
    if (short_id.length() > 8) {
        short_id = short_id.substr(short_id.length() - 8);
    }
    return "(" + short_id + ")";
}

std::string TraceLogger::fmt_card(const Game& game, const CardId& card_id) const {
    const Card* card = game.find_card(card_id);
    std::string label = card ? card->name : "?";
    if (card && card->is_tapped) {
        label += " [T]";
    }
    return label + " " + fmt_id(card_id.value);
}

std::string TraceLogger::format_zone_line(const Game& game, const Zone& zone) const {
    std::ostringstream line;
    line << zone.name << " " << fmt_id(zone.id.value)
         << " <" << to_string(zone.kind) << ", " << to_string(zone.visibility) << ">"
         << " (" << zone.size();
    if (zone.max_size) {
        line << "/" << *zone.max_size;
    }
    line << "): [";
    for (size_t i = 0; i < zone.cards.size(); i++) {
        if (i > 0) line << ", ";
        line << fmt_card(game, zone.cards[i]);
    }
    line << "]";
    return line.str();
}

void TraceLogger::log_action(const Game& game, const Action& action) {
    if (!enabled_ || !log_file_.is_open()) return;

    std::string actor = "system";
    if (action.player_id) {
        const Player* player = game.find_player(*action.player_id);
        actor = player ? player->name : action.player_id->value;
    }

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << game.turn_number << " | " << game.phase
              << " | BY: " << actor << "] ACTION: " << action.to_string() << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void TraceLogger::log_state(const Game& game) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";

    for (const auto& player : game.players) {
        log_file_ << "[PLAYER " << player.name << " " << fmt_id(player.id.value) << "]";
        if (game.current_player == player.id) {
            log_file_ << " *current*";
        }
        log_file_ << "\n";

        log_file_ << "RESOURCES: {";
        bool first = true;
        for (const auto& entry : player.resources) {
            if (!first) log_file_ << ", ";
            log_file_ << entry.first << ": " << entry.second;
            first = false;
        }
        log_file_ << "}\n";

        for (const auto& zone_id : player.zones) {
            if (const Zone* zone = game.find_zone(zone_id)) {
                log_file_ << format_zone_line(game, *zone) << "\n";
            }
        }
        log_file_ << "\n";
    }

    // Zones nobody owns
    log_file_ << "[SHARED]\n";
    log_file_ << format_zone_line(game, game.stack) << "\n";
    for (const auto& zone : game.zones) {
        if (!zone.owner) {
            log_file_ << format_zone_line(game, zone) << "\n";
        }
    }

    log_file_ << "\n[GLOBAL]\n";
    log_file_ << "Phase: " << game.phase
              << " | Turn: " << game.turn_number
              << " | Listeners: " << game.event_manager.listeners.size()
              << " | Queued events: " << game.event_manager.event_queue.size() << "\n";
    for (const auto& entry : game.global_properties) {
        log_file_ << entry.first << " = " << entry.second.dump() << "\n";
    }

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void TraceLogger::write_events(const std::vector<GameEvent>& events, const char* label) {
    log_file_ << label << " (" << events.size() << "):\n";
    for (const auto& event : events) {
        log_file_ << "  - " << event.type << " by " << event.trigger_name()
                  << " " << event.payload.dump() << "\n";
    }
}

void TraceLogger::write_errors(const std::vector<std::string>& errors) {
    for (const auto& error : errors) {
        log_file_ << "  ! " << error << "\n";
    }
}

void TraceLogger::log_dispatch(const DispatchResult& result) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "APPLIED ACTIONS (" << result.applied_actions.size() << "):\n";
    for (const auto& action : result.applied_actions) {
        log_file_ << "  - " << action.to_string() << "\n";
    }
    write_events(result.processed_events, "PROCESSED EVENTS");
    write_events(result.generated_events, "GENERATED EVENTS");
    write_errors(result.errors);
    log_file_ << "\n";

    log_file_.flush();
}

void TraceLogger::log_events(const EventProcessingResult& result) {
    if (!enabled_ || !log_file_.is_open()) return;

    write_events(result.processed_events, "PROCESSED EVENTS");
    write_events(result.generated_events, "GENERATED EVENTS");
    write_errors(result.errors);
    log_file_ << "\n";

    log_file_.flush();
}

void TraceLogger::log_message(const std::string& message) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "-- " << message << "\n";
    log_file_.flush();
}

} // namespace cardforge
