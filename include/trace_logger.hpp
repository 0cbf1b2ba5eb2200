/**
 * CardForge Engine - Trace Logger
 *
 * Complete game state visibility for debugging.
 * Logs every zone including private ones (hands, decks) and shows card IDs
 * so exact card movement can be tracked across actions and rule cascades.
 */

#pragma once

#include "game_integration.hpp"
#include <fstream>
#include <string>

namespace cardforge {

/**
 * TraceLogger - Linear state trace written to a timestamped file.
 */
class TraceLogger {
public:
    /**
     * Constructor - creates the output directory and a timestamped log file.
     *
     * @param output_dir Directory for log files (default: traces)
     */
    explicit TraceLogger(const std::string& output_dir = "traces");

    ~TraceLogger();

    TraceLogger(const TraceLogger&) = delete;
    TraceLogger& operator=(const TraceLogger&) = delete;

    /**
     * Log an action header.
     *
     * @param game Game the action is applied to (for names and turn)
     * @param action Action being taken
     */
    void log_action(const Game& game, const Action& action);

    /**
     * Log complete game state snapshot (including private zones).
     */
    void log_state(const Game& game);

    /**
     * Log what an action cascade did: applied actions, events, errors.
     */
    void log_dispatch(const DispatchResult& result);

    /**
     * Log a processing pass that was not driven by an action.
     */
    void log_events(const EventProcessingResult& result);

    /** Free-form note. */
    void log_message(const std::string& message);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format card as "CardName (short_id)".
     * Uses last 8 characters of the id for brevity.
     */
    std::string fmt_card(const Game& game, const CardId& card_id) const;

    /**
     * Format an id as "(short_id)".
     */
    static std::string fmt_id(const std::string& id);

    std::string format_zone_line(const Game& game, const Zone& zone) const;

    void write_events(const std::vector<GameEvent>& events, const char* label);
    void write_errors(const std::vector<std::string>& errors);
};

} // namespace cardforge
