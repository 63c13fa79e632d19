/**
 * Fusion Duel Engine - X-Ray Logger
 *
 * Complete game state visibility for debugging.
 * Logs both hands, both draw piles in draw order, fields with stance and
 * active star, discards, and every battle record.
 */

#pragma once

#include "game_state.hpp"
#include "action.hpp"
#include <string>
#include <fstream>

namespace duel {

/**
 * XRayLogger - Linear trace of a whole match.
 *
 * If the log file cannot be opened the logger disables itself and every
 * call becomes a no-op.
 */
class XRayLogger {
public:
    /**
     * Constructor - creates a timestamped log file.
     *
     * @param output_dir Directory for log files, created if missing
     */
    explicit XRayLogger(const std::string& output_dir = "xrays");

    ~XRayLogger();

    /**
     * Log an action header.
     *
     * @param turn_count Current turn number
     * @param player_id Player taking action
     * @param action Action being taken
     */
    void log_action(int turn_count, PlayerID player_id, const Action& action);

    /**
     * Log complete game state snapshot.
     */
    void log_state(const GameState& state);

    /**
     * Log one battle record.
     */
    void log_battle(const BattleResult& battle);

    /**
     * Log game end result.
     *
     * @param winner Winning player ID (nullopt if draw)
     * @param reason Reason for game end
     */
    void log_game_end(std::optional<PlayerID> winner, const std::string& reason);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }

    void set_enabled(bool enabled) { enabled_ = enabled && log_file_.is_open(); }

private:
    std::string log_path_;
    std::ofstream log_file_;
    bool enabled_ = true;

    /**
     * Format card as "Name [ATK/DEF] (Star1/Star2)".
     */
    std::string fmt_card(const CardInstance& card) const;

    /**
     * Format the field line with stance and active star.
     * Format: "FIELD:  Dark Magician [2500/2100] | ATK | Star: Uranus"
     */
    std::string format_field_line(const std::optional<CardInstance>& field) const;

    std::string format_zone(const std::string& label, const Zone& zone) const;

    void write_player(const PlayerState& player);

    static std::string timestamp(const char* format);
};

} // namespace duel
