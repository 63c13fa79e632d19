/**
 * Fusion Duel Engine - X-Ray Logger Implementation
 */

#include "xray_logger.hpp"
#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace duel {

std::string XRayLogger::timestamp(const char* format) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);

    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

XRayLogger::XRayLogger(const std::string& output_dir) {
    // Create output directory if it doesn't exist
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        std::cerr << "[X-Ray Logger] Failed to create directory " << output_dir
                  << ": " << ec.message() << std::endl;
        enabled_ = false;
        return;
    }

    log_path_ = output_dir + "/xray_duel_" + timestamp("%Y%m%d_%H%M%S") + ".log";

    log_file_.open(log_path_);
    if (!log_file_.is_open()) {
        std::cerr << "[X-Ray Logger] Failed to open log file: " << log_path_ << std::endl;
        enabled_ = false;
        return;
    }

    // Write header
    log_file_ << std::string(80, '=') << "\n";
    log_file_ << "X-RAY DUEL LOG - LINEAR STATE TRACE\n";
    log_file_ << "Started: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";
    log_file_ << std::string(80, '=') << "\n\n";

    std::cout << "[X-Ray Logger] Logging to: " << log_path_ << std::endl;
}

XRayLogger::~XRayLogger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

std::string XRayLogger::fmt_card(const CardInstance& card) const {
    std::ostringstream out;
    out << card.name << " [" << card.atk << "/" << card.def << "] ("
        << to_string(card.star1) << "/" << to_string(card.star2) << ")";
    return out.str();
}

std::string XRayLogger::format_field_line(const std::optional<CardInstance>& field) const {
    if (!field.has_value()) {
        return "FIELD:  (Empty)";
    }

    std::ostringstream line;
    line << "FIELD:  " << field->name << " [" << field->atk << "/" << field->def << "]"
         << " | " << to_string(field->stance)
         << " | Star: " << to_string(field->selected_star);
    return line.str();
}

std::string XRayLogger::format_zone(const std::string& label, const Zone& zone) const {
    std::ostringstream line;
    line << label << " (" << zone.count() << "): [";
    for (size_t i = 0; i < zone.cards.size(); i++) {
        if (i > 0) line << ", ";
        line << fmt_card(zone.cards[i]);
    }
    line << "]";
    return line.str();
}

void XRayLogger::write_player(const PlayerState& player) {
    log_file_ << "[" << player.name << "] LP: " << player.life_points << "\n";
    log_file_ << format_field_line(player.field) << "\n";
    log_file_ << format_zone("HAND", player.hand) << "\n";
    log_file_ << format_zone("DECK", player.deck) << "\n";
    log_file_ << format_zone("DISCARD", player.discard) << "\n";
}

void XRayLogger::log_action(int turn_count, PlayerID player_id, const Action& action) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '#') << "\n";
    log_file_ << "[TURN " << turn_count << " | PLAYER: P" << static_cast<int>(player_id)
              << "] ACTION: " << action.to_string() << "\n";
    log_file_ << std::string(80, '#') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_state(const GameState& state) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << std::string(80, '=') << "\n";

    write_player(state.human());
    log_file_ << "\n";
    write_player(state.ai());

    log_file_ << "\n[GLOBAL]\n";
    log_file_ << "Phase: " << to_string(state.current_phase)
              << " | Turn: " << state.turn_count
              << " | Current Player: P" << static_cast<int>(state.current_player_index) << "\n";
    log_file_ << "Battles: " << state.battle_log.size() << "\n";

    log_file_ << std::string(80, '=') << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_battle(const BattleResult& battle) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "[BATTLE] Attacker: P" << static_cast<int>(battle.attacker_id)
              << " | " << to_string(battle.outcome) << "\n";
    log_file_ << "  Player: " << battle.human_card << " (" << to_string(battle.human_stance)
              << ", " << to_string(battle.human_star) << ") = " << battle.human_value << "\n";
    log_file_ << "  AI:     " << battle.ai_card << " (" << to_string(battle.ai_stance)
              << ", " << to_string(battle.ai_star) << ") = " << battle.ai_value << "\n";
    log_file_ << "  Bonus:  attacker " << battle.attacker_bonus
              << ", defender " << battle.defender_bonus << "\n";
    if (battle.damaged_player.has_value()) {
        log_file_ << "  Damage: " << battle.damage << " to P"
                  << static_cast<int>(*battle.damaged_player) << "\n";
    }
    log_file_ << "  " << battle.description << "\n\n";

    log_file_.flush();
}

void XRayLogger::log_game_end(std::optional<PlayerID> winner, const std::string& reason) {
    if (!enabled_ || !log_file_.is_open()) return;

    log_file_ << "\n" << std::string(80, '=') << "\n";
    log_file_ << "GAME END\n";
    log_file_ << std::string(80, '=') << "\n";

    if (winner.has_value()) {
        log_file_ << "Winner: P" << static_cast<int>(*winner)
                  << (*winner == AI_PLAYER ? " (AI)" : " (Player)") << "\n";
    } else {
        log_file_ << "Result: Draw\n";
    }

    log_file_ << "Reason: " << reason << "\n";
    log_file_ << "Ended: " << timestamp("%Y-%m-%d %H:%M:%S") << "\n";

    log_file_ << std::string(80, '=') << "\n";

    log_file_.flush();
}

} // namespace duel
