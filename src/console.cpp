/**
 * Fusion Duel Engine - Interactive Console
 *
 * Human-vs-AI duel REPL. The human moves first; "end" hands the turn to the
 * minimax AI, which plays its whole turn and hands control back.
 */

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <memory>

#include "duel_engine.hpp"
#include "xray_logger.hpp"

using namespace duel;

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

std::vector<std::string> split(const std::string& s, char delim = ' ') {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (std::getline(iss, token, delim)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::optional<int> parse_int(const std::string& s) {
    try {
        size_t consumed = 0;
        int value = std::stoi(s, &consumed);
        if (consumed != s.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void print_help() {
    std::cout << R"(
=== Fusion Duel Console ===

Commands:
  help                    - Show this help
  quit / exit             - Exit console

Game:
  new                     - Deal a new match
  show                    - Show current game state
  deck                    - Show the next cards of both draw piles
  log                     - Show the battle log

Your Turn:
  actions / a             - Show all legal actions (numbered)
  do <number>             - Execute legal action by number
  play <i> [atk|def] [1|2] - Play hand card i (default ATK, star 1)
  fuse <i> <j>            - Fuse hand cards i and j
  fusions                 - List fusable pairs in your hand
  undo                    - Take back this turn's play
  battle                  - Attack with your field card
  end                     - End your turn (the AI moves)

AI:
  depth <n>               - Set search depth
  difficulty <name>       - easy | normal | hard | expert

Examples:
  play 0 atk 2            # Summon card #0 in attack with its second star
  fuse 1 3                # Fuse cards #1 and #3
  battle                  # Attack the AI's field card
)" << std::endl;
}

// ============================================================================
// GAME STATE DISPLAY
// ============================================================================

void show_field(const PlayerState& player) {
    std::cout << "  Field: ";
    if (player.field.has_value()) {
        const CardInstance& card = *player.field;
        std::cout << card.name << " [" << card.atk << "/" << card.def << "] "
                  << to_string(card.stance) << " | Star: " << to_string(card.selected_star);
    } else {
        std::cout << "(Empty)";
    }
    std::cout << std::endl;
}

void show_hand(const PlayerState& player) {
    std::cout << "  Hand (" << player.hand.count() << "):" << std::endl;
    for (int i = 0; i < player.hand.count(); ++i) {
        const CardInstance& card = player.hand.cards[i];
        std::cout << "    [" << i << "] " << card.name
                  << " [" << card.atk << "/" << card.def << "] "
                  << to_string(card.star1) << "/" << to_string(card.star2) << std::endl;
    }
}

void show_player(const PlayerState& player) {
    std::cout << "--- " << player.name << " ---" << std::endl;
    std::cout << "  LP: " << player.life_points
              << " | Deck: " << player.deck.count()
              << " | Discard: " << player.discard.count() << std::endl;
    show_field(player);
    show_hand(player);
}

void show_actions(const std::vector<Action>& actions) {
    std::cout << "Legal actions (" << actions.size() << "):" << std::endl;
    for (size_t i = 0; i < actions.size(); ++i) {
        std::cout << "  " << i << ": " << actions[i].to_string() << std::endl;
    }
}

void show_battle(const BattleResult& battle) {
    std::cout << "[Battle] " << battle.human_card << " (" << battle.human_value << ") vs "
              << battle.ai_card << " (" << battle.ai_value << ")" << std::endl;
    std::cout << "[Battle] " << battle.description << std::endl;
}

// ============================================================================
// CONSOLE CLASS
// ============================================================================

class Console {
public:
    GameConfig config;
    CardDatabase card_db;
    DuelEngine engine;
    MinimaxAI ai;
    GameState state;

    // X-Ray logger for debugging
    std::unique_ptr<XRayLogger> xray_logger;

    // Human turn bookkeeping
    bool card_played_this_turn = false;
    bool battled_this_turn = false;
    bool game_started = false;

    explicit Console(const GameConfig& config_)
        : config(config_)
        , engine(card_db)
        , ai(engine, config_.search)
    {
        if (!card_db.load_from_json(config.catalog_path)) {
            std::cerr << "Warning: Failed to load card catalog from " << config.catalog_path << std::endl;
        }

        if (config.xray_enabled) {
            xray_logger = std::make_unique<XRayLogger>(config.xray_dir);
        }
    }

    void xray_action(PlayerID player, const Action& action) {
        if (xray_logger) {
            xray_logger->log_action(state.turn_count, player, action);
            xray_logger->log_state(state);
        }
    }

    void xray_battle(const BattleResult& battle) {
        if (xray_logger) {
            xray_logger->log_battle(battle);
        }
    }

    // ========================================================================
    // GAME FLOW
    // ========================================================================

    void cmd_new() {
        if (card_db.card_count() == 0) {
            std::cout << "No cards loaded; cannot deal a match." << std::endl;
            return;
        }

        state = engine.create_game(config);
        card_played_this_turn = false;
        battled_this_turn = false;
        game_started = true;

        std::cout << "New duel! Difficulty: " << ai.get_difficulty_name()
                  << " (depth " << ai.config().max_depth << ")" << std::endl;
        if (xray_logger) {
            xray_logger->log_state(state);
        }
        cmd_show();
    }

    bool require_human_turn() {
        if (!game_started) {
            std::cout << "No game in progress. Type 'new'." << std::endl;
            return false;
        }
        if (state.is_game_over()) {
            std::cout << "The duel is over. Type 'new' to play again." << std::endl;
            return false;
        }
        return true;
    }

    void announce_game_over() {
        if (!state.is_game_over()) {
            return;
        }

        std::string reason = (state.human().life_points <= 0 || state.ai().life_points <= 0)
                           ? "Life points depleted" : "Out of cards";
        std::cout << "\n*** DUEL OVER: " << to_string(state.result) << " (" << reason << ") ***" << std::endl;
        if (xray_logger) {
            xray_logger->log_game_end(state.winner_id, reason);
        }
    }

    void cmd_show() {
        if (!game_started) {
            std::cout << "No game in progress. Type 'new'." << std::endl;
            return;
        }

        GameInfo info = state.get_info();
        std::cout << "\n=== Turn " << info.turn << " | " << info.current_player
                  << " | Phase: " << to_string(state.current_phase) << " ===" << std::endl;
        show_player(state.ai());
        show_player(state.human());
        if (info.game_over) {
            std::cout << "Winner: " << info.winner.value_or("none") << std::endl;
        }
    }

    void cmd_deck() {
        if (!game_started) return;
        for (PlayerID player : {HUMAN_PLAYER, AI_PLAYER}) {
            std::cout << state.get_player(player).name << " next:";
            for (const auto& card : engine.upcoming_cards(state, player)) {
                std::cout << " " << card.name << " [" << card.atk << "/" << card.def << "]";
            }
            std::cout << std::endl;
        }
    }

    void cmd_log() {
        if (state.battle_log.empty()) {
            std::cout << "No battles yet." << std::endl;
            return;
        }
        for (size_t i = 0; i < state.battle_log.size(); ++i) {
            std::cout << i + 1 << ". " << state.battle_log[i].description << std::endl;
        }
    }

    // ========================================================================
    // HUMAN ACTIONS
    // ========================================================================

    void execute(const Action& action) {
        if (action.is_play() && card_played_this_turn) {
            std::cout << "You already played a card this turn (use 'undo' to change it)." << std::endl;
            return;
        }

        if (!engine.apply_action(state, HUMAN_PLAYER, action)) {
            std::cout << "Action rejected: " << action.to_string() << std::endl;
            return;
        }

        if (action.is_play()) {
            card_played_this_turn = true;
            std::cout << "You summon " << state.human().field->name << " in "
                      << to_string(state.human().field->stance) << "." << std::endl;
        } else if (action.is_fuse()) {
            const CardInstance* result = state.human().hand.back();
            std::cout << "Fusion! You get " << (result ? result->name : "?") << "." << std::endl;
        }

        xray_action(HUMAN_PLAYER, action);
        announce_game_over();
    }

    void cmd_actions() {
        if (!require_human_turn()) return;
        show_actions(engine.get_legal_actions(state, HUMAN_PLAYER));
    }

    void cmd_do(const std::vector<std::string>& args) {
        if (!require_human_turn()) return;
        if (args.size() < 2) {
            std::cout << "Usage: do <number>" << std::endl;
            return;
        }

        auto actions = engine.get_legal_actions(state, HUMAN_PLAYER);
        auto index = parse_int(args[1]);
        if (!index.has_value() || *index < 0 || *index >= static_cast<int>(actions.size())) {
            std::cout << "Invalid action number. Use 'actions' to list them." << std::endl;
            return;
        }
        execute(actions[*index]);
    }

    void cmd_play(const std::vector<std::string>& args) {
        if (!require_human_turn()) return;
        if (args.size() < 2) {
            std::cout << "Usage: play <i> [atk|def] [1|2]" << std::endl;
            return;
        }

        auto index = parse_int(args[1]);
        if (!index.has_value()) {
            std::cout << "Invalid hand index: " << args[1] << std::endl;
            return;
        }

        Stance stance = Stance::ATTACK;
        if (args.size() > 2) {
            std::string s = to_lower(args[2]);
            if (s == "def" || s == "d") {
                stance = Stance::DEFENSE;
            } else if (s != "atk" && s != "a") {
                std::cout << "Stance must be atk or def." << std::endl;
                return;
            }
        }

        int star_num = 1;
        if (args.size() > 3) {
            auto star = parse_int(args[3]);
            if (!star.has_value() || (*star != 1 && *star != 2)) {
                std::cout << "Star must be 1 or 2." << std::endl;
                return;
            }
            star_num = *star;
        }

        execute(Action::play(HUMAN_PLAYER, *index, stance, star_num));
    }

    void cmd_fuse(const std::vector<std::string>& args) {
        if (!require_human_turn()) return;
        if (args.size() < 3) {
            std::cout << "Usage: fuse <i> <j>" << std::endl;
            return;
        }

        auto first = parse_int(args[1]);
        auto second = parse_int(args[2]);
        if (!first.has_value() || !second.has_value()) {
            std::cout << "Invalid hand indices." << std::endl;
            return;
        }
        if (!state.human().can_fuse(card_db, *first, *second).has_value()) {
            std::cout << "Those cards do not fuse." << std::endl;
            return;
        }
        execute(Action::fuse(HUMAN_PLAYER, *first, *second));
    }

    void cmd_fusions() {
        if (!require_human_turn()) return;
        auto options = state.human().possible_fusions(card_db);
        if (options.empty()) {
            std::cout << "No fusions available." << std::endl;
            return;
        }
        for (const auto& option : options) {
            std::cout << "  " << option.first << " + " << option.second << " -> "
                      << option.result.name << " [" << option.result.atk << "/"
                      << option.result.def << "]" << std::endl;
        }
    }

    void cmd_undo() {
        if (!require_human_turn()) return;
        if (battled_this_turn) {
            std::cout << "Cannot undo after battling." << std::endl;
            return;
        }
        if (!card_played_this_turn || !engine.undo_last_play(state, HUMAN_PLAYER)) {
            std::cout << "Nothing to undo." << std::endl;
            return;
        }
        card_played_this_turn = false;
        std::cout << "Play undone." << std::endl;
    }

    void cmd_battle() {
        if (!require_human_turn()) return;
        if (battled_this_turn) {
            std::cout << "You already battled this turn." << std::endl;
            return;
        }

        auto battle = engine.resolve_battle(state, HUMAN_PLAYER);
        if (!battle.has_value()) {
            std::cout << "Both fields must be occupied to battle." << std::endl;
            return;
        }

        battled_this_turn = true;
        show_battle(*battle);
        xray_battle(*battle);
        announce_game_over();
    }

    void cmd_end() {
        if (!require_human_turn()) return;

        engine.next_turn(state);
        announce_game_over();
        if (state.is_game_over()) return;

        std::cout << "\nAI is thinking (" << ai.get_difficulty_name() << ")..." << std::endl;
        size_t battles_before = state.battle_log.size();
        std::vector<Action> taken = ai.play_turn(state);

        for (const auto& action : taken) {
            std::cout << "AI: " << action.to_string() << std::endl;
            xray_action(AI_PLAYER, action);
        }
        if (taken.empty()) {
            std::cout << "AI cannot move." << std::endl;
        }
        if (state.battle_log.size() > battles_before) {
            show_battle(state.battle_log.back());
            xray_battle(state.battle_log.back());
        }

        announce_game_over();
        if (state.is_game_over()) return;

        engine.next_turn(state);
        card_played_this_turn = false;
        battled_this_turn = false;
        announce_game_over();
        cmd_show();
    }

    // ========================================================================
    // AI SETTINGS
    // ========================================================================

    void cmd_depth(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Depth: " << ai.config().max_depth << std::endl;
            return;
        }
        auto depth = parse_int(args[1]);
        if (!depth.has_value() || *depth < 1) {
            std::cout << "Depth must be a positive integer." << std::endl;
            return;
        }
        ai.set_max_depth(*depth);
        std::cout << "Depth set to " << *depth << " (" << ai.get_difficulty_name() << ")" << std::endl;
    }

    void cmd_difficulty(const std::vector<std::string>& args) {
        if (args.size() < 2) {
            std::cout << "Difficulty: " << ai.get_difficulty_name() << std::endl;
            return;
        }
        auto depth = depth_for_difficulty(args[1]);
        if (!depth.has_value()) {
            std::cout << "Unknown difficulty: " << args[1] << std::endl;
            return;
        }
        ai.set_max_depth(*depth);
        std::cout << "Difficulty set to " << ai.get_difficulty_name() << std::endl;
    }

    void run() {
        std::cout << "Fusion Duel Console v" << get_version() << std::endl;
        std::cout << "=====================================\n" << std::endl;

        cmd_new();

        std::string line;
        while (true) {
            std::cout << "\n> ";
            if (!std::getline(std::cin, line)) {
                break;
            }

            auto args = split(line);
            if (args.empty()) continue;

            const std::string& cmd = args[0];

            // Allow just typing a number as shorthand for "do <number>"
            if (std::isdigit(static_cast<unsigned char>(cmd[0]))) {
                std::vector<std::string> do_args = {"do"};
                do_args.insert(do_args.end(), args.begin(), args.end());
                cmd_do(do_args);
                continue;
            }

            if (cmd == "quit" || cmd == "exit" || cmd == "q") {
                break;
            } else if (cmd == "help" || cmd == "h" || cmd == "?") {
                print_help();
            } else if (cmd == "new" || cmd == "reset" || cmd == "restart") {
                cmd_new();
            } else if (cmd == "show" || cmd == "s") {
                cmd_show();
            } else if (cmd == "actions" || cmd == "a") {
                cmd_actions();
            } else if (cmd == "do" || cmd == "d") {
                cmd_do(args);
            } else if (cmd == "play" || cmd == "p") {
                cmd_play(args);
            } else if (cmd == "fuse" || cmd == "f") {
                cmd_fuse(args);
            } else if (cmd == "fusions") {
                cmd_fusions();
            } else if (cmd == "undo" || cmd == "u") {
                cmd_undo();
            } else if (cmd == "battle" || cmd == "b") {
                cmd_battle();
            } else if (cmd == "end" || cmd == "e") {
                cmd_end();
            } else if (cmd == "depth") {
                cmd_depth(args);
            } else if (cmd == "difficulty") {
                cmd_difficulty(args);
            } else if (cmd == "deck") {
                cmd_deck();
            } else if (cmd == "log") {
                cmd_log();
            } else {
                std::cout << "Unknown command: '" << cmd << "'. Type 'help' for commands." << std::endl;
            }
        }

        std::cout << "Goodbye!" << std::endl;
    }
};

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    GameConfig config;

    // Optional: duel_console [config.json]
    if (argc > 1 && !load_config_from_json(argv[1], config)) {
        std::cerr << "Using default configuration." << std::endl;
    }

    Console console(config);
    console.run();
    return 0;
}
