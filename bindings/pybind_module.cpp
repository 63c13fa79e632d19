/**
 * Fusion Duel Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine and minimax AI.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "duel_engine.hpp"

namespace py = pybind11;

PYBIND11_MODULE(duel_engine_cpp, m) {
    m.doc() = "Fusion card duel engine with a minimax opponent";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<duel::GuardianStar>(m, "GuardianStar")
        .value("SUN", duel::GuardianStar::SUN)
        .value("MOON", duel::GuardianStar::MOON)
        .value("VENUS", duel::GuardianStar::VENUS)
        .value("MERCURY", duel::GuardianStar::MERCURY)
        .value("MARS", duel::GuardianStar::MARS)
        .value("JUPITER", duel::GuardianStar::JUPITER)
        .value("SATURN", duel::GuardianStar::SATURN)
        .value("URANUS", duel::GuardianStar::URANUS)
        .value("PLUTO", duel::GuardianStar::PLUTO)
        .value("NEPTUNE", duel::GuardianStar::NEPTUNE)
        .export_values();

    py::enum_<duel::Stance>(m, "Stance")
        .value("ATTACK", duel::Stance::ATTACK)
        .value("DEFENSE", duel::Stance::DEFENSE)
        .export_values();

    py::enum_<duel::GamePhase>(m, "GamePhase")
        .value("DRAW", duel::GamePhase::DRAW)
        .value("MAIN", duel::GamePhase::MAIN)
        .value("BATTLE", duel::GamePhase::BATTLE)
        .value("END", duel::GamePhase::END)
        .export_values();

    py::enum_<duel::GameResult>(m, "GameResult")
        .value("ONGOING", duel::GameResult::ONGOING)
        .value("HUMAN_WIN", duel::GameResult::HUMAN_WIN)
        .value("AI_WIN", duel::GameResult::AI_WIN)
        .value("DRAW", duel::GameResult::DRAW)
        .export_values();

    py::enum_<duel::ActionType>(m, "ActionType")
        .value("PLAY", duel::ActionType::PLAY)
        .value("FUSE", duel::ActionType::FUSE)
        .value("PASS", duel::ActionType::PASS)
        .export_values();

    py::enum_<duel::BattleOutcome>(m, "BattleOutcome")
        .value("ATTACKER_WINS", duel::BattleOutcome::ATTACKER_WINS)
        .value("DEFENDER_WINS", duel::BattleOutcome::DEFENDER_WINS)
        .value("REBOUND", duel::BattleOutcome::REBOUND)
        .value("MUTUAL_DESTRUCTION", duel::BattleOutcome::MUTUAL_DESTRUCTION)
        .value("STANDOFF", duel::BattleOutcome::STANDOFF)
        .export_values();

    m.attr("HUMAN_PLAYER") = duel::HUMAN_PLAYER;
    m.attr("AI_PLAYER") = duel::AI_PLAYER;

    m.def("combat_bonus", &duel::combat_bonus);

    // ========================================================================
    // CARD INSTANCE
    // ========================================================================

    py::class_<duel::CardInstance>(m, "CardInstance")
        .def(py::init<>())
        .def_readwrite("card_id", &duel::CardInstance::card_id)
        .def_readwrite("name", &duel::CardInstance::name)
        .def_readwrite("card_type", &duel::CardInstance::card_type)
        .def_readwrite("attribute", &duel::CardInstance::attribute)
        .def_readwrite("atk", &duel::CardInstance::atk)
        .def_readwrite("defense", &duel::CardInstance::def)
        .def_readwrite("level", &duel::CardInstance::level)
        .def_readwrite("star1", &duel::CardInstance::star1)
        .def_readwrite("star2", &duel::CardInstance::star2)
        .def_readwrite("selected_star", &duel::CardInstance::selected_star)
        .def_readwrite("stance", &duel::CardInstance::stance)
        .def("stance_value", &duel::CardInstance::stance_value)
        .def("select_star", &duel::CardInstance::select_star)
        .def("clone", &duel::CardInstance::clone)
        .def("__repr__", &duel::CardInstance::to_string);

    // ========================================================================
    // ZONE
    // ========================================================================

    py::class_<duel::Zone>(m, "Zone")
        .def(py::init<>())
        .def_readwrite("cards", &duel::Zone::cards)
        .def("count", &duel::Zone::count)
        .def("is_empty", &duel::Zone::is_empty)
        .def("peek", &duel::Zone::peek)
        .def("__len__", &duel::Zone::count);

    // ========================================================================
    // PLAYER STATE
    // ========================================================================

    py::class_<duel::FusionOption>(m, "FusionOption")
        .def_readonly("first", &duel::FusionOption::first)
        .def_readonly("second", &duel::FusionOption::second)
        .def_readonly("result", &duel::FusionOption::result);

    py::class_<duel::PlayerState>(m, "PlayerState")
        .def(py::init<>())
        .def_readwrite("player_id", &duel::PlayerState::player_id)
        .def_readwrite("name", &duel::PlayerState::name)
        .def_readwrite("is_ai", &duel::PlayerState::is_ai)
        .def_readwrite("life_points", &duel::PlayerState::life_points)
        .def_readwrite("max_hand_size", &duel::PlayerState::max_hand_size)
        .def_readwrite("deck", &duel::PlayerState::deck)
        .def_readwrite("hand", &duel::PlayerState::hand)
        .def_readwrite("discard", &duel::PlayerState::discard)
        .def_readwrite("field", &duel::PlayerState::field)
        .def("draw", &duel::PlayerState::draw)
        .def("play_to_field", &duel::PlayerState::play_to_field)
        .def("undo_last_play", &duel::PlayerState::undo_last_play)
        .def("can_fuse", &duel::PlayerState::can_fuse)
        .def("fuse", &duel::PlayerState::fuse)
        .def("possible_fusions", &duel::PlayerState::possible_fusions)
        .def("has_field_card", &duel::PlayerState::has_field_card)
        .def("is_decked_out", &duel::PlayerState::is_decked_out)
        .def("clone", &duel::PlayerState::clone);

    // ========================================================================
    // ACTION
    // ========================================================================

    py::class_<duel::Action>(m, "Action")
        .def(py::init<>())
        .def(py::init<duel::ActionType, duel::PlayerID>())
        .def_readwrite("action_type", &duel::Action::action_type)
        .def_readwrite("player_id", &duel::Action::player_id)
        .def_readwrite("hand_index", &duel::Action::hand_index)
        .def_readwrite("stance", &duel::Action::stance)
        .def_readwrite("star_num", &duel::Action::star_num)
        .def_readwrite("fuse_first", &duel::Action::fuse_first)
        .def_readwrite("fuse_second", &duel::Action::fuse_second)
        .def_readwrite("card_name", &duel::Action::card_name)
        .def("__str__", &duel::Action::to_string)
        .def("__repr__", &duel::Action::to_string)
        .def(py::self == py::self)
        .def(py::self != py::self)
        // Factory methods
        .def_static("play", &duel::Action::play,
                    py::arg("player"), py::arg("index"), py::arg("stance"),
                    py::arg("star_num"), py::arg("card_name") = "")
        .def_static("fuse", &duel::Action::fuse,
                    py::arg("player"), py::arg("first"), py::arg("second"),
                    py::arg("result_name") = "")
        .def_static("pass_turn", &duel::Action::pass);

    // ========================================================================
    // BATTLE
    // ========================================================================

    py::class_<duel::BattleResult>(m, "BattleResult")
        .def_readonly("attacker_id", &duel::BattleResult::attacker_id)
        .def_readonly("human_card", &duel::BattleResult::human_card)
        .def_readonly("ai_card", &duel::BattleResult::ai_card)
        .def_readonly("attacker_value", &duel::BattleResult::attacker_value)
        .def_readonly("defender_value", &duel::BattleResult::defender_value)
        .def_readonly("human_value", &duel::BattleResult::human_value)
        .def_readonly("ai_value", &duel::BattleResult::ai_value)
        .def_readonly("damage", &duel::BattleResult::damage)
        .def_readonly("damaged_player", &duel::BattleResult::damaged_player)
        .def_readonly("outcome", &duel::BattleResult::outcome)
        .def_readonly("winner", &duel::BattleResult::winner)
        .def_readonly("description", &duel::BattleResult::description);

    // ========================================================================
    // GAME STATE
    // ========================================================================

    py::class_<duel::GameInfo>(m, "GameInfo")
        .def_readonly("turn", &duel::GameInfo::turn)
        .def_readonly("current_player", &duel::GameInfo::current_player)
        .def_readonly("human_lp", &duel::GameInfo::human_lp)
        .def_readonly("ai_lp", &duel::GameInfo::ai_lp)
        .def_readonly("human_hand", &duel::GameInfo::human_hand)
        .def_readonly("ai_hand", &duel::GameInfo::ai_hand)
        .def_readonly("human_deck", &duel::GameInfo::human_deck)
        .def_readonly("ai_deck", &duel::GameInfo::ai_deck)
        .def_readonly("human_field", &duel::GameInfo::human_field)
        .def_readonly("ai_field", &duel::GameInfo::ai_field)
        .def_readonly("game_over", &duel::GameInfo::game_over)
        .def_readonly("winner", &duel::GameInfo::winner);

    py::class_<duel::GameState>(m, "GameState")
        .def(py::init<>())
        .def_readonly("players", &duel::GameState::players)
        .def_readwrite("turn_count", &duel::GameState::turn_count)
        .def_readwrite("current_player_index", &duel::GameState::current_player_index)
        .def_readwrite("current_phase", &duel::GameState::current_phase)
        .def_readwrite("result", &duel::GameState::result)
        .def_readwrite("winner_id", &duel::GameState::winner_id)
        .def_readonly("battle_log", &duel::GameState::battle_log)
        .def_readonly("last_battle", &duel::GameState::last_battle)
        .def_readwrite("record_battles", &duel::GameState::record_battles)
        .def("get_player", py::overload_cast<duel::PlayerID>(&duel::GameState::get_player),
             py::return_value_policy::reference_internal)
        .def("human", py::overload_cast<>(&duel::GameState::human),
             py::return_value_policy::reference_internal)
        .def("ai", py::overload_cast<>(&duel::GameState::ai),
             py::return_value_policy::reference_internal)
        .def("is_game_over", &duel::GameState::is_game_over)
        .def("get_info", &duel::GameState::get_info)
        .def("clone", &duel::GameState::clone)
        .def("clone_for_search", &duel::GameState::clone_for_search);

    // ========================================================================
    // CARD DATABASE
    // ========================================================================

    py::class_<duel::CardDef>(m, "CardDef")
        .def_readonly("card_id", &duel::CardDef::card_id)
        .def_readonly("name", &duel::CardDef::name)
        .def_readonly("card_type", &duel::CardDef::card_type)
        .def_readonly("atk", &duel::CardDef::atk)
        .def_readonly("defense", &duel::CardDef::def)
        .def_readonly("attribute", &duel::CardDef::attribute)
        .def_readonly("level", &duel::CardDef::level)
        .def_readonly("star1", &duel::CardDef::star1)
        .def_readonly("star2", &duel::CardDef::star2);

    py::class_<duel::CardDatabase>(m, "CardDatabase")
        .def(py::init<>())
        .def("load_from_json", &duel::CardDatabase::load_from_json)
        .def("load_from_json_string", &duel::CardDatabase::load_from_json_string)
        .def("get_card", &duel::CardDatabase::get_card, py::return_value_policy::reference)
        .def("find_by_name", &duel::CardDatabase::find_by_name, py::return_value_policy::reference)
        .def("has_card", &duel::CardDatabase::has_card)
        .def("create_instance", &duel::CardDatabase::create_instance)
        .def("check_fusion", py::overload_cast<const std::string&, const std::string&>(
                 &duel::CardDatabase::check_fusion, py::const_))
        .def("get_all_card_ids", &duel::CardDatabase::get_all_card_ids)
        .def("card_count", &duel::CardDatabase::card_count)
        .def("fusion_count", &duel::CardDatabase::fusion_count);

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    py::class_<duel::SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("max_depth", &duel::SearchConfig::max_depth)
        .def_readwrite("use_alpha_beta", &duel::SearchConfig::use_alpha_beta)
        .def_readwrite("verbose", &duel::SearchConfig::verbose);

    py::class_<duel::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("deck_size", &duel::GameConfig::deck_size)
        .def_readwrite("starting_life", &duel::GameConfig::starting_life)
        .def_readwrite("max_hand_size", &duel::GameConfig::max_hand_size)
        .def_readwrite("initial_hand_size", &duel::GameConfig::initial_hand_size)
        .def_readwrite("random_seed", &duel::GameConfig::random_seed)
        .def_readwrite("catalog_path", &duel::GameConfig::catalog_path)
        .def_readwrite("search", &duel::GameConfig::search);

    m.def("depth_for_difficulty", &duel::depth_for_difficulty);
    m.def("difficulty_name", &duel::difficulty_name);

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<duel::DuelEngine>(m, "DuelEngine")
        .def(py::init<const duel::CardDatabase&>(), py::keep_alive<1, 2>())
        .def("get_legal_actions", &duel::DuelEngine::get_legal_actions)
        .def("apply_action", &duel::DuelEngine::apply_action)
        .def("step", &duel::DuelEngine::step)
        .def("resolve_battle", &duel::DuelEngine::resolve_battle)
        .def("next_turn", &duel::DuelEngine::next_turn)
        .def("draw", &duel::DuelEngine::draw)
        .def("undo_last_play", &duel::DuelEngine::undo_last_play)
        .def("upcoming_cards", &duel::DuelEngine::upcoming_cards,
             py::arg("state"), py::arg("player"), py::arg("num_cards") = 3)
        .def("check_win_conditions", &duel::DuelEngine::check_win_conditions)
        .def("create_game", &duel::DuelEngine::create_game)
        .def("get_card_database", &duel::DuelEngine::get_card_database,
             py::return_value_policy::reference_internal);

    // ========================================================================
    // MINIMAX AI
    // ========================================================================

    py::class_<duel::MinimaxAI>(m, "MinimaxAI")
        .def(py::init<const duel::DuelEngine&, duel::SearchConfig>(),
             py::arg("engine"), py::arg("config") = duel::SearchConfig(),
             py::keep_alive<1, 2>())
        .def("get_best_move", &duel::MinimaxAI::get_best_move)
        .def("play_turn", &duel::MinimaxAI::play_turn)
        .def("evaluate", &duel::MinimaxAI::evaluate)
        .def("set_max_depth", &duel::MinimaxAI::set_max_depth)
        .def("get_difficulty_name", &duel::MinimaxAI::get_difficulty_name)
        .def("nodes_evaluated", &duel::MinimaxAI::nodes_evaluated)
        .def("pruning_count", &duel::MinimaxAI::pruning_count);

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = duel::get_version();
    m.attr("__version__") = duel::get_version();
}
