#include "bj/config.h"
#include "bj/game_utils.hpp"
#include "bj/optimizer.h"
#include "bj/parallel_simulator.h"
#include "bj/simulator.h"
#include "bj/strategy_table.h"
#include "spdlog/spdlog.h"

#include <exception>  // std::exception
#include <iostream>   // std::cerr
#include <string>     // std::string

int main(int /*argc*/, char* /*argv*/[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Démarrage du simulateur de blackjack…");

    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    const long        num_hands         = 200000;
    const long        trials_per_row    = 2000;   // Valeur basse pour test
    const unsigned    num_threads       = 4;
    const std::string strategy_filename = "strategy_table.dat";

    try
    {
        // 1. Configuration de la table
        bj_solver::SimulationConfig config;
        config.num_decks = 6;
        config.penetration = 75;
        config.rules.dealer_hits_soft_17 = bj_solver::dealer_hits_soft_17_from_string("17s");
        config.rules.double_after_split = true;
        config.rules.allow_resplit = true;
        config.rules.resplit_aces = false;
        config.rules.blackjack_payout = bj_solver::payout_from_string("3:2");
        config.counting_enabled = true;
        config.counting_system = bj_solver::counting_system_from_string("Hi-Lo");
        config.bet_size = 100.0;
        config.seed = 20240601u;
        config.validate();
        spdlog::info("Configuration : {}", bj_solver::describe_config(config));

        // 2. Stratégie : fichier existant, sinon stratégie de base
        bj_solver::StrategyTable strategy;
        if (strategy.load_from_file(strategy_filename))
            spdlog::info("Stratégie chargée depuis {}.", strategy_filename);
        else
        {
            strategy.load_basic_strategy();
            spdlog::info("Pas de stratégie existante ({}), stratégie de base.", strategy_filename);
        }

        // 3. Simulation (threads indépendants, agrégats fusionnés)
        bj_solver::ParallelSimulator parallel(config, strategy, num_threads);
        const bj_solver::SimulationSummary summary = parallel.run_simulations(num_hands, config.bet_size);
        spdlog::info("Mains : {}  Gains : {}  Pertes : {}  Égalités : {}  Blackjacks : {}",
                     summary.total_games, summary.wins, summary.losses, summary.pushes, summary.blackjacks);
        spdlog::info("EV par main : {:.3f}  Taux de retour : {:.3f}%  Taux de gain : {:.2f}%",
                     summary.expected_value, summary.return_rate, summary.win_rate);
        for (const auto& [count, bucket] : summary.count_stats)
        {
            if (bucket.hands < 1000) continue;
            spdlog::info("  TC {:+d} : {} mains, EV {:.3f}", count, bucket.hands, bucket.average_ev());
        }

        // 4. Analyse d'une situation précise
        bj_solver::Simulator simulator(config, strategy);
        const bj_solver::SituationAnalysis analysis =
            simulator.analyze_situation("10,6", "10", true, true, trials_per_row * 5, config.bet_size);
        if (!analysis.ok())
            spdlog::warn("Analyse impossible : {}", analysis.error);
        else
        {
            for (const auto& [action, result] : analysis.actions)
                spdlog::info("  {} vs 10 : {} -> EV {:.2f} ({} mains)", analysis.player_label,
                             bj_solver::action_to_string(action), result.expected_value, result.total_games);
            if (analysis.best_action)
                spdlog::info("Meilleure action : {}", bj_solver::action_to_string(*analysis.best_action));
        }

        // 5. Optimisation de la table de base
        bj_solver::StrategyOptimizer optimizer(config, strategy);
        const bj_solver::OptimizationReport report = optimizer.optimize_strategy(
            std::nullopt, trials_per_row, config.bet_size,
            [](const std::string& status, double percent) {
                spdlog::debug("[{:5.1f}%] {}", percent, status);
            });
        for (const auto& change : report.changes)
            spdlog::info("  {}", change.message);

        // 6. Sauvegarde
        if (strategy.save_to_file(strategy_filename))
            spdlog::info("Stratégie sauvegardée dans {}.", strategy_filename);
        else
            spdlog::error("Échec de la sauvegarde de {}.", strategy_filename);
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }
    catch (...)
    {
        spdlog::critical("Erreur critique inconnue interceptée.");
        std::cerr << "Erreur critique inconnue interceptée.\n";
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
