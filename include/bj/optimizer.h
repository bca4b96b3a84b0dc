#ifndef BJ_OPTIMIZER_H
#define BJ_OPTIMIZER_H

#include "bj/common_types.h"
#include "bj/config.h"
#include "bj/simulation_stats.h"
#include "bj/simulator.h"
#include "bj/strategy_table.h"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bj_solver {

// Modification appliquée à une cellule
struct StrategyChange {
    HandKey            key;
    int                dealer = 0;
    std::optional<int> count_level; // nullopt = table de base
    Action             from = Action::STAND;
    Action             to   = Action::STAND;
    double             expected_value = 0.0;
    std::string        message; // "Hard 16 vs 10: Stand -> Hit (Base, EV -0.5400)"
};

struct OptimizationReport {
    int  total_cells  = 0;
    int  cells_tested = 0;
    int  cells_skipped = 0; // Aucun essai retenu (compte jamais atteint) : cellule inchangée
    int  changes_made = 0;
    bool cancelled    = false;
    std::vector<StrategyChange> changes;
    // Nombre de changements par niveau de compte (optimisation multi-niveaux)
    std::map<int, int> changes_by_level;
};

// Progression : (description, pourcentage 0..100, croissant)
using OptimizationProgress = std::function<void(const std::string&, double)>;

// Lignes balayées : hard 21..5, soft 21..13, paires A,A..2,2 (36 lignes, 360 cellules)
std::vector<HandKey> optimization_rows();

// Les niveaux -4..+4 de l'optimisation multi-niveaux
std::vector<int> optimization_count_levels();

class StrategyOptimizer {
public:
    // La stratégie est modifiée en place ; le simulateur interne la lit directement.
    StrategyOptimizer(const SimulationConfig& config, StrategyTable& strategy);

    /**
     * @brief Optimise les 360 cellules, une ligne à la fois.
     * Pour chaque cellule, l'action de meilleure EV remplace l'action courante
     * si elle diffère. Avec count_level, la couche de ce niveau est écrite.
     * Interruptible entre deux lignes (et pendant le test d'une ligne).
     */
    OptimizationReport optimize_strategy(std::optional<int> count_level,
                                         long num_simulations, double bet_size,
                                         const OptimizationProgress& progress = {},
                                         const CancellationToken* cancel = nullptr);

    // Enchaîne les niveaux -4..+4. Lève std::invalid_argument hors mode "count based".
    OptimizationReport optimize_all_count_levels(long num_simulations, double bet_size,
                                                 const OptimizationProgress& progress = {},
                                                 const CancellationToken* cancel = nullptr);

    Simulator& simulator() { return simulator_; }

private:
    Action current_action(const HandKey& key, int dealer, std::optional<int> count_level) const;

    StrategyTable& strategy_;
    Simulator      simulator_;
};

} // namespace bj_solver

#endif // BJ_OPTIMIZER_H
