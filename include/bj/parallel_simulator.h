#ifndef BJ_PARALLEL_SIMULATOR_H
#define BJ_PARALLEL_SIMULATOR_H

#include "bj/config.h"
#include "bj/simulation_stats.h"
#include "bj/strategy_table.h"

namespace bj_solver {

// Répartit une simulation sur plusieurs threads. Chaque worker a son propre
// sabot, son compteur et sa copie de stratégie ; les agrégats sont fusionnés à la fin.
class ParallelSimulator {
public:
    // num_threads = 0 : std::thread::hardware_concurrency()
    ParallelSimulator(const SimulationConfig& config, const StrategyTable& strategy, unsigned num_threads = 0);

    // progress est appelé depuis les workers, sous verrou, avec le total cumulé
    SimulationSummary run_simulations(long num_simulations, double bet_size,
                                      const ProgressCallback& progress = {},
                                      const CancellationToken* cancel = nullptr);

    unsigned num_threads() const { return num_threads_; }

private:
    SimulationConfig config_;
    StrategyTable    strategy_;
    unsigned         num_threads_;
};

} // namespace bj_solver

#endif // BJ_PARALLEL_SIMULATOR_H
