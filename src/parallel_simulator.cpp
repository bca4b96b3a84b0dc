#include "bj/parallel_simulator.h"
#include "bj/simulator.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace bj_solver {

ParallelSimulator::ParallelSimulator(const SimulationConfig& config, const StrategyTable& strategy, unsigned num_threads)
    : config_(config), strategy_(strategy), num_threads_(num_threads)
{
    config_.validate();
    if (num_threads_ == 0) {
        num_threads_ = std::max(1u, std::thread::hardware_concurrency());
    }
}

SimulationSummary ParallelSimulator::run_simulations(long num_simulations, double bet_size,
                                                     const ProgressCallback& progress,
                                                     const CancellationToken* cancel) {
    const long workers = std::min<long>(num_threads_, std::max(1L, num_simulations));
    spdlog::info("Simulation parallèle : {} mains sur {} threads.", num_simulations, workers);

    std::vector<SimulationSummary> partials(workers);
    std::vector<std::exception_ptr> errors(workers);
    std::vector<long> done_per_worker(workers, 0);
    std::mutex progress_mutex;
    std::vector<std::thread> threads;
    threads.reserve(workers);

    for (long w = 0; w < workers; ++w) {
        // Répartition : les premiers workers prennent le reste de la division
        const long share = num_simulations / workers + (w < num_simulations % workers ? 1 : 0);

        threads.emplace_back([&, w, share]() {
            try {
                SimulationConfig worker_config = config_;
                if (config_.seed) {
                    worker_config.seed = *config_.seed + static_cast<uint32_t>(w) * 7919u;
                }
                // Copie locale : aucune écriture partagée entre workers
                const StrategyTable worker_strategy = strategy_;
                Simulator simulator(worker_config, worker_strategy);

                ProgressCallback worker_progress;
                if (progress) {
                    worker_progress = [&, w](long done, long) {
                        std::lock_guard<std::mutex> lock(progress_mutex);
                        done_per_worker[w] = done;
                        long total_done = 0;
                        for (long d : done_per_worker) total_done += d;
                        progress(total_done, num_simulations);
                    };
                }
                partials[w] = simulator.run_simulations(share, bet_size, worker_progress, cancel);
            } catch (...) {
                errors[w] = std::current_exception();
            }
        });
    }

    for (std::thread& t : threads) {
        t.join();
    }

    // Erreur d'un worker : propagée à l'appelant
    for (const std::exception_ptr& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    SimulationSummary merged;
    merged.counting_enabled = config_.counting_enabled;
    for (const SimulationSummary& partial : partials) {
        merged.merge(partial);
    }
    merged.finalize();

    spdlog::info("Simulation parallèle terminée : {} mains, EV {:.4f}.", merged.total_games, merged.expected_value);
    return merged;
}

} // namespace bj_solver
