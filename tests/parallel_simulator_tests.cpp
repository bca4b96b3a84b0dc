#include "bj/parallel_simulator.h"
#include "bj/strategy_table.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>

using namespace bj_solver;

namespace {

StrategyTable basic_strategy() {
    StrategyTable strategy;
    strategy.load_basic_strategy();
    return strategy;
}

} // namespace

TEST_CASE("Parallel simulation merges worker results", "[parallel]") {
    SimulationConfig config;
    config.seed = 1234u;
    config.chunk_size = 250;
    config.counting_enabled = true;

    ParallelSimulator parallel(config, basic_strategy(), 4);
    REQUIRE(parallel.num_threads() == 4);

    // Rappelé depuis les workers, sous verrou : pas d'assertion ici
    long max_done = 0;
    long reported_total = 0;
    const SimulationSummary summary = parallel.run_simulations(
        2001, 1.0, [&](long done, long total) {
            reported_total = total;
            max_done = std::max(max_done, done);
        });

    REQUIRE(summary.total_games == 2001);
    REQUIRE(summary.wins + summary.losses + summary.pushes == 2001);
    REQUIRE(max_done == 2001);
    REQUIRE(reported_total == 2001);
    REQUIRE(summary.counting_enabled);

    long counted = 0;
    for (const auto& [count, bucket] : summary.count_stats) {
        counted += bucket.hands;
    }
    REQUIRE(counted == 2001);
    REQUIRE(summary.samples.size() == MAX_SAMPLE_RESULTS);
}

TEST_CASE("Parallel simulation is reproducible with a seed", "[parallel]") {
    SimulationConfig config;
    config.seed = 99u;
    const StrategyTable strategy = basic_strategy();

    const SimulationSummary a = ParallelSimulator(config, strategy, 3).run_simulations(900, 1.0);
    const SimulationSummary b = ParallelSimulator(config, strategy, 3).run_simulations(900, 1.0);
    REQUIRE(a.total_winnings == b.total_winnings);
    REQUIRE(a.blackjacks == b.blackjacks);
}

TEST_CASE("Parallel simulation edge cases", "[parallel]") {
    SimulationConfig config;
    config.seed = 5u;
    const StrategyTable strategy = basic_strategy();

    SECTION("Default thread count") {
        ParallelSimulator parallel(config, strategy);
        REQUIRE(parallel.num_threads() >= 1);
    }

    SECTION("More threads than hands") {
        ParallelSimulator parallel(config, strategy, 8);
        REQUIRE(parallel.run_simulations(3, 1.0).total_games == 3);
    }

    SECTION("Worker errors reach the caller") {
        ParallelSimulator parallel(config, strategy, 2);
        const ProgressCallback failing = [](long, long) { throw std::runtime_error("progress failure"); };
        REQUIRE_THROWS_AS(parallel.run_simulations(100, 1.0, failing), std::runtime_error);
    }

    SECTION("Cancelled run") {
        ParallelSimulator parallel(config, strategy, 2);
        CancellationToken token;
        token.cancel();
        const SimulationSummary summary = parallel.run_simulations(1000, 1.0, {}, &token);
        REQUIRE(summary.cancelled);
        REQUIRE(summary.total_games == 0);
    }

    SECTION("Invalid configuration") {
        config.num_decks = 12;
        REQUIRE_THROWS_AS(ParallelSimulator(config, strategy, 2), std::invalid_argument);
    }
}
