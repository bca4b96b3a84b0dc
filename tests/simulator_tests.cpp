#include "bj/simulator.h"
#include "bj/game_utils.hpp"
#include "bj/strategy_table.h"
#include "eval/hand_evaluator.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace bj_solver;

namespace {

SimulationConfig seeded_config(uint32_t seed = 42u) {
    SimulationConfig config;
    config.seed = seed;
    config.chunk_size = 500;
    return config;
}

StrategyTable basic_strategy() {
    StrategyTable strategy;
    strategy.load_basic_strategy();
    return strategy;
}

std::set<Action> tested_actions(const RowTestResult& row, int dealer) {
    std::set<Action> actions;
    for (const auto& [action, ev] : row.summary.at(dealer)) {
        actions.insert(action);
    }
    return actions;
}

} // namespace

TEST_CASE("Representative hands", "[simulator]") {
    REQUIRE(cards_to_string(representative_hand(HandKey::hard(16))) == "[10 6]");
    REQUIRE(cards_to_string(representative_hand(HandKey::hard(12))) == "[7 5]");
    REQUIRE(cards_to_string(representative_hand(HandKey::hard(9))) == "[4 5]");
    REQUIRE(cards_to_string(representative_hand(HandKey::hard(5))) == "[2 3]");
    REQUIRE(cards_to_string(representative_hand(HandKey::soft(18))) == "[A 7]");
    REQUIRE(cards_to_string(representative_hand(HandKey::soft(13))) == "[A 2]");
    REQUIRE(cards_to_string(representative_hand(HandKey::pair(8))) == "[8 8]");
    REQUIRE(cards_to_string(representative_hand(HandKey::pair(11))) == "[A A]");

    for (int total = MIN_HARD_TOTAL; total <= MAX_HARD_TOTAL; ++total) {
        REQUIRE(evaluate_hand(representative_hand(HandKey::hard(total))).total == total);
    }
    for (int total = MIN_SOFT_TOTAL; total <= MAX_SOFT_TOTAL; ++total) {
        REQUIRE(evaluate_hand(representative_hand(HandKey::soft(total))) == HandValue{total, true});
    }
}

TEST_CASE("Actions tested per row", "[simulator]") {
    using V = std::vector<Action>;
    REQUIRE(row_actions(HandKey::hard(16)) == V{Action::HIT, Action::STAND, Action::DOUBLE});
    REQUIRE(row_actions(HandKey::pair(8)) == V{Action::HIT, Action::STAND, Action::DOUBLE, Action::SPLIT});
    REQUIRE(row_actions(HandKey::pair(11)) == V{Action::HIT, Action::STAND, Action::SPLIT});
    // Blackjacks naturels : rien à décider
    REQUIRE(row_actions(HandKey::soft(21)) == V{Action::STAND});
    REQUIRE(row_actions(HandKey::hard(21)) == V{Action::STAND});
}

TEST_CASE("Row test of hard 16 against a 10", "[simulator][row]") {
    const StrategyTable strategy = basic_strategy();
    Simulator simulator(seeded_config(), strategy);

    SECTION("Label variant returns H, S and D only") {
        const RowTestResult row = simulator.test_row_actions("16", {"10"}, std::nullopt, 10000, 100.0);
        REQUIRE(row.key == HandKey::hard(16));
        REQUIRE(row.summary.size() == 1);
        REQUIRE(tested_actions(row, 10) == std::set<Action>{Action::HIT, Action::STAND, Action::DOUBLE});
        for (const auto& [action, ev] : row.summary.at(10)) {
            REQUIRE(std::isfinite(ev));
            // Essais communs à toutes les actions, blackjacks du croupier exclus
            REQUIRE(row.games(10, action) + row.dealer_naturals == 10000);
        }
        REQUIRE(row.dealer_naturals > 0);
        REQUIRE(row.games(10, Action::HIT) > 8800);
        REQUIRE_FALSE(row.cancelled);
    }

    SECTION("Expected values per unit bet, dealer without blackjack") {
        REQUIRE(strategy.lookup(HandKey::hard(16), 10, true, false) == Action::HIT);

        const RowTestResult row = simulator.test_row_actions(HandKey::hard(16), {10}, std::nullopt, 100000, 1.0);
        const double hit = row.expected_value(10, Action::HIT);
        const double stand = row.expected_value(10, Action::STAND);
        const double dbl = row.expected_value(10, Action::DOUBLE);

        // EV de référence de la stratégie de base : [-0.54, -0.50], bruit Monte Carlo < 0.01
        REQUIRE(hit > -0.55);
        REQUIRE(hit < -0.50);
        REQUIRE(stand > -0.55);
        REQUIRE(stand < -0.50);
        // Doubler 16 contre 10 coûte nettement plus
        REQUIRE(dbl < std::max(hit, stand) - 0.2);
    }

    SECTION("Dealer naturals are only possible against a 10 or an ace") {
        const RowTestResult six = simulator.test_row_actions(HandKey::hard(16), {6}, std::nullopt, 2000, 1.0);
        REQUIRE(six.dealer_naturals == 0);
        REQUIRE(six.games(6, Action::STAND) == 2000);

        const RowTestResult ace = simulator.test_row_actions(HandKey::hard(16), {11}, std::nullopt, 2000, 1.0);
        REQUIRE(ace.dealer_naturals > 400);
        REQUIRE(ace.games(11, Action::STAND) + ace.dealer_naturals == 2000);
        // Stand : une unité misée par essai retenu
        REQUIRE(ace.results.at(11).at(Action::STAND).total_bet == ace.games(11, Action::STAND));
    }

    SECTION("Several dealer cards") {
        const RowTestResult row = simulator.test_row_actions("S18", {"2", "9", "A"}, std::nullopt, 500, 1.0);
        REQUIRE(row.summary.size() == 3);
        REQUIRE(row.summary.count(11) == 1);
        REQUIRE(row.games(9, Action::STAND) == 500);
    }

    SECTION("Progress reaches the total") {
        long last_done = 0;
        long calls = 0;
        simulator.test_row_actions(HandKey::pair(8), {6}, std::nullopt, 1200, 1.0,
                                   [&](long done, long total) {
                                       REQUIRE(total == 1200);
                                       REQUIRE(done >= last_done);
                                       last_done = done;
                                       calls++;
                                   });
        REQUIRE(last_done == 1200);
        REQUIRE(calls == 3);
    }

    SECTION("Cancelled before the first trial") {
        CancellationToken token;
        token.cancel();
        const RowTestResult row = simulator.test_row_actions(HandKey::hard(12), {4}, std::nullopt, 1000, 1.0,
                                                             {}, &token);
        REQUIRE(row.cancelled);
        REQUIRE(row.games(4, Action::HIT) == 0);
    }

    SECTION("Invalid labels throw") {
        REQUIRE_THROWS_AS(simulator.test_row_actions("XX", {"10"}, std::nullopt, 10, 1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(simulator.test_row_actions("16", {"1"}, std::nullopt, 10, 1.0), std::invalid_argument);
    }
}

TEST_CASE("Row tests use the current strategy table", "[simulator][row]") {
    StrategyTable strategy = basic_strategy();
    Simulator simulator(seeded_config(7u), strategy);

    // Après un split de 8,8 la suite suit la table : 8 contre 6 en Stand
    const double before = simulator.test_cell_action(HandKey::pair(8), 6, Action::SPLIT, std::nullopt, 2000, 1.0)
                              .expected_value();
    for (int total = MIN_HARD_TOTAL; total <= MAX_HARD_TOTAL; ++total) {
        strategy.set_action(HandKey::hard(total), 6, Action::HIT);
    }
    const double after = simulator.test_cell_action(HandKey::pair(8), 6, Action::SPLIT, std::nullopt, 2000, 1.0)
                             .expected_value();
    REQUIRE(after < before);
}

TEST_CASE("Cell test", "[simulator][cell]") {
    const StrategyTable strategy = basic_strategy();

    SECTION("Doubling 11 against a 6 wins money") {
        Simulator simulator(seeded_config(), strategy);
        const OutcomeTally tally = simulator.test_cell_action(HandKey::hard(11), 6, Action::DOUBLE,
                                                              std::nullopt, 2000, 1.0);
        REQUIRE(tally.games == 2000);
        REQUIRE(tally.wins + tally.losses + tally.pushes == tally.games);
        REQUIRE(tally.expected_value() > 0.1);
        // Un double mise toujours deux unités
        REQUIRE_THAT(tally.total_bet, Catch::Matchers::WithinAbs(4000.0, 1e-6));
    }

    SECTION("Count filter keeps only matching trials") {
        SimulationConfig config = seeded_config();
        config.counting_enabled = true;
        Simulator simulator(config, strategy);

        // Sabot neuf moins 10,6 et un 6 : compte vrai arrondi 0
        const OutcomeTally at_zero = simulator.test_cell_action(HandKey::hard(16), 6, Action::STAND, 0, 300, 1.0);
        REQUIRE(at_zero.games == 300);
        const OutcomeTally at_five = simulator.test_cell_action(HandKey::hard(16), 6, Action::STAND, 5, 300, 1.0);
        REQUIRE(at_five.games == 0);
    }

    SECTION("Count level ignored without counting") {
        Simulator simulator(seeded_config(), strategy);
        const OutcomeTally tally = simulator.test_cell_action(HandKey::hard(16), 6, Action::STAND, 5, 300, 1.0);
        REQUIRE(tally.games == 300);
    }
}

TEST_CASE("Situation analysis", "[simulator][analysis]") {
    const StrategyTable strategy = basic_strategy();
    Simulator simulator(seeded_config(), strategy);

    SECTION("Invalid cards give an error") {
        const SituationAnalysis bad_player = simulator.analyze_situation("10,X", "10");
        REQUIRE_FALSE(bad_player.ok());
        REQUIRE(bad_player.error == "Invalid card input");
        REQUIRE(bad_player.actions.empty());

        const SituationAnalysis bad_dealer = simulator.analyze_situation("10,6", "1");
        REQUIRE(bad_dealer.error == "Invalid card input");
    }

    SECTION("Pair of 8s against a 6") {
        const SituationAnalysis analysis = simulator.analyze_situation("8,8", "6", true, true, 1000, 1.0);
        REQUIRE(analysis.ok());
        REQUIRE(analysis.player_key == HandKey::pair(8));
        REQUIRE(analysis.player_label == "8,8");
        REQUIRE(analysis.can_double);
        REQUIRE(analysis.can_split);
        REQUIRE(analysis.actions.size() == 4);
        REQUIRE(analysis.best_action.has_value());
        REQUIRE(analysis.actions.at(*analysis.best_action).expected_value == analysis.best_expected_value);
        for (const auto& [action, result] : analysis.actions) {
            REQUIRE(result.total_games == 1000);
            REQUIRE(result.wins + result.losses + result.pushes == result.total_games);
        }
    }

    SECTION("Options switched off and three card hands") {
        const SituationAnalysis no_double = simulator.analyze_situation("10,6", "10", false, true, 200, 1.0);
        REQUIRE_FALSE(no_double.can_double);
        REQUIRE_FALSE(no_double.can_split);
        REQUIRE(no_double.actions.count(Action::DOUBLE) == 0);

        const SituationAnalysis three_cards = simulator.analyze_situation("5,4,3", "7", true, true, 200, 1.0);
        REQUIRE(three_cards.ok());
        REQUIRE(three_cards.player_key == HandKey::hard(12));
        REQUIRE_FALSE(three_cards.can_double);
        REQUIRE(three_cards.actions.size() == 2);

        const SituationAnalysis soft = simulator.analyze_situation("A,7", "9", true, true, 200, 1.0);
        REQUIRE(soft.player_label == "S18");
    }
}

TEST_CASE("Session simulation", "[simulator][run]") {
    const StrategyTable strategy = basic_strategy();

    SECTION("Totals are consistent") {
        Simulator simulator(seeded_config(), strategy);
        const SimulationSummary summary = simulator.run_simulations(3000, 100.0);
        REQUIRE(summary.total_games == 3000);
        REQUIRE(summary.wins + summary.losses + summary.pushes == summary.total_games);
        REQUIRE(summary.blackjacks <= summary.wins);
        REQUIRE(summary.total_bet >= 3000 * 100.0);
        REQUIRE_THAT(summary.expected_value, Catch::Matchers::WithinAbs(summary.total_winnings / 3000.0, 1e-9));
        REQUIRE(summary.samples.size() == MAX_SAMPLE_RESULTS);
        REQUIRE(summary.count_stats.empty());

        long cell_games = 0;
        for (const auto& [cell, tally] : summary.cell_stats) {
            cell_games += tally.games;
        }
        REQUIRE(cell_games == 3000);
    }

    SECTION("Same seed, same results") {
        Simulator a(seeded_config(11u), strategy);
        Simulator b(seeded_config(11u), strategy);
        const SimulationSummary sa = a.run_simulations(1000, 10.0);
        const SimulationSummary sb = b.run_simulations(1000, 10.0);
        REQUIRE(sa.total_winnings == sb.total_winnings);
        REQUIRE(sa.wins == sb.wins);
    }

    SECTION("Count statistics when counting") {
        SimulationConfig config = seeded_config();
        config.counting_enabled = true;
        Simulator simulator(config, strategy);
        const SimulationSummary summary = simulator.run_simulations(3000, 1.0);
        REQUIRE(summary.counting_enabled);
        REQUIRE_FALSE(summary.count_stats.empty());
        long hands = 0;
        for (const auto& [count, bucket] : summary.count_stats) {
            hands += bucket.hands;
        }
        REQUIRE(hands == 3000);
    }

    SECTION("Progress per chunk") {
        Simulator simulator(seeded_config(), strategy);
        std::vector<long> reported;
        simulator.run_simulations(1200, 1.0, [&](long done, long) { reported.push_back(done); });
        REQUIRE(reported == std::vector<long>{500, 1000, 1200});
    }

    SECTION("Cancellation between chunks") {
        Simulator simulator(seeded_config(), strategy);
        CancellationToken token;
        const SimulationSummary summary = simulator.run_simulations(
            5000, 1.0, [&](long done, long) { if (done >= 1000) token.cancel(); }, &token);
        REQUIRE(summary.cancelled);
        REQUIRE(summary.total_games == 1000);
    }

    SECTION("Observer sees every hand") {
        Simulator simulator(seeded_config(), strategy);
        long observed = 0;
        simulator.set_hand_observer([&](const GameResult& result) {
            REQUIRE(result.player_cards.size() == 2);
            observed++;
        });
        simulator.run_simulations(700, 1.0);
        const GameResult single = simulator.play_single_hand(5.0);
        REQUIRE(observed == 701);
        REQUIRE(single.total_bet >= 5.0);
    }

    SECTION("The shoe persists across hands") {
        Simulator simulator(seeded_config(), strategy);
        simulator.play_single_hand(1.0);
        const int consumed = simulator.engine().shoe().consumed_cards();
        REQUIRE(consumed >= 4);
        simulator.play_single_hand(1.0);
        REQUIRE(simulator.engine().shoe().consumed_cards() > consumed);
    }
}
