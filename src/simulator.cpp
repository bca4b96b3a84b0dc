#include "bj/simulator.h"
#include "bj/game_utils.hpp"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace bj_solver {

double RowTestResult::expected_value(int dealer_value, Action action) const {
    auto row = summary.find(dealer_value);
    if (row == summary.end()) return 0.0;
    auto cell = row->second.find(action);
    return cell == row->second.end() ? 0.0 : cell->second;
}

long RowTestResult::games(int dealer_value, Action action) const {
    auto row = results.find(dealer_value);
    if (row == results.end()) return 0;
    auto cell = row->second.find(action);
    return cell == row->second.end() ? 0 : cell->second.games;
}

std::vector<Card> representative_hand(const HandKey& key) {
    switch (key.kind) {
        case HandKind::SOFT:
            // As + complément : S13 -> A,2 ... S21 -> A,10
            return {make_card(Rank::ACE), make_card(rank_from_value(key.value - 11))};
        case HandKind::PAIR: {
            const Card c = make_card(rank_from_value(key.value));
            return {c, c};
        }
        case HandKind::HARD:
        default: {
            int first = 0;
            if (key.value >= 10 && key.value <= 20) {
                first = std::min(10, key.value - 5);
            } else {
                first = key.value / 2;
            }
            return {make_card(rank_from_value(first)), make_card(rank_from_value(key.value - first))};
        }
    }
}

std::vector<Action> row_actions(const HandKey& key) {
    if (is_blackjack(representative_hand(key))) {
        return {Action::STAND};
    }
    std::vector<Action> actions = {Action::HIT, Action::STAND};
    if (!(key.kind == HandKind::PAIR && key.value == 11)) {
        actions.push_back(Action::DOUBLE);
    }
    if (key.kind == HandKind::PAIR) {
        actions.push_back(Action::SPLIT);
    }
    return actions;
}

Simulator::Simulator(const SimulationConfig& config, const StrategyTable& strategy)
    : config_(config), strategy_(strategy), engine_(make_engine(config))
{
    if (config.seed) {
        // Graines d'essai distinctes de la suite du sabot principal
        seed_rng_.seed(*config.seed + 1);
    } else {
        std::random_device rd;
        seed_rng_.seed(rd());
    }
}

SimulationSummary Simulator::run_simulations(long num_simulations, double bet_size,
                                             const ProgressCallback& progress,
                                             const CancellationToken* cancel) {
    SimulationSummary summary;
    summary.counting_enabled = engine_.counter() != nullptr;

    spdlog::info("Simulation de {} mains (mise {}, {})...", num_simulations, bet_size, describe_config(config_));

    long done = 0;
    while (done < num_simulations) {
        if (is_cancelled(cancel)) {
            summary.cancelled = true;
            spdlog::info("Simulation annulée après {} mains.", done);
            break;
        }

        const long end = std::min(done + config_.chunk_size, num_simulations);
        for (; done < end; ++done) {
            // Compte relevé avant la distribution
            const int count = engine_.count_level();
            GameResult result = engine_.play_game(strategy_, bet_size);
            if (observer_) {
                observer_(result);
            }
            summary.record(result, count);
        }

        spdlog::debug("Simulation : {}/{} mains.", done, num_simulations);
        if (progress) {
            progress(done, num_simulations);
        }
    }

    summary.finalize();
    spdlog::info("Simulation terminée : {} mains, EV {:.4f}, retour {:.3f}%.",
                 summary.total_games, summary.expected_value, summary.return_rate);
    return summary;
}

RowTestResult Simulator::test_row_actions(const HandKey& key,
                                          const std::vector<int>& dealer_values,
                                          std::optional<int> count_level,
                                          long num_simulations, double bet_size,
                                          const ProgressCallback& progress,
                                          const CancellationToken* cancel) {
    std::vector<Card> dealer_cards;
    dealer_cards.reserve(dealer_values.size());
    for (int value : dealer_values) {
        dealer_cards.push_back(make_card(rank_from_value(value)));
    }
    return run_forced_trials(key, representative_hand(key), dealer_cards, row_actions(key),
                             count_level, num_simulations, bet_size, progress, cancel);
}

RowTestResult Simulator::test_row_actions(const std::string& label,
                                          const std::vector<std::string>& dealer_labels,
                                          std::optional<int> count_level,
                                          long num_simulations, double bet_size,
                                          const ProgressCallback& progress,
                                          const CancellationToken* cancel) {
    std::vector<int> dealer_values;
    dealer_values.reserve(dealer_labels.size());
    for (const std::string& dealer : dealer_labels) {
        dealer_values.push_back(dealer_value_from_label(dealer));
    }
    return test_row_actions(hand_key_from_string(label), dealer_values, count_level,
                            num_simulations, bet_size, progress, cancel);
}

OutcomeTally Simulator::test_cell_action(const HandKey& key, int dealer_value, Action action,
                                         std::optional<int> count_level,
                                         long num_simulations, double bet_size,
                                         const ProgressCallback& progress,
                                         const CancellationToken* cancel) {
    const RowTestResult row = run_forced_trials(key, representative_hand(key),
                                                {make_card(rank_from_value(dealer_value))}, {action},
                                                count_level, num_simulations, bet_size, progress, cancel);
    return row.results.at(dealer_value).at(action);
}

SituationAnalysis Simulator::analyze_situation(const std::string& player_cards,
                                               const std::string& dealer_card,
                                               bool allow_double,
                                               bool allow_split,
                                               long num_simulations,
                                               double bet_size,
                                               const ProgressCallback& progress) {
    SituationAnalysis analysis;
    try {
        analysis.player_cards = parse_card_list(player_cards);
        analysis.dealer_card = card_from_string(dealer_card);
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Analyse de situation : entrée invalide ({}).", e.what());
        analysis.error = "Invalid card input";
        return analysis;
    }

    analysis.can_double = allow_double && can_double(analysis.player_cards);
    analysis.can_split = allow_split && can_split(analysis.player_cards);
    analysis.player_key = hand_key_for(analysis.player_cards, analysis.can_split);
    analysis.player_label = hand_key_to_string(analysis.player_key);

    std::vector<Action> actions = {Action::HIT, Action::STAND};
    if (analysis.can_double) actions.push_back(Action::DOUBLE);
    if (analysis.can_split) actions.push_back(Action::SPLIT);

    spdlog::info("Analyse de {} contre {} ({} essais par action)...",
                 cards_to_string(analysis.player_cards), to_string(analysis.dealer_card), num_simulations);

    const RowTestResult row = run_forced_trials(analysis.player_key, analysis.player_cards,
                                                {analysis.dealer_card}, actions, std::nullopt,
                                                num_simulations, bet_size, progress, nullptr);

    const auto& per_action = row.results.at(analysis.dealer_card.value());
    double best_ev = -std::numeric_limits<double>::infinity();
    for (Action action : actions) {
        const OutcomeTally& tally = per_action.at(action);
        ActionAnalysis a;
        a.action = action;
        a.expected_value = tally.expected_value();
        a.win_rate = tally.win_rate();
        a.return_rate = tally.return_rate();
        a.wins = tally.wins;
        a.losses = tally.losses;
        a.pushes = tally.pushes;
        a.total_games = tally.games;
        analysis.actions[action] = a;

        if (a.expected_value > best_ev) {
            best_ev = a.expected_value;
            analysis.best_action = action;
        }
    }
    analysis.best_expected_value = best_ev;
    return analysis;
}

GameResult Simulator::play_single_hand(double bet_size) {
    GameResult result = engine_.play_game(strategy_, bet_size);
    if (observer_) {
        observer_(result);
    }
    return result;
}

RowTestResult Simulator::run_forced_trials(const HandKey& cell_key,
                                           const std::vector<Card>& player_cards,
                                           const std::vector<Card>& dealer_cards,
                                           const std::vector<Action>& actions,
                                           std::optional<int> count_level,
                                           long num_simulations, double bet_size,
                                           const ProgressCallback& progress,
                                           const CancellationToken* cancel) {
    RowTestResult row;
    row.key = cell_key;
    row.player_cards = player_cards;
    row.actions = actions;

    // Le filtre et la surcharge par compte n'ont de sens qu'avec un compteur
    const bool by_count = count_level.has_value() && config_.counting_enabled;

    // Une copie de stratégie par (croupier, action), cellule testée forcée
    std::map<int, std::map<Action, StrategyTable>> forced_tables;
    for (const Card& dealer : dealer_cards) {
        for (Action action : actions) {
            StrategyTable table = strategy_;
            if (by_count) {
                table.set_count_action(*count_level, cell_key, dealer.value(), action);
            } else {
                table.set_action(cell_key, dealer.value(), action);
            }
            forced_tables[dealer.value()].emplace(action, std::move(table));
            row.results[dealer.value()][action] = OutcomeTally{};
        }
    }

    long done = 0;
    while (done < num_simulations && !row.cancelled) {
        const long end = std::min(done + config_.chunk_size, num_simulations);
        for (; done < end && !row.cancelled; ++done) {
            if (is_cancelled(cancel)) {
                row.cancelled = true;
                break;
            }

            // Sabot neuf privé des cartes du joueur
            GameEngine trial(config_.rules, make_shoe(config_, seed_rng_()), make_counter(config_));
            trial.shoe().set_penetration_threshold(100);
            for (const Card& card : player_cards) {
                trial.shoe().remove_rank(card.rank, trial.counter());
            }

            for (const Card& dealer : dealer_cards) {
                if (is_cancelled(cancel)) {
                    row.cancelled = true;
                    break;
                }

                GameEngine dealer_trial = trial;
                dealer_trial.shoe().remove_rank(dealer.rank, dealer_trial.counter());

                if (by_count && dealer_trial.count_level() != *count_level) {
                    continue;
                }

                for (Action action : actions) {
                    if (is_cancelled(cancel)) {
                        row.cancelled = true;
                        break;
                    }
                    // Même suite de cartes pour chaque action
                    GameEngine action_trial = dealer_trial;
                    const GameResult result = action_trial.play_forced_hand(
                        player_cards, dealer, action, forced_tables.at(dealer.value()).at(action), bet_size, true);
                    // Blackjack du croupier : la décision n'a pas lieu, l'essai est écarté.
                    // Carte cachée identique pour toutes les actions de l'essai.
                    if (is_blackjack({result.dealer_cards[0], result.dealer_cards[1]})) {
                        row.dealer_naturals++;
                        break;
                    }
                    row.results[dealer.value()][action].record(result);
                }
                if (row.cancelled) break;
            }
        }

        if (progress) {
            progress(done, num_simulations);
        }
    }

    for (const auto& [dealer, per_action] : row.results) {
        for (const auto& [action, tally] : per_action) {
            row.summary[dealer][action] = tally.expected_value();
        }
    }

    spdlog::debug("Test {} : {} essais, {} écartés (blackjack croupier){}.", describe_hand_key(cell_key), done,
                  row.dealer_naturals, row.cancelled ? " (annulé)" : "");
    return row;
}

} // namespace bj_solver
