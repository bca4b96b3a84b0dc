#include "bj/optimizer.h"
#include "bj/game_utils.hpp"
#include "core/cards.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"
#include <limits>
#include <stdexcept>

namespace bj_solver {

namespace {

std::string scope_label(std::optional<int> count_level) {
    if (!count_level) return "Base";
    return fmt::format("TC {:+d}", *count_level);
}

} // namespace

std::vector<HandKey> optimization_rows() {
    std::vector<HandKey> rows;
    for (int total = MAX_HARD_TOTAL; total >= MIN_HARD_TOTAL; --total) {
        rows.push_back(HandKey::hard(total));
    }
    for (int total = MAX_SOFT_TOTAL; total >= MIN_SOFT_TOTAL; --total) {
        rows.push_back(HandKey::soft(total));
    }
    for (int value = MAX_PAIR_VALUE; value >= MIN_PAIR_VALUE; --value) {
        rows.push_back(HandKey::pair(value));
    }
    return rows;
}

std::vector<int> optimization_count_levels() {
    return {-4, -3, -2, -1, 0, 1, 2, 3, 4};
}

StrategyOptimizer::StrategyOptimizer(const SimulationConfig& config, StrategyTable& strategy)
    : strategy_(strategy), simulator_(config, strategy) {}

Action StrategyOptimizer::current_action(const HandKey& key, int dealer, std::optional<int> count_level) const {
    if (count_level) {
        if (auto action = strategy_.get_count_action(*count_level, key, dealer)) {
            return *action;
        }
    }
    return strategy_.get_action(key, dealer).value_or(Action::STAND);
}

OptimizationReport StrategyOptimizer::optimize_strategy(std::optional<int> count_level,
                                                        long num_simulations, double bet_size,
                                                        const OptimizationProgress& progress,
                                                        const CancellationToken* cancel) {
    const std::vector<HandKey> rows = optimization_rows();
    const std::vector<int> dealers(DEALER_CARD_VALUES.begin(), DEALER_CARD_VALUES.end());

    OptimizationReport report;
    report.total_cells = static_cast<int>(rows.size() * dealers.size());

    // La couche par compte n'est écrite qu'en mode "count based" avec comptage actif
    const bool by_count = strategy_.count_based() && simulator_.config().counting_enabled;
    const std::optional<int> target = by_count ? count_level : std::nullopt;

    spdlog::info("Optimisation de {} cellules ({}), {} essais par ligne...",
                 report.total_cells, scope_label(target), num_simulations);

    for (const HandKey& key : rows) {
        if (is_cancelled(cancel)) {
            report.cancelled = true;
            break;
        }

        const int cells_done = report.cells_tested + report.cells_skipped;
        const double row_start = 100.0 * cells_done / report.total_cells;
        const std::string row_name = describe_hand_key(key);
        if (progress) {
            progress("Testing row: " + row_name + " vs all dealers...", row_start);
        }

        const RowTestResult row = simulator_.test_row_actions(key, dealers, target, num_simulations, bet_size,
                                                              {}, cancel);
        if (row.cancelled) {
            report.cancelled = true;
            break;
        }

        int row_tested = 0;
        for (int dealer : dealers) {
            Action best_action = Action::STAND;
            double best_ev = -std::numeric_limits<double>::infinity();
            bool any_trial = false;
            for (Action action : row.actions) {
                if (row.games(dealer, action) == 0) continue;
                any_trial = true;
                const double ev = row.expected_value(dealer, action);
                if (ev > best_ev) {
                    best_ev = ev;
                    best_action = action;
                }
            }
            // Tous les essais filtrés par le compte : cellule inchangée
            if (!any_trial) {
                report.cells_skipped++;
                continue;
            }
            report.cells_tested++;
            row_tested++;

            const Action current = current_action(key, dealer, target);
            if (best_action == current) continue;

            StrategyChange change;
            change.key = key;
            change.dealer = dealer;
            change.count_level = target;
            change.from = current;
            change.to = best_action;
            change.expected_value = best_ev;
            change.message = fmt::format("{} vs {}: {} -> {} ({}, EV {:+.4f})", row_name,
                                         dealer_label_from_value(dealer), action_to_string(current),
                                         action_to_string(best_action), scope_label(target), best_ev);

            if (target) {
                strategy_.set_count_action(*target, key, dealer, best_action);
            } else {
                strategy_.set_action(key, dealer, best_action);
            }
            spdlog::debug("{}", change.message);
            report.changes.push_back(std::move(change));
            report.changes_made++;
        }

        if (row_tested == 0) {
            spdlog::warn("Ligne {} ({}) : aucun essai au compte demandé, ligne inchangée.",
                         row_name, scope_label(target));
        }
        spdlog::info("Ligne {} optimisée ({}/{} cellules, {} changements).",
                     row_name, report.cells_tested, report.total_cells, report.changes_made);
        if (progress) {
            progress("Row " + row_name + " done",
                     100.0 * (report.cells_tested + report.cells_skipped) / report.total_cells);
        }
    }

    if (target) {
        report.changes_by_level[*target] = report.changes_made;
    }

    spdlog::info("Optimisation {} : {}/{} cellules testées, {} sans essai, {} changements.",
                 report.cancelled ? "annulée" : "terminée",
                 report.cells_tested, report.total_cells, report.cells_skipped, report.changes_made);
    return report;
}

OptimizationReport StrategyOptimizer::optimize_all_count_levels(long num_simulations, double bet_size,
                                                                const OptimizationProgress& progress,
                                                                const CancellationToken* cancel) {
    if (!strategy_.count_based() || !simulator_.config().counting_enabled) {
        throw std::invalid_argument("Count-based strategy mode must be enabled to optimize all count levels");
    }

    const std::vector<int> levels = optimization_count_levels();
    OptimizationReport total;

    for (size_t i = 0; i < levels.size(); ++i) {
        const int level = levels[i];
        if (is_cancelled(cancel)) {
            total.cancelled = true;
            break;
        }

        const double level_start = 100.0 * static_cast<double>(i) / levels.size();
        const double level_span = 100.0 / levels.size();
        auto level_progress = [&](const std::string& status, double percent) {
            if (progress) {
                progress(scope_label(level) + " - " + status, level_start + level_span * percent / 100.0);
            }
        };

        OptimizationReport report = optimize_strategy(level, num_simulations, bet_size, level_progress, cancel);

        total.total_cells += report.total_cells;
        total.cells_tested += report.cells_tested;
        total.cells_skipped += report.cells_skipped;
        total.changes_made += report.changes_made;
        total.changes_by_level[level] = report.changes_made;
        for (StrategyChange& change : report.changes) {
            total.changes.push_back(std::move(change));
        }
        if (report.cancelled) {
            total.cancelled = true;
            break;
        }
    }

    if (progress && !total.cancelled) {
        progress("All count levels done", 100.0);
    }
    return total;
}

} // namespace bj_solver
