#ifndef BJ_SIMULATOR_H
#define BJ_SIMULATOR_H

#include "bj/common_types.h"
#include "bj/config.h"
#include "bj/game_engine.h"
#include "bj/simulation_stats.h"
#include "bj/strategy_table.h"
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace bj_solver {

// Résultat d'un test de ligne : tally et EV par (carte croupier, action)
struct RowTestResult {
    HandKey             key;
    std::vector<Card>   player_cards; // Main représentative jouée
    std::vector<Action> actions;
    std::map<int, std::map<Action, OutcomeTally>> results;
    std::map<int, std::map<Action, double>>       summary; // EV par main
    long dealer_naturals = 0; // Essais écartés : blackjack du croupier
    bool cancelled = false;

    // EV d'une cellule, 0 si elle n'a pas été testée
    double expected_value(int dealer_value, Action action) const;
    long games(int dealer_value, Action action) const;
};

struct ActionAnalysis {
    Action action          = Action::STAND;
    double expected_value  = 0.0;
    double win_rate        = 0.0;
    double return_rate     = 0.0;
    long   wins            = 0;
    long   losses          = 0;
    long   pushes          = 0;
    long   total_games     = 0;
};

// Analyse d'une situation précise. error non vide si l'entrée est invalide.
struct SituationAnalysis {
    std::string error;

    std::vector<Card> player_cards;
    Card              dealer_card;
    HandKey           player_key;
    std::string       player_label;
    bool              can_double = false;
    bool              can_split  = false;

    std::map<Action, ActionAnalysis> actions;
    std::optional<Action>            best_action;
    double                           best_expected_value = 0.0;

    bool ok() const { return error.empty(); }
};

// Main représentative d'une ligne : S18 -> A,7 ; paire -> la paire ;
// hard 10..20 -> min(10, v-5) + reste ; sinon deux moitiés.
std::vector<Card> representative_hand(const HandKey& key);

// Actions testées pour une ligne : H, S, D (sauf A,A), P pour les paires.
// Un blackjack naturel n'est testé qu'en Stand.
std::vector<Action> row_actions(const HandKey& key);

// Session de simulation : un moteur (sabot + compteur persistants entre les mains)
// et une stratégie de référence, partagée avec l'appelant.
class Simulator {
public:
    Simulator(const SimulationConfig& config, const StrategyTable& strategy);

    /**
     * @brief Joue n mains consécutives sur le sabot de la session.
     * Traitement par paquets de config.chunk_size mains ; la progression est
     * signalée et l'annulation consultée entre deux paquets.
     */
    SimulationSummary run_simulations(long num_simulations, double bet_size,
                                      const ProgressCallback& progress = {},
                                      const CancellationToken* cancel = nullptr);

    /**
     * @brief Évalue toutes les actions d'une ligne contre plusieurs cartes croupier.
     * Chaque essai part d'un sabot neuf privé des cartes connues ; toutes les
     * actions d'un même essai voient la même suite de cartes. La cellule testée
     * est forcée dans une copie de la stratégie (couche du niveau de compte si
     * count_level est fourni et le comptage actif, table de base sinon).
     * Avec un niveau de compte, les essais dont le compte vrai arrondi diffère
     * sont ignorés. Les essais où le croupier a un blackjack sont écartés :
     * l'EV est celle d'une décision réellement jouée.
     */
    RowTestResult test_row_actions(const HandKey& key,
                                   const std::vector<int>& dealer_values,
                                   std::optional<int> count_level,
                                   long num_simulations, double bet_size,
                                   const ProgressCallback& progress = {},
                                   const CancellationToken* cancel = nullptr);

    // Variante à libellés externes ("16", "S18", "A,A" ; croupier "2".."10", "A")
    RowTestResult test_row_actions(const std::string& label,
                                   const std::vector<std::string>& dealer_labels,
                                   std::optional<int> count_level,
                                   long num_simulations, double bet_size,
                                   const ProgressCallback& progress = {},
                                   const CancellationToken* cancel = nullptr);

    // Une seule cellule, une seule action
    OutcomeTally test_cell_action(const HandKey& key, int dealer_value, Action action,
                                  std::optional<int> count_level,
                                  long num_simulations, double bet_size,
                                  const ProgressCallback& progress = {},
                                  const CancellationToken* cancel = nullptr);

    // Cartes libres ("A,7", "10,6,2") contre une carte croupier. Ne lève pas :
    // une entrée invalide donne error == "Invalid card input".
    SituationAnalysis analyze_situation(const std::string& player_cards,
                                        const std::string& dealer_card,
                                        bool allow_double = true,
                                        bool allow_split = true,
                                        long num_simulations = 10000,
                                        double bet_size = 100.0,
                                        const ProgressCallback& progress = {});

    // Une main complète sur le sabot de la session
    GameResult play_single_hand(double bet_size);

    void set_hand_observer(HandObserver observer) { observer_ = std::move(observer); }

    GameEngine& engine() { return engine_; }
    const SimulationConfig& config() const { return config_; }

private:
    // Primitive commune aux tests de ligne, de cellule et à l'analyse de situation
    RowTestResult run_forced_trials(const HandKey& cell_key,
                                    const std::vector<Card>& player_cards,
                                    const std::vector<Card>& dealer_cards,
                                    const std::vector<Action>& actions,
                                    std::optional<int> count_level,
                                    long num_simulations, double bet_size,
                                    const ProgressCallback& progress,
                                    const CancellationToken* cancel);

    SimulationConfig     config_;
    const StrategyTable& strategy_;
    GameEngine           engine_;
    std::mt19937         seed_rng_; // Graines des sabots d'essai
    HandObserver         observer_;
};

} // namespace bj_solver

#endif // BJ_SIMULATOR_H
