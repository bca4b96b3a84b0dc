#ifndef BJ_SIMULATION_STATS_H
#define BJ_SIMULATION_STATS_H

#include "bj/common_types.h"
#include "bj/game_engine.h"
#include <atomic>
#include <functional>
#include <map>
#include <vector>

namespace bj_solver {

// Compteurs d'issues pour un ensemble de mains (cellule, action testée...)
struct OutcomeTally {
    long   games          = 0;
    long   wins           = 0; // Blackjacks inclus
    long   losses         = 0;
    long   pushes         = 0;
    double total_winnings = 0.0;
    double total_bet      = 0.0;

    void record(const GameResult& result);
    void merge(const OutcomeTally& other);

    double expected_value() const { return games > 0 ? total_winnings / games : 0.0; }
    double win_rate() const { return games > 0 ? static_cast<double>(wins) / games * 100.0 : 0.0; }
    double return_rate() const { return total_bet > 0.0 ? total_winnings / total_bet * 100.0 : 0.0; }
};

// Cellule observée : main initiale, carte croupier, première action, compte arrondi
struct CellKey {
    HandKey hand;
    int     dealer = 0;
    Action  action = Action::STAND;
    int     count  = 0;

    bool operator<(const CellKey& other) const;
};

// Statistiques par niveau de compte
struct CountBucket {
    long   hands          = 0;
    double total_winnings = 0.0;

    double average_ev() const { return hands > 0 ? total_winnings / hands : 0.0; }
};

constexpr size_t MAX_SAMPLE_RESULTS = 100;

struct SimulationSummary {
    long   total_games    = 0;
    long   wins           = 0; // Blackjacks inclus
    long   losses         = 0;
    long   pushes         = 0;
    long   blackjacks     = 0;
    double total_winnings = 0.0;
    double total_bet      = 0.0;

    // Calculés par finalize()
    double expected_value = 0.0;
    double win_rate       = 0.0;
    double return_rate    = 0.0;

    std::map<CellKey, OutcomeTally> cell_stats;
    bool                            counting_enabled = false;
    std::map<int, CountBucket>      count_stats;     // Vide sans comptage
    std::vector<GameResult>         samples;         // Premières mains jouées
    bool                            cancelled = false;

    // count : compte vrai arrondi avant la main (0 sans comptage)
    void record(const GameResult& result, int count);
    // Réduction associative : sommes et dictionnaires fusionnés
    void merge(const SimulationSummary& other);
    void finalize();
};

// Progression : (réalisé, total)
using ProgressCallback = std::function<void(long, long)>;
// Appelé avec chaque main terminée
using HandObserver = std::function<void(const GameResult&)>;

// Jeton d'annulation coopérative, consulté entre deux mains
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    void reset() { cancelled_.store(false); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancellationToken* token) {
    return token != nullptr && token->is_cancelled();
}

} // namespace bj_solver

#endif // BJ_SIMULATION_STATS_H
