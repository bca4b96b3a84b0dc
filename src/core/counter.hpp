#ifndef BJ_CORE_COUNTER_HPP
#define BJ_CORE_COUNTER_HPP

#include "core/cards.hpp"
#include <array>
#include <string>

namespace bj_solver {

// Systèmes de comptage disponibles
enum class CountingSystem {
    HI_LO,
    HI_OPT_I,
    HI_OPT_II,
    OMEGA_II,
    KO,       // Knockout (non équilibré)
    ACE_FIVE,
    CUSTOM
};

// Poids par rang, indexé par rank_index() (TWO..ACE)
using CountWeights = std::array<int, NUM_RANKS>;

struct CountingSystemInfo {
    std::string  name;
    std::string  description;
    bool         balanced = true;
    CountWeights weights{};
};

// Table de référence des systèmes nommés. Pour CUSTOM les poids sont nuls.
CountingSystemInfo system_info(CountingSystem system);

std::string counting_system_to_string(CountingSystem system);
CountingSystem counting_system_from_string(const std::string& name);

// Un système est équilibré si la somme des poids sur un paquet complet est nulle.
bool is_balanced(const CountWeights& weights);

class Counter {
public:
    explicit Counter(CountingSystem system = CountingSystem::HI_LO);
    Counter(CountingSystem system, const CountWeights& custom_weights);

    // Ajoute le poids de la carte au compte courant. Retourne le delta appliqué.
    int update(const Card& card);

    // Compte vrai = compte courant / paquets restants (0 si plus aucun paquet)
    double true_count(int remaining_cards, int num_decks) const;

    // Compte vrai arrondi : clé des surcharges de stratégie et des statistiques
    int count_range(int remaining_cards, int num_decks) const;

    void reset() { running_count_ = 0; }

    void set_system(CountingSystem system);
    void set_custom_weights(const CountWeights& weights);

    int running_count() const { return running_count_; }
    CountingSystem system() const { return system_; }
    const CountWeights& weights() const { return weights_; }
    bool balanced() const { return balanced_; }

    // Accès test : positionne directement le compte courant
    void set_running_count_for_testing(int running_count) { running_count_ = running_count; }

private:
    CountingSystem system_;
    CountWeights   weights_{};
    bool           balanced_ = true;
    int            running_count_ = 0;
};

} // namespace bj_solver

#endif // BJ_CORE_COUNTER_HPP
