#ifndef BJ_CORE_SHOE_HPP
#define BJ_CORE_SHOE_HPP

#include "core/cards.hpp"
#include <cstdint>
#include <optional>
#include <random>   // Pour std::mt19937
#include <vector>

namespace bj_solver {

class Counter;

// Sabot multi-paquets. Les cartes sont tirées depuis la fin de cards_.
// Invariant : cards_.size() + consumed_.size() == num_decks * 52 entre deux mélanges.
class Shoe {
public:
    static constexpr int MIN_DECKS = 1;
    static constexpr int MAX_DECKS = 8;
    static constexpr int DEFAULT_PENETRATION = 75;

    explicit Shoe(int num_decks = 6, std::optional<uint32_t> seed = std::nullopt);
    ~Shoe() = default;

    // Reconstruit num_decks * 52 cartes, mélange (Fisher-Yates via std::shuffle),
    // remet la pénétration à 0 et le compteur éventuel à 0.
    void shuffle(Counter* counter = nullptr);

    // Tire une carte. Sabot vide : remélange silencieux puis tire.
    Card draw(Counter* counter = nullptr);

    // Vrai quand la pénétration atteint le seuil ET qu'il reste moins d'un paquet.
    // Le remélange n'a lieu qu'entre deux mains.
    bool should_reshuffle() const;

    void set_penetration_threshold(int percentage);

    // Retire une carte du rang donné (cartes connues avant une simulation).
    // La carte passe dans les cartes consommées. Faux si aucune n'est disponible.
    bool remove_rank(Rank rank, Counter* counter = nullptr);

    int    num_decks() const { return num_decks_; }
    int    total_cards() const { return num_decks_ * CARDS_PER_DECK; }
    int    remaining_cards() const { return static_cast<int>(cards_.size()); }
    int    consumed_cards() const { return static_cast<int>(consumed_.size()); }
    double penetration() const { return penetration_; }
    int    penetration_threshold() const { return penetration_threshold_; }
    int    shuffle_count() const { return shuffle_count_; }

    // Fixe l'ordre de distribution : deal_order[0] sortira en premier.
    // Le reste du sabot est vidé ; un épuisement déclenchera un vrai mélange.
    void stack_for_testing(const std::vector<Card>& deal_order);

private:
    void update_penetration();

    int               num_decks_;
    std::vector<Card> cards_;
    std::vector<Card> consumed_;
    double            penetration_ = 0.0;
    int               penetration_threshold_ = DEFAULT_PENETRATION;
    int               shuffle_count_ = 0;
    std::mt19937      rng_;
};

} // namespace bj_solver

#endif // BJ_CORE_SHOE_HPP
