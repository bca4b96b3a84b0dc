#ifndef BJ_HAND_EVALUATOR_HPP
#define BJ_HAND_EVALUATOR_HPP

#include <vector>

#include "core/cards.hpp"

namespace bj_solver {

// Valeur d'une main : total et indicateur "soft" (au moins un As compté 11)
struct HandValue {
    int  total   = 0;
    bool is_soft = false;

    bool operator==(const HandValue& other) const {
        return total == other.total && is_soft == other.is_soft;
    }
};

// --- Interface de l'évaluateur ---

/**
 * @brief Calcule la valeur d'une main.
 * Chaque As compte d'abord 11 ; tant que le total dépasse 21 et qu'un As compte
 * encore 11, il repasse à 1.
 * @param cards Cartes de la main (ordre indifférent).
 * @return Le total et is_soft (vrai si un As compte encore 11 et total <= 21).
 */
HandValue evaluate_hand(const std::vector<Card>& cards);

/**
 * @brief Blackjack naturel : exactement 2 cartes valant 21.
 */
bool is_blackjack(const std::vector<Card>& cards);

/**
 * @brief Paire séparable : 2 cartes de même valeur blackjack (10 et Roi inclus).
 */
bool can_split(const std::vector<Card>& cards);

/**
 * @brief Doublement possible structurellement : exactement 2 cartes.
 */
bool can_double(const std::vector<Card>& cards);

bool is_bust(const std::vector<Card>& cards);

// Valeur de paire normalisée (2..11, 11 = As). Suppose can_split(cards).
int pair_value(const std::vector<Card>& cards);

} // namespace bj_solver

#endif // BJ_HAND_EVALUATOR_HPP
