#ifndef BJ_CARDS_HPP
#define BJ_CARDS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept> // Pour std::invalid_argument

namespace bj_solver {

// Enum pour les rangs. Les figures restent distinctes (utile pour les systèmes
// de comptage personnalisés), seule la valeur blackjack les regroupe.
enum class Rank : uint8_t {
    TWO = 0, THREE = 1, FOUR = 2, FIVE = 3, SIX = 4, SEVEN = 5, EIGHT = 6,
    NINE = 7, TEN = 8, JACK = 9, QUEEN = 10, KING = 11, ACE = 12
};

constexpr int NUM_RANKS       = 13;
constexpr int CARDS_PER_DECK  = 52;
constexpr int CARDS_PER_RANK  = 4; // Par paquet

// Valeur blackjack d'un rang : As = 11, figures = 10, sinon valeur faciale.
constexpr int rank_value(Rank r) {
    switch (r) {
        case Rank::ACE:   return 11;
        case Rank::TEN:
        case Rank::JACK:
        case Rank::QUEEN:
        case Rank::KING:  return 10;
        default:          return static_cast<int>(r) + 2;
    }
}

constexpr int rank_index(Rank r) { return static_cast<int>(r); }

// Une carte est immuable une fois tirée : seul le rang compte au blackjack.
struct Card {
    Rank rank = Rank::TWO;

    constexpr int  value()  const { return rank_value(rank); }
    constexpr bool is_ace() const { return rank == Rank::ACE; }

    constexpr bool operator==(const Card& other) const { return rank == other.rank; }
    constexpr bool operator!=(const Card& other) const { return rank != other.rank; }
};

constexpr Card make_card(Rank r) { return Card{r}; }

// Tous les rangs dans l'ordre de l'enum (pratique pour construire un sabot)
constexpr std::array<Rank, NUM_RANKS> ALL_RANKS = {
    Rank::TWO, Rank::THREE, Rank::FOUR, Rank::FIVE, Rank::SIX, Rank::SEVEN, Rank::EIGHT,
    Rank::NINE, Rank::TEN, Rank::JACK, Rank::QUEEN, Rank::KING, Rank::ACE
};

// Fonctions de conversion string <-> Rank/Card
// Libellés: "2".."10", "J", "Q", "K", "A". En entrée "T" et "ACE" sont acceptés.
std::string to_string(Rank r);
std::string to_string(const Card& c);

Rank rank_from_string(const std::string& s);
Card card_from_string(const std::string& s);

// Rang représentatif d'une valeur blackjack (2..11, 10 -> TEN, 11 -> ACE)
Rank rank_from_value(int value);

// Découpe "A, 10,K" en cartes. Lève std::invalid_argument sur un jeton invalide.
std::vector<Card> parse_card_list(const std::string& s);

// Libellé colonne croupier : "2".."10", "A" (toute carte de valeur 10 -> "10")
std::string dealer_label(const Card& up_card);
std::string dealer_label_from_value(int value);
int dealer_value_from_label(const std::string& label);

std::string cards_to_string(const std::vector<Card>& cards);

} // namespace bj_solver

#endif // BJ_CARDS_HPP
