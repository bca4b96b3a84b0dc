#ifndef BJ_COMMON_TYPES_H
#define BJ_COMMON_TYPES_H

#include <array>
#include <cstdint>

namespace bj_solver {

// Actions du joueur (codes d'une lettre H/S/D/P dans les tables)
enum class Action : uint8_t {
    HIT,
    STAND,
    DOUBLE,
    SPLIT
};

// Type de ligne d'une table de stratégie
enum class HandKind : uint8_t {
    HARD,
    SOFT,
    PAIR
};

// Clé d'une ligne de table : Hard(5..21) | Soft(13..21) | Pair(2..11, 11 = As)
struct HandKey {
    HandKind kind  = HandKind::HARD;
    int      value = 0;

    static constexpr HandKey hard(int total) { return HandKey{HandKind::HARD, total}; }
    static constexpr HandKey soft(int total) { return HandKey{HandKind::SOFT, total}; }
    static constexpr HandKey pair(int card_value) { return HandKey{HandKind::PAIR, card_value}; }

    bool operator<(const HandKey& other) const {
        if (kind != other.kind) return static_cast<int>(kind) < static_cast<int>(other.kind);
        return value < other.value;
    }

    bool operator==(const HandKey& other) const {
        return kind == other.kind && value == other.value;
    }
    bool operator!=(const HandKey& other) const { return !(*this == other); }
};

// Bornes des lignes de table
constexpr int MIN_HARD_TOTAL = 5;
constexpr int MAX_HARD_TOTAL = 21;
constexpr int MIN_SOFT_TOTAL = 13;
constexpr int MAX_SOFT_TOTAL = 21;
constexpr int MIN_PAIR_VALUE = 2;
constexpr int MAX_PAIR_VALUE = 11;

// Colonnes croupier, par valeur blackjack (11 = As)
constexpr int NUM_DEALER_CARDS = 10;
constexpr std::array<int, NUM_DEALER_CARDS> DEALER_CARD_VALUES = {2, 3, 4, 5, 6, 7, 8, 9, 10, 11};

// Paiement du blackjack naturel
enum class BlackjackPayout : uint8_t {
    THREE_TO_TWO,
    SIX_TO_FIVE,
    ONE_TO_ONE
};

inline double payout_ratio(BlackjackPayout payout) {
    switch (payout) {
        case BlackjackPayout::THREE_TO_TWO: return 1.5;
        case BlackjackPayout::SIX_TO_FIVE:  return 1.2;
        default:                            return 1.0;
    }
}

// Règles de table, immuables pendant une simulation
struct Rules {
    bool            dealer_hits_soft_17 = false; // false = "17s" (reste sur tous les 17)
    bool            double_after_split  = true;
    bool            allow_resplit       = true;
    bool            resplit_aces        = false;
    BlackjackPayout blackjack_payout    = BlackjackPayout::THREE_TO_TWO;
};

// Issue d'une main complète
enum class Outcome : uint8_t {
    WIN,
    LOSE,
    PUSH,
    BLACKJACK
};

} // namespace bj_solver

#endif // BJ_COMMON_TYPES_H
