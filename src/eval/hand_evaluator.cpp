#include "eval/hand_evaluator.hpp"

namespace bj_solver {

HandValue evaluate_hand(const std::vector<Card>& cards) {
    int total = 0;
    int soft_aces = 0;

    for (const Card& card : cards) {
        total += card.value();
        if (card.is_ace()) {
            ++soft_aces;
        }
    }

    // Ajustement des As : 11 -> 1
    while (total > 21 && soft_aces > 0) {
        total -= 10;
        --soft_aces;
    }

    return {total, soft_aces > 0 && total <= 21};
}

bool is_blackjack(const std::vector<Card>& cards) {
    return cards.size() == 2 && evaluate_hand(cards).total == 21;
}

bool can_split(const std::vector<Card>& cards) {
    // Comparaison par valeur, pas par rang : 10 et K forment une paire
    return cards.size() == 2 && cards[0].value() == cards[1].value();
}

bool can_double(const std::vector<Card>& cards) {
    return cards.size() == 2;
}

bool is_bust(const std::vector<Card>& cards) {
    return evaluate_hand(cards).total > 21;
}

int pair_value(const std::vector<Card>& cards) {
    return cards.empty() ? 0 : cards[0].value();
}

} // namespace bj_solver
