#ifndef BJ_GAME_ENGINE_H
#define BJ_GAME_ENGINE_H

#include "bj/common_types.h"
#include "bj/strategy_table.h"
#include "core/cards.hpp"
#include "core/counter.hpp"
#include "core/shoe.hpp"
#include <optional>
#include <vector>

namespace bj_solver {

// Une main du joueur (plusieurs après un split)
struct PlayerHand {
    std::vector<Card> cards;
    double bet  = 1.0;   // Multiplicateur de mise (2 après un double)
    bool   lost = false; // Perdue avant l'abattage (dépassement)
};

// Résultat d'une main complète
struct GameResult {
    Outcome           outcome   = Outcome::PUSH;
    double            winnings  = 0.0; // Gain net, en unités de mise
    double            total_bet = 0.0; // Somme misée, splits et doubles compris
    std::vector<Card> player_cards;    // Les deux cartes initiales
    std::vector<Card> dealer_cards;    // Main finale du croupier
    Card              dealer_up_card;
    std::vector<PlayerHand> hands;     // Mains finales du joueur

    // Première décision, pour l'attribution aux cellules
    HandKey initial_key;
    Action  initial_action = Action::STAND;
};

// Orchestration d'une main : distribution, blackjacks, mains du joueur, croupier, paiement.
// Le moteur possède son sabot et son compteur (optionnel) ; copier un moteur copie
// leur état, y compris le générateur aléatoire.
class GameEngine {
public:
    explicit GameEngine(const Rules& rules, int num_decks = 6, std::optional<uint32_t> seed = std::nullopt);
    GameEngine(const Rules& rules, Shoe shoe, std::optional<Counter> counter = std::nullopt);

    // Joue une main complète. Remélange d'abord si le sabot l'exige.
    GameResult play_game(const StrategyTable& strategy, double bet_size = 100.0);

    /**
     * @brief Joue une main à partir de cartes connues.
     * La carte cachée du croupier est tirée du sabot. Si forced_action est fourni,
     * il remplace la première décision de la main initiale ; la suite (y compris
     * les mains issues d'un split) suit la stratégie.
     * @param can_double Doublement autorisé sur la main initiale.
     */
    GameResult play_forced_hand(const std::vector<Card>& player_cards,
                                const Card& dealer_up_card,
                                std::optional<Action> forced_action,
                                const StrategyTable& strategy,
                                double bet_size,
                                bool can_double = true);

    // Tire jusqu'à ce que le croupier reste (17, ou 18 sur un soft 17 en H17) ou dépasse.
    std::vector<Card> play_dealer(std::vector<Card> dealer_cards);

    Card draw();

    double true_count() const;
    int count_level() const; // Compte vrai arrondi, 0 sans compteur

    void enable_counting(const Counter& counter);
    void disable_counting() { counter_.reset(); }

    Shoe& shoe() { return shoe_; }
    const Shoe& shoe() const { return shoe_; }
    Counter* counter() { return counter_ ? &*counter_ : nullptr; }
    const Counter* counter() const { return counter_ ? &*counter_ : nullptr; }
    const Rules& rules() const { return rules_; }

private:
    // Règle les blackjacks naturels. Retourne vrai si la main est terminée.
    bool resolve_naturals(GameResult& result, double bet_size) const;

    void play_player_hands(GameResult& result,
                           const StrategyTable& strategy,
                           bool can_double_first,
                           std::optional<Action> forced_action);

    void settle(GameResult& result, double bet_size);

    Rules                  rules_;
    Shoe                   shoe_;
    std::optional<Counter> counter_;
};

} // namespace bj_solver

#endif // BJ_GAME_ENGINE_H
