#include "bj/game_engine.h"
#include "bj/game_utils.hpp"
#include "eval/hand_evaluator.hpp"
#include "spdlog/spdlog.h"
#include <utility>

namespace bj_solver {

GameEngine::GameEngine(const Rules& rules, int num_decks, std::optional<uint32_t> seed)
    : rules_(rules), shoe_(num_decks, seed) {}

GameEngine::GameEngine(const Rules& rules, Shoe shoe, std::optional<Counter> counter)
    : rules_(rules), shoe_(std::move(shoe)), counter_(std::move(counter)) {}

void GameEngine::enable_counting(const Counter& counter) {
    counter_ = counter;
}

Card GameEngine::draw() {
    return shoe_.draw(counter());
}

double GameEngine::true_count() const {
    if (!counter_) return 0.0;
    return counter_->true_count(shoe_.remaining_cards(), shoe_.num_decks());
}

int GameEngine::count_level() const {
    if (!counter_) return 0;
    return counter_->count_range(shoe_.remaining_cards(), shoe_.num_decks());
}

GameResult GameEngine::play_game(const StrategyTable& strategy, double bet_size) {
    if (shoe_.should_reshuffle()) {
        spdlog::debug("GameEngine: pénétration {:.1f}% atteinte, remélange du sabot.", shoe_.penetration());
        shoe_.shuffle(counter());
    }

    GameResult result;
    result.player_cards = {draw(), draw()};
    result.dealer_cards = {draw(), draw()};
    result.dealer_up_card = result.dealer_cards[0];
    result.initial_key = hand_key_for(result.player_cards, true);
    result.hands.push_back(PlayerHand{result.player_cards, 1.0, false});

    if (resolve_naturals(result, bet_size)) {
        return result;
    }

    play_player_hands(result, strategy, true, std::nullopt);
    settle(result, bet_size);
    return result;
}

GameResult GameEngine::play_forced_hand(const std::vector<Card>& player_cards,
                                        const Card& dealer_up_card,
                                        std::optional<Action> forced_action,
                                        const StrategyTable& strategy,
                                        double bet_size,
                                        bool can_double) {
    GameResult result;
    result.player_cards = player_cards;
    result.dealer_cards = {dealer_up_card, draw()};
    result.dealer_up_card = dealer_up_card;
    result.initial_key = hand_key_for(player_cards, true);
    result.hands.push_back(PlayerHand{player_cards, 1.0, false});

    if (resolve_naturals(result, bet_size)) {
        return result;
    }

    play_player_hands(result, strategy, can_double, forced_action);
    settle(result, bet_size);
    return result;
}

std::vector<Card> GameEngine::play_dealer(std::vector<Card> dealer_cards) {
    while (true) {
        const HandValue hv = evaluate_hand(dealer_cards);
        if (hv.total > 21) break;

        // "17s" : reste sur tous les 17. H17 : un soft 17 doit encore tirer.
        const int stand_value = (rules_.dealer_hits_soft_17 && hv.is_soft && hv.total == 17) ? 18 : 17;
        if (hv.total >= stand_value) break;

        dealer_cards.push_back(draw());
    }
    return dealer_cards;
}

bool GameEngine::resolve_naturals(GameResult& result, double bet_size) const {
    const bool player_bj = is_blackjack(result.player_cards);
    const bool dealer_bj = is_blackjack(result.dealer_cards);
    if (!player_bj && !dealer_bj) {
        return false;
    }

    result.total_bet = bet_size;
    if (player_bj && dealer_bj) {
        result.outcome = Outcome::PUSH;
        result.winnings = 0.0;
    } else if (player_bj) {
        result.outcome = Outcome::BLACKJACK;
        result.winnings = bet_size * payout_ratio(rules_.blackjack_payout);
    } else {
        result.outcome = Outcome::LOSE;
        result.winnings = -bet_size;
        result.hands[0].lost = true;
    }
    spdlog::trace("Naturel : joueur {} croupier {} -> {} ({})", cards_to_string(result.player_cards),
                  cards_to_string(result.dealer_cards), outcome_to_string(result.outcome), result.winnings);
    return true;
}

void GameEngine::play_player_hands(GameResult& result,
                                   const StrategyTable& strategy,
                                   bool can_double_first,
                                   std::optional<Action> forced_action) {
    std::vector<PlayerHand>& hands = result.hands;
    const int dealer_value = result.dealer_up_card.value();
    bool first_decision_made = false;

    // Les mains issues d'un split sont ajoutées en fin de liste et jouées ensuite
    for (size_t i = 0; i < hands.size(); ++i) {
        while (true) {
            // Référence reprise à chaque tour : un split peut réallouer le vecteur
            PlayerHand& hand = hands[i];
            const HandValue hv = evaluate_hand(hand.cards);
            if (hv.total >= 21) break;

            const bool is_pair = can_split(hand.cards);
            const bool has_split = hands.size() > 1;
            const bool is_ace_pair = is_pair && hand.cards[0].is_ace();
            const bool resplit_ok = !has_split || (is_ace_pair ? rules_.resplit_aces : rules_.allow_resplit);
            const bool split_eligible = is_pair && resplit_ok;
            const bool double_eligible = can_double(hand.cards) &&
                                         (has_split ? rules_.double_after_split : can_double_first);

            Action action = Action::STAND;
            if (i == 0 && !first_decision_made && forced_action) {
                action = *forced_action;
            } else {
                const HandKey key = hand_key_for(hand.cards, split_eligible);
                action = strategy.lookup(key, dealer_value, double_eligible, split_eligible, count_level());
            }

            // Action impossible ici : on tire une carte
            if ((action == Action::DOUBLE && !double_eligible) || (action == Action::SPLIT && !split_eligible)) {
                action = Action::HIT;
            }

            if (i == 0 && !first_decision_made) {
                result.initial_action = action;
                first_decision_made = true;
            }

            if (action == Action::STAND) {
                break;
            }

            if (action == Action::HIT) {
                hand.cards.push_back(draw());
                if (is_bust(hand.cards)) {
                    hand.lost = true;
                    break;
                }
                continue;
            }

            if (action == Action::DOUBLE) {
                hand.bet *= 2.0;
                hand.cards.push_back(draw());
                if (is_bust(hand.cards)) {
                    hand.lost = true;
                }
                break;
            }

            // Split : la seconde carte part dans une nouvelle main de même mise
            const Card moved = hand.cards.back();
            hand.cards.pop_back();
            PlayerHand split_hand{{moved, draw()}, hand.bet, false};
            hand.cards.push_back(draw());
            hands.push_back(std::move(split_hand));
            // La main courante continue
        }
    }
}

void GameEngine::settle(GameResult& result, double bet_size) {
    result.dealer_cards = play_dealer(std::move(result.dealer_cards));
    const int dealer_total = evaluate_hand(result.dealer_cards).total;
    const bool dealer_bust = dealer_total > 21;

    double winnings = 0.0;
    double bet_units = 0.0;
    for (const PlayerHand& hand : result.hands) {
        bet_units += hand.bet;
        const double stake = bet_size * hand.bet;
        const int player_total = evaluate_hand(hand.cards).total;

        if (hand.lost || player_total > 21) {
            winnings -= stake;
        } else if (dealer_bust || player_total > dealer_total) {
            winnings += stake;
        } else if (player_total < dealer_total) {
            winnings -= stake;
        }
        // Égalité : mise rendue
    }

    result.winnings = winnings;
    result.total_bet = bet_size * bet_units;
    if (winnings > 0.0) {
        result.outcome = Outcome::WIN;
    } else if (winnings < 0.0) {
        result.outcome = Outcome::LOSE;
    } else {
        result.outcome = Outcome::PUSH;
    }

    spdlog::trace("Main : joueur {} ({} mains, action {}) croupier {} -> {} ({})",
                  cards_to_string(result.player_cards), result.hands.size(),
                  action_to_string(result.initial_action), cards_to_string(result.dealer_cards),
                  outcome_to_string(result.outcome), winnings);
}

} // namespace bj_solver
