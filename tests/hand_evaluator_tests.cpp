#include <catch2/catch_test_macros.hpp>
#include "eval/hand_evaluator.hpp"
#include "core/cards.hpp"
#include <vector>

using namespace bj_solver;

namespace {
std::vector<Card> hand(const std::string& s) { return parse_card_list(s); }
}

TEST_CASE("Hand value", "[evaluator]") {
    SECTION("Hard totals") {
        REQUIRE(evaluate_hand(hand("10,6")) == HandValue{16, false});
        REQUIRE(evaluate_hand(hand("K,Q")) == HandValue{20, false});
        REQUIRE(evaluate_hand(hand("2,3,4")) == HandValue{9, false});
    }

    SECTION("Soft totals") {
        REQUIRE(evaluate_hand(hand("A,6")) == HandValue{17, true});
        REQUIRE(evaluate_hand(hand("A,A")) == HandValue{12, true});
        REQUIRE(evaluate_hand(hand("A,2,3")) == HandValue{16, true});
    }

    SECTION("Aces drop from 11 to 1") {
        REQUIRE(evaluate_hand(hand("A,6,10")) == HandValue{17, false});
        REQUIRE(evaluate_hand(hand("A,A,9")) == HandValue{21, true});
        REQUIRE(evaluate_hand(hand("A,A,A,A")) == HandValue{14, true});
        REQUIRE(evaluate_hand(hand("A,A,10,10")) == HandValue{22, false});
    }

    SECTION("Adding a card never lowers the total below 21 reachability") {
        std::vector<Card> cards = hand("A");
        int previous = evaluate_hand(cards).total;
        for (const char* c : {"A", "5", "A", "2"}) {
            cards.push_back(card_from_string(c));
            const int total = evaluate_hand(cards).total;
            REQUIRE(total <= 21);
            REQUIRE(total >= previous - 10);
            previous = total;
        }
    }
}

TEST_CASE("Blackjack detection", "[evaluator]") {
    REQUIRE(is_blackjack(hand("A,K")));
    REQUIRE(is_blackjack(hand("10,A")));
    REQUIRE(is_blackjack(hand("J,A")));
    REQUIRE_FALSE(is_blackjack(hand("A,5,5")));
    REQUIRE_FALSE(is_blackjack(hand("A,9")));
    REQUIRE_FALSE(is_blackjack(hand("K,Q")));
}

TEST_CASE("Split and double eligibility", "[evaluator]") {
    SECTION("Pairs compare blackjack value, not rank") {
        REQUIRE(can_split(hand("8,8")));
        REQUIRE(can_split(hand("10,K")));
        REQUIRE(can_split(hand("A,A")));
        REQUIRE_FALSE(can_split(hand("9,8")));
        REQUIRE_FALSE(can_split(hand("8,8,2")));
        REQUIRE(pair_value(hand("Q,J")) == 10);
        REQUIRE(pair_value(hand("A,A")) == 11);
    }

    SECTION("Double needs exactly two cards") {
        REQUIRE(can_double(hand("5,6")));
        REQUIRE_FALSE(can_double(hand("2,3,6")));
        REQUIRE_FALSE(can_double(hand("9")));
    }

    SECTION("Bust") {
        REQUIRE(is_bust(hand("10,6,K")));
        REQUIRE_FALSE(is_bust(hand("10,A,K")));
    }
}
