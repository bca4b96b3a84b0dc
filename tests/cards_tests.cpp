#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "core/cards.hpp"
#include <string>
#include <vector>

using namespace bj_solver;

TEST_CASE("Card Creation and Properties", "[cards]") {
    Card ace = make_card(Rank::ACE);
    Card king = make_card(Rank::KING);
    Card ten = make_card(Rank::TEN);
    Card two = make_card(Rank::TWO);

    SECTION("Blackjack values") {
        REQUIRE(ace.value() == 11);
        REQUIRE(king.value() == 10);
        REQUIRE(ten.value() == 10);
        REQUIRE(two.value() == 2);
        REQUIRE(make_card(Rank::NINE).value() == 9);
        REQUIRE(ace.is_ace());
        REQUIRE_FALSE(king.is_ace());
    }

    SECTION("Ranks stay distinct even with equal values") {
        REQUIRE(ten != king);
        REQUIRE(ten.value() == king.value());
    }

    SECTION("to_string conversion is correct") {
        REQUIRE(to_string(ace) == "A");
        REQUIRE(to_string(king) == "K");
        REQUIRE(to_string(ten) == "10");
        REQUIRE(to_string(two) == "2");
    }
}

TEST_CASE("Card String Conversions", "[cards][string]") {
    SECTION("card_from_string accepts the usual labels") {
        REQUIRE(card_from_string("A") == make_card(Rank::ACE));
        REQUIRE(card_from_string("ace") == make_card(Rank::ACE));
        REQUIRE(card_from_string(" 10 ") == make_card(Rank::TEN));
        REQUIRE(card_from_string("T") == make_card(Rank::TEN));
        REQUIRE(card_from_string("q") == make_card(Rank::QUEEN));
        REQUIRE(card_from_string("7") == make_card(Rank::SEVEN));
    }

    SECTION("Invalid labels throw") {
        REQUIRE_THROWS_AS(card_from_string("1"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("11"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string("X"), std::invalid_argument);
        REQUIRE_THROWS_AS(card_from_string(""), std::invalid_argument);
    }

    SECTION("rank_from_value") {
        REQUIRE(rank_from_value(11) == Rank::ACE);
        REQUIRE(rank_from_value(10) == Rank::TEN);
        REQUIRE(rank_from_value(2) == Rank::TWO);
        REQUIRE_THROWS_AS(rank_from_value(12), std::invalid_argument);
    }
}

TEST_CASE("Card list parsing", "[cards][string]") {
    std::vector<Card> cards = parse_card_list("A, 10,K");
    REQUIRE(cards.size() == 3);
    REQUIRE(cards[0] == make_card(Rank::ACE));
    REQUIRE(cards[1] == make_card(Rank::TEN));
    REQUIRE(cards[2] == make_card(Rank::KING));
    REQUIRE(cards_to_string(cards) == "[A 10 K]");

    REQUIRE_THROWS_AS(parse_card_list("A,Z"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_card_list(""), std::invalid_argument);
}

TEST_CASE("Dealer column labels", "[cards]") {
    REQUIRE(dealer_label(make_card(Rank::ACE)) == "A");
    REQUIRE(dealer_label(make_card(Rank::QUEEN)) == "10");
    REQUIRE(dealer_label(make_card(Rank::SIX)) == "6");
    REQUIRE(dealer_value_from_label("A") == 11);
    REQUIRE(dealer_value_from_label("11") == 11);
    REQUIRE(dealer_value_from_label("K") == 10);
    REQUIRE(dealer_value_from_label("4") == 4);
    REQUIRE_THROWS_AS(dealer_label_from_value(1), std::invalid_argument);
}
