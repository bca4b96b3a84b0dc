#include "core/cards.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>

namespace bj_solver {

// Helper maps pour la conversion libellé <-> Rank
const std::map<std::string, Rank> LABEL_TO_RANK = {
    {"2", Rank::TWO}, {"3", Rank::THREE}, {"4", Rank::FOUR}, {"5", Rank::FIVE},
    {"6", Rank::SIX}, {"7", Rank::SEVEN}, {"8", Rank::EIGHT}, {"9", Rank::NINE},
    {"10", Rank::TEN}, {"T", Rank::TEN}, {"J", Rank::JACK}, {"Q", Rank::QUEEN},
    {"K", Rank::KING}, {"A", Rank::ACE}, {"ACE", Rank::ACE}
};
const std::map<Rank, std::string> RANK_TO_LABEL = {
    {Rank::TWO, "2"}, {Rank::THREE, "3"}, {Rank::FOUR, "4"}, {Rank::FIVE, "5"},
    {Rank::SIX, "6"}, {Rank::SEVEN, "7"}, {Rank::EIGHT, "8"}, {Rank::NINE, "9"},
    {Rank::TEN, "10"}, {Rank::JACK, "J"}, {Rank::QUEEN, "Q"}, {Rank::KING, "K"},
    {Rank::ACE, "A"}
};

namespace {

std::string trim_upper(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out = (begin < end) ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

} // namespace

// --- Implémentations des fonctions de conversion ---

std::string to_string(Rank r) {
    auto it = RANK_TO_LABEL.find(r);
    if (it == RANK_TO_LABEL.end()) {
        return "?";
    }
    return it->second;
}

std::string to_string(const Card& c) {
    return to_string(c.rank);
}

Rank rank_from_string(const std::string& s) {
    auto it = LABEL_TO_RANK.find(trim_upper(s));
    if (it == LABEL_TO_RANK.end()) {
        throw std::invalid_argument("Invalid rank label: '" + s + "'");
    }
    return it->second;
}

Card card_from_string(const std::string& s) {
    return make_card(rank_from_string(s));
}

Rank rank_from_value(int value) {
    if (value == 11 || value == 1) return Rank::ACE;
    if (value == 10) return Rank::TEN;
    if (value >= 2 && value <= 9) return static_cast<Rank>(value - 2);
    throw std::invalid_argument("Invalid card value: " + std::to_string(value));
}

std::vector<Card> parse_card_list(const std::string& s) {
    std::vector<Card> cards;
    std::stringstream ss(s);
    std::string token;
    while (std::getline(ss, token, ',')) {
        cards.push_back(card_from_string(token)); // Propage std::invalid_argument
    }
    if (cards.empty()) {
        throw std::invalid_argument("Empty card list: '" + s + "'");
    }
    return cards;
}

std::string dealer_label(const Card& up_card) {
    return dealer_label_from_value(up_card.value());
}

std::string dealer_label_from_value(int value) {
    if (value == 11) return "A";
    if (value < 2 || value > 10) {
        throw std::invalid_argument("Invalid dealer card value: " + std::to_string(value));
    }
    return std::to_string(value);
}

int dealer_value_from_label(const std::string& label) {
    // "11" est toléré pour l'As (ancien format d'export)
    const std::string l = trim_upper(label);
    if (l == "11") return 11;
    return rank_value(rank_from_string(l));
}

std::string cards_to_string(const std::vector<Card>& cards) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < cards.size(); ++i) {
        ss << bj_solver::to_string(cards[i]);
        if (i < cards.size() - 1) {
            ss << " ";
        }
    }
    ss << "]";
    return ss.str();
}

} // namespace bj_solver
