#include "bj/game_utils.hpp"
#include "eval/hand_evaluator.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace bj_solver {

namespace {

std::string strip(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Valeur blackjack d'un jeton de paire : "A", "11", "K", "10", "7"...
int pair_token_value(const std::string& token) {
    if (token == "11") return 11;
    return rank_value(rank_from_string(token));
}

} // namespace

char action_to_code(Action action) {
    switch (action) {
        case Action::HIT:    return 'H';
        case Action::STAND:  return 'S';
        case Action::DOUBLE: return 'D';
        case Action::SPLIT:  return 'P';
        default:             return 'S';
    }
}

Action action_from_code(char code) {
    switch (std::toupper(static_cast<unsigned char>(code))) {
        case 'H': return Action::HIT;
        case 'D': return Action::DOUBLE;
        case 'P': return Action::SPLIT;
        default:  return Action::STAND; // Code inconnu : on reste
    }
}

Action action_from_code(const std::string& code) {
    const std::string c = strip(code);
    if (c.size() != 1) return Action::STAND;
    return action_from_code(c[0]);
}

std::string action_to_string(Action action) {
    switch (action) {
        case Action::HIT:    return "Hit";
        case Action::STAND:  return "Stand";
        case Action::DOUBLE: return "Double";
        case Action::SPLIT:  return "Split";
        default:             return "Stand";
    }
}

std::string hand_key_to_string(const HandKey& key) {
    switch (key.kind) {
        case HandKind::HARD: return std::to_string(key.value);
        case HandKind::SOFT: return "S" + std::to_string(key.value);
        case HandKind::PAIR: {
            const std::string r = (key.value == 11) ? "A" : std::to_string(key.value);
            return r + "," + r;
        }
    }
    return std::to_string(key.value);
}

HandKey hand_key_from_string(const std::string& label) {
    const std::string l = strip(label);
    if (l.empty()) {
        throw std::invalid_argument("Empty hand label");
    }

    const auto comma = l.find(',');
    if (comma != std::string::npos) {
        const int first = pair_token_value(l.substr(0, comma));
        const int second = pair_token_value(l.substr(comma + 1));
        if (first != second) {
            throw std::invalid_argument("Not a pair label: '" + label + "'");
        }
        return HandKey::pair(first);
    }

    if (l[0] == 'S' && is_number(l.substr(1))) {
        const int total = std::stoi(l.substr(1));
        if (total < MIN_SOFT_TOTAL || total > MAX_SOFT_TOTAL) {
            throw std::invalid_argument("Soft total out of range: '" + label + "'");
        }
        return HandKey::soft(total);
    }

    if (is_number(l)) {
        const int total = std::stoi(l);
        if (total < 4 || total > MAX_HARD_TOTAL) {
            throw std::invalid_argument("Hard total out of range: '" + label + "'");
        }
        return HandKey::hard(total);
    }

    throw std::invalid_argument("Invalid hand label: '" + label + "'");
}

std::string describe_hand_key(const HandKey& key) {
    switch (key.kind) {
        case HandKind::HARD: return "Hard " + std::to_string(key.value);
        case HandKind::SOFT: return "Soft " + std::to_string(key.value);
        case HandKind::PAIR: return "Pair " + hand_key_to_string(key);
    }
    return hand_key_to_string(key);
}

HandKey hand_key_for(const std::vector<Card>& cards, bool pair_allowed) {
    if (pair_allowed && can_split(cards)) {
        return HandKey::pair(pair_value(cards));
    }
    const HandValue hv = evaluate_hand(cards);
    return hv.is_soft ? HandKey::soft(hv.total) : HandKey::hard(hv.total);
}

std::string outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::WIN:       return "win";
        case Outcome::LOSE:      return "lose";
        case Outcome::PUSH:      return "push";
        case Outcome::BLACKJACK: return "blackjack";
        default:                 return "unknown";
    }
}

std::string payout_to_string(BlackjackPayout payout) {
    switch (payout) {
        case BlackjackPayout::THREE_TO_TWO: return "3:2";
        case BlackjackPayout::SIX_TO_FIVE:  return "6:5";
        case BlackjackPayout::ONE_TO_ONE:   return "1:1";
        default:                            return "3:2";
    }
}

BlackjackPayout payout_from_string(const std::string& s) {
    const std::string p = strip(s);
    if (p == "3:2") return BlackjackPayout::THREE_TO_TWO;
    if (p == "6:5") return BlackjackPayout::SIX_TO_FIVE;
    if (p == "1:1") return BlackjackPayout::ONE_TO_ONE;
    throw std::invalid_argument("Unknown blackjack payout: '" + s + "'");
}

} // namespace bj_solver
