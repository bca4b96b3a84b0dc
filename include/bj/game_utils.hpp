#ifndef BJ_GAME_UTILS_HPP
#define BJ_GAME_UTILS_HPP

#include "bj/common_types.h"
#include "core/cards.hpp"
#include <string>
#include <vector>

namespace bj_solver {

// Codes d'action : H, S, D, P. Un code inconnu donne STAND.
char action_to_code(Action action);
Action action_from_code(char code);
Action action_from_code(const std::string& code);
std::string action_to_string(Action action); // "Hit", "Stand", ...

// Libellés de lignes : "16", "S17", "8,8", "A,A", "10,10"
std::string hand_key_to_string(const HandKey& key);

// Accepte aussi "K,K"/"J,Q" (valeurs égales) et "11,11". Lève std::invalid_argument.
HandKey hand_key_from_string(const std::string& label);

// Libellé descriptif pour les journaux : "Hard 16", "Soft 17", "Pair 8,8"
std::string describe_hand_key(const HandKey& key);

// Clé de stratégie d'une main. pair_allowed : la main peut être séparée ici.
HandKey hand_key_for(const std::vector<Card>& cards, bool pair_allowed);

std::string outcome_to_string(Outcome outcome);
std::string payout_to_string(BlackjackPayout payout);
BlackjackPayout payout_from_string(const std::string& s);

} // namespace bj_solver

#endif // BJ_GAME_UTILS_HPP
