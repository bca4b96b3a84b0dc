#include "bj/config.h"
#include "bj/game_utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace bj_solver {

void SimulationConfig::validate() const {
    if (num_decks < Shoe::MIN_DECKS || num_decks > Shoe::MAX_DECKS) {
        throw std::invalid_argument("num_decks must be in [1, 8], got " + std::to_string(num_decks));
    }
    if (penetration < 50 || penetration > 100) {
        throw std::invalid_argument("penetration must be in [50, 100], got " + std::to_string(penetration));
    }
    if (bet_size <= 0.0) {
        throw std::invalid_argument("bet_size must be positive");
    }
    if (num_simulations <= 0) {
        throw std::invalid_argument("num_simulations must be positive");
    }
    if (chunk_size <= 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    if (counting_enabled && counting_system == CountingSystem::CUSTOM && !custom_weights) {
        throw std::invalid_argument("Custom counting system requires a weight table");
    }
    if (count_based_strategy && !counting_enabled) {
        throw std::invalid_argument("Count-based strategy requires counting to be enabled");
    }
}

Shoe make_shoe(const SimulationConfig& config, std::optional<uint32_t> seed) {
    Shoe shoe(config.num_decks, seed);
    shoe.set_penetration_threshold(config.penetration);
    return shoe;
}

std::optional<Counter> make_counter(const SimulationConfig& config) {
    if (!config.counting_enabled) {
        return std::nullopt;
    }
    if (config.counting_system == CountingSystem::CUSTOM) {
        if (!config.custom_weights) {
            throw std::invalid_argument("Custom counting system requires a weight table");
        }
        return Counter(CountingSystem::CUSTOM, *config.custom_weights);
    }
    return Counter(config.counting_system);
}

GameEngine make_engine(const SimulationConfig& config) {
    config.validate();
    return GameEngine(config.rules, make_shoe(config, config.seed), make_counter(config));
}

bool dealer_hits_soft_17_from_string(const std::string& rule) {
    std::string r = rule;
    std::transform(r.begin(), r.end(), r.begin(), [](unsigned char c) { return std::tolower(c); });
    if (r == "17s" || r == "s17") return false;
    if (r == "17" || r == "h17") return true;
    throw std::invalid_argument("Unknown dealer rule: '" + rule + "'");
}

std::string dealer_rule_to_string(bool dealer_hits_soft_17) {
    return dealer_hits_soft_17 ? "H17" : "S17";
}

std::string describe_config(const SimulationConfig& config) {
    std::stringstream ss;
    ss << config.num_decks << " paquets, pénétration " << config.penetration << "%, "
       << dealer_rule_to_string(config.rules.dealer_hits_soft_17)
       << (config.rules.double_after_split ? ", DAS" : ", no DAS")
       << (config.rules.allow_resplit ? ", resplit" : ", no resplit")
       << (config.rules.resplit_aces ? ", RSA" : "")
       << ", BJ " << payout_to_string(config.rules.blackjack_payout);
    if (config.counting_enabled) {
        ss << ", comptage " << counting_system_to_string(config.counting_system);
        if (config.count_based_strategy) ss << " (stratégie par compte)";
    }
    return ss.str();
}

} // namespace bj_solver
