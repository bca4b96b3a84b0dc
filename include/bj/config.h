#ifndef BJ_CONFIG_H
#define BJ_CONFIG_H

#include "bj/common_types.h"
#include "bj/game_engine.h"
#include "core/counter.hpp"
#include "core/shoe.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace bj_solver {

// Paramètres d'une session de simulation
struct SimulationConfig {
    int   num_decks   = 6;
    int   penetration = Shoe::DEFAULT_PENETRATION; // % avant remélange
    Rules rules;

    bool                        counting_enabled = false;
    CountingSystem              counting_system  = CountingSystem::HI_LO;
    std::optional<CountWeights> custom_weights;  // Requis pour CountingSystem::CUSTOM

    bool   count_based_strategy = false;
    double bet_size             = 100.0;
    long   num_simulations      = 100000;
    long   chunk_size           = 10000;
    std::optional<uint32_t> seed;

    // Lève std::invalid_argument sur une valeur hors bornes
    void validate() const;
};

// Sabot configuré (paquets, pénétration). seed remplace celle de la config.
Shoe make_shoe(const SimulationConfig& config, std::optional<uint32_t> seed);
std::optional<Counter> make_counter(const SimulationConfig& config);
GameEngine make_engine(const SimulationConfig& config);

// Règle croupier : "17s" = reste sur tous les 17, "17" ou "H17" = tire sur soft 17
bool dealer_hits_soft_17_from_string(const std::string& rule);
std::string dealer_rule_to_string(bool dealer_hits_soft_17);

std::string describe_config(const SimulationConfig& config);

} // namespace bj_solver

#endif // BJ_CONFIG_H
