#include "core/counter.hpp"
#include <cmath>
#include <map>
#include <numeric>
#include <stdexcept>

namespace bj_solver {

namespace {

// Ordre des poids : 2 3 4 5 6 7 8 9 10 J Q K A
const std::map<CountingSystem, CountingSystemInfo> SYSTEMS = {
    {CountingSystem::HI_LO, {"Hi-Lo",
        "Most popular balanced system. +1 for 2-6, 0 for 7-9, -1 for 10-A.",
        true, {1, 1, 1, 1, 1, 0, 0, 0, -1, -1, -1, -1, -1}}},
    {CountingSystem::HI_OPT_I, {"Hi-Opt I",
        "Balanced system that ignores 2s and Aces. +1 for 3-6, 0 for 2,7-9,A, -1 for 10-K.",
        true, {0, 1, 1, 1, 1, 0, 0, 0, -1, -1, -1, -1, 0}}},
    {CountingSystem::HI_OPT_II, {"Hi-Opt II",
        "Advanced balanced system with varied point values. Requires ace side count.",
        true, {1, 1, 2, 2, 1, 1, 0, 0, -2, -2, -2, -2, 0}}},
    {CountingSystem::OMEGA_II, {"Omega II",
        "Advanced balanced system. Requires ace side count.",
        true, {1, 1, 2, 2, 2, 1, 0, -1, -2, -2, -2, -2, 0}}},
    {CountingSystem::KO, {"KO (Knockout)",
        "Unbalanced system. +1 for 2-7, 0 for 8-9, -1 for 10-A.",
        false, {1, 1, 1, 1, 1, 1, 0, 0, -1, -1, -1, -1, -1}}},
    {CountingSystem::ACE_FIVE, {"Ace-Five",
        "Simple system focusing only on 5s and Aces. +1 for 5, -1 for Ace.",
        false, {0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 0, -1}}},
    {CountingSystem::CUSTOM, {"Custom",
        "Custom counting system",
        false, {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0}}}
};

} // namespace

CountingSystemInfo system_info(CountingSystem system) {
    auto it = SYSTEMS.find(system);
    if (it == SYSTEMS.end()) {
        return SYSTEMS.at(CountingSystem::HI_LO);
    }
    return it->second;
}

std::string counting_system_to_string(CountingSystem system) {
    return system_info(system).name;
}

CountingSystem counting_system_from_string(const std::string& name) {
    if (name == "KO") return CountingSystem::KO;
    for (const auto& [system, info] : SYSTEMS) {
        if (info.name == name) return system;
    }
    throw std::invalid_argument("Unknown counting system: '" + name + "'");
}

bool is_balanced(const CountWeights& weights) {
    // Un paquet : 4 cartes de chaque rang
    return std::accumulate(weights.begin(), weights.end(), 0) * CARDS_PER_RANK == 0;
}

Counter::Counter(CountingSystem system)
    : system_(system)
{
    set_system(system);
}

Counter::Counter(CountingSystem system, const CountWeights& custom_weights)
    : system_(system)
{
    if (system == CountingSystem::CUSTOM) {
        set_custom_weights(custom_weights);
    } else {
        set_system(system);
    }
}

int Counter::update(const Card& card) {
    const int delta = weights_[rank_index(card.rank)];
    running_count_ += delta;
    return delta;
}

double Counter::true_count(int remaining_cards, int /*num_decks*/) const {
    const double remaining_decks = static_cast<double>(remaining_cards) / CARDS_PER_DECK;
    if (remaining_decks <= 0.0) return 0.0;
    return static_cast<double>(running_count_) / remaining_decks;
}

int Counter::count_range(int remaining_cards, int num_decks) const {
    return static_cast<int>(std::lround(true_count(remaining_cards, num_decks)));
}

void Counter::set_system(CountingSystem system) {
    const CountingSystemInfo info = system_info(system);
    system_   = system;
    weights_  = info.weights;
    balanced_ = info.balanced;
    reset();
}

void Counter::set_custom_weights(const CountWeights& weights) {
    system_   = CountingSystem::CUSTOM;
    weights_  = weights;
    balanced_ = is_balanced(weights);
    reset();
}

} // namespace bj_solver
