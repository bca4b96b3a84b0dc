#include "core/shoe.hpp"
#include "core/counter.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace bj_solver {

Shoe::Shoe(int num_decks, std::optional<uint32_t> seed)
    : num_decks_(num_decks)
{
    if (num_decks < MIN_DECKS || num_decks > MAX_DECKS) {
        throw std::invalid_argument("Number of decks must be in [1, 8], got " + std::to_string(num_decks));
    }
    if (seed) {
        rng_.seed(*seed);
    } else {
        std::random_device rd;
        rng_.seed(rd());
    }
    cards_.reserve(total_cards());
    consumed_.reserve(total_cards());
    // Mélange initial
    shuffle();
}

void Shoe::shuffle(Counter* counter) {
    cards_.clear();
    consumed_.clear();
    for (int d = 0; d < num_decks_; ++d) {
        for (Rank r : ALL_RANKS) {
            for (int s = 0; s < CARDS_PER_RANK; ++s) {
                cards_.push_back(make_card(r));
            }
        }
    }
    std::shuffle(cards_.begin(), cards_.end(), rng_);
    penetration_ = 0.0;
    ++shuffle_count_;

    // Le compte n'a de sens que pour la composition courante du sabot
    if (counter) {
        counter->reset();
    }
}

Card Shoe::draw(Counter* counter) {
    if (cards_.empty()) {
        spdlog::debug("Shoe: sabot épuisé en cours de main, remélange silencieux.");
        shuffle(counter);
    }

    Card card = cards_.back();
    cards_.pop_back();
    consumed_.push_back(card);
    update_penetration();

    if (counter) {
        counter->update(card);
    }
    return card;
}

bool Shoe::should_reshuffle() const {
    return penetration_ >= static_cast<double>(penetration_threshold_) &&
           remaining_cards() < CARDS_PER_DECK;
}

void Shoe::set_penetration_threshold(int percentage) {
    if (percentage < 50 || percentage > 100) {
        throw std::invalid_argument("Penetration threshold must be in [50, 100], got " + std::to_string(percentage));
    }
    penetration_threshold_ = percentage;
}

bool Shoe::remove_rank(Rank rank, Counter* counter) {
    auto it = std::find_if(cards_.begin(), cards_.end(),
                           [rank](const Card& c) { return c.rank == rank; });
    if (it == cards_.end()) {
        return false;
    }
    Card card = *it;
    cards_.erase(it);
    consumed_.push_back(card);
    update_penetration();
    if (counter) {
        counter->update(card);
    }
    return true;
}

void Shoe::stack_for_testing(const std::vector<Card>& deal_order) {
    if (static_cast<int>(deal_order.size()) > total_cards()) {
        throw std::invalid_argument("Stacked shoe cannot hold more than " + std::to_string(total_cards()) + " cards.");
    }
    // draw() dépile par la fin : on stocke l'ordre inversé
    cards_.assign(deal_order.rbegin(), deal_order.rend());
    consumed_.clear();
    penetration_ = 0.0;
}

void Shoe::update_penetration() {
    penetration_ = static_cast<double>(consumed_.size()) / static_cast<double>(total_cards()) * 100.0;
}

} // namespace bj_solver
