#include "bj/simulation_stats.h"
#include <tuple>

namespace bj_solver {

void OutcomeTally::record(const GameResult& result) {
    games++;
    total_winnings += result.winnings;
    total_bet += result.total_bet;
    switch (result.outcome) {
        case Outcome::WIN:
        case Outcome::BLACKJACK: wins++; break;
        case Outcome::LOSE:      losses++; break;
        default:                 pushes++; break;
    }
}

void OutcomeTally::merge(const OutcomeTally& other) {
    games += other.games;
    wins += other.wins;
    losses += other.losses;
    pushes += other.pushes;
    total_winnings += other.total_winnings;
    total_bet += other.total_bet;
}

bool CellKey::operator<(const CellKey& other) const {
    if (hand != other.hand) return hand < other.hand;
    return std::make_tuple(dealer, static_cast<int>(action), count) <
           std::make_tuple(other.dealer, static_cast<int>(other.action), other.count);
}

void SimulationSummary::record(const GameResult& result, int count) {
    total_games++;
    total_winnings += result.winnings;
    total_bet += result.total_bet;

    switch (result.outcome) {
        case Outcome::WIN:       wins++; break;
        case Outcome::LOSE:      losses++; break;
        case Outcome::PUSH:      pushes++; break;
        case Outcome::BLACKJACK: blackjacks++; wins++; break;
    }

    cell_stats[CellKey{result.initial_key, result.dealer_up_card.value(), result.initial_action, count}].record(result);

    if (counting_enabled) {
        CountBucket& bucket = count_stats[count];
        bucket.hands++;
        bucket.total_winnings += result.winnings;
    }

    if (samples.size() < MAX_SAMPLE_RESULTS) {
        samples.push_back(result);
    }
}

void SimulationSummary::merge(const SimulationSummary& other) {
    total_games += other.total_games;
    wins += other.wins;
    losses += other.losses;
    pushes += other.pushes;
    blackjacks += other.blackjacks;
    total_winnings += other.total_winnings;
    total_bet += other.total_bet;

    for (const auto& [key, tally] : other.cell_stats) {
        cell_stats[key].merge(tally);
    }
    counting_enabled = counting_enabled || other.counting_enabled;
    for (const auto& [count, bucket] : other.count_stats) {
        CountBucket& mine = count_stats[count];
        mine.hands += bucket.hands;
        mine.total_winnings += bucket.total_winnings;
    }
    for (const GameResult& sample : other.samples) {
        if (samples.size() >= MAX_SAMPLE_RESULTS) break;
        samples.push_back(sample);
    }
    cancelled = cancelled || other.cancelled;
}

void SimulationSummary::finalize() {
    expected_value = total_games > 0 ? total_winnings / total_games : 0.0;
    win_rate = total_games > 0 ? static_cast<double>(wins) / total_games * 100.0 : 0.0;
    return_rate = total_bet > 0.0 ? total_winnings / total_bet * 100.0 : 0.0;
}

} // namespace bj_solver
