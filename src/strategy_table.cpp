#include "bj/strategy_table.h"
#include "bj/game_utils.hpp"
#include "core/cards.hpp"
#include "spdlog/spdlog.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace bj_solver {

namespace {

// Stratégie de base, colonnes croupier 2 3 4 5 6 7 8 9 10 A
struct PresetRow {
    int value;
    const char* codes;
};

const PresetRow BASIC_HARD[] = {
    {5,  "HHHHHHHHHH"}, {6,  "HHHHHHHHHH"}, {7,  "HHHHHHHHHH"}, {8,  "HHHHHHHHHH"},
    {9,  "HDDDDHHHHH"}, {10, "DDDDDDDDHH"}, {11, "DDDDDDDDDD"}, {12, "HHSSSHHHHH"},
    {13, "SSSSSHHHHH"}, {14, "SSSSSHHHHH"}, {15, "SSSSSHHHHH"}, {16, "SSSSSHHHHH"},
    {17, "SSSSSSSSSS"}, {18, "SSSSSSSSSS"}, {19, "SSSSSSSSSS"}, {20, "SSSSSSSSSS"},
    {21, "SSSSSSSSSS"}
};

const PresetRow BASIC_SOFT[] = {
    {13, "HHHDDHHHHH"}, {14, "HHDDDHHHHH"}, {15, "HHDDDHHHHH"}, {16, "HHDDDHHHHH"},
    {17, "HDDDDHHHHH"}, {18, "SDDDDSSHHH"}, {19, "SSSSSSSSSS"}, {20, "SSSSSSSSSS"},
    {21, "SSSSSSSSSS"}
};

const PresetRow BASIC_PAIRS[] = {
    {2,  "PPPPPPHHHH"}, {3,  "PPPPPPHHHH"}, {4,  "HHHPPHHHHH"}, {5,  "DDDDDDDDHH"},
    {6,  "PPPPPHHHHH"}, {7,  "PPPPPPHHHH"}, {8,  "PPPPPPPPPP"}, {9,  "PPPPPSPPSS"},
    {10, "SSSSSSSSSS"}, {11, "PPPPPPPPPP"}
};

std::string kind_to_string(HandKind kind) {
    switch (kind) {
        case HandKind::HARD: return "hard";
        case HandKind::SOFT: return "soft";
        case HandKind::PAIR: return "pair";
    }
    return "hard";
}

HandKind kind_from_string(const std::string& s) {
    if (s == "hard") return HandKind::HARD;
    if (s == "soft") return HandKind::SOFT;
    if (s == "pair") return HandKind::PAIR;
    throw std::invalid_argument("Unknown hand kind: '" + s + "'");
}

bool key_in_range(const HandKey& key) {
    switch (key.kind) {
        case HandKind::HARD: return key.value >= 4 && key.value <= MAX_HARD_TOTAL;
        case HandKind::SOFT: return key.value >= MIN_SOFT_TOTAL && key.value <= MAX_SOFT_TOTAL;
        case HandKind::PAIR: return key.value >= MIN_PAIR_VALUE && key.value <= MAX_PAIR_VALUE;
    }
    return false;
}

// Sérialise les lignes d'un type donné
LabelTable to_label_table(const ActionTable& table, HandKind kind) {
    LabelTable out;
    for (const auto& [key, row] : table) {
        if (key.kind != kind) continue;
        LabelRow& label_row = out[std::to_string(key.value)];
        for (const auto& [dealer, action] : row) {
            label_row[dealer_label_from_value(dealer)] = action_to_code(action);
        }
    }
    return out;
}

void fill_from_label_table(ActionTable& table, HandKind kind, const LabelTable& labels) {
    for (const auto& [value_label, row] : labels) {
        HandKey key{kind, 0};
        try {
            key.value = std::stoi(value_label);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid " + kind_to_string(kind) + " row label: '" + value_label + "'");
        }
        if (!key_in_range(key)) {
            throw std::invalid_argument("Row out of range: " + describe_hand_key(key));
        }
        ActionRow& action_row = table[key];
        for (const auto& [dealer, code] : row) {
            action_row[dealer_value_from_label(dealer)] = action_from_code(code);
        }
    }
}

void erase_kind(ActionTable& table, HandKind kind) {
    for (auto it = table.begin(); it != table.end();) {
        if (it->first.kind == kind) {
            it = table.erase(it);
        } else {
            ++it;
        }
    }
}

void check_dealer(int dealer_value) {
    if (dealer_value < 2 || dealer_value > 11) {
        throw std::invalid_argument("Dealer card value must be in [2, 11], got " + std::to_string(dealer_value));
    }
}

} // namespace

StrategyTable::StrategyTable() {
    initialize_empty();
}

Action StrategyTable::lookup(const HandKey& key, int dealer_value, bool can_double, bool can_split,
                             int count_level) const {
    HandKey k = key;
    if (k.kind == HandKind::PAIR && !can_split) {
        // Paire non séparable : lue comme le total équivalent (A,A = soft 12)
        k = (k.value == 11) ? HandKey::soft(12) : HandKey::hard(2 * k.value);
    }

    auto resolve = [can_double](Action a) {
        return (a == Action::DOUBLE && !can_double) ? Action::HIT : a;
    };

    if (count_based_ && count_level != 0) {
        auto layer = by_count_.find(count_level);
        if (layer != by_count_.end()) {
            if (auto action = find_in(layer->second, k, dealer_value)) {
                return resolve(*action);
            }
        }
    }

    if (auto action = find_in(base_, k, dealer_value)) {
        return resolve(*action);
    }

    spdlog::trace("StrategyTable: aucune entrée pour {} vs {}, heuristique par défaut.",
                  describe_hand_key(k), dealer_value);
    return default_action(k);
}

void StrategyTable::set_action(const HandKey& key, int dealer_value, Action action) {
    check_dealer(dealer_value);
    base_[key][dealer_value] = action;
}

void StrategyTable::set_count_action(int count_level, const HandKey& key, int dealer_value, Action action) {
    check_dealer(dealer_value);
    // Le niveau 0 est la table de base
    ActionTable& layer = (count_level == 0) ? base_ : by_count_[count_level];
    layer[key][dealer_value] = action;
    count_based_ = true;
}

std::optional<Action> StrategyTable::get_action(const HandKey& key, int dealer_value) const {
    return find_in(base_, key, dealer_value);
}

std::optional<Action> StrategyTable::get_count_action(int count_level, const HandKey& key, int dealer_value) const {
    if (count_level == 0) {
        return find_in(base_, key, dealer_value);
    }
    auto layer = by_count_.find(count_level);
    if (layer == by_count_.end()) {
        return std::nullopt;
    }
    return find_in(layer->second, key, dealer_value);
}

void StrategyTable::clear_count_level(int count_level) {
    by_count_.erase(count_level);
}

std::vector<int> StrategyTable::count_levels() const {
    std::vector<int> levels;
    levels.reserve(by_count_.size());
    for (const auto& entry : by_count_) {
        levels.push_back(entry.first);
    }
    return levels;
}

void StrategyTable::initialize_empty() {
    base_.clear();
    by_count_.clear();
    for (int dealer : DEALER_CARD_VALUES) {
        for (int total = MIN_HARD_TOTAL; total <= MAX_HARD_TOTAL; ++total) {
            base_[HandKey::hard(total)][dealer] = Action::STAND;
        }
        for (int total = MIN_SOFT_TOTAL; total <= MAX_SOFT_TOTAL; ++total) {
            base_[HandKey::soft(total)][dealer] = Action::STAND;
        }
        for (int value = MIN_PAIR_VALUE; value <= MAX_PAIR_VALUE; ++value) {
            base_[HandKey::pair(value)][dealer] = Action::HIT;
        }
    }
}

void StrategyTable::load_basic_strategy() {
    initialize_empty();

    auto load_rows = [this](const auto& rows, HandKind kind) {
        for (const PresetRow& row : rows) {
            for (int i = 0; i < NUM_DEALER_CARDS; ++i) {
                base_[HandKey{kind, row.value}][DEALER_CARD_VALUES[i]] = action_from_code(row.codes[i]);
            }
        }
    };
    load_rows(BASIC_HARD, HandKind::HARD);
    load_rows(BASIC_SOFT, HandKind::SOFT);
    load_rows(BASIC_PAIRS, HandKind::PAIR);
    spdlog::debug("StrategyTable: stratégie de base chargée ({} lignes).", base_.size());
}

void StrategyTable::load_optimal_strategy() {
    load_basic_strategy();
}

StrategyExport StrategyTable::export_strategy() const {
    StrategyExport data;
    data.count_based = count_based_;
    data.hard = to_label_table(base_, HandKind::HARD);
    data.soft = to_label_table(base_, HandKind::SOFT);
    data.pairs = to_label_table(base_, HandKind::PAIR);
    for (const auto& [level, table] : by_count_) {
        const std::string level_label = std::to_string(level);
        data.hard_by_count[level_label] = to_label_table(table, HandKind::HARD);
        data.soft_by_count[level_label] = to_label_table(table, HandKind::SOFT);
        data.pairs_by_count[level_label] = to_label_table(table, HandKind::PAIR);
    }
    return data;
}

void StrategyTable::import_strategy(const StrategyExport& data) {
    // Construction sur une copie : la table courante reste intacte en cas d'erreur
    StrategyTable imported;

    auto replace_kind = [&imported](HandKind kind, const LabelTable& labels) {
        if (labels.empty()) return;
        erase_kind(imported.base_, kind);
        fill_from_label_table(imported.base_, kind, labels);
    };
    replace_kind(HandKind::HARD, data.hard);
    replace_kind(HandKind::SOFT, data.soft);
    replace_kind(HandKind::PAIR, data.pairs);

    auto import_layers = [&imported](HandKind kind, const std::map<std::string, LabelTable>& layers) {
        for (const auto& [level_label, labels] : layers) {
            int level = 0;
            try {
                level = std::stoi(level_label);
            } catch (const std::exception&) {
                throw std::invalid_argument("Invalid count level: '" + level_label + "'");
            }
            ActionTable& target = (level == 0) ? imported.base_ : imported.by_count_[level];
            fill_from_label_table(target, kind, labels);
        }
    };
    import_layers(HandKind::HARD, data.hard_by_count);
    import_layers(HandKind::SOFT, data.soft_by_count);
    import_layers(HandKind::PAIR, data.pairs_by_count);

    imported.count_based_ = data.count_based;
    *this = std::move(imported);
}

bool StrategyTable::save_to_file(const std::string& filename) const {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        spdlog::error("Impossible d'ouvrir le fichier de stratégie : {}", filename);
        return false;
    }

    spdlog::info("Sauvegarde de la stratégie ({} lignes de base, {} niveaux de compte) dans {}...",
                 base_.size(), by_count_.size(), filename);

    outfile << "count_based\t" << (count_based_ ? 1 : 0) << "\n";

    auto write_table = [&outfile](const std::string& layer, const ActionTable& table) {
        for (const auto& [key, row] : table) {
            for (const auto& [dealer, action] : row) {
                // Format: couche<TAB>type<TAB>valeur<TAB>croupier<TAB>action
                outfile << layer << "\t" << kind_to_string(key.kind) << "\t" << key.value << "\t"
                        << dealer_label_from_value(dealer) << "\t" << action_to_code(action) << "\n";
            }
        }
    };
    write_table("base", base_);
    for (const auto& [level, table] : by_count_) {
        write_table(std::to_string(level), table);
    }

    outfile.close();
    if (outfile.fail()) {
        spdlog::error("Erreur lors de l'écriture ou de la fermeture du fichier : {}", filename);
        return false;
    }

    spdlog::info("Sauvegarde terminée.");
    return true;
}

bool StrategyTable::load_from_file(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        spdlog::warn("Impossible d'ouvrir le fichier de stratégie : {}. Table inchangée.", filename);
        return false;
    }

    ActionTable base;
    std::map<int, ActionTable> by_count;
    bool count_based = false;
    std::string line;
    long line_count = 0;
    long loaded_count = 0;

    spdlog::info("Chargement de la stratégie depuis {}...", filename);

    while (std::getline(infile, line)) {
        line_count++;
        if (line.empty()) continue;

        std::stringstream ss_line(line);
        std::string segment;
        std::vector<std::string> parts;
        while (std::getline(ss_line, segment, '\t')) {
            parts.push_back(segment);
        }

        if (parts.size() == 2 && parts[0] == "count_based") {
            count_based = (parts[1] == "1");
            continue;
        }

        if (parts.size() != 5) {
            spdlog::warn("Erreur de format ligne {}: {} segments (5 attendus). Ligne: {}", line_count, parts.size(), line);
            continue;
        }

        try {
            HandKey key{kind_from_string(parts[1]), std::stoi(parts[2])};
            if (!key_in_range(key)) {
                throw std::invalid_argument("row out of range");
            }
            const int dealer = dealer_value_from_label(parts[3]);
            const Action action = action_from_code(parts[4]);

            const int level = (parts[0] == "base") ? 0 : std::stoi(parts[0]);
            ActionTable& target = (level == 0) ? base : by_count[level];
            target[key][dealer] = action;
            loaded_count++;
        } catch (const std::exception& e) {
            spdlog::warn("Erreur de format ligne {}: {}. Ligne: {}", line_count, e.what(), line);
        }
    }

    base_ = std::move(base);
    by_count_ = std::move(by_count);
    count_based_ = count_based;

    spdlog::info("Chargement terminé. {} cellules chargées depuis {} lignes.", loaded_count, line_count);
    return true;
}

std::optional<Action> StrategyTable::find_in(const ActionTable& table, const HandKey& key, int dealer_value) {
    auto row = table.find(key);
    if (row == table.end()) {
        return std::nullopt;
    }
    auto cell = row->second.find(dealer_value);
    if (cell == row->second.end()) {
        return std::nullopt;
    }
    return cell->second;
}

Action StrategyTable::default_action(const HandKey& key) {
    switch (key.kind) {
        case HandKind::HARD: return key.value < 17 ? Action::HIT : Action::STAND;
        case HandKind::SOFT: return key.value < 19 ? Action::HIT : Action::STAND;
        default:             return Action::STAND;
    }
}

} // namespace bj_solver
