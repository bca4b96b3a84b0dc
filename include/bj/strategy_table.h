#ifndef BJ_STRATEGY_TABLE_H
#define BJ_STRATEGY_TABLE_H

#include "bj/common_types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bj_solver {

// Une ligne : valeur de la carte croupier (2..11) -> action
using ActionRow = std::map<int, Action>;
using ActionTable = std::map<HandKey, ActionRow>;

// Format d'échange : libellés texte, codes d'action H/S/D/P.
// hard/soft indexés par total ("16"), pairs par valeur ("8", "11" = As),
// colonnes par libellé croupier ("2".."10", "A").
using LabelRow = std::map<std::string, char>;
using LabelTable = std::map<std::string, LabelRow>;

struct StrategyExport {
    bool count_based = false;
    LabelTable hard;
    LabelTable soft;
    LabelTable pairs;
    // Clé externe : niveau de compte en texte ("-2", "3")
    std::map<std::string, LabelTable> hard_by_count;
    std::map<std::string, LabelTable> soft_by_count;
    std::map<std::string, LabelTable> pairs_by_count;
};

class StrategyTable {
public:
    // Table initialisée par initialize_empty()
    StrategyTable();

    /**
     * @brief Action à jouer pour une main.
     * En mode "count based" avec un niveau non nul, la surcharge du niveau est
     * consultée d'abord, puis la table de base, puis les heuristiques par défaut.
     * Une clé PAIR non séparable est relue comme son total hard/soft.
     * Un Double trouvé alors que can_double est faux devient Hit.
     */
    Action lookup(const HandKey& key, int dealer_value, bool can_double, bool can_split,
                  int count_level = 0) const;

    void set_action(const HandKey& key, int dealer_value, Action action);
    // Active aussi le mode "count based". Le niveau 0 écrit dans la table de base.
    void set_count_action(int count_level, const HandKey& key, int dealer_value, Action action);

    std::optional<Action> get_action(const HandKey& key, int dealer_value) const;
    // Niveau 0 : table de base
    std::optional<Action> get_count_action(int count_level, const HandKey& key, int dealer_value) const;

    void clear_count_level(int count_level);
    std::vector<int> count_levels() const;

    bool count_based() const { return count_based_; }
    void set_count_based(bool enabled) { count_based_ = enabled; }

    // --- Préréglages ---
    void initialize_empty();      // hard/soft = Stand, paires = Hit
    void load_basic_strategy();   // Table de référence 6-8 paquets, croupier reste sur 17
    void load_optimal_strategy(); // Identique à la stratégie de base

    // --- Export / import ---
    StrategyExport export_strategy() const;
    // Remplace entièrement la table. Lève std::invalid_argument sur un libellé invalide.
    void import_strategy(const StrategyExport& data);

    // Fichier texte, une cellule par ligne : couche<TAB>type<TAB>valeur<TAB>croupier<TAB>action
    bool save_to_file(const std::string& filename) const;
    bool load_from_file(const std::string& filename);

    const ActionTable& base_table() const { return base_; }

private:
    static std::optional<Action> find_in(const ActionTable& table, const HandKey& key, int dealer_value);
    static Action default_action(const HandKey& key);

    ActionTable base_;
    std::map<int, ActionTable> by_count_;
    bool count_based_ = false;
};

} // namespace bj_solver

#endif // BJ_STRATEGY_TABLE_H
