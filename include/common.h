#ifndef COMMON_H
#define COMMON_H

#include <cstdint>
#include <vector>
#include <map>
#include <string>
#include <algorithm>
#include <stdexcept>

typedef uint32_t ItemId;
typedef uint32_t SupportCount;

// Itemsets and transactions hold sorted, duplicate-free item ids
typedef std::vector<ItemId> Itemset;
typedef std::vector<ItemId> Transaction;
typedef std::vector<Transaction> TransactionList;

// All itemsets of one level share the same size
typedef std::map<Itemset, SupportCount> FrequentLevel;
typedef std::vector<FrequentLevel> FrequentLevels;

struct Rule {
    Itemset antecedent;
    Itemset consequent;
    SupportCount count;     // absolute support of antecedent + consequent
    double support;
    double confidence;
    double lift;
    double leverage;
    double conviction;      // +inf when confidence is 1
    double zhangs_metric;
    double jaccard;
    double certainty;
    double kulczynski;
};

struct RuleStats {
    uint32_t candidate_rules = 0;     // splits examined
    uint32_t missing_support = 0;     // antecedent or consequent not in any level
    uint32_t undefined_metric = 0;    // antecedent or consequent with zero support
    uint32_t below_threshold = 0;     // dropped by confidence, lift or leverage
};

class InvalidThreshold : public std::invalid_argument {
public:
    InvalidThreshold(const std::string& name, double value)
        : std::invalid_argument(name + " out of range: " + std::to_string(value)), _name(name), _value(value) {}

    const std::string& name() const { return _name; }
    double value() const { return _value; }

private:
    std::string _name;
    double _value;
};

class EmptyTransactionSet : public std::runtime_error {
public:
    EmptyTransactionSet(): std::runtime_error("transaction set is empty") {}
};

inline Itemset make_itemset(std::vector<ItemId> items) {
    std::sort(items.begin(), items.end());
    items.erase(std::unique(items.begin(), items.end()), items.end());
    return items;
}

inline bool is_subset(const Itemset& itemset, const Transaction& transaction) {
    return std::includes(transaction.begin(), transaction.end(), itemset.begin(), itemset.end());
}

// min_support must lie in (0, 1]
inline void check_min_support(double min_support) {
    if (!(min_support > 0.0 && min_support <= 1.0)) {
        throw InvalidThreshold("min_support", min_support);
    }
}

// min_confidence must lie in [0, 1]
inline void check_min_confidence(double min_confidence) {
    if (!(min_confidence >= 0.0 && min_confidence <= 1.0)) {
        throw InvalidThreshold("min_confidence", min_confidence);
    }
}

#endif // COMMON_H
