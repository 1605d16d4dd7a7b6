#ifndef RULES_H
#define RULES_H

#include <vector>
#include <limits>
#include <cstddef>

#include "common.h"

struct RuleOptions {
    double min_confidence = 0.0;
    // Lift and leverage filters apply only when raised above -inf
    double min_lift = -std::numeric_limits<double>::infinity();
    double min_leverage = -std::numeric_limits<double>::infinity();
};

// Later levels overwrite earlier ones on an identical itemset
FrequentLevel flatten_levels(const FrequentLevels& levels);

std::vector<Rule> derive_rules(const FrequentLevels& levels, size_t transaction_count,
                               const RuleOptions& options, RuleStats& stats);
std::vector<Rule> derive_rules(const FrequentLevels& levels, const TransactionList& transactions,
                               double min_confidence);

// Confidence desc, lift desc, then antecedent and consequent ids
void sort_rules(std::vector<Rule>& rules);

#endif
