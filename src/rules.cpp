#include "rules.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>


FrequentLevel flatten_levels(const FrequentLevels& levels) {
    FrequentLevel all;
    for (const auto& level : levels) {
        for (const auto& [itemset, count] : level) {
            all[itemset] = count;
        }
    }
    return all;
}

static bool score_rule(Rule& rule, SupportCount count_a, SupportCount count_c, size_t n) {
    if (count_a == 0 || count_c == 0) {
        return false;
    }

    double supp_f = static_cast<double>(rule.count) / n;
    double supp_a = static_cast<double>(count_a) / n;
    double supp_c = static_cast<double>(count_c) / n;

    rule.support = supp_f;
    rule.confidence = static_cast<double>(rule.count) / count_a;
    rule.lift = rule.confidence / supp_c;
    rule.leverage = supp_f - supp_a * supp_c;

    if (rule.count < count_a) {
        rule.conviction = (1.0 - supp_c) / (1.0 - rule.confidence);
    } else {
        rule.conviction = std::numeric_limits<double>::infinity();
    }

    double zhang_denom = std::max(supp_f * (1.0 - supp_a), supp_a * (supp_c - supp_f));
    rule.zhangs_metric = zhang_denom != 0.0 ? rule.leverage / zhang_denom : 0.0;

    rule.jaccard = supp_f / (supp_a + supp_c - supp_f);

    if (count_c < n) {
        rule.certainty = (rule.confidence - supp_c) / (1.0 - supp_c);
    } else {
        rule.certainty = 0.0;
    }

    rule.kulczynski = 0.5 * (rule.confidence + static_cast<double>(rule.count) / count_c);
    return true;
}

std::vector<Rule> derive_rules(const FrequentLevels& levels, size_t transaction_count,
                               const RuleOptions& options, RuleStats& stats) {
    check_min_confidence(options.min_confidence);
    if (transaction_count == 0) {
        throw EmptyTransactionSet();
    }

    stats = RuleStats();
    std::vector<Rule> rules;
    FrequentLevel all = flatten_levels(levels);

    for (const auto& [itemset, count] : all) {
        size_t size = itemset.size();
        if (size < 2) continue;
        if (size >= 64) {
            throw std::length_error("itemset too large for rule enumeration: " + std::to_string(size));
        }

        // Every mask except the empty and the full one is a proper split
        uint64_t full = (uint64_t(1) << size) - 1;
        for (uint64_t mask = 1; mask < full; ++mask) {
            Rule rule{};
            rule.count = count;
            for (size_t j = 0; j < size; ++j) {
                if (mask & (uint64_t(1) << j)) {
                    rule.antecedent.push_back(itemset[j]);
                } else {
                    rule.consequent.push_back(itemset[j]);
                }
            }
            stats.candidate_rules++;

            auto a_it = all.find(rule.antecedent);
            auto c_it = all.find(rule.consequent);
            if (a_it == all.end() || c_it == all.end()) {
                stats.missing_support++;
                continue;
            }

            if (!score_rule(rule, a_it->second, c_it->second, transaction_count)) {
                stats.undefined_metric++;
                continue;
            }

            if (rule.confidence < options.min_confidence
                || rule.lift < options.min_lift
                || rule.leverage < options.min_leverage) {
                stats.below_threshold++;
                continue;
            }
            rules.push_back(std::move(rule));
        }
    }

#ifdef PRINT
    std::cout << "Rules: " << stats.candidate_rules << " examined, " << rules.size() << " kept, "
              << stats.missing_support << " missing support, " << stats.undefined_metric << " undefined" << std::endl;
#endif
    return rules;
}

std::vector<Rule> derive_rules(const FrequentLevels& levels, const TransactionList& transactions,
                               double min_confidence) {
    RuleOptions options;
    options.min_confidence = min_confidence;
    RuleStats stats;
    return derive_rules(levels, transactions.size(), options, stats);
}

void sort_rules(std::vector<Rule>& rules) {
    std::sort(rules.begin(), rules.end(), [](const Rule& a, const Rule& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.lift != b.lift) return a.lift > b.lift;
        if (a.antecedent != b.antecedent) return a.antecedent < b.antecedent;
        return a.consequent < b.consequent;
    });
}
