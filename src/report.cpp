#include "report.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

static std::string format_metric(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

static std::string format_ratio(SupportCount count, size_t transaction_count) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(count) / transaction_count;
    return oss.str();
}

void print_levels(std::ostream& out, const FrequentLevels& levels, const ItemDictionary& dictionary,
                  size_t transaction_count) {
    for (size_t k = 0; k < levels.size(); ++k) {
        std::vector<std::pair<std::string, SupportCount>> rows;
        for (const auto& [itemset, count] : levels[k]) {
            rows.emplace_back(dictionary.format(itemset), count);
        }
        std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });

        out << "Level " << k + 1 << " (" << rows.size() << " itemsets)" << std::endl;
        for (const auto& [label, count] : rows) {
            out << "  " << label << ": " << count << " (" << format_ratio(count, transaction_count) << ")" << std::endl;
        }
    }
}

void print_rules(std::ostream& out, const std::vector<Rule>& rules, const ItemDictionary& dictionary) {
    out << "Rules (" << rules.size() << ")" << std::endl;
    for (const auto& rule : rules) {
        out << "  " << dictionary.format(rule.antecedent) << " -> " << dictionary.format(rule.consequent)
            << "  support=" << format_metric(rule.support)
            << " confidence=" << format_metric(rule.confidence)
            << " lift=" << format_metric(rule.lift)
            << " leverage=" << format_metric(rule.leverage)
            << " conviction=" << format_metric(rule.conviction)
            << " zhang=" << format_metric(rule.zhangs_metric)
            << " jaccard=" << format_metric(rule.jaccard)
            << " certainty=" << format_metric(rule.certainty)
            << " kulczynski=" << format_metric(rule.kulczynski)
            << std::endl;
    }
}
