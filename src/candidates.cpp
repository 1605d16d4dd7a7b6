#include "candidates.h"

#include <set>

std::vector<ItemId> candidate_universe(const FrequentLevel& level) {
    std::set<ItemId> items;
    for (const auto& [itemset, count] : level) {
        items.insert(itemset.begin(), itemset.end());
    }
    return std::vector<ItemId>(items.begin(), items.end());
}

std::vector<Itemset> singleton_candidates(const std::vector<ItemId>& items) {
    std::vector<Itemset> candidates;
    for (ItemId item : make_itemset(items)) {
        candidates.push_back({item});
    }
    return candidates;
}

std::vector<Itemset> generate_candidates(const FrequentLevel& previous_level, size_t k) {
    std::vector<Itemset> candidates;
    std::vector<ItemId> universe = candidate_universe(previous_level);
    size_t n = universe.size();
    if (k == 0 || k > n) {
        return candidates;
    }

    // Lexicographic walk over index combinations; the universe is sorted, so
    // each emitted itemset is sorted and distinct.
    std::vector<size_t> idx(k);
    for (size_t i = 0; i < k; ++i) {
        idx[i] = i;
    }

    while (true) {
        Itemset candidate(k);
        for (size_t i = 0; i < k; ++i) {
            candidate[i] = universe[idx[i]];
        }
        candidates.push_back(std::move(candidate));

        size_t pos = k;
        while (pos > 0 && idx[pos - 1] == n - k + pos - 1) {
            --pos;
        }
        if (pos == 0) {
            break;
        }
        ++idx[pos - 1];
        for (size_t i = pos; i < k; ++i) {
            idx[i] = idx[i - 1] + 1;
        }
    }
    return candidates;
}
