#ifndef CANDIDATES_H
#define CANDIDATES_H

#include <vector>
#include <cstddef>

#include "common.h"

// Distinct items over every itemset of the level, ascending
std::vector<ItemId> candidate_universe(const FrequentLevel& level);

std::vector<Itemset> singleton_candidates(const std::vector<ItemId>& items);

// Every k-combination of the items seen in the previous level. Candidates are
// not pruned by their (k-1)-subsets; only the item universe is restricted.
std::vector<Itemset> generate_candidates(const FrequentLevel& previous_level, size_t k);

#endif
