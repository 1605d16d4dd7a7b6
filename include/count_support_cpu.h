#ifndef COUNT_SUPPORT_CPU_H
#define COUNT_SUPPORT_CPU_H

#include <vector>
#include <cstdint>

#include "common.h"

// histogram[i] receives the number of transactions containing candidates[i]
void cpu_count_support(const std::vector<Itemset>& candidates, const TransactionList& transactions,
                       std::vector<SupportCount>& histogram, int num_threads);

// Keeps the candidates whose count / |transactions| reaches min_support
FrequentLevel count_support(const std::vector<Itemset>& candidates, const TransactionList& transactions,
                            double min_support, int num_threads);

#endif
