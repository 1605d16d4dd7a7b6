#include <vector>
#include <thread>
#include <cstdint>
#include <algorithm>
#include <iostream>

#include "count_support_cpu.h"

// Parallel support counting using std::thread. Each worker scans a contiguous
// slice of the transactions into its own histogram; the histograms are summed.
void cpu_count_support(const std::vector<Itemset>& candidates, const TransactionList& transactions,
                       std::vector<SupportCount>& histogram, int num_threads) {
    size_t count = transactions.size();
    if (num_threads < 1) num_threads = 1;
    if (static_cast<size_t>(num_threads) > count) num_threads = count > 0 ? static_cast<int>(count) : 1;

    std::vector<std::vector<SupportCount>> local_hists(num_threads, std::vector<SupportCount>(candidates.size(), 0));
    size_t stride = (count + num_threads - 1) / num_threads;
    auto worker = [&](int tid) {
        size_t start = tid * stride;
        size_t end = std::min(count, start + stride);
        for (size_t t = start; t < end; ++t) {
            const Transaction& transaction = transactions[t];
            for (size_t c = 0; c < candidates.size(); ++c) {
                if (candidates[c].size() <= transaction.size() && is_subset(candidates[c], transaction)) {
                    local_hists[tid][c]++;
                }
            }
        }
    };

    if (num_threads == 1) {
        worker(0);
    } else {
        std::vector<std::thread> threads;
        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back(worker, t);
        }
        for (auto& th : threads) th.join();
    }

    // Reduce local histograms
    histogram.assign(candidates.size(), 0);
    for (int t = 0; t < num_threads; ++t) {
        for (size_t c = 0; c < candidates.size(); ++c) {
            histogram[c] += local_hists[t][c];
        }
    }
}

FrequentLevel count_support(const std::vector<Itemset>& candidates, const TransactionList& transactions,
                            double min_support, int num_threads) {
    check_min_support(min_support);
    if (transactions.empty()) {
        throw EmptyTransactionSet();
    }

    std::vector<SupportCount> histogram;
    cpu_count_support(candidates, transactions, histogram, num_threads);

    FrequentLevel level;
    double n = static_cast<double>(transactions.size());
    for (size_t c = 0; c < candidates.size(); ++c) {
        if (static_cast<double>(histogram[c]) / n >= min_support) {
            level.emplace(candidates[c], histogram[c]);
        }
    }

#ifdef PRINT
    std::cout << "Counted " << candidates.size() << " candidates, " << level.size() << " frequent" << std::endl;
#endif
    return level;
}
