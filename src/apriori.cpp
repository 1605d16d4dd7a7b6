#include "apriori.h"

#include <iostream>
#include <string>

#include "candidates.h"
#include "count_support_cpu.h"

const TransactionList& AprioriMiner::transactions() const {
    if (_db) {
        return _db->transactions();
    }
    if (!_transactions) {
        throw std::logic_error("AprioriMiner has no transaction source");
    }
    return *_transactions;
}

const FrequentLevels& AprioriMiner::mine(int max_length) {
    check_min_support(_min_support);
    if (transactions().empty()) {
        throw EmptyTransactionSet();
    }

    _levels.clear();

    FrequentLevel level = seed_level();
    if (level.empty()) {
        return _levels;
    }
    _levels.push_back(std::move(level));

    size_t k = 1;
    while (max_length <= 0 || k < static_cast<size_t>(max_length)) {
        ++k;
        FrequentLevel next = next_level(_levels.back(), k);
        if (next.empty()) {
            break;
        }
        _levels.push_back(std::move(next));
    }

#ifdef PRINT
    for (size_t i = 0; i < _levels.size(); ++i) {
        std::cout << "Level " << i + 1 << ": " << _levels[i].size() << " frequent itemsets" << std::endl;
    }
#endif
    return _levels;
}

FrequentLevel AprioriMiner::seed_level() {
    IncidenceGraph graph(transactions());
    std::vector<Itemset> candidates = singleton_candidates(graph.seed_items());
    return count_support(candidates, transactions(), _min_support, _num_threads);
}

FrequentLevel AprioriMiner::next_level(const FrequentLevel& previous_level, size_t k) {
    std::vector<Itemset> candidates = generate_candidates(previous_level, k);
    if (candidates.empty()) {
        return FrequentLevel();
    }
    return count_support(candidates, transactions(), _min_support, _num_threads);
}
