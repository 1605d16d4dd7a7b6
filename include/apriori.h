#ifndef APRIORI_H
#define APRIORI_H

#include <vector>
#include <cstddef>

#include "common.h"
#include "db.hpp"
#include "incidence_graph.h"
#include "param.h"

// Level-wise miner: seed level 1 from the incidence graph, then alternate
// candidate generation and support counting until a level comes back empty.
class AprioriMiner {
public:
    AprioriMiner(double min_support, Database* db)
        : _min_support(min_support), _db(db), _transactions(nullptr), _num_threads(NR_THREADS) {}
    AprioriMiner(double min_support, const TransactionList* transactions)
        : _min_support(min_support), _db(nullptr), _transactions(transactions), _num_threads(NR_THREADS) {}

    // max_length > 0 stops after that level
    const FrequentLevels& mine(int max_length = 0);

    const FrequentLevels& get_levels() const { return _levels; }
    const TransactionList& transactions() const;
    size_t transaction_count() const { return transactions().size(); }
    double min_support() const { return _min_support; }

    void set_num_threads(int num_threads) { _num_threads = num_threads > 0 ? num_threads : 1; }

private:
    double _min_support;
    Database* _db;
    const TransactionList* _transactions;
    int _num_threads;
    FrequentLevels _levels;

    FrequentLevel seed_level();
    FrequentLevel next_level(const FrequentLevel& previous_level, size_t k);
};

#endif
