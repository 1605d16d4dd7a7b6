#include "apriori.h"
#include "db.hpp"
#include "rules.h"
#include "report.h"
#include "param.h"
#include "timer.h"

#include <cstdio>
#include <iostream>
#include <fstream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 4) {
        printf("Usage: %s <data_file> <min_support> <min_confidence> [output_file]\n", argv[0]);
        return 1;
    }
    std::string db_path = argv[1];

    try {
        double min_support = std::stod(argv[2]);
        double min_confidence = std::stod(argv[3]);
        check_min_support(min_support);
        check_min_confidence(min_confidence);

        Database db(db_path);
        {
            Timer::Phase phase("Load database");
            db.load();
        }

        AprioriMiner miner(min_support, &db);
        miner.set_num_threads(param_threads());
        int max_length = param_max_length();

        Timer::instance().start("Mine frequent itemsets");
        const FrequentLevels& levels = miner.mine(max_length);
        Timer::instance().stop();

        RuleOptions options;
        options.min_confidence = min_confidence;
        options.min_lift = param_min_lift();
        options.min_leverage = param_min_leverage();

        RuleStats stats;
        Timer::instance().start("Derive rules");
        std::vector<Rule> rules = derive_rules(levels, miner.transaction_count(), options, stats);
        sort_rules(rules);
        Timer::instance().stop();

        std::ofstream file;
        if (argc > 4) {
            file.open(argv[4]);
            if (!file.is_open()) {
                throw std::runtime_error("Could not open file: " + std::string(argv[4]));
            }
        }
        std::ostream& output = file.is_open() ? file : std::cout;

        print_levels(output, levels, db.dictionary(), miner.transaction_count());
        print_rules(output, rules, db.dictionary());

        if (stats.missing_support > 0 || stats.undefined_metric > 0) {
            std::cerr << "Skipped " << stats.missing_support << " rules without subset support, "
                      << stats.undefined_metric << " with undefined metrics" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Timer::instance().print_records();

    return 0;
}
