#ifndef REPORT_H
#define REPORT_H

#include <iostream>
#include <vector>
#include <cstddef>

#include "common.h"
#include "db.hpp"

void print_levels(std::ostream& out, const FrequentLevels& levels, const ItemDictionary& dictionary,
                  size_t transaction_count);
void print_rules(std::ostream& out, const std::vector<Rule>& rules, const ItemDictionary& dictionary);

#endif
