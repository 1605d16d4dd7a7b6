#ifndef DB_H
#define DB_H

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>
#include <optional>

#include "common.h"

class ItemDictionary {
public:
    ItemId intern(const std::string& label);
    std::optional<ItemId> find(const std::string& label) const;
    const std::string& label(ItemId id) const;
    size_t size() const { return _labels.size(); }

    Itemset itemset(const std::vector<std::string>& labels) const;
    std::string format(const Itemset& itemset) const;

private:
    std::unordered_map<std::string, ItemId> _ids;
    std::vector<std::string> _labels;
};

enum class InputFormat {
    Basket,     // whitespace separated items, one transaction per line
    Table       // CSV with a header row, items are "<column>_<value>"
};

class Database {
public:
    Database(const std::string& file_path): Database(file_path, format_for(file_path)) {}
    Database(const std::string& file_path, InputFormat format): _file_path(file_path), _format(format) {
        _file.open(_file_path);
        if (!_file.is_open()) {
            throw std::runtime_error("Could not open file: " + _file_path);
        }
    }

    ~Database() {
        if (_file.is_open()) {
            _file.close();
        }
    }

    void seek_to_start();
    const TransactionList& load();

    const TransactionList& transactions() const { return _transactions; }
    const ItemDictionary& dictionary() const { return _dictionary; }
    InputFormat format() const { return _format; }

    static InputFormat format_for(const std::string& file_path);

private:
    std::string _file_path;
    std::ifstream _file;
    InputFormat _format;
    ItemDictionary _dictionary;
    TransactionList _transactions;

    void load_baskets();
    void load_table();
};

std::vector<std::string> split_csv_line(const std::string& line);

// Interns every label and returns one sorted transaction per row
TransactionList make_transactions(const std::vector<std::vector<std::string>>& rows, ItemDictionary& dictionary);

#endif
