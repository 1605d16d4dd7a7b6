#include "db.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

ItemId ItemDictionary::intern(const std::string& label) {
    auto it = _ids.find(label);
    if (it != _ids.end()) {
        return it->second;
    }
    ItemId id = static_cast<ItemId>(_labels.size());
    _ids.emplace(label, id);
    _labels.push_back(label);
    return id;
}

std::optional<ItemId> ItemDictionary::find(const std::string& label) const {
    auto it = _ids.find(label);
    if (it == _ids.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string& ItemDictionary::label(ItemId id) const {
    if (id >= _labels.size()) {
        throw std::out_of_range("Unknown item id: " + std::to_string(id));
    }
    return _labels[id];
}

Itemset ItemDictionary::itemset(const std::vector<std::string>& labels) const {
    std::vector<ItemId> items;
    for (const auto& label : labels) {
        auto id = find(label);
        if (!id) {
            throw std::out_of_range("Unknown item: " + label);
        }
        items.push_back(*id);
    }
    return make_itemset(items);
}

std::string ItemDictionary::format(const Itemset& itemset) const {
    std::vector<std::string> labels;
    for (ItemId item : itemset) {
        labels.push_back(label(item));
    }
    std::sort(labels.begin(), labels.end());

    std::string result = "{";
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) result += ", ";
        result += labels[i];
    }
    result += "}";
    return result;
}

InputFormat Database::format_for(const std::string& file_path) {
    std::string extension;
    size_t dot = file_path.find_last_of('.');
    if (dot != std::string::npos) {
        extension = file_path.substr(dot + 1);
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    }
    return extension == "csv" ? InputFormat::Table : InputFormat::Basket;
}

void Database::seek_to_start() {
    _file.clear();
    _file.seekg(0, std::ios::beg);
}

const TransactionList& Database::load() {
    seek_to_start();
    _transactions.clear();

    if (_format == InputFormat::Table) {
        load_table();
    } else {
        load_baskets();
    }

#ifdef PRINT
    std::cout << "Loaded " << _transactions.size() << " transactions, "
              << _dictionary.size() << " distinct items from " << _file_path << std::endl;
#endif
    return _transactions;
}

void Database::load_baskets() {
    std::string line;
    while (std::getline(_file, line)) {
        std::istringstream iss(line);
        std::vector<ItemId> items;
        std::string label;
        while (iss >> label) {
            items.push_back(_dictionary.intern(label));
        }
        if (!items.empty()) {
            _transactions.push_back(make_itemset(items));
        }
    }
}

void Database::load_table() {
    std::string line;
    if (!std::getline(_file, line)) {
        return;
    }
    std::vector<std::string> header = split_csv_line(line);

    size_t line_no = 1;
    while (std::getline(_file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        std::vector<std::string> cells = split_csv_line(line);
        if (cells.size() != header.size()) {
            throw std::runtime_error(_file_path + ":" + std::to_string(line_no) + ": expected "
                                     + std::to_string(header.size()) + " columns, got "
                                     + std::to_string(cells.size()));
        }

        std::vector<ItemId> items;
        for (size_t col = 0; col < cells.size(); ++col) {
            if (cells[col].empty()) continue;
            items.push_back(_dictionary.intern(header[col] + "_" + cells[col]));
        }
        _transactions.push_back(make_itemset(items));
    }
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell += ch;
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            cells.push_back(cell);
            cell.clear();
        } else if (ch != '\r') {
            cell += ch;
        }
    }
    cells.push_back(cell);
    return cells;
}

TransactionList make_transactions(const std::vector<std::vector<std::string>>& rows, ItemDictionary& dictionary) {
    TransactionList transactions;
    transactions.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<ItemId> items;
        for (const auto& label : row) {
            items.push_back(dictionary.intern(label));
        }
        transactions.push_back(make_itemset(items));
    }
    return transactions;
}
