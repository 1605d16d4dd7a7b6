#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "db.hpp"
#include "test_util.h"

static std::string data_path(const std::string& name) {
    return std::string(TEST_DATA_DIR) + "/" + name;
}

TEST(ItemDictionaryTest, InternAssignsDenseIdsInFirstSeenOrder) {
    ItemDictionary dictionary;
    EXPECT_EQ(dictionary.intern("milk"), 0u);
    EXPECT_EQ(dictionary.intern("bread"), 1u);
    EXPECT_EQ(dictionary.intern("milk"), 0u);
    EXPECT_EQ(dictionary.size(), 2u);
    EXPECT_EQ(dictionary.label(1), "bread");
}

TEST(ItemDictionaryTest, LookupIsExactStringEquality) {
    ItemDictionary dictionary;
    dictionary.intern("color_red");
    EXPECT_TRUE(dictionary.find("color_red").has_value());
    EXPECT_FALSE(dictionary.find("color_Red").has_value());
    EXPECT_FALSE(dictionary.find("color_red ").has_value());
    EXPECT_THROW(dictionary.label(7), std::out_of_range);
    EXPECT_THROW(dictionary.itemset({"missing"}), std::out_of_range);
}

TEST(ItemDictionaryTest, FormatSortsLabels) {
    ItemDictionary dictionary;
    dictionary.intern("C");
    dictionary.intern("A");
    EXPECT_EQ(dictionary.format(dictionary.itemset({"C", "A"})), "{A, C}");
    EXPECT_EQ(dictionary.format(Itemset()), "{}");
}

TEST(MakeTransactionsTest, CollapsesDuplicatesAndSorts) {
    ItemDictionary dictionary;
    TransactionList transactions = make_transactions({{"B", "A", "B"}, {}}, dictionary);
    ASSERT_EQ(transactions.size(), 2u);
    EXPECT_EQ(transactions[0], items(dictionary, {"A", "B"}));
    EXPECT_EQ(transactions[0].size(), 2u);
    EXPECT_TRUE(std::is_sorted(transactions[0].begin(), transactions[0].end()));
    EXPECT_TRUE(transactions[1].empty());
}

TEST(DatabaseTest, FormatFollowsExtension) {
    EXPECT_EQ(Database::format_for("data/rows.csv"), InputFormat::Table);
    EXPECT_EQ(Database::format_for("ROWS.CSV"), InputFormat::Table);
    EXPECT_EQ(Database::format_for("baskets.txt"), InputFormat::Basket);
    EXPECT_EQ(Database::format_for("baskets"), InputFormat::Basket);
}

TEST(DatabaseTest, MissingFileThrows) {
    EXPECT_THROW({ Database db(data_path("does_not_exist.txt")); }, std::runtime_error);
}

TEST(DatabaseTest, LoadsBasketsAndSkipsBlankLines) {
    Database db(data_path("example.txt"));
    const TransactionList& transactions = db.load();
    ASSERT_EQ(transactions.size(), 5u);

    const ItemDictionary& dictionary = db.dictionary();
    EXPECT_EQ(dictionary.size(), 4u);
    EXPECT_EQ(transactions[0], items(dictionary, {"A", "B", "C"}));
    EXPECT_EQ(transactions[2], items(dictionary, {"B", "C", "D"}));
    EXPECT_EQ(transactions[4], items(dictionary, {"B", "C"}));
}

TEST(DatabaseTest, ReloadDoesNotDuplicateTransactions) {
    Database db(data_path("example.txt"));
    db.load();
    db.load();
    EXPECT_EQ(db.transactions().size(), 5u);
    EXPECT_EQ(db.dictionary().size(), 4u);
}

TEST(DatabaseTest, LoadsTableAsColumnValueItems) {
    Database db(data_path("weather.csv"));
    ASSERT_EQ(db.format(), InputFormat::Table);
    const TransactionList& transactions = db.load();
    ASSERT_EQ(transactions.size(), 6u);

    const ItemDictionary& dictionary = db.dictionary();
    EXPECT_EQ(transactions[0], items(dictionary, {"outlook_sunny", "windy_false", "play_no"}));
    // empty cell contributes nothing
    EXPECT_EQ(transactions[3], items(dictionary, {"outlook_rain", "play_yes"}));
    // quoted cell matches the unquoted label
    EXPECT_EQ(transactions[4], items(dictionary, {"outlook_rain", "windy_false", "play_yes"}));
    EXPECT_EQ(transactions[5], items(dictionary, {"outlook_over, cast", "windy_true", "play_say \"yes\""}));
}

TEST(DatabaseTest, RaggedRowThrows) {
    Database db(data_path("ragged.csv"));
    EXPECT_THROW(db.load(), std::runtime_error);
}

TEST(SplitCsvLineTest, HandlesQuotesAndEmptyCells) {
    EXPECT_EQ(split_csv_line("a,,c"), (std::vector<std::string>{"a", "", "c"}));
    EXPECT_EQ(split_csv_line("\"x,y\",z"), (std::vector<std::string>{"x,y", "z"}));
    EXPECT_EQ(split_csv_line("\"a\"\"b\""), (std::vector<std::string>{"a\"b"}));
    EXPECT_EQ(split_csv_line("last,\r"), (std::vector<std::string>{"last", ""}));
}
