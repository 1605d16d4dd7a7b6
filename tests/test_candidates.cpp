#include <gtest/gtest.h>

#include <set>

#include "candidates.h"
#include "test_util.h"

class CandidatesTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* label : {"A", "B", "C", "D", "E"}) {
            dictionary.intern(label);
        }
    }

    Itemset set(const std::vector<std::string>& labels) {
        return dictionary.itemset(labels);
    }

    ItemDictionary dictionary;
};

TEST_F(CandidatesTest, UniverseFlattensLevel) {
    FrequentLevel level = {{set({"A", "B"}), 3}, {set({"B", "D"}), 2}};
    EXPECT_EQ(candidate_universe(level), set({"A", "B", "D"}));
}

TEST_F(CandidatesTest, SingletonsAreDeduplicated) {
    std::vector<Itemset> candidates = singleton_candidates({2, 0, 2});
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0], Itemset{0});
    EXPECT_EQ(candidates[1], Itemset{2});
}

TEST_F(CandidatesTest, AllPairsFromSingletonLevel) {
    FrequentLevel level = {{set({"A"}), 3}, {set({"B"}), 3}, {set({"C"}), 5}};
    std::vector<Itemset> candidates = generate_candidates(level, 2);

    std::set<Itemset> expected = {set({"A", "B"}), set({"A", "C"}), set({"B", "C"})};
    EXPECT_EQ(std::set<Itemset>(candidates.begin(), candidates.end()), expected);
    EXPECT_EQ(candidates.size(), expected.size());
}

// Candidates are drawn from the item universe, not joined and pruned by
// frequent subsets: {A, C} was never frequent, yet {A, B, C} is emitted.
TEST_F(CandidatesTest, NoSubsetPruning) {
    FrequentLevel level = {{set({"A", "B"}), 3}, {set({"B", "C"}), 3}};
    std::vector<Itemset> candidates = generate_candidates(level, 3);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0], set({"A", "B", "C"}));
}

TEST_F(CandidatesTest, DisjointPairsYieldFullClosure) {
    FrequentLevel level = {{set({"A", "B"}), 2}, {set({"C", "D"}), 2}};
    std::vector<Itemset> candidates = generate_candidates(level, 2);
    // C(4, 2) pairs, including the never-seen {A, C}, {A, D}, {B, C}, {B, D}
    EXPECT_EQ(candidates.size(), 6u);
    std::set<Itemset> unique(candidates.begin(), candidates.end());
    EXPECT_EQ(unique.size(), 6u);
    EXPECT_TRUE(unique.count(set({"A", "D"})));
}

TEST_F(CandidatesTest, CountMatchesBinomial) {
    FrequentLevel level;
    for (const char* label : {"A", "B", "C", "D", "E"}) {
        level[set({label})] = 1;
    }
    EXPECT_EQ(generate_candidates(level, 1).size(), 5u);
    EXPECT_EQ(generate_candidates(level, 2).size(), 10u);
    EXPECT_EQ(generate_candidates(level, 3).size(), 10u);
    EXPECT_EQ(generate_candidates(level, 5).size(), 1u);
    for (const auto& candidate : generate_candidates(level, 3)) {
        EXPECT_EQ(candidate.size(), 3u);
        EXPECT_TRUE(std::is_sorted(candidate.begin(), candidate.end()));
    }
}

TEST_F(CandidatesTest, UniverseSmallerThanKYieldsNothing) {
    FrequentLevel level = {{set({"A", "B"}), 3}};
    EXPECT_TRUE(generate_candidates(level, 3).empty());
    EXPECT_TRUE(generate_candidates(level, 10).empty());
}

TEST_F(CandidatesTest, EmptyPreviousLevelYieldsNothing) {
    EXPECT_TRUE(generate_candidates(FrequentLevel(), 2).empty());
}
