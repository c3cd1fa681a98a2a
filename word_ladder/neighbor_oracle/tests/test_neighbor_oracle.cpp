#include "neighbor_oracle.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <gmock/gmock-matchers.h>

#include <stdexcept>
#include <vector>


using namespace ::testing;
using namespace word_ladder;


// ====================
// Test fixture
// ====================

class NeighborOracleTest : public ::testing::Test {
 protected:
    void SetUp() override {
        dictionary_ = Dictionary{"four", "tire", "tree", "free", "flee", "fore", "tore", "trre"};
    }

    Dictionary dictionary_;
};


// ====================
// Direct scan
// ====================

TEST_F(NeighborOracleTest, Neighbors_OneLetterApart) {
    EXPECT_THAT(neighbors("tree", dictionary_), ElementsAre("free", "trre"));
    EXPECT_THAT(neighbors("trre", dictionary_), ElementsAre("tire", "tore", "tree"));
}

TEST_F(NeighborOracleTest, Neighbors_IsolatedWord) {
    EXPECT_THAT(neighbors("four", dictionary_), IsEmpty());
}

TEST_F(NeighborOracleTest, Neighbors_WordNotInDictionary) {
    EXPECT_THAT(neighbors("tred", dictionary_), ElementsAre("tree"));
}

TEST_F(NeighborOracleTest, Neighbors_CaseInsensitive) {
    EXPECT_EQ(neighbors("TREE", dictionary_), neighbors("tree", dictionary_));
    EXPECT_THAT(neighbors("Trre", dictionary_), Not(Contains("trre")));
}

TEST_F(NeighborOracleTest, Neighbors_NeverContainsWordItself) {
    for (const auto& word : dictionary_) {
        EXPECT_THAT(neighbors(word, dictionary_), Not(Contains(word))) << word;
    }
}

TEST_F(NeighborOracleTest, Neighbors_SameLengthAndOneDifference) {
    for (const auto& word : dictionary_) {
        const auto result = neighbors(word, dictionary_);
        EXPECT_THAT(result, Each(SizeIs(word.size()))) << word;
        for (const auto& next : result) {
            EXPECT_EQ(hamming_distance(next, word), 1u) << word << " -> " << next;
        }
    }
}

TEST(NeighborOracleMixedLengthTest, Neighbors_IgnoreOtherLengths) {
    Dictionary dictionary{"cat", "cart", "cot", "at", "cats"};
    EXPECT_THAT(neighbors("cat", dictionary), ElementsAre("cot"));
}

TEST(NeighborOracleMixedLengthTest, Index_KeepsOnlyItsLength) {
    Dictionary dictionary{"cat", "cart", "cot", "card", "cast"};
    NeighborIndex index(dictionary, 4);

    EXPECT_EQ(index.word_length(), 4u);
    EXPECT_EQ(index.size(), 3u);
    EXPECT_FALSE(index.contains("cat"));
    EXPECT_THAT(index.neighbors("cart"), UnorderedElementsAre("card", "cast"));
}

TEST(NeighborOracleMixedLengthTest, Neighbors_EmptyDictionary) {
    EXPECT_THAT(neighbors("cat", Dictionary{}), IsEmpty());
}


// ====================
// Wildcard index
// ====================

TEST_F(NeighborOracleTest, Index_MatchesDirectScan) {
    NeighborIndex index(dictionary_, 4);
    EXPECT_EQ(index.size(), dictionary_.size());

    std::vector<Word> queries(dictionary_.begin(), dictionary_.end());
    queries.push_back("tred");
    queries.push_back("Free");
    queries.push_back("zzzz");

    for (const auto& word : queries) {
        EXPECT_EQ(index.neighbors(word), neighbors(word, dictionary_)) << word;
    }
}

TEST_F(NeighborOracleTest, Index_AddRejectsDuplicatesAndOtherLengths) {
    NeighborIndex index(dictionary_, 4);

    EXPECT_FALSE(index.add("tree"));
    EXPECT_FALSE(index.add("TREE"));
    EXPECT_FALSE(index.add("cat"));
    EXPECT_TRUE(index.add("tred"));

    EXPECT_TRUE(index.contains("tred"));
    EXPECT_FALSE(index.contains("cat"));
    EXPECT_EQ(index.size(), dictionary_.size() + 1);
    EXPECT_THAT(index.neighbors("tree"), ElementsAre("free", "tred", "trre"));
}

TEST(NeighborIndexTest, PatternsFromDifferentPositionsDoNotMix) {
    // "a*" blanked at 0 and "*b" blanked at 1 spell the same pattern
    NeighborIndex index(2);
    index.add("a*");
    index.add("*b");
    index.add("ab");

    EXPECT_THAT(index.neighbors("a*"), ElementsAre("ab"));
    EXPECT_THAT(index.neighbors("*b"), ElementsAre("ab"));
    EXPECT_THAT(index.neighbors("ab"), ElementsAre("*b", "a*"));
}

TEST(NeighborIndexTest, ZeroLengthThrows) {
    EXPECT_THROW(NeighborIndex(0), std::invalid_argument);
}

TEST(NeighborIndexTest, OtherLengthHasNoNeighbors) {
    NeighborIndex index(Dictionary{"cat", "cot"}, 3);
    EXPECT_THAT(index.neighbors("cart"), IsEmpty());
}
