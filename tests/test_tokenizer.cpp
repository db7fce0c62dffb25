// =============================================================================
// Tokenizer and Keyword Index Tests
// =============================================================================

#include <gtest/gtest.h>
#include <vectrix/text/simple_tokenizer.hpp>
#include <vectrix/index/bm25_index.hpp>

#include <string>
#include <vector>

using namespace vectrix;

class SimpleTokenizerTest : public ::testing::Test {
protected:
    SimpleTokenizer tokenizer_;
};

TEST_F(SimpleTokenizerTest, WordsCarryLeadingSpace) {
    EXPECT_EQ(SimpleTokenizer::pre_tokenize("hello world"),
              std::vector<std::string>({"hello", " world"}));
    EXPECT_EQ(tokenizer_.encode("hello world").size(), 2u);
}

TEST_F(SimpleTokenizerTest, ClassesSplitApart) {
    EXPECT_EQ(SimpleTokenizer::pre_tokenize("abc123!!"),
              std::vector<std::string>({"abc", "123", "!!"}));
    EXPECT_EQ(SimpleTokenizer::pre_tokenize("a  b"),
              std::vector<std::string>({"a", " ", " b"}));
    EXPECT_EQ(SimpleTokenizer::pre_tokenize("x\n\ny"),
              std::vector<std::string>({"x", "\n\n", "y"}));
}

TEST_F(SimpleTokenizerTest, LongPiecesAreCut) {
    EXPECT_EQ(SimpleTokenizer::pre_tokenize("abcdefghijkl"),
              std::vector<std::string>({"abcdefgh", "ijkl"}));

    // Never cut inside a multi-byte character
    std::string accented = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";   // five "é"
    std::vector<std::string> pieces = SimpleTokenizer::pre_tokenize(accented);
    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[0].size(), 8u);
    EXPECT_EQ(pieces[1].size(), 2u);
}

TEST_F(SimpleTokenizerTest, DecodeReproducesInput) {
    std::string text = "Tokenizers  split\ttext, numbers like 42 and caf\xC3\xA9s.\n\n  Done!";
    EXPECT_EQ(tokenizer_.decode(tokenizer_.encode(text)), text);

    std::vector<int> tokens = tokenizer_.encode("one two");
    std::vector<int> tail(tokens.begin() + 1, tokens.end());
    EXPECT_EQ(tokenizer_.decode(tail), " two");
}

TEST_F(SimpleTokenizerTest, RepeatedPiecesShareIds) {
    std::vector<int> tokens = tokenizer_.encode("x x x");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_NE(tokens[0], tokens[1]);
    EXPECT_EQ(tokens[1], tokens[2]);
    EXPECT_EQ(tokenizer_.vocabulary_size(), 2u);
}

TEST_F(SimpleTokenizerTest, UnknownIdsAreSkipped) {
    tokenizer_.encode("known");
    EXPECT_EQ(tokenizer_.decode({0, 99, -1}), "known");
}

// =============================================================================
// BM25
// =============================================================================

class Bm25IndexTest : public ::testing::Test {};

TEST_F(Bm25IndexTest, TokenizeLowercasesAndDropsStopWords) {
    EXPECT_EQ(Bm25Index::tokenize("The Quick, brown FOX is in the box"),
              std::vector<std::string>({"quick", "brown", "fox", "box"}));
}

TEST_F(Bm25IndexTest, RanksByTermWeight) {
    Bm25Index index;
    index.add_document(10, "apples and oranges");
    index.add_document(20, "apples apples apples pie");
    index.add_document(30, "grapes only");

    std::vector<Bm25Hit> hits = index.search("apples", 10);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].doc, 20u);
    EXPECT_EQ(hits[1].doc, 10u);
    EXPECT_GT(hits[0].score, hits[1].score);
}

TEST_F(Bm25IndexTest, RareTermsWeighMore) {
    Bm25Index index;
    index.add_document(0, "common rare");
    index.add_document(1, "common word");
    index.add_document(2, "common thing");

    std::vector<Bm25Hit> hits = index.search("common rare", 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].doc, 0u);
}

TEST_F(Bm25IndexTest, LimitAndEmptyQueries) {
    Bm25Index index;
    EXPECT_TRUE(index.search("anything", 5).empty());

    index.add_document(0, "alpha beta");
    index.add_document(1, "alpha gamma");
    EXPECT_EQ(index.search("alpha", 1).size(), 1u);
    EXPECT_TRUE(index.search("alpha", 0).empty());
    EXPECT_TRUE(index.search("the and of", 5).empty());
    EXPECT_TRUE(index.search("delta", 5).empty());
}

TEST_F(Bm25IndexTest, IndexGrowsAfterSearch) {
    Bm25Index index;
    index.add_document(0, "first text");
    EXPECT_EQ(index.search("second", 5).size(), 0u);

    index.add_document(1, "second text");
    std::vector<Bm25Hit> hits = index.search("second", 5);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].doc, 1u);
    EXPECT_EQ(index.size(), 2u);
}
