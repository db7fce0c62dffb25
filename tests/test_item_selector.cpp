// =============================================================================
// Item Selector Tests
// =============================================================================

#include <gtest/gtest.h>
#include <vectrix/index/item_selector.hpp>
#include <cmath>
#include <cstdint>
#include <vector>

using namespace vectrix;

class ItemSelectorTest : public ::testing::Test {
protected:
    Json item() const {
        return Json::parse(R"({"category": "food", "price": 12.5, "stock": 3,
                               "organic": true, "tag": "fresh"})");
    }
};

TEST_F(ItemSelectorTest, SelfSimilarityIsOne) {
    std::vector<float> v = {0.3f, -1.2f, 4.0f, 0.0f, 2.5f};
    EXPECT_NEAR(ItemSelector::cosine_similarity(v, v), 1.0, 1e-9);

    double norm = ItemSelector::normalize(v);
    EXPECT_NEAR(ItemSelector::normalized_cosine_similarity(v, norm, v, norm), 1.0, 1e-9);
}

TEST_F(ItemSelectorTest, OppositeAndOrthogonalVectors) {
    std::vector<float> a = {1.0f, 0.0f};
    std::vector<float> b = {-1.0f, 0.0f};
    std::vector<float> c = {0.0f, 2.0f};
    EXPECT_NEAR(ItemSelector::cosine_similarity(a, b), -1.0, 1e-9);
    EXPECT_NEAR(ItemSelector::cosine_similarity(a, c), 0.0, 1e-9);
}

TEST_F(ItemSelectorTest, ZeroVectorGivesNaN) {
    std::vector<float> zero = {0.0f, 0.0f, 0.0f};
    std::vector<float> v = {1.0f, 2.0f, 3.0f};
    EXPECT_TRUE(std::isnan(ItemSelector::cosine_similarity(zero, v)));
    EXPECT_TRUE(std::isnan(ItemSelector::normalized_cosine_similarity(v, 3.74, zero, 0.0)));
}

TEST_F(ItemSelectorTest, NormIsEuclideanLength) {
    EXPECT_DOUBLE_EQ(ItemSelector::normalize({3.0f, 4.0f}), 5.0);
    EXPECT_DOUBLE_EQ(ItemSelector::normalize({}), 0.0);
}

TEST_F(ItemSelectorTest, EmptyFilterSelectsEverything) {
    EXPECT_TRUE(ItemSelector::select(item(), Json()));
    EXPECT_TRUE(ItemSelector::select(item(), Json::object()));
}

TEST_F(ItemSelectorTest, ScalarFieldMeansEquality) {
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"category": "food"})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": "drink"})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"stock": 3.0})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"stock": "3"})")));
}

TEST_F(ItemSelectorTest, ComparisonOperators) {
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"price": {"$gt": 12}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"price": {"$gt": 12.5}})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"price": {"$gte": 12.5}})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"price": {"$lt": 13}})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"price": {"$lte": 12.5, "$gte": 10}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"price": {"$lte": 12.5, "$gte": 13}})")));
}

TEST_F(ItemSelectorTest, ComparisonOnNonNumberFails) {
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": {"$gt": 1}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"price": {"$gt": "1"}})")));
}

TEST_F(ItemSelectorTest, EqAndNe) {
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"organic": {"$eq": true}})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"category": {"$ne": "drink"}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": {"$ne": "food"}})")));
}

// $in and $nin are exact, type-strict membership tests against the operand array.
// A string operand is not searched for substrings.
TEST_F(ItemSelectorTest, InAndNinUseExactMembership) {
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"category": {"$in": ["drink", "food"]}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": {"$in": ["foo", "drink"]}})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"stock": {"$in": [1, 2, 3]}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"stock": {"$in": ["3"]}})")));

    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(R"({"category": {"$nin": ["drink"]}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": {"$nin": ["food"]}})")));

    // Non-array operands match nothing, whichever operator
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": {"$in": "seafood"}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": {"$nin": "seafood"}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"tag": {"$in": "fresh"}})")));
}

TEST_F(ItemSelectorTest, LargeIntegersCompareExactly) {
    // Both round to the same double
    Json metadata = Json::parse(R"({"id": 9007199254740993})");
    EXPECT_FALSE(ItemSelector::select(metadata, Json::parse(R"({"id": 9007199254740992})")));
    EXPECT_TRUE(ItemSelector::select(metadata, Json::parse(R"({"id": {"$eq": 9007199254740993}})")));
    EXPECT_TRUE(ItemSelector::select(metadata, Json::parse(R"({"id": {"$ne": 9007199254740992}})")));
    EXPECT_FALSE(ItemSelector::select(metadata, Json::parse(R"({"id": {"$in": [9007199254740992]}})")));
    EXPECT_TRUE(ItemSelector::select(metadata, Json::parse(R"({"id": {"$nin": [9007199254740992]}})")));

    // Signed and unsigned storage of the same value
    Json signed_metadata = Json::object();
    signed_metadata["stock"] = static_cast<int64_t>(3);
    signed_metadata["delta"] = static_cast<int64_t>(-1);
    EXPECT_TRUE(ItemSelector::select(signed_metadata, Json::parse(R"({"stock": 3})")));
    EXPECT_FALSE(ItemSelector::select(signed_metadata, Json::parse(R"({"delta": 18446744073709551615})")));
    EXPECT_TRUE(ItemSelector::select(signed_metadata, Json::parse(R"({"delta": -1})")));
}

TEST_F(ItemSelectorTest, MissingOrNullFieldNeverMatches) {
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"color": "red"})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"color": {"$ne": "red"}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"color": {"$nin": ["red"]}})")));

    Json with_null = item();
    with_null["color"] = nullptr;
    EXPECT_FALSE(ItemSelector::select(with_null, Json::parse(R"({"color": {"$ne": "red"}})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"category": null})")));
}

TEST_F(ItemSelectorTest, AndOr) {
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(
        R"({"$and": [{"category": "food"}, {"price": {"$lt": 20}}]})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(
        R"({"$and": [{"category": "food"}, {"price": {"$gt": 20}}]})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(
        R"({"$or": [{"category": "drink"}, {"organic": true}]})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(
        R"({"$or": [{"category": "drink"}, {"organic": false}]})")));
    EXPECT_TRUE(ItemSelector::select(item(), Json::parse(
        R"({"$or": [{"$and": [{"stock": 3}, {"tag": "fresh"}]}, {"category": "x"}]})")));
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"$and": {"category": "food"}})")));
}

TEST_F(ItemSelectorTest, UnknownOperatorFails) {
    EXPECT_FALSE(ItemSelector::select(item(), Json::parse(R"({"price": {"$regex": "1.*"}})")));
}

TEST_F(ItemSelectorTest, SelectDoesNotModifyArguments) {
    Json metadata = item();
    Json filter = Json::parse(R"({"$or": [{"price": {"$gte": 1}}, {"missing": 1}]})");
    Json metadata_copy = metadata;
    Json filter_copy = filter;

    bool first = ItemSelector::select(metadata, filter);
    bool second = ItemSelector::select(metadata, filter);

    EXPECT_EQ(first, second);
    EXPECT_EQ(metadata, metadata_copy);
    EXPECT_EQ(filter, filter_copy);
}
