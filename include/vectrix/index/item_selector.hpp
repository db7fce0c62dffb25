/*
 * vectrix C++17 - Item Selector
 *
 * Vector similarity and metadata filter evaluation. Stateless.
 *
 * Filters are JSON objects in a Mongo-like dialect:
 *   {"category": "food"}                        exact match
 *   {"price": {"$gte": 10, "$lt": 20}}          operator sub-filter
 *   {"$or": [{"a": 1}, {"b": {"$in": [2, 3]}}]}
 *
 * $in / $nin test exact, type-strict membership of the stored value in the
 * operand array. A field missing from the metadata (or null) never matches.
 */
#ifndef vectrix_INDEX_ITEM_SELECTOR_HPP
#define vectrix_INDEX_ITEM_SELECTOR_HPP

#include <vectrix/core/json.hpp>
#include <vector>

namespace vectrix {

class ItemSelector {
public:
    // Cosine similarity over the overlapping prefix of both vectors.
    // NaN when either norm is zero.
    static double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

    // Euclidean length.
    static double normalize(const std::vector<float>& v);

    // Cosine similarity with precomputed norms. NaN when either norm is zero.
    static double normalized_cosine_similarity(const std::vector<float>& a, double norm_a,
                                               const std::vector<float>& b, double norm_b);

    // True when `metadata` satisfies `filter`. A null or empty filter selects everything.
    static bool select(const Json& metadata, const Json& filter);

private:
    static double dot_product(const std::vector<float>& a, const std::vector<float>& b);
    static bool metadata_filter(const Json* value, const Json& filter);
    static bool scalar_equal(const Json& a, const Json& b);
    static bool in_array(const Json& value, const Json& operand);
};

} // namespace vectrix

#endif // vectrix_INDEX_ITEM_SELECTOR_HPP
