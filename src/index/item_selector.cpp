#include <vectrix/index/item_selector.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace vectrix {

// ============================================================================
// Similarity
// ============================================================================

double ItemSelector::dot_product(const std::vector<float>& a, const std::vector<float>& b) {
    size_t n = std::min(a.size(), b.size());
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

double ItemSelector::normalize(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * static_cast<double>(x);
    }
    return std::sqrt(sum);
}

double ItemSelector::cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    size_t n = std::min(a.size(), b.size());
    std::vector<float> pa(a.begin(), a.begin() + n);
    std::vector<float> pb(b.begin(), b.begin() + n);

    double norm_a = normalize(pa);
    double norm_b = normalize(pb);
    if (norm_a == 0.0 || norm_b == 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return dot_product(pa, pb) / (norm_a * norm_b);
}

double ItemSelector::normalized_cosine_similarity(const std::vector<float>& a, double norm_a,
                                                  const std::vector<float>& b, double norm_b) {
    if (norm_a == 0.0 || norm_b == 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return dot_product(a, b) / (norm_a * norm_b);
}

// ============================================================================
// Filters
// ============================================================================

bool ItemSelector::scalar_equal(const Json& a, const Json& b) {
    if (a.is_number_integer() && b.is_number_integer()) {
        if (a.is_number_unsigned() && b.is_number_unsigned()) {
            return a.get<uint64_t>() == b.get<uint64_t>();
        }
        if (a.is_number_unsigned() || b.is_number_unsigned()) {
            const Json& u = a.is_number_unsigned() ? a : b;
            const Json& s = a.is_number_unsigned() ? b : a;
            int64_t signed_value = s.get<int64_t>();
            return signed_value >= 0 && static_cast<uint64_t>(signed_value) == u.get<uint64_t>();
        }
        return a.get<int64_t>() == b.get<int64_t>();
    }
    if (a.is_number() && b.is_number()) {
        return a.get<double>() == b.get<double>();
    }
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string&>() == b.get_ref<const std::string&>();
    }
    if (a.is_boolean() && b.is_boolean()) {
        return a.get<bool>() == b.get<bool>();
    }
    return false;
}

bool ItemSelector::in_array(const Json& value, const Json& operand) {
    for (const auto& candidate : operand) {
        if (scalar_equal(value, candidate)) {
            return true;
        }
    }
    return false;
}

bool ItemSelector::select(const Json& metadata, const Json& filter) {
    if (filter.is_null() || (filter.is_object() && filter.empty())) {
        return true;
    }
    if (!filter.is_object()) {
        return false;
    }

    for (auto it = filter.begin(); it != filter.end(); ++it) {
        const std::string& key = it.key();
        const Json& value = it.value();

        if (key == "$and") {
            if (!value.is_array()) return false;
            for (const auto& sub : value) {
                if (!select(metadata, sub)) return false;
            }
        } else if (key == "$or") {
            if (!value.is_array()) return false;
            bool any = false;
            for (const auto& sub : value) {
                if (select(metadata, sub)) {
                    any = true;
                    break;
                }
            }
            if (!any) return false;
        } else {
            if (value.is_null()) return false;

            const Json* field = nullptr;
            if (metadata.is_object()) {
                auto found = metadata.find(key);
                if (found != metadata.end()) field = &(*found);
            }

            if (value.is_object()) {
                if (!metadata_filter(field, value)) return false;
            } else {
                if (!field || !scalar_equal(*field, value)) return false;
            }
        }
    }
    return true;
}

bool ItemSelector::metadata_filter(const Json* value, const Json& filter) {
    if (!value || value->is_null()) {
        return false;
    }

    for (auto it = filter.begin(); it != filter.end(); ++it) {
        const std::string& op = it.key();
        const Json& operand = it.value();
        if (operand.is_null()) {
            return false;
        }

        if (op == "$eq") {
            if (!scalar_equal(*value, operand)) return false;
        } else if (op == "$ne") {
            if (scalar_equal(*value, operand)) return false;
        } else if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte") {
            if (!value->is_number() || !operand.is_number()) return false;
            double v = value->get<double>();
            double o = operand.get<double>();
            if (op == "$gt" && !(v > o)) return false;
            if (op == "$gte" && !(v >= o)) return false;
            if (op == "$lt" && !(v < o)) return false;
            if (op == "$lte" && !(v <= o)) return false;
        } else if (op == "$in") {
            if (!operand.is_array() || !in_array(*value, operand)) return false;
        } else if (op == "$nin") {
            if (!operand.is_array() || in_array(*value, operand)) return false;
        } else {
            return false;
        }
    }
    return true;
}

} // namespace vectrix
