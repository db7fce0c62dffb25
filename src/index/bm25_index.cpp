#include <vectrix/index/bm25_index.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace vectrix {

Bm25Index::Bm25Index() : avg_length_(0.0), built_(false) {}

const std::unordered_set<std::string>& Bm25Index::stop_words() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "and", "are", "as", "at", "be", "been", "being", "but", "by",
        "can", "could", "did", "do", "does", "for", "from", "had", "has", "have",
        "if", "in", "into", "is", "it", "its", "may", "might", "no", "not", "of",
        "on", "or", "should", "so", "such", "that", "the", "their", "then", "there",
        "these", "they", "this", "those", "through", "to", "was", "were", "when",
        "which", "will", "with", "would"
    };
    return words;
}

std::vector<std::string> Bm25Index::tokenize(const std::string& text) {
    std::vector<std::string> terms;
    const auto& stops = stop_words();

    std::string current;
    auto flush = [&]() {
        if (!current.empty()) {
            if (stops.find(current) == stops.end()) {
                terms.push_back(current);
            }
            current.clear();
        }
    };

    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        // Non-ASCII bytes stay inside terms so UTF-8 words survive intact
        if (std::isalnum(uc) || uc >= 0x80) {
            current += static_cast<char>(std::tolower(uc));
        } else {
            flush();
        }
    }
    flush();
    return terms;
}

void Bm25Index::add_document(size_t doc, const std::string& text) {
    std::vector<std::string> terms = tokenize(text);

    Document d;
    d.doc = doc;
    d.length = terms.size();
    for (const auto& t : terms) {
        d.tf[t]++;
    }
    for (const auto& kv : d.tf) {
        doc_freq_[kv.first]++;
    }

    documents_.push_back(std::move(d));
    built_ = false;
}

void Bm25Index::build() {
    idf_.clear();
    avg_length_ = 0.0;
    if (documents_.empty()) {
        built_ = true;
        return;
    }

    double n = static_cast<double>(documents_.size());
    double total = 0.0;
    for (const auto& d : documents_) {
        total += static_cast<double>(d.length);
    }
    avg_length_ = total / n;

    // IDF: log((N - df + 0.5) / (df + 0.5) + 1)
    for (const auto& kv : doc_freq_) {
        double df = static_cast<double>(kv.second);
        idf_[kv.first] = std::log((n - df + 0.5) / (df + 0.5) + 1.0);
    }
    built_ = true;
}

double Bm25Index::idf(const std::string& term) const {
    auto it = idf_.find(term);
    return it != idf_.end() ? it->second : 0.0;
}

std::vector<Bm25Hit> Bm25Index::search(const std::string& query, size_t limit) {
    std::vector<Bm25Hit> hits;
    if (!built_) build();
    if (documents_.empty() || limit == 0) return hits;

    std::vector<std::string> query_terms = tokenize(query);
    if (query_terms.empty()) return hits;

    double avg = avg_length_ > 0.0 ? avg_length_ : 1.0;
    for (const auto& d : documents_) {
        double score = 0.0;
        double dl = static_cast<double>(d.length);
        for (const auto& term : query_terms) {
            auto tf_it = d.tf.find(term);
            if (tf_it == d.tf.end()) continue;

            // IDF * (tf * (k1 + 1)) / (tf + k1 * (1 - b + b * dl / avgdl))
            double tf = static_cast<double>(tf_it->second);
            score += idf(term) * (tf * (k1 + 1.0)) / (tf + k1 * (1.0 - b + b * dl / avg));
        }
        if (score > 0.0) {
            hits.push_back(Bm25Hit{d.doc, score});
        }
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const Bm25Hit& x, const Bm25Hit& y) { return x.score > y.score; });
    if (hits.size() > limit) {
        hits.resize(limit);
    }
    return hits;
}

} // namespace vectrix
