#include <vectrix/documents/local_document_result.hpp>
#include <vectrix/documents/local_document_index.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <algorithm>

namespace vectrix {

namespace {

const char* const SECTION_CONNECTOR = "\n\n...\n\n";

// Below this many spare tokens a section is not padded
const long MIN_OVERLAP_BUDGET = 40;

struct SectionChunk {
    std::string text;
    size_t start_pos;
    size_t end_pos;
    double score;
    size_t token_count;
    bool is_bm25;
};

struct Section {
    std::vector<SectionChunk> chunks;
    double score;
    size_t token_count;
    bool is_bm25;
};

Status chunk_span(const IndexItem& item, size_t& start, size_t& end) {
    const Json& m = item.metadata;
    if (!m.is_object() ||
        !m.contains("startPos") || !m["startPos"].is_number_unsigned() ||
        !m.contains("endPos") || !m["endPos"].is_number_unsigned()) {
        return Status::fail(ErrorKind::PARSE, "Chunk " + item.id + " has no text span");
    }
    start = m["startPos"].get<size_t>();
    end = m["endPos"].get<size_t>();
    return Status::ok();
}

std::string slice(const std::string& text, size_t start, size_t end) {
    if (start >= text.size() || end < start) return "";
    return text.substr(start, end - start + 1);
}

// Greedy document-order packing of the chunks of one kind
std::vector<Section> fold_sections(const std::vector<SectionChunk>& chunks,
                                   bool bm25,
                                   size_t max_tokens) {
    std::vector<Section> sections;
    for (const auto& chunk : chunks) {
        if (chunk.is_bm25 != bm25) continue;
        if (sections.empty() || sections.back().token_count + chunk.token_count > max_tokens) {
            Section section;
            section.score = 0.0;
            section.token_count = 0;
            section.is_bm25 = bm25;
            sections.push_back(section);
        }
        Section& section = sections.back();
        section.chunks.push_back(chunk);
        section.score += chunk.score;
        section.token_count += chunk.token_count;
    }
    for (auto& section : sections) {
        section.score /= static_cast<double>(section.chunks.size());
    }
    return sections;
}

void merge_adjacent(Section& section) {
    std::vector<SectionChunk> merged;
    for (auto& chunk : section.chunks) {
        if (!merged.empty() && merged.back().end_pos + 1 == chunk.start_pos) {
            merged.back().text += chunk.text;
            merged.back().end_pos = chunk.end_pos;
            merged.back().token_count += chunk.token_count;
        } else {
            merged.push_back(chunk);
        }
    }
    section.chunks.swap(merged);
}

// At most the last `max_bytes` bytes, starting on a character boundary
std::string tail_text(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t start = text.size() - max_bytes;
    while (start < text.size() && is_utf8_continuation(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    return text.substr(start);
}

DocumentTextSection render(const Section& section) {
    DocumentTextSection out;
    for (const auto& chunk : section.chunks) {
        out.text += chunk.text;
    }
    out.token_count = section.token_count;
    out.score = section.score;
    out.is_bm25 = section.is_bm25;
    return out;
}

} // anonymous namespace

LocalDocumentResult::LocalDocumentResult(LocalDocumentIndex* index,
                                         const std::string& id,
                                         const std::string& uri,
                                         const std::vector<QueryResult>& chunks)
    : LocalDocument(index, id, uri)
    , chunks_(chunks)
    , score_(0.0)
{
    for (const auto& chunk : chunks_) {
        score_ += chunk.score;
    }
    if (!chunks_.empty()) {
        score_ /= static_cast<double>(chunks_.size());
    }
}

// ============================================================================
// All sections
// ============================================================================

Status LocalDocumentResult::render_all_sections(size_t max_tokens,
                                                std::vector<DocumentTextSection>& out) {
    out.clear();
    if (max_tokens < 1) {
        return Status::fail(ErrorKind::VALIDATION, "max_tokens must be >= 1");
    }

    std::string text;
    Status s = load_text(text);
    if (!s.success) return s;

    Tokenizer& tokenizer = *index_->tokenizer();

    // Re-tokenize each chunk and cut the ones over budget into pieces
    std::vector<SectionChunk> pieces;
    for (const auto& chunk : chunks_) {
        size_t start = 0, end = 0;
        s = chunk_span(chunk.item, start, end);
        if (!s.success) return s;

        std::vector<int> tokens = tokenizer.encode(slice(text, start, end));
        size_t pos = start;
        for (size_t offset = 0; offset < tokens.size(); offset += max_tokens) {
            size_t length = std::min(max_tokens, tokens.size() - offset);
            SectionChunk piece;
            piece.text = tokenizer.decode(std::vector<int>(tokens.begin() + offset,
                                                           tokens.begin() + offset + length));
            piece.start_pos = pos;
            piece.end_pos = pos + piece.text.size() - 1;
            piece.score = chunk.score;
            piece.token_count = length;
            piece.is_bm25 = false;
            pos += piece.text.size();
            pieces.push_back(piece);
        }
    }

    std::stable_sort(pieces.begin(), pieces.end(),
                     [](const SectionChunk& a, const SectionChunk& b) {
                         return a.start_pos < b.start_pos;
                     });

    for (const auto& section : fold_sections(pieces, false, max_tokens)) {
        out.push_back(render(section));
    }
    return Status::ok();
}

// ============================================================================
// Best sections
// ============================================================================

Status LocalDocumentResult::render_sections(size_t max_tokens,
                                            size_t max_sections,
                                            std::vector<DocumentTextSection>& out,
                                            bool overlapping_chunks) {
    out.clear();
    if (max_tokens < 1) {
        return Status::fail(ErrorKind::VALIDATION, "max_tokens must be >= 1");
    }

    std::string text;
    Status s = load_text(text);
    if (!s.success) return s;

    // Short documents are returned whole
    size_t length = 0;
    s = get_length(length);
    if (!s.success) return s;
    if (length <= max_tokens) {
        DocumentTextSection section;
        section.text = text;
        section.token_count = length;
        section.score = 1.0;
        out.push_back(section);
        return Status::ok();
    }

    Tokenizer& tokenizer = *index_->tokenizer();

    std::vector<SectionChunk> candidates;
    for (const auto& chunk : chunks_) {
        size_t start = 0, end = 0;
        s = chunk_span(chunk.item, start, end);
        if (!s.success) return s;

        SectionChunk candidate;
        candidate.text = slice(text, start, end);
        candidate.start_pos = start;
        candidate.end_pos = end;
        candidate.score = chunk.score;
        candidate.token_count = tokenizer.encode(candidate.text).size();
        candidate.is_bm25 = chunk.is_bm25();
        if (candidate.token_count <= max_tokens) {
            candidates.push_back(candidate);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const SectionChunk& a, const SectionChunk& b) {
                         return a.start_pos < b.start_pos;
                     });

    if (candidates.empty()) {
        if (chunks_.empty()) {
            return Status::ok();
        }
        // Nothing fits, return the head of the best chunk
        const QueryResult* top = &chunks_[0];
        for (const auto& chunk : chunks_) {
            if (chunk.score > top->score) top = &chunk;
        }
        size_t start = 0, end = 0;
        s = chunk_span(top->item, start, end);
        if (!s.success) return s;

        std::vector<int> tokens = tokenizer.encode(slice(text, start, end));
        if (tokens.size() > max_tokens) tokens.resize(max_tokens);

        DocumentTextSection section;
        section.text = tokenizer.decode(tokens);
        section.token_count = tokens.size();
        section.score = top->score;
        out.push_back(section);
        return Status::ok();
    }

    std::vector<Section> sections = fold_sections(candidates, false, max_tokens);
    std::vector<Section> bm25_sections = fold_sections(candidates, true, max_tokens);
    sections.insert(sections.end(), bm25_sections.begin(), bm25_sections.end());

    std::stable_sort(sections.begin(), sections.end(),
                     [](const Section& a, const Section& b) { return a.score > b.score; });
    if (sections.size() > max_sections) {
        sections.resize(max_sections);
    }

    size_t connector_tokens = overlapping_chunks ? tokenizer.encode(SECTION_CONNECTOR).size() : 0;

    for (auto& section : sections) {
        merge_adjacent(section);
        if (!overlapping_chunks) continue;

        size_t section_start = section.chunks.front().start_pos;
        size_t section_end = section.chunks.back().end_pos;

        if (section.chunks.size() > 1) {
            std::vector<SectionChunk> joined;
            for (size_t i = 0; i < section.chunks.size(); ++i) {
                if (i > 0) {
                    SectionChunk connector;
                    connector.text = SECTION_CONNECTOR;
                    connector.start_pos = 0;
                    connector.end_pos = 0;
                    connector.score = 0.0;
                    connector.token_count = connector_tokens;
                    connector.is_bm25 = false;
                    joined.push_back(connector);
                    section.token_count += connector_tokens;
                }
                joined.push_back(section.chunks[i]);
            }
            section.chunks.swap(joined);
        }

        long budget = static_cast<long>(max_tokens) - static_cast<long>(section.token_count);
        if (budget <= MIN_OVERLAP_BUDGET) continue;

        bool has_after = section_end + 1 < text.size();
        if (section_start > 0) {
            long half = (budget + 1) / 2;
            std::vector<int> before = tokenizer.encode(
                tail_text(text.substr(0, section_start), static_cast<size_t>(half) * 8));
            size_t take = std::min(before.size(), static_cast<size_t>(has_after ? half : budget));
            if (take > 0) {
                SectionChunk chunk;
                chunk.text = tokenizer.decode(std::vector<int>(before.end() - take, before.end()));
                chunk.start_pos = section_start - chunk.text.size();
                chunk.end_pos = section_start - 1;
                chunk.score = 0.0;
                chunk.token_count = take;
                chunk.is_bm25 = false;
                section.chunks.insert(section.chunks.begin(), chunk);
                section.token_count += take;
                budget -= static_cast<long>(take);
            }
        }

        if (has_after && budget > 0) {
            std::vector<int> after = tokenizer.encode(
                truncate_safe(text.substr(section_end + 1), static_cast<size_t>(budget) * 8));
            size_t take = std::min(after.size(), static_cast<size_t>(budget));
            if (take > 0) {
                SectionChunk chunk;
                chunk.text = tokenizer.decode(std::vector<int>(after.begin(), after.begin() + take));
                chunk.start_pos = section_end + 1;
                chunk.end_pos = section_end + chunk.text.size();
                chunk.score = 0.0;
                chunk.token_count = take;
                chunk.is_bm25 = false;
                section.chunks.push_back(chunk);
                section.token_count += take;
            }
        }
    }

    for (const auto& section : sections) {
        out.push_back(render(section));
    }
    LOG_DEBUG("[DocumentResult] %s rendered into %zu sections", uri().c_str(), out.size());
    return Status::ok();
}

} // namespace vectrix
