#include <vectrix/text/text_splitter.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <algorithm>
#include <cctype>

namespace vectrix {

namespace {

// ASCII letters and digits, or any byte of a multi-byte character
bool has_alphanumeric(const std::string& text) {
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x80 || std::isalnum(uc)) return true;
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TextSplitter::TextSplitter(const TextSplitterConfig& config) : config_(config) {
    if (config_.separators.empty()) {
        config_.separators = separators_for(config_.doc_type);
    }
}

Status TextSplitter::create(const TextSplitterConfig& config, std::unique_ptr<TextSplitter>& out) {
    if (config.chunk_size < 1) {
        return Status::fail(ErrorKind::VALIDATION, "chunk_size must be >= 1");
    }
    if (config.chunk_overlap < 0) {
        return Status::fail(ErrorKind::VALIDATION, "chunk_overlap must be >= 0");
    }
    if (config.chunk_overlap > config.chunk_size) {
        return Status::fail(ErrorKind::VALIDATION, "chunk_overlap must be <= chunk_size");
    }
    if (!config.tokenizer) {
        return Status::fail(ErrorKind::VALIDATION, "a tokenizer is required");
    }
    out.reset(new TextSplitter(config));
    return Status::ok();
}

// ============================================================================
// Splitting
// ============================================================================

std::vector<TextChunk> TextSplitter::split(const std::string& text) const {
    std::vector<TextChunk> chunks = recursive_split(text, 0, 0);

    size_t overlap = static_cast<size_t>(config_.chunk_overlap);
    if (overlap > 0) {
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (i > 0) {
                const std::vector<int>& prev = chunks[i - 1].tokens;
                size_t n = std::min(overlap, prev.size());
                chunks[i].start_overlap.assign(prev.end() - n, prev.end());
            }
            if (i + 1 < chunks.size()) {
                const std::vector<int>& next = chunks[i + 1].tokens;
                size_t n = std::min(overlap, next.size());
                chunks[i].end_overlap.assign(next.begin(), next.begin() + n);
            }
        }
    }

    LOG_DEBUG("[TextSplitter] %zu bytes -> %zu chunks", text.size(), chunks.size());
    return chunks;
}

std::vector<TextChunk> TextSplitter::recursive_split(const std::string& text,
                                                     size_t separator_index,
                                                     size_t start_pos) const {
    std::vector<TextChunk> chunks;
    if (text.empty()) {
        return chunks;
    }

    const std::vector<std::string>& separators = config_.separators;
    size_t chunk_size = static_cast<size_t>(config_.chunk_size);
    size_t next_index = std::min(separator_index + 1, separators.size());

    std::vector<std::string> parts;
    std::string separator;
    bool indivisible = false;

    if (separator_index < separators.size()) {
        if (separators[separator_index] == " ") {
            // Token spans are contiguous, nothing sits between them
            parts = split_by_tokens(text);
        } else {
            separator = separators[separator_index];
            parts = vectrix::split(text, separator);
        }
    } else {
        size_t half = text.size() / 2;
        while (half > 0 && is_utf8_continuation(static_cast<unsigned char>(text[half]))) {
            --half;
        }
        if (half == 0) {
            half = text.size() / 2;
            while (half < text.size() &&
                   is_utf8_continuation(static_cast<unsigned char>(text[half]))) {
                ++half;
            }
        }
        if (half == 0 || half >= text.size()) {
            indivisible = true;
            parts.push_back(text);
        } else {
            parts.push_back(text.substr(0, half));
            parts.push_back(text.substr(half));
        }
    }

    size_t pos = start_pos;
    for (size_t i = 0; i < parts.size(); ++i) {
        bool last = (i + 1 == parts.size());
        size_t next_pos = pos + parts[i].size() + (last ? 0 : separator.size());

        std::string chunk = parts[i];
        if (config_.keep_separators && !last) {
            chunk += separator;
        }

        if (!has_alphanumeric(chunk)) {
            pos = next_pos;
            continue;
        }

        std::vector<TextChunk> sub;
        if (!indivisible && chunk.size() > chunk_size * 6) {
            sub = recursive_split(chunk, next_index, pos);
        } else {
            std::vector<int> tokens = config_.tokenizer->encode(chunk);
            if (!indivisible && tokens.size() > chunk_size) {
                sub = recursive_split(chunk, next_index, pos);
            } else {
                TextChunk leaf;
                leaf.text = chunk;
                leaf.tokens = tokens;
                leaf.start_pos = pos;
                leaf.end_pos = next_pos - 1;
                sub.push_back(leaf);
            }
        }
        chunks.insert(chunks.end(),
                      std::make_move_iterator(sub.begin()),
                      std::make_move_iterator(sub.end()));

        pos = next_pos;
    }

    return combine_chunks(std::move(chunks));
}

std::vector<TextChunk> TextSplitter::combine_chunks(std::vector<TextChunk> chunks) const {
    std::vector<TextChunk> combined;
    size_t chunk_size = static_cast<size_t>(config_.chunk_size);
    const char* joiner = config_.keep_separators ? "" : " ";

    for (auto& chunk : chunks) {
        if (combined.empty() ||
            combined.back().tokens.size() + chunk.tokens.size() > chunk_size) {
            combined.push_back(std::move(chunk));
            continue;
        }

        TextChunk& current = combined.back();
        current.text += joiner;
        current.text += chunk.text;
        current.end_pos = chunk.end_pos;
        current.tokens.insert(current.tokens.end(), chunk.tokens.begin(), chunk.tokens.end());
    }
    return combined;
}

std::vector<std::string> TextSplitter::split_by_tokens(const std::string& text) const {
    std::vector<std::string> parts;
    std::vector<int> tokens = config_.tokenizer->encode(text);
    size_t chunk_size = static_cast<size_t>(config_.chunk_size);

    if (tokens.size() <= chunk_size) {
        parts.push_back(text);
        return parts;
    }
    for (size_t i = 0; i < tokens.size(); i += chunk_size) {
        size_t end = std::min(tokens.size(), i + chunk_size);
        std::vector<int> span(tokens.begin() + i, tokens.begin() + end);
        parts.push_back(config_.tokenizer->decode(span));
    }
    return parts;
}

// ============================================================================
// Default separators
// ============================================================================

std::vector<std::string> TextSplitter::separators_for(const std::string& doc_type) {
    std::string type = to_lower(doc_type);

    if (type == "cpp") {
        return {"\nclass ", "\nvoid ", "\nint ", "\nfloat ", "\ndouble ", "\nif ",
                "\nfor ", "\nwhile ", "\nswitch ", "\ncase ", "\n\n", "\n"};
    }
    if (type == "go") {
        return {"\nfunc ", "\nvar ", "\nconst ", "\ntype ", "\nif ", "\nfor ",
                "\nswitch ", "\ncase ", "\n\n", "\n"};
    }
    if (type == "java" || type == "c#" || type == "csharp" || type == "cs" ||
        type == "ts" || type == "tsx" || type == "typescript") {
        return {"// LLM-REGION", "/* LLM-REGION", "\nclass ", "\npublic ", "\nprotected ",
                "\nprivate ", "\nstatic ", "\nif ", "\nfor ", "\nwhile ", "\nswitch ",
                "\ncase ", "\n\n", "\n", " "};
    }
    if (type == "js" || type == "jsx" || type == "javascript") {
        return {"// LLM-REGION", "/* LLM-REGION", "\nclass ", "\nfunction ", "\nconst ",
                "\nlet ", "\nvar ", "\nif ", "\nfor ", "\nwhile ", "\nswitch ",
                "\ncase ", "\ndefault ", "\n\n", "\n"};
    }
    if (type == "php") {
        return {"\nfunction ", "\nclass ", "\nif ", "\nforeach ", "\nwhile ", "\ndo ",
                "\nswitch ", "\ncase ", "\n\n", "\n"};
    }
    if (type == "proto") {
        return {"\nmessage ", "\nservice ", "\nenum ", "\noption ", "\nimport ",
                "\nsyntax ", "\n\n", "\n"};
    }
    if (type == "python" || type == "py") {
        return {"\nclass ", "\ndef ", "\n\tdef ", "\n\n", "\n"};
    }
    if (type == "rst") {
        return {"\n===\n", "\n---\n", "\n***\n", "\n.. ", "\n\n", "\n"};
    }
    if (type == "ruby") {
        return {"\ndef ", "\nclass ", "\nif ", "\nunless ", "\nwhile ", "\nfor ",
                "\ndo ", "\nbegin ", "\nrescue ", "\n\n", "\n"};
    }
    if (type == "rust") {
        return {"\nfn ", "\nconst ", "\nlet ", "\nif ", "\nwhile ", "\nfor ",
                "\nloop ", "\nmatch ", "\n\n", "\n"};
    }
    if (type == "scala") {
        return {"\nclass ", "\nobject ", "\ndef ", "\nval ", "\nvar ", "\nif ",
                "\nfor ", "\nwhile ", "\nmatch ", "\ncase ", "\n\n", "\n"};
    }
    if (type == "swift") {
        return {"\nfunc ", "\nclass ", "\nstruct ", "\nenum ", "\nif ", "\nfor ",
                "\nwhile ", "\ndo ", "\nswitch ", "\ncase ", "\n\n", "\n"};
    }
    if (type == "md" || type == "markdown") {
        return {"\n## ", "\n### ", "\n#### ", "\n##### ", "\n###### ", "```\n\n",
                "\n\n***\n\n", "\n\n---\n\n", "\n\n___\n\n", "<table>", "\n\n", "\n"};
    }
    if (type == "latex") {
        return {"\n\\chapter{", "\n\\section{", "\n\\subsection{", "\n\\subsubsection{",
                "\n\\begin{enumerate}", "\n\\begin{itemize}", "\n\\begin{description}",
                "\n\\begin{list}", "\n\\begin{quote}", "\n\\begin{quotation}",
                "\n\\begin{verse}", "\n\\begin{verbatim}", "\n\\begin{align}", "\n\n", "\n"};
    }
    if (type == "html") {
        return {"<body>", "<div>", "<p>", "<br>", "<li>", "<h1>", "<h2>", "<h3>", "<h4>",
                "<h5>", "<h6>", "<span>", "<table>", "<tr>", "<td>", "<th>", "<ul>",
                "<ol>", "<header>", "<footer>", "<nav>", "<head>", "<style>", "<script>",
                "<meta>", "<title>"};
    }
    if (type == "sol") {
        return {"\npragma ", "\nusing ", "\ncontract ", "\ninterface ", "\nlibrary ",
                "\nconstructor ", "\ntype ", "\nfunction ", "\nevent ", "\nmodifier ",
                "\nerror ", "\nstruct ", "\nenum ", "\nif ", "\nfor ", "\nwhile ",
                "\ndo while ", "\nassembly ", "\n\n", "\n"};
    }
    return {"\n\n", "\n"};
}

} // namespace vectrix
