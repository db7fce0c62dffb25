#include <vectrix/text/simple_tokenizer.hpp>
#include <vectrix/core/logger.hpp>
#include <vectrix/core/utils.hpp>
#include <algorithm>
#include <cctype>

namespace vectrix {

const size_t SimpleTokenizer::MAX_PIECE_BYTES;

namespace {

enum class CharClass {
    LETTER,
    DIGIT,
    SPACE,
    PUNCT
};

CharClass classify(unsigned char c) {
    if (c >= 0x80 || std::isalpha(c)) return CharClass::LETTER;
    if (std::isdigit(c)) return CharClass::DIGIT;
    if (std::isspace(c)) return CharClass::SPACE;
    return CharClass::PUNCT;
}

// Append [start, end) as pieces of at most MAX_PIECE_BYTES, never splitting a code point
void emit(const std::string& text, size_t start, size_t end, std::vector<std::string>& out) {
    while (start < end) {
        size_t cut = std::min(end, start + SimpleTokenizer::MAX_PIECE_BYTES);
        if (cut < end) {
            size_t boundary = cut;
            while (boundary > start &&
                   is_utf8_continuation(static_cast<unsigned char>(text[boundary]))) {
                --boundary;
            }
            if (boundary > start) cut = boundary;
        }
        out.push_back(text.substr(start, cut - start));
        start = cut;
    }
}

} // anonymous namespace

std::vector<std::string> SimpleTokenizer::pre_tokenize(const std::string& text) {
    std::vector<std::string> pieces;
    size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t start = i;

        // " word", " 123", " ..." keep their single leading space
        if (c == ' ' && i + 1 < n &&
            classify(static_cast<unsigned char>(text[i + 1])) != CharClass::SPACE) {
            ++i;
            c = static_cast<unsigned char>(text[i]);
        }

        CharClass cls = classify(c);
        if (cls == CharClass::SPACE) {
            size_t j = i;
            while (j < n && classify(static_cast<unsigned char>(text[j])) == CharClass::SPACE) {
                ++j;
            }
            // Leave a trailing ' ' for the next word
            if (j < n && j - i > 1 && text[j - 1] == ' ') {
                --j;
            }
            emit(text, start, j, pieces);
            i = j;
            continue;
        }

        size_t j = i;
        while (j < n && classify(static_cast<unsigned char>(text[j])) == cls) {
            ++j;
        }
        emit(text, start, j, pieces);
        i = j;
    }
    return pieces;
}

int SimpleTokenizer::id_for(const std::string& piece) {
    auto it = ids_.find(piece);
    if (it != ids_.end()) {
        return it->second;
    }
    int id = static_cast<int>(pieces_.size());
    ids_[piece] = id;
    pieces_.push_back(piece);
    return id;
}

std::vector<int> SimpleTokenizer::encode(const std::string& text) {
    std::vector<int> tokens;
    for (const auto& piece : pre_tokenize(text)) {
        tokens.push_back(id_for(piece));
    }
    return tokens;
}

std::string SimpleTokenizer::decode(const std::vector<int>& tokens) {
    std::string text;
    for (int id : tokens) {
        if (id < 0 || static_cast<size_t>(id) >= pieces_.size()) {
            LOG_WARN("[SimpleTokenizer] Unknown token id %d skipped", id);
            continue;
        }
        text += pieces_[static_cast<size_t>(id)];
    }
    return text;
}

} // namespace vectrix
