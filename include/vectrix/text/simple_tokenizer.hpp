/*
 * vectrix C++17 - Simple Tokenizer
 *
 * GPT-style pre-tokenizer: words carry their leading space, digit and
 * punctuation runs stand alone, whitespace runs keep their last space for
 * the following word. Pieces longer than 8 bytes are cut on UTF-8
 * boundaries. Each distinct piece gets an id the first time it is seen,
 * so ids are only meaningful within one tokenizer instance.
 */
#ifndef vectrix_TEXT_SIMPLE_TOKENIZER_HPP
#define vectrix_TEXT_SIMPLE_TOKENIZER_HPP

#include <vectrix/text/tokenizer.hpp>
#include <unordered_map>

namespace vectrix {

class SimpleTokenizer : public Tokenizer {
public:
    static const size_t MAX_PIECE_BYTES = 8;

    std::vector<int> encode(const std::string& text) override;
    std::string decode(const std::vector<int>& tokens) override;

    size_t vocabulary_size() const { return pieces_.size(); }

    // Split text into pieces without assigning ids.
    static std::vector<std::string> pre_tokenize(const std::string& text);

private:
    int id_for(const std::string& piece);

    std::unordered_map<std::string, int> ids_;
    std::vector<std::string> pieces_;
};

} // namespace vectrix

#endif // vectrix_TEXT_SIMPLE_TOKENIZER_HPP
