#ifndef vectrix_TEXT_TOKENIZER_HPP
#define vectrix_TEXT_TOKENIZER_HPP

#include <string>
#include <vector>

namespace vectrix {

// Text <-> token ids. decode(encode(t)) must reproduce t byte for byte.
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    virtual std::vector<int> encode(const std::string& text) = 0;
    virtual std::string decode(const std::vector<int>& tokens) = 0;
};

} // namespace vectrix

#endif // vectrix_TEXT_TOKENIZER_HPP
