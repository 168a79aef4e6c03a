#ifndef CUTPLAN_PARSER_TOKENIZER_HPP
#define CUTPLAN_PARSER_TOKENIZER_HPP

#include "token.hpp"
#include <string_view>

namespace cutplan {
namespace parser {

class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next();           // Get next token
    Token peek();           // Look ahead without consuming
    bool at_end() const;

private:
    std::string_view input_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
    std::optional<Token> peeked_;

    void skip_whitespace();
    void skip_comment();
    void advance();
    char current() const;
    char peek_char(size_t offset = 1) const;

    Token scan_token();
    Token scan_number();
    Token scan_word();
    Token make_token(TokenType type, std::string text,
                     uint32_t line, uint32_t column);
};

}  // namespace parser
}  // namespace cutplan

#endif // CUTPLAN_PARSER_TOKENIZER_HPP
