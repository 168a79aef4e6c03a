#include "tokenizer.hpp"
#include <cctype>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cutplan {
namespace parser {

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

char Tokenizer::current() const {
    if (at_end()) return '\0';
    return input_[pos_];
}

char Tokenizer::peek_char(size_t offset) const {
    if (pos_ + offset >= input_.size()) return '\0';
    return input_[pos_ + offset];
}

void Tokenizer::advance() {
    if (!at_end()) {
        if (current() == '\n') {
            line_++;
            column_ = 1;
        } else {
            column_++;
        }
        pos_++;
    }
}

void Tokenizer::skip_whitespace() {
    while (!at_end()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

// '#' to end of line; the newline itself is left for the parser
void Tokenizer::skip_comment() {
    while (!at_end() && current() != '\n') {
        advance();
    }
}

Token Tokenizer::make_token(TokenType type, std::string text,
                            uint32_t line, uint32_t column) {
    return Token{type, std::move(text), line, column, std::nullopt, std::nullopt};
}

Token Tokenizer::peek() {
    if (!peeked_) {
        peeked_ = next();
    }
    return *peeked_;
}

Token Tokenizer::next() {
    if (peeked_) {
        Token t = *peeked_;
        peeked_.reset();
        return t;
    }
    return scan_token();
}

Token Tokenizer::scan_token() {
    skip_whitespace();
    if (current() == '#') {
        skip_comment();
    }

    if (at_end()) {
        return make_token(TokenType::EndOfFile, "", line_, column_);
    }

    uint32_t start_line = line_;
    uint32_t start_column = column_;

    char c = current();

    // Single character tokens
    switch (c) {
        case '\n':
            advance();
            return make_token(TokenType::EndOfLine, "\n", start_line, start_column);
        case '*':
            advance();
            return make_token(TokenType::Times, "*", start_line, start_column);
        case ':':
            advance();
            return make_token(TokenType::Colon, ":", start_line, start_column);
    }

    // "x" between a count and a length: 10 x 2000, 10x2000
    if ((c == 'x' || c == 'X') && !std::isalpha(static_cast<unsigned char>(peek_char()))) {
        advance();
        return make_token(TokenType::Times, std::string(1, c), start_line, start_column);
    }

    // Numbers, including a leading sign or decimal point
    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && std::isdigit(static_cast<unsigned char>(peek_char()))) ||
        (c == '-' && (std::isdigit(static_cast<unsigned char>(peek_char())) ||
                      (peek_char() == '.' && std::isdigit(static_cast<unsigned char>(peek_char(2))))))) {
        return scan_number();
    }

    // Words and keywords
    if (std::isalpha(static_cast<unsigned char>(c))) {
        return scan_word();
    }

    // Unknown character
    std::string text(1, c);
    advance();
    return make_token(TokenType::Unknown, text, start_line, start_column);
}

Token Tokenizer::scan_number() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    std::string text;
    if (current() == '-') {
        text += current();
        advance();
    }

    bool seen_point = false;
    while (!at_end()) {
        char c = current();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            text += c;
            advance();
        } else if (c == '.' && !seen_point &&
                   std::isdigit(static_cast<unsigned char>(peek_char()))) {
            seen_point = true;
            text += c;
            advance();
        } else {
            break;
        }
    }

    // Too many digits for a double; the parser reports it as unexpected
    double value = 0.0;
    try {
        value = std::stod(text);
    } catch (const std::out_of_range&) {
        return make_token(TokenType::Unknown, text, start_line, start_column);
    }

    Token token = make_token(TokenType::Number, text, start_line, start_column);
    token.number = value;
    return token;
}

Token Tokenizer::scan_word() {
    uint32_t start_line = line_;
    uint32_t start_column = column_;

    std::string word;
    while (!at_end() && std::isalpha(static_cast<unsigned char>(current()))) {
        word += current();
        advance();
    }

    // Convert to lowercase for comparison
    std::string lower_word = word;
    std::transform(lower_word.begin(), lower_word.end(), lower_word.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    // Keywords
    if (lower_word == "stock" || lower_word == "bars" || lower_word == "bar") {
        return make_token(TokenType::Stock, word, start_line, start_column);
    }
    if (lower_word == "kerf" || lower_word == "blade") {
        return make_token(TokenType::Kerf, word, start_line, start_column);
    }
    if (lower_word == "cut" || lower_word == "cuts") {
        return make_token(TokenType::Cut, word, start_line, start_column);
    }
    if (lower_word == "units" || lower_word == "unit") {
        return make_token(TokenType::Units, word, start_line, start_column);
    }

    // Unit names
    if (auto unit = unit_from_string(lower_word)) {
        Token token = make_token(TokenType::UnitName, word, start_line, start_column);
        token.unit = unit;
        return token;
    }

    // Unknown word
    return make_token(TokenType::Unknown, word, start_line, start_column);
}

}  // namespace parser
}  // namespace cutplan
