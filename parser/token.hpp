#ifndef CUTPLAN_PARSER_TOKEN_HPP
#define CUTPLAN_PARSER_TOKEN_HPP

#include <units/unit.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace cutplan {
namespace parser {

enum class TokenType {
    // Keywords
    Stock, Kerf, Cut, Units,

    // Values
    Number, UnitName,

    // Structure
    Times,      // x, X or *
    Colon,

    // Special
    EndOfLine, EndOfFile, Unknown
};

struct Token {
    TokenType type;
    std::string text;
    uint32_t line;
    uint32_t column;
    std::optional<double> number;   // For Number tokens
    std::optional<Unit> unit;       // For UnitName tokens
};

}  // namespace parser
}  // namespace cutplan

#endif // CUTPLAN_PARSER_TOKEN_HPP
