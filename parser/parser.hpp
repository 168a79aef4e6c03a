#ifndef CUTPLAN_PARSER_PARSER_HPP
#define CUTPLAN_PARSER_PARSER_HPP

#include "tokenizer.hpp"
#include <job/cut_job.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cutplan {
namespace parser {

// Reads a cut list:
//
//   stock 10 x 2000 mm
//   kerf 3.2 mm
//   cut 1500 x 6
//   cut 12 in x 2
//
// Anything not given keeps the CutJob::empty() value. A cut written in a
// unit other than the stock's is converted to the stock unit.
class Parser {
public:
    explicit Parser(Tokenizer tokenizer);

    CutJob parse();

    const std::vector<std::string>& errors() const { return errors_; }
    bool has_errors() const { return !errors_.empty(); }

private:
    struct PendingUnit {
        size_t cut_index;
        Unit unit;
    };

    Tokenizer tokenizer_;
    Token current_;
    std::vector<std::string> errors_;
    std::vector<PendingUnit> cut_units_;

    void advance();
    bool check(TokenType type) const;
    bool match(TokenType type);
    void skip_to_next_line();
    void end_line();
    void error(const std::string& message);

    void parse_line(CutJob& job);
    void parse_stock(CutJob& job);
    void parse_kerf(CutJob& job);
    void parse_cut(CutJob& job);
    void parse_units(CutJob& job);

    std::optional<double> parse_number(const std::string& what);
    std::optional<uint32_t> parse_count(const std::string& what);
    std::optional<Unit> parse_optional_unit();
};

}  // namespace parser
}  // namespace cutplan

#endif // CUTPLAN_PARSER_PARSER_HPP
