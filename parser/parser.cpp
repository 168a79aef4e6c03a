#include "parser.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <limits>
#include <sstream>

namespace cutplan {
namespace parser {

Parser::Parser(Tokenizer tokenizer) : tokenizer_(std::move(tokenizer)) {
    advance();
}

void Parser::advance() {
    current_ = tokenizer_.next();
}

bool Parser::check(TokenType type) const {
    return current_.type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        advance();
        return true;
    }
    return false;
}

void Parser::error(const std::string& message) {
    std::ostringstream oss;
    oss << message << " at line " << current_.line << ", column " << current_.column;
    if (!current_.text.empty() && current_.text != "\n") {
        oss << " (got '" << current_.text << "')";
    }
    errors_.push_back(oss.str());
}

void Parser::skip_to_next_line() {
    while (!check(TokenType::EndOfLine) && !check(TokenType::EndOfFile)) {
        advance();
    }
    if (check(TokenType::EndOfLine)) {
        advance();
    }
}

// Trailing tokens are an error; the rest of the line is discarded
void Parser::end_line() {
    if (!check(TokenType::EndOfLine) && !check(TokenType::EndOfFile)) {
        error("Unexpected trailing input");
    }
    skip_to_next_line();
}

CutJob Parser::parse() {
    auto log = logging::get_logger();
    CutJob job = CutJob::empty();
    cut_units_.clear();

    while (!check(TokenType::EndOfFile)) {
        // Skip empty lines
        while (match(TokenType::EndOfLine)) {}

        if (check(TokenType::EndOfFile)) {
            break;
        }

        parse_line(job);
    }

    // Cuts written in their own unit follow the final stock unit
    for (const auto& pending : cut_units_) {
        auto& cut = job.cuts[pending.cut_index];
        if (pending.unit != job.length_unit) {
            double converted = convert_length(cut.length, pending.unit, job.length_unit);
            log->debug("Parser: cut {} converted {}{} -> {}{}",
                       pending.cut_index + 1, cut.length, unit_suffix(pending.unit),
                       converted, unit_suffix(job.length_unit));
            cut.length = converted;
        }
    }

    log->debug("Parser: {} cut requests, {} errors", job.cuts.size(), errors_.size());
    return job;
}

void Parser::parse_line(CutJob& job) {
    switch (current_.type) {
        case TokenType::Stock:
            parse_stock(job);
            return;
        case TokenType::Kerf:
            parse_kerf(job);
            return;
        case TokenType::Cut:
            parse_cut(job);
            return;
        case TokenType::Units:
            parse_units(job);
            return;
        default:
            error("Expected 'stock', 'kerf', 'cut' or 'units'");
            skip_to_next_line();
            return;
    }
}

std::optional<double> Parser::parse_number(const std::string& what) {
    if (!check(TokenType::Number)) {
        error("Expected " + what);
        return std::nullopt;
    }
    double value = *current_.number;
    advance();
    return value;
}

std::optional<uint32_t> Parser::parse_count(const std::string& what) {
    if (!check(TokenType::Number)) {
        error("Expected " + what);
        return std::nullopt;
    }
    double value = *current_.number;
    if (value < 0.0 || std::floor(value) != value ||
        value > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        error("Expected " + what + " to be a whole number");
        advance();
        return std::nullopt;
    }
    advance();
    return static_cast<uint32_t>(value);
}

std::optional<Unit> Parser::parse_optional_unit() {
    if (check(TokenType::UnitName)) {
        Unit unit = *current_.unit;
        advance();
        return unit;
    }
    return std::nullopt;
}

// stock <length> [unit]  |  stock <count> x <length> [unit]
void Parser::parse_stock(CutJob& job) {
    advance();  // consume Stock
    match(TokenType::Colon);

    auto first = parse_number("stock length or count");
    if (!first) {
        skip_to_next_line();
        return;
    }

    if (match(TokenType::Times)) {
        if (*first < 1.0 || std::floor(*first) != *first ||
            *first > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
            error("Stock count must be a whole number between 1 and " +
                  std::to_string(std::numeric_limits<uint32_t>::max()));
            skip_to_next_line();
            return;
        }
        auto length = parse_number("stock length");
        if (!length) {
            skip_to_next_line();
            return;
        }
        job.stock_count = static_cast<uint32_t>(*first);
        job.stock_length = *length;
    } else {
        job.stock_length = *first;
    }

    if (job.stock_length <= 0.0) {
        error("Stock length must be positive");
    }
    if (auto unit = parse_optional_unit()) {
        job.length_unit = *unit;
    }
    end_line();
}

// kerf <width> [unit]
void Parser::parse_kerf(CutJob& job) {
    advance();  // consume Kerf
    match(TokenType::Colon);

    auto width = parse_number("kerf width");
    if (!width) {
        skip_to_next_line();
        return;
    }
    if (*width < 0.0) {
        error("Kerf width must not be negative");
    }
    job.kerf_width = *width;
    job.kerf_unit = parse_optional_unit().value_or(Unit::Millimeter);
    end_line();
}

// cut <length> [unit] [x <quantity>]
void Parser::parse_cut(CutJob& job) {
    advance();  // consume Cut
    match(TokenType::Colon);

    auto length = parse_number("cut length");
    if (!length) {
        skip_to_next_line();
        return;
    }
    if (*length <= 0.0) {
        error("Cut length must be positive");
    }

    CutRequest request{*length, 1};
    auto unit = parse_optional_unit();

    if (match(TokenType::Times)) {
        auto quantity = parse_count("cut quantity");
        if (!quantity) {
            skip_to_next_line();
            return;
        }
        request.quantity = *quantity;
    }

    if (unit) {
        cut_units_.push_back(PendingUnit{job.cuts.size(), *unit});
    }
    job.cuts.push_back(request);
    end_line();
}

// units <unit>
void Parser::parse_units(CutJob& job) {
    advance();  // consume Units
    match(TokenType::Colon);

    auto unit = parse_optional_unit();
    if (!unit) {
        error("Expected a unit (mm, cm, m, in, ft, yd)");
        skip_to_next_line();
        return;
    }
    job.length_unit = *unit;
    end_line();
}

}  // namespace parser
}  // namespace cutplan
