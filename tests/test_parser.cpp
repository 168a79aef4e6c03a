#include "parser/tokenizer.hpp"
#include "parser/parser.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace cutplan;
using namespace cutplan::parser;

// ============== Tokenizer Tests ==============

TEST(Tokenizer, StockLine) {
    Tokenizer tokenizer("stock 10 x 2000 mm");

    EXPECT_EQ(tokenizer.next().type, TokenType::Stock);

    Token count = tokenizer.next();
    EXPECT_EQ(count.type, TokenType::Number);
    EXPECT_DOUBLE_EQ(count.number.value_or(0), 10.0);

    EXPECT_EQ(tokenizer.next().type, TokenType::Times);

    Token length = tokenizer.next();
    EXPECT_EQ(length.type, TokenType::Number);
    EXPECT_DOUBLE_EQ(length.number.value_or(0), 2000.0);

    Token unit = tokenizer.next();
    EXPECT_EQ(unit.type, TokenType::UnitName);
    EXPECT_EQ(unit.unit, Unit::Millimeter);

    EXPECT_EQ(tokenizer.next().type, TokenType::EndOfFile);
}

TEST(Tokenizer, CompactForm) {
    Tokenizer tokenizer("10x2000mm 4*3");

    EXPECT_EQ(tokenizer.next().type, TokenType::Number);
    EXPECT_EQ(tokenizer.next().type, TokenType::Times);
    EXPECT_EQ(tokenizer.next().type, TokenType::Number);
    EXPECT_EQ(tokenizer.next().type, TokenType::UnitName);
    EXPECT_EQ(tokenizer.next().type, TokenType::Number);
    EXPECT_EQ(tokenizer.next().type, TokenType::Times);
    EXPECT_EQ(tokenizer.next().type, TokenType::Number);
}

TEST(Tokenizer, FractionalAndSignedNumbers) {
    Tokenizer tokenizer("3.2 .5 -1.25 7.");

    EXPECT_DOUBLE_EQ(tokenizer.next().number.value_or(0), 3.2);
    EXPECT_DOUBLE_EQ(tokenizer.next().number.value_or(0), 0.5);
    EXPECT_DOUBLE_EQ(tokenizer.next().number.value_or(0), -1.25);

    // A trailing point is not part of the number
    EXPECT_DOUBLE_EQ(tokenizer.next().number.value_or(0), 7.0);
    EXPECT_EQ(tokenizer.next().type, TokenType::Unknown);
}

TEST(Tokenizer, OverlongNumberIsUnknown) {
    std::string text = "1" + std::string(400, '0') + " 5";
    Tokenizer tokenizer(text);

    Token big = tokenizer.next();
    EXPECT_EQ(big.type, TokenType::Unknown);
    EXPECT_FALSE(big.number.has_value());
    EXPECT_EQ(big.column, 1u);
    EXPECT_DOUBLE_EQ(tokenizer.next().number.value_or(0), 5.0);
}

TEST(Tokenizer, CommentsAndLines) {
    Tokenizer tokenizer("# cut list\ncut 5 # trailing\n");

    EXPECT_EQ(tokenizer.next().type, TokenType::EndOfLine);
    Token cut = tokenizer.next();
    EXPECT_EQ(cut.type, TokenType::Cut);
    EXPECT_EQ(cut.line, 2u);
    EXPECT_EQ(tokenizer.next().type, TokenType::Number);
    EXPECT_EQ(tokenizer.next().type, TokenType::EndOfLine);
    EXPECT_EQ(tokenizer.next().type, TokenType::EndOfFile);
}

TEST(Tokenizer, CaseInsensitivity) {
    Tokenizer tokenizer("STOCK Kerf CUT Units FEET");

    EXPECT_EQ(tokenizer.next().type, TokenType::Stock);
    EXPECT_EQ(tokenizer.next().type, TokenType::Kerf);
    EXPECT_EQ(tokenizer.next().type, TokenType::Cut);
    EXPECT_EQ(tokenizer.next().type, TokenType::Units);

    Token unit = tokenizer.next();
    EXPECT_EQ(unit.type, TokenType::UnitName);
    EXPECT_EQ(unit.unit, Unit::Foot);
}

TEST(Tokenizer, Peek) {
    Tokenizer tokenizer("kerf 2");
    EXPECT_EQ(tokenizer.peek().type, TokenType::Kerf);
    EXPECT_EQ(tokenizer.next().type, TokenType::Kerf);
    EXPECT_EQ(tokenizer.next().type, TokenType::Number);
}

// ============== Parser Tests ==============

namespace {

CutJob parse_text(const std::string& text, std::vector<std::string>* errors = nullptr) {
    Parser parser{Tokenizer(text)};
    CutJob job = parser.parse();
    if (errors) {
        *errors = parser.errors();
    }
    return job;
}

}  // namespace

TEST(Parser, FullJob) {
    std::string text =
        "# aluminium frame\n"
        "stock 25 x 6 m\n"
        "kerf 3.2 mm\n"
        "cut 1.5 x 6\n"
        "cut 0.75 x 4\n";

    std::vector<std::string> errors;
    CutJob job = parse_text(text, &errors);

    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(job.stock_count, 25u);
    EXPECT_DOUBLE_EQ(job.stock_length, 6.0);
    EXPECT_EQ(job.length_unit, Unit::Meter);
    EXPECT_DOUBLE_EQ(job.kerf_width, 3.2);
    EXPECT_EQ(job.kerf_unit, Unit::Millimeter);
    ASSERT_EQ(job.cuts.size(), 2u);
    EXPECT_DOUBLE_EQ(job.cuts[0].length, 1.5);
    EXPECT_EQ(job.cuts[0].quantity, 6u);
    EXPECT_DOUBLE_EQ(job.cuts[1].length, 0.75);
    EXPECT_EQ(job.cuts[1].quantity, 4u);
}

TEST(Parser, DefaultsWhenOmitted) {
    std::vector<std::string> errors;
    CutJob job = parse_text("cut 300\n", &errors);

    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(job.stock_count, 25u);
    EXPECT_DOUBLE_EQ(job.stock_length, 2000.0);
    EXPECT_DOUBLE_EQ(job.kerf_width, 0.0);
    ASSERT_EQ(job.cuts.size(), 1u);
    EXPECT_EQ(job.cuts[0].quantity, 1u);
}

TEST(Parser, StockLengthOnly) {
    CutJob job = parse_text("stock 96 in");
    EXPECT_EQ(job.stock_count, 25u);
    EXPECT_DOUBLE_EQ(job.stock_length, 96.0);
    EXPECT_EQ(job.length_unit, Unit::Inch);
}

TEST(Parser, UnitsLine) {
    CutJob job = parse_text("units cm\nstock 5 x 300\ncut 120 x 3\n");
    EXPECT_EQ(job.length_unit, Unit::Centimeter);
    EXPECT_EQ(job.stock_count, 5u);
    EXPECT_DOUBLE_EQ(job.cuts[0].length, 120.0);
}

TEST(Parser, KerfUnitDefaultsToMillimeters) {
    CutJob job = parse_text("units in\nkerf 3\n");
    EXPECT_EQ(job.length_unit, Unit::Inch);
    EXPECT_EQ(job.kerf_unit, Unit::Millimeter);

    job = parse_text("kerf 0.125 in\n");
    EXPECT_EQ(job.kerf_unit, Unit::Inch);
}

TEST(Parser, CutInOtherUnitIsConverted) {
    CutJob job = parse_text("stock 2000 mm\ncut 12 in x 2\ncut 500 x 1\n");
    ASSERT_EQ(job.cuts.size(), 2u);
    EXPECT_NEAR(job.cuts[0].length, 304.8, 1e-9);
    EXPECT_EQ(job.cuts[0].quantity, 2u);
    EXPECT_DOUBLE_EQ(job.cuts[1].length, 500.0);
}

TEST(Parser, CutUnitFollowsLaterStockUnit) {
    CutJob job = parse_text("cut 1 ft x 2\nstock 4 x 96 in\n");
    EXPECT_EQ(job.length_unit, Unit::Inch);
    EXPECT_NEAR(job.cuts[0].length, 12.0, 1e-9);
}

TEST(Parser, ColonsAreAccepted) {
    std::vector<std::string> errors;
    CutJob job = parse_text("stock: 3 x 1000\ncut: 200 x 2\n", &errors);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(job.stock_count, 3u);
    EXPECT_EQ(job.cuts.size(), 1u);
}

TEST(Parser, ErrorsCarryLineNumbers) {
    std::vector<std::string> errors;
    parse_text("stock 10 x 2000\nfrobnicate 3\n", &errors);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("line 2"), std::string::npos);
    EXPECT_NE(errors[0].find("frobnicate"), std::string::npos);
}

TEST(Parser, ContinuesAfterError) {
    std::vector<std::string> errors;
    CutJob job = parse_text("bogus line here\ncut 100 x 2\n", &errors);

    EXPECT_EQ(errors.size(), 1u);
    ASSERT_EQ(job.cuts.size(), 1u);
    EXPECT_EQ(job.cuts[0].quantity, 2u);
}

TEST(Parser, RejectsBadValues) {
    std::vector<std::string> errors;

    parse_text("stock x 2000\n", &errors);
    EXPECT_FALSE(errors.empty());

    parse_text("stock 2.5 x 2000\n", &errors);
    EXPECT_FALSE(errors.empty());

    parse_text("cut 1500 x 2.5\n", &errors);
    EXPECT_FALSE(errors.empty());

    parse_text("cut 0 x 2\n", &errors);
    EXPECT_FALSE(errors.empty());

    parse_text("kerf -1\n", &errors);
    EXPECT_FALSE(errors.empty());

    parse_text("units furlong\n", &errors);
    EXPECT_FALSE(errors.empty());

    parse_text("cut 100 x 2 extra\n", &errors);
    EXPECT_FALSE(errors.empty());

    CutJob job = parse_text("stock 5000000000 x 2000 mm\ncut 1500 x 6\n", &errors);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("line 1"), std::string::npos);
    EXPECT_EQ(job.stock_count, CutJob{}.stock_count);
    ASSERT_EQ(job.cuts.size(), 1u);

    job = parse_text("stock 4294967295 x 2000\n", &errors);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(job.stock_count, 4294967295u);
}

TEST(Parser, OverlongNumberIsReportedWithPosition) {
    std::vector<std::string> errors;
    std::string text = "cut 1" + std::string(400, '0') + " x 2\ncut 300 x 4\n";
    CutJob job = parse_text(text, &errors);

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("line 1, column 5"), std::string::npos);
    ASSERT_EQ(job.cuts.size(), 1u);
    EXPECT_DOUBLE_EQ(job.cuts[0].length, 300.0);
    EXPECT_EQ(job.cuts[0].quantity, 4u);
}

TEST(Parser, ZeroQuantityIsAllowed) {
    std::vector<std::string> errors;
    CutJob job = parse_text("cut 100 x 0\n", &errors);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(job.cuts[0].quantity, 0u);
}
