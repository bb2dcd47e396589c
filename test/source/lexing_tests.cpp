#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>
#include <lexer/scanner.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <lox/lox.hpp>
#include <object/object.hpp>

// NOLINTBEGIN(*-magic-numbers)
namespace
{
struct expected_token
{
    token_type type;
    std::string_view lexeme;
};

auto assert_tokens(std::string_view input, const std::vector<expected_token>& expected_tokens) -> void
{
    auto scnr = scanner {input};
    const auto tokens = scnr.scan_tokens();
    ASSERT_FALSE(scnr.has_error()) << "while scanning: `" << input << "`";
    ASSERT_EQ(tokens.size(), expected_tokens.size()) << "while scanning: `" << input << "`";
    for (auto idx = 0UL; idx < tokens.size(); ++idx) {
        EXPECT_EQ(tokens[idx].type, expected_tokens[idx].type) << "token " << idx << ": " << tokens[idx];
        EXPECT_EQ(tokens[idx].lexeme, expected_tokens[idx].lexeme) << "token " << idx << ": " << tokens[idx];
    }
}
}  // namespace

TEST(lexing, testNextToken)
{
    using enum token_type;
    assert_tokens(R"r(var five = 5;
var ten = 10.5;
print five + ten;
!-/*5;
5 < 10 > 5;
10 == 10;
10 != 9;
5 <= 6 >= 4;
"foobar"
"foo bar"
""
{ } ( ) , .
true false nil
)r",
                  {
                      {var, "var"},       {ident, "five"},       {assign, "="},          {number, "5"},
                      {semicolon, ";"},   {var, "var"},          {ident, "ten"},         {assign, "="},
                      {number, "10.5"},   {semicolon, ";"},      {print, "print"},       {ident, "five"},
                      {plus, "+"},        {ident, "ten"},        {semicolon, ";"},       {exclamation, "!"},
                      {minus, "-"},       {slash, "/"},          {asterisk, "*"},        {number, "5"},
                      {semicolon, ";"},   {number, "5"},         {less_than, "<"},       {number, "10"},
                      {greater_than, ">"}, {number, "5"},        {semicolon, ";"},       {number, "10"},
                      {equals, "=="},     {number, "10"},        {semicolon, ";"},       {number, "10"},
                      {not_equals, "!="}, {number, "9"},         {semicolon, ";"},       {number, "5"},
                      {less_equal, "<="}, {number, "6"},         {greater_equal, ">="},  {number, "4"},
                      {semicolon, ";"},   {string, R"("foobar")"}, {string, R"("foo bar")"}, {string, R"("")"},
                      {lsquirly, "{"},    {rsquirly, "}"},       {lparen, "("},          {rparen, ")"},
                      {comma, ","},       {dot, "."},            {tru, "true"},          {fals, "false"},
                      {nil, "nil"},       {eof, ""},
                  });
}

TEST(lexing, testPunctuationTokenCount)
{
    const std::array inputs {
        std::string_view {"(){},.-+;*=!<>/"},
        std::string_view {";"},
        std::string_view {"(((((("},
        std::string_view {"-!-!-!"},
    };
    for (const auto input : inputs) {
        auto scnr = scanner {input};
        const auto tokens = scnr.scan_tokens();
        EXPECT_FALSE(scnr.has_error());
        EXPECT_EQ(tokens.size(), input.size() + 1) << "while scanning: `" << input << "`";
    }
}

TEST(lexing, testTwoCharacterOperatorsDoNotSkipCharacters)
{
    using enum token_type;
    assert_tokens("!!=", {{exclamation, "!"}, {not_equals, "!="}, {eof, ""}});
    assert_tokens("<==", {{less_equal, "<="}, {assign, "="}, {eof, ""}});
    assert_tokens("===", {{equals, "=="}, {assign, "="}, {eof, ""}});
    assert_tokens(">(", {{greater_than, ">"}, {lparen, "("}, {eof, ""}});
    assert_tokens("=!=", {{assign, "="}, {not_equals, "!="}, {eof, ""}});
}

TEST(lexing, testLineComments)
{
    using enum token_type;
    assert_tokens("1 // a comment with \"quotes\" and @\n2", {{number, "1"}, {number, "2"}, {eof, ""}});
    assert_tokens("4 / 2 // halves", {{number, "4"}, {slash, "/"}, {number, "2"}, {eof, ""}});
    assert_tokens("// nothing but a comment", {{eof, ""}});
}

TEST(lexing, testNumbers)
{
    struct number_test
    {
        std::string_view input;
        double expected;
    };
    const std::array tests {
        number_test {"0", 0.0},
        number_test {"123", 123.0},
        number_test {"45.67", 45.67},
        number_test {"007", 7.0},
        number_test {"1.5", 1.5},
    };
    for (const auto& [input, expected] : tests) {
        auto scnr = scanner {input};
        const auto tokens = scnr.scan_tokens();
        ASSERT_EQ(tokens.size(), 2U);
        ASSERT_EQ(tokens[0].type, token_type::number);
        ASSERT_TRUE(tokens[0].literal.has_value());
        EXPECT_DOUBLE_EQ(tokens[0].literal->as<number_value>(), expected) << "while scanning: `" << input << "`";
    }
}

TEST(lexing, testOutOfRangeNumbersSaturate)
{
    const auto huge = "1" + std::string(400, '0');
    auto huge_scnr = scanner {huge};
    const auto huge_tokens = huge_scnr.scan_tokens();
    ASSERT_FALSE(huge_scnr.has_error());
    ASSERT_EQ(huge_tokens.size(), 2U);
    ASSERT_EQ(huge_tokens[0].type, token_type::number);
    EXPECT_EQ(huge_tokens[0].lexeme, huge);
    const auto huge_value = huge_tokens[0].literal->as<number_value>();
    EXPECT_TRUE(std::isinf(huge_value));
    EXPECT_GT(huge_value, 0);

    const auto tiny = "0." + std::string(400, '0') + "1";
    auto tiny_scnr = scanner {tiny};
    const auto tiny_tokens = tiny_scnr.scan_tokens();
    ASSERT_FALSE(tiny_scnr.has_error());
    ASSERT_EQ(tiny_tokens.size(), 2U);
    EXPECT_EQ(tiny_tokens[0].literal, object {0.0});
}

TEST(lexing, testScanTokensTwiceKeepsOneEof)
{
    auto scnr = scanner {"1 + 2"};
    const auto first = scnr.scan_tokens();
    const auto second = scnr.scan_tokens();
    ASSERT_EQ(first.size(), 4U);
    EXPECT_EQ(second, first);
    EXPECT_EQ(std::count_if(second.cbegin(), second.cend(), [](const token& tok) { return tok.type == token_type::eof; }),
              1);
}

TEST(lexing, testTrailingDotIsNotPartOfNumber)
{
    using enum token_type;
    assert_tokens("8.", {{number, "8"}, {dot, "."}, {eof, ""}});
    assert_tokens("8.x", {{number, "8"}, {dot, "."}, {ident, "x"}, {eof, ""}});
    assert_tokens(".5", {{dot, "."}, {number, "5"}, {eof, ""}});
    assert_tokens("1.2.3", {{number, "1.2"}, {dot, "."}, {number, "3"}, {eof, ""}});
}

TEST(lexing, testStrings)
{
    auto scnr = scanner {R"("foo bar" "")"};
    const auto tokens = scnr.scan_tokens();
    ASSERT_FALSE(scnr.has_error());
    ASSERT_EQ(tokens.size(), 3U);
    EXPECT_EQ(tokens[0].type, token_type::string);
    EXPECT_EQ(tokens[0].lexeme, R"("foo bar")");
    EXPECT_EQ(tokens[0].literal, object {string_value {"foo bar"}});
    EXPECT_EQ(tokens[1].literal, object {string_value {}});
}

TEST(lexing, testMultiLineString)
{
    auto scnr = scanner {"\"first\nsecond\" after"};
    const auto tokens = scnr.scan_tokens();
    ASSERT_FALSE(scnr.has_error());
    ASSERT_EQ(tokens.size(), 3U);
    EXPECT_EQ(tokens[0].literal, object {string_value {"first\nsecond"}});
    EXPECT_EQ(tokens[0].line(), 1U);
    EXPECT_EQ(tokens[1].type, token_type::ident);
    EXPECT_EQ(tokens[1].line(), 2U);
    EXPECT_EQ(tokens[2].line(), 2U);
}

TEST(lexing, testUnterminatedString)
{
    auto scnr = scanner {R"("abc)"};
    const auto tokens = scnr.scan_tokens();
    EXPECT_TRUE(scnr.has_error());
    ASSERT_EQ(tokens.size(), 1U);
    EXPECT_EQ(tokens[0].type, token_type::eof);
    ASSERT_EQ(scnr.errors().size(), 1U);
    EXPECT_EQ(scnr.errors()[0].message, "Unterminated string.");
    EXPECT_EQ(scnr.errors()[0].loc.line, 1U);
}

TEST(lexing, testUnterminatedStringReportsStartingLine)
{
    auto scnr = scanner {"1;\n\"abc\ndef\nghi"};
    const auto tokens = scnr.scan_tokens();
    ASSERT_TRUE(scnr.has_error());
    ASSERT_EQ(scnr.errors().size(), 1U);
    EXPECT_EQ(scnr.errors()[0].loc.line, 2U);
    ASSERT_EQ(tokens.size(), 3U);
    EXPECT_EQ(tokens[2].type, token_type::eof);
    EXPECT_EQ(tokens[2].line(), 4U);
}

TEST(lexing, testIdentifiersAndKeywords)
{
    using enum token_type;
    assert_tokens("true false nil var print foo _bar baz9 variable printer nil_",
                  {
                      {tru, "true"},
                      {fals, "false"},
                      {nil, "nil"},
                      {var, "var"},
                      {print, "print"},
                      {ident, "foo"},
                      {ident, "_bar"},
                      {ident, "baz9"},
                      {ident, "variable"},
                      {ident, "printer"},
                      {ident, "nil_"},
                      {eof, ""},
                  });
}

TEST(lexing, testKeywordLiterals)
{
    auto scnr = scanner {"true false nil"};
    const auto tokens = scnr.scan_tokens();
    ASSERT_EQ(tokens.size(), 4U);
    EXPECT_EQ(tokens[0].literal, object {true});
    EXPECT_EQ(tokens[1].literal, object {false});
    ASSERT_TRUE(tokens[2].literal.has_value());
    EXPECT_TRUE(tokens[2].literal->is_nil());
    EXPECT_FALSE(tokens[3].literal.has_value());
}

TEST(lexing, testUnexpectedCharactersDoNotStopScanning)
{
    auto scnr = scanner {"1 @ 2\n# 3"};
    const auto tokens = scnr.scan_tokens();
    ASSERT_TRUE(scnr.has_error());
    ASSERT_EQ(scnr.errors().size(), 2U);
    EXPECT_EQ(scnr.errors()[0], (scan_error {.loc = {.line = 1, .column = 3}, .message = "Unexpected character."}));
    EXPECT_EQ(scnr.errors()[1], (scan_error {.loc = {.line = 2, .column = 1}, .message = "Unexpected character."}));
    ASSERT_EQ(tokens.size(), 4U);
    EXPECT_EQ(tokens[0].lexeme, "1");
    EXPECT_EQ(tokens[1].lexeme, "2");
    EXPECT_EQ(tokens[2].lexeme, "3");
    EXPECT_EQ(tokens[3].type, token_type::eof);
}

TEST(lexing, testLocations)
{
    auto scnr = scanner {"var x = 1;\n  print x;\n"};
    const auto tokens = scnr.scan_tokens();
    ASSERT_EQ(tokens.size(), 9U);
    EXPECT_EQ(tokens[0].loc, (location {.line = 1, .column = 1}));
    EXPECT_EQ(tokens[1].loc, (location {.line = 1, .column = 5}));
    EXPECT_EQ(tokens[4].loc, (location {.line = 1, .column = 10}));
    EXPECT_EQ(tokens[5].loc, (location {.line = 2, .column = 3}));
    EXPECT_EQ(tokens[6].loc, (location {.line = 2, .column = 9}));
    EXPECT_EQ(tokens[8].type, token_type::eof);
    EXPECT_EQ(tokens[8].line(), 3U);
}

TEST(lexing, testScanEntryPoint)
{
    const auto result = scan("var a = 1; var b = 2; print a + b;");
    EXPECT_FALSE(result.had_error());
    EXPECT_EQ(result.tokens.size(), 16U);
    EXPECT_EQ(result.tokens.back().type, token_type::eof);

    const auto failed = scan("var s = \"open");
    EXPECT_TRUE(failed.had_error());
    EXPECT_EQ(failed.tokens.size(), 4U);
}
// NOLINTEND(*-magic-numbers)
