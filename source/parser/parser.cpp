#include <algorithm>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <fmt/format.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
auto format_parse_error(const token& offending, std::string_view message) -> std::string
{
    if (offending.type == token_type::eof) {
        return fmt::format("[line {}] Error at end: {}", offending.line(), message);
    }
    return fmt::format("[line {}] Error at '{}': {}", offending.line(), offending.lexeme, message);
}
}  // namespace

parse_error::parse_error(token offending, std::string message)
    : std::runtime_error {format_parse_error(offending, message)}
    , m_offending {std::move(offending)}
    , m_message {std::move(message)}
{
}

parser::parser(std::vector<token> tokens)
    : m_tokens {std::move(tokens)}
{
    // every rule relies on the sequence being closed by exactly one eof
    if (m_tokens.empty() || m_tokens.back().type != token_type::eof) {
        const auto loc = m_tokens.empty() ? location {} : m_tokens.back().loc;
        m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .literal = std::nullopt, .loc = loc});
    }
}

auto parser::parse_program() -> program
{
    auto prgrm = program {};
    while (!is_at_end()) {
        prgrm.statements.push_back(parse_declaration());
    }
    return prgrm;
}

auto parser::parse_declaration() -> statement
{
    if (get({token_type::var})) {
        return parse_var_statement();
    }
    return parse_statement();
}

auto parser::parse_var_statement() -> statement
{
    using enum token_type;
    auto name = expect(ident, "Expect variable name.");
    expression_ptr initializer;
    if (get({assign})) {
        initializer = parse_expression();
    }
    expect(semicolon, "Expect ';' after variable declaration.");
    return statement {var_statement {.name = std::move(name), .initializer = std::move(initializer)}};
}

auto parser::parse_statement() -> statement
{
    if (get({token_type::print})) {
        return parse_print_statement();
    }
    return parse_expression_statement();
}

auto parser::parse_print_statement() -> statement
{
    auto value = parse_expression();
    expect(token_type::semicolon, "Expect ';' after value.");
    return statement {print_statement {.expr = std::move(value)}};
}

auto parser::parse_expression_statement() -> statement
{
    auto expr = parse_expression();
    expect(token_type::semicolon, "Expect ';' after expression.");
    return statement {expression_statement {.expr = std::move(expr)}};
}

auto parser::parse_expression() -> expression_ptr
{
    return parse_assignment();
}

auto parser::parse_assignment() -> expression_ptr
{
    auto target = parse_equality();
    if (!get({token_type::assign})) {
        return target;
    }
    auto equals = previous_token();
    auto value = parse_assignment();
    if (!target->is<variable_expression>()) {
        throw parse_error(std::move(equals), "Invalid assignment target.");
    }
    return make_expression(assign_expression {
        .name = target->as<variable_expression>().name,
        .value = std::move(value),
    });
}

auto parser::parse_equality() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression({not_equals, equals}, &parser::parse_comparison);
}

auto parser::parse_comparison() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression({greater_than, greater_equal, less_than, less_equal}, &parser::parse_term);
}

auto parser::parse_term() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression({minus, plus}, &parser::parse_factor);
}

auto parser::parse_factor() -> expression_ptr
{
    using enum token_type;
    return parse_binary_expression({slash, asterisk}, &parser::parse_unary);
}

auto parser::parse_binary_expression(std::initializer_list<token_type> operators, operand_parser operand)
    -> expression_ptr
{
    auto left = (this->*operand)();
    while (get(operators)) {
        auto oprtr = previous_token();
        auto right = (this->*operand)();
        left = make_expression(binary_expression {
            .left = std::move(left),
            .op = std::move(oprtr),
            .right = std::move(right),
        });
    }
    return left;
}

auto parser::parse_unary() -> expression_ptr
{
    using enum token_type;
    if (get({exclamation, minus})) {
        auto oprtr = previous_token();
        auto right = parse_unary();
        return make_expression(unary_expression {.op = std::move(oprtr), .right = std::move(right)});
    }
    return parse_primary();
}

auto parser::parse_primary() -> expression_ptr
{
    using enum token_type;
    if (get({number, string, tru, fals, nil})) {
        return make_expression(literal_expression {.value = previous_token().literal.value_or(object {})});
    }
    if (get({ident})) {
        return make_expression(variable_expression {.name = previous_token()});
    }
    if (get({lparen})) {
        auto inner = parse_expression();
        expect(rparen, "Expect ')' after expression.");
        return make_expression(grouping_expression {.inner = std::move(inner)});
    }
    throw parse_error(current_token(), "Expect expression.");
}

auto parser::get(std::initializer_list<token_type> types) -> bool
{
    if (std::any_of(types.begin(), types.end(), [this](token_type type) { return current_token_is(type); })) {
        next_token();
        return true;
    }
    return false;
}

auto parser::expect(token_type type, std::string_view message) -> const token&
{
    if (current_token_is(type)) {
        return next_token();
    }
    throw parse_error(current_token(), std::string {message});
}

auto parser::next_token() -> const token&
{
    if (!is_at_end()) {
        m_current++;
    }
    return previous_token();
}

auto parser::current_token_is(token_type type) const -> bool
{
    return current_token().type == type;
}

auto parser::current_token() const -> const token&
{
    return m_tokens[m_current];
}

auto parser::previous_token() const -> const token&
{
    return m_tokens[m_current - 1];
}

auto parser::is_at_end() const -> bool
{
    return current_token_is(token_type::eof);
}
