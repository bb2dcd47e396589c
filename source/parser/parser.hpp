#pragma once

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <lexer/token.hpp>

struct parse_error final : std::runtime_error
{
    parse_error(token offending, std::string message);

    [[nodiscard]] auto offending() const -> const token& { return m_offending; }
    [[nodiscard]] auto message() const -> const std::string& { return m_message; }

  private:
    token m_offending;
    std::string m_message;
};

class parser final
{
  public:
    explicit parser(std::vector<token> tokens);
    auto parse_program() -> program;

  private:
    using operand_parser = auto (parser::*)() -> expression_ptr;

    auto parse_declaration() -> statement;
    auto parse_var_statement() -> statement;
    auto parse_statement() -> statement;
    auto parse_print_statement() -> statement;
    auto parse_expression_statement() -> statement;

    auto parse_expression() -> expression_ptr;
    auto parse_assignment() -> expression_ptr;
    auto parse_equality() -> expression_ptr;
    auto parse_comparison() -> expression_ptr;
    auto parse_term() -> expression_ptr;
    auto parse_factor() -> expression_ptr;
    auto parse_unary() -> expression_ptr;
    auto parse_primary() -> expression_ptr;
    auto parse_binary_expression(std::initializer_list<token_type> operators, operand_parser operand)
        -> expression_ptr;

    auto get(std::initializer_list<token_type> types) -> bool;
    auto expect(token_type type, std::string_view message) -> const token&;
    auto next_token() -> const token&;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    [[nodiscard]] auto current_token() const -> const token&;
    [[nodiscard]] auto previous_token() const -> const token&;
    [[nodiscard]] auto is_at_end() const -> bool;

    std::vector<token> m_tokens;
    std::vector<token>::size_type m_current {0};
};
