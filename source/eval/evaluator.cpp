#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "evaluator.hpp"

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <fmt/format.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <object/object.hpp>
#include <overloaded.hpp>

#include "environment.hpp"

eval_error::eval_error(location loc, std::string message)
    : std::runtime_error {fmt::format("[line {}] Error: {}", loc.line, message)}
    , m_loc {loc}
    , m_message {std::move(message)}
{
}

namespace
{
auto invalid_operands(const token& oprtr, const object& left, const object& right, std::string_view expected)
    -> eval_error
{
    return eval_error {oprtr.loc,
                       fmt::format("Invalid operands: {} and {}. {}", left.inspect(), right.inspect(), expected)};
}

template<typename Operation>
auto apply_numeric(const token& oprtr, const object& left, const object& right, Operation operation) -> object
{
    if (!left.is<number_value>() || !right.is<number_value>()) {
        throw invalid_operands(oprtr, left, right, "Expected numbers");
    }
    return object {operation(left.as<number_value>(), right.as<number_value>())};
}

auto apply_plus(const token& oprtr, const object& left, const object& right) -> object
{
    return std::visit(
        overloaded {
            [](const number_value lhs, const number_value rhs) { return object {lhs + rhs}; },
            [](const string_value& lhs, const string_value& rhs) { return object {lhs + rhs}; },
            [&](const number_value, const auto&) -> object
            { throw invalid_operands(oprtr, left, right, "Expected a number"); },
            [&](const string_value&, const auto&) -> object
            { throw invalid_operands(oprtr, left, right, "Expected a string"); },
            [&](const auto&, const auto&) -> object
            { throw invalid_operands(oprtr, left, right, "Expected a number or string"); },
        },
        left.value,
        right.value);
}

// only numbers, strings and booleans compare, and only against their own kind
auto apply_equals(const token& oprtr, const object& left, const object& right) -> bool
{
    if (left.is_nil() || left.value.index() != right.value.index()) {
        throw invalid_operands(oprtr, left, right, "Expected comparable types");
    }
    return left == right;
}

auto apply_binary_operator(const token& oprtr, const object& left, const object& right) -> object
{
    using enum token_type;
    switch (oprtr.type) {
        case plus:
            return apply_plus(oprtr, left, right);
        case minus:
            return apply_numeric(oprtr, left, right, std::minus<> {});
        case asterisk:
            return apply_numeric(oprtr, left, right, std::multiplies<> {});
        case slash:
            return apply_numeric(oprtr, left, right, std::divides<> {});
        case less_than:
            return apply_numeric(oprtr, left, right, std::less<> {});
        case less_equal:
            return apply_numeric(oprtr, left, right, std::less_equal<> {});
        case greater_than:
            return apply_numeric(oprtr, left, right, std::greater<> {});
        case greater_equal:
            return apply_numeric(oprtr, left, right, std::greater_equal<> {});
        case equals:
            return object {apply_equals(oprtr, left, right)};
        case not_equals:
            return object {!apply_equals(oprtr, left, right)};
        default:
            throw eval_error {oprtr.loc, fmt::format("Invalid operator: {}", oprtr.type)};
    }
}

}  // namespace

evaluator::evaluator(environment& env, std::ostream& out)
    : m_env {env}
    , m_out {out}
{
}

auto evaluator::evaluate(const program& prgrm) -> void
{
    for (const auto& stmt : prgrm.statements) {
        execute(stmt);
    }
}

auto evaluator::execute(const statement& stmt) -> void
{
    std::visit(overloaded {
                   [this](const expression_statement& expr_stmt) { evaluate(*expr_stmt.expr); },
                   [this](const print_statement& print_stmt)
                   { m_out << evaluate(*print_stmt.expr).display() << '\n'; },
                   [this](const var_statement& var_stmt)
                   {
                       auto value = var_stmt.initializer != nullptr ? evaluate(*var_stmt.initializer) : object {};
                       m_env.set(var_stmt.name.lexeme, std::move(value));
                   },
               },
               stmt.node);
}

auto evaluator::evaluate(const expression& expr) -> object
{
    return std::visit(overloaded {
                          [this](const binary_expression& binary) { return evaluate_binary(binary); },
                          [this](const unary_expression& unary) { return evaluate_unary(unary); },
                          [this](const grouping_expression& grouping) { return evaluate(*grouping.inner); },
                          [](const literal_expression& literal) { return literal.value; },
                          [this](const variable_expression& variable) { return evaluate_variable(variable); },
                          [this](const assign_expression& assign) { return evaluate_assign(assign); },
                      },
                      expr.node);
}

auto evaluator::evaluate_binary(const binary_expression& expr) -> object
{
    const auto left = evaluate(*expr.left);
    const auto right = evaluate(*expr.right);
    return apply_binary_operator(expr.op, left, right);
}

auto evaluator::evaluate_unary(const unary_expression& expr) -> object
{
    const auto right = evaluate(*expr.right);
    using enum token_type;
    switch (expr.op.type) {
        case exclamation:
            return object {!right.is_truthy()};
        case minus:
            if (!right.is<number_value>()) {
                throw eval_error {expr.op.loc,
                                  fmt::format("Invalid operand: {}. Expected a number", right.inspect())};
            }
            return object {-right.as<number_value>()};
        default:
            throw eval_error {expr.op.loc, fmt::format("Invalid operator: {}", expr.op.type)};
    }
}

auto evaluator::evaluate_variable(const variable_expression& expr) const -> object
{
    auto value = m_env.get(expr.name.lexeme);
    if (!value) {
        throw eval_error {expr.name.loc, fmt::format("Undefined variable: {}", expr.name.lexeme)};
    }
    return *std::move(value);
}

auto evaluator::evaluate_assign(const assign_expression& expr) -> object
{
    auto value = evaluate(*expr.value);
    m_env.set(expr.name.lexeme, value);
    return value;
}
