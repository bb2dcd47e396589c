#include <string>
#include <variant>

#include "expression.hpp"

#include <fmt/format.h>
#include <overloaded.hpp>

auto expression::string() const -> std::string
{
    return std::visit(
        overloaded {
            [](const binary_expression& expr)
            { return fmt::format("({} {} {})", expr.left->string(), expr.op.type, expr.right->string()); },
            [](const unary_expression& expr) { return fmt::format("({}{})", expr.op.type, expr.right->string()); },
            [](const grouping_expression& expr) { return fmt::format("({})", expr.inner->string()); },
            [](const literal_expression& expr) { return expr.value.inspect(); },
            [](const variable_expression& expr) { return expr.name.lexeme; },
            [](const assign_expression& expr) { return fmt::format("{} = {}", expr.name.lexeme, expr.value->string()); },
        },
        node);
}
