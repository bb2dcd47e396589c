#pragma once

#include <memory>
#include <string>
#include <variant>

#include <lexer/token.hpp>
#include <object/object.hpp>

struct expression;
using expression_ptr = std::unique_ptr<expression>;

struct binary_expression final
{
    expression_ptr left;
    token op;
    expression_ptr right;
};

struct unary_expression final
{
    token op;
    expression_ptr right;
};

struct grouping_expression final
{
    expression_ptr inner;
};

struct literal_expression final
{
    object value;
};

struct variable_expression final
{
    token name;
};

struct assign_expression final
{
    token name;
    expression_ptr value;
};

struct expression final
{
    using node_type = std::variant<binary_expression,
                                   unary_expression,
                                   grouping_expression,
                                   literal_expression,
                                   variable_expression,
                                   assign_expression>;

    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(node);
    }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        return std::get<T>(node);
    }

    [[nodiscard]] auto string() const -> std::string;

    node_type node;
};

template<typename T>
auto make_expression(T&& node) -> expression_ptr
{
    return std::make_unique<expression>(expression {std::forward<T>(node)});
}
