#pragma once

#include <string>
#include <variant>
#include <vector>

#include <lexer/token.hpp>

#include "expression.hpp"

struct expression_statement final
{
    expression_ptr expr;
};

struct print_statement final
{
    expression_ptr expr;
};

struct var_statement final
{
    token name;
    // null when declared without an initializer
    expression_ptr initializer;
};

struct statement final
{
    using node_type = std::variant<expression_statement, print_statement, var_statement>;

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
