#pragma once

#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <lexer/location.hpp>
#include <object/object.hpp>

#include "environment.hpp"

struct eval_error final : std::runtime_error
{
    eval_error(location loc, std::string message);

    [[nodiscard]] auto loc() const -> const location& { return m_loc; }
    [[nodiscard]] auto line() const -> std::size_t { return m_loc.line; }
    [[nodiscard]] auto message() const -> const std::string& { return m_message; }

  private:
    location m_loc;
    std::string m_message;
};

class evaluator final
{
  public:
    explicit evaluator(environment& env, std::ostream& out = std::cout);

    // runs the statements in order, stops at the first eval_error
    auto evaluate(const program& prgrm) -> void;
    auto execute(const statement& stmt) -> void;
    auto evaluate(const expression& expr) -> object;

  private:
    auto evaluate_binary(const binary_expression& expr) -> object;
    auto evaluate_unary(const unary_expression& expr) -> object;
    auto evaluate_variable(const variable_expression& expr) const -> object;
    auto evaluate_assign(const assign_expression& expr) -> object;

    environment& m_env;
    std::ostream& m_out;
};
