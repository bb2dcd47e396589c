#include <string>
#include <variant>

#include "statements.hpp"

#include <fmt/format.h>
#include <overloaded.hpp>

auto statement::string() const -> std::string
{
    return std::visit(overloaded {
                          [](const expression_statement& stmt) { return fmt::format("{};", stmt.expr->string()); },
                          [](const print_statement& stmt) { return fmt::format("print {};", stmt.expr->string()); },
                          [](const var_statement& stmt)
                          {
                              if (stmt.initializer == nullptr) {
                                  return fmt::format("var {};", stmt.name.lexeme);
                              }
                              return fmt::format("var {} = {};", stmt.name.lexeme, stmt.initializer->string());
                          },
                      },
                      node);
}
