#include <string>
#include <variant>

#include "object.hpp"

#include <fmt/format.h>
#include <overloaded.hpp>

auto object::is_truthy() const -> bool
{
    return std::visit(overloaded {
                          [](const nil_type) { return false; },
                          [](const bool val) { return val; },
                          [](const auto&) { return true; },
                      },
                      value);
}

auto object::type_name() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_type) { return "nil"; },
                          [](const bool) { return "boolean"; },
                          [](const number_value) { return "number"; },
                          [](const string_value&) { return "string"; },
                      },
                      value);
}

auto object::display() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_type) -> std::string { return "nil"; },
                          [](const bool val) -> std::string { return val ? "true" : "false"; },
                          [](const number_value val) -> std::string { return fmt::format("{}", val); },
                          [](const string_value& val) -> std::string { return val; },
                      },
                      value);
}

auto object::inspect() const -> std::string
{
    if (const auto* str = std::get_if<string_value>(&value); str != nullptr) {
        return fmt::format(R"("{}")", *str);
    }
    return display();
}

auto operator==(const object& lhs, const object& rhs) -> bool
{
    return std::visit(overloaded {
                          [](const nil_type, const nil_type) { return true; },
                          [](const bool val1, const bool val2) { return val1 == val2; },
                          [](const number_value val1, const number_value val2) { return val1 == val2; },
                          [](const string_value& val1, const string_value& val2) { return val1 == val2; },
                          [](const auto&, const auto&) { return false; },
                      },
                      lhs.value,
                      rhs.value);
}

auto operator<<(std::ostream& ostream, const object& obj) -> std::ostream&
{
    return ostream << obj.inspect();
}
