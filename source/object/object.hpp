#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

#include <fmt/ostream.h>

using nil_type = std::monostate;
using number_value = double;
using string_value = std::string;

using value_type = std::variant<nil_type, bool, number_value, string_value>;

struct object
{
    template<typename T>
    [[nodiscard]] constexpr auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    [[nodiscard]] constexpr auto is_nil() const -> bool { return is<nil_type>(); }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        if (!is<T>()) {
            throw std::runtime_error("Error trying to convert " + inspect() + " to " + object {T {}}.type_name());
        }
        return std::get<T>(value);
    }

    // nil and false are falsy, everything else, including 0 and "", is truthy
    [[nodiscard]] auto is_truthy() const -> bool;
    [[nodiscard]] auto type_name() const -> std::string;

    // the form written by print: strings unquoted
    [[nodiscard]] auto display() const -> std::string;

    // the form used in diagnostics: strings quoted
    [[nodiscard]] auto inspect() const -> std::string;

    value_type value {};
};

// structural equality, values of different types are never equal
auto operator==(const object& lhs, const object& rhs) -> bool;

auto operator<<(std::ostream& ostream, const object& obj) -> std::ostream&;

template<>
struct fmt::formatter<object> : ostream_formatter
{
};
