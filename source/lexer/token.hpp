#pragma once

#include <optional>
#include <ostream>
#include <string>

#include <fmt/ostream.h>
#include <object/object.hpp>

#include "location.hpp"
#include "token_type.hpp"

struct token final
{
    token_type type {token_type::eof};
    std::string lexeme;
    std::optional<object> literal;
    location loc;

    [[nodiscard]] auto line() const -> std::size_t { return loc.line; }
    auto operator==(const token& other) const -> bool;
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
