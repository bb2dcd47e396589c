#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    eof,

    // single character tokens
    lparen,
    rparen,
    lsquirly,
    rsquirly,
    comma,
    dot,
    minus,
    plus,
    semicolon,
    asterisk,
    slash,

    // one or two character tokens
    exclamation,
    not_equals,
    assign,
    equals,
    less_than,
    less_equal,
    greater_than,
    greater_equal,

    // multi character tokens
    ident,
    string,
    number,

    // keywords
    tru,
    fals,
    nil,
    var,
    print,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
