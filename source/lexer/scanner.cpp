#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "scanner.hpp"

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table =
    std::array<std::optional<token_type>, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(std::nullopt);
    arr['('] = lparen;
    arr[')'] = rparen;
    arr['{'] = lsquirly;
    arr['}'] = rsquirly;
    arr[','] = comma;
    arr['.'] = dot;
    arr['-'] = minus;
    arr['+'] = plus;
    arr[';'] = semicolon;
    arr['*'] = asterisk;
    arr['/'] = slash;
    arr['!'] = exclamation;
    arr['='] = assign;
    arr['<'] = less_than;
    arr['>'] = greater_than;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();

struct two_char_token
{
    token_type first;
    char second;
    token_type merged;
};

constexpr auto two_char_tokens = std::array {
    two_char_token {.first = token_type::exclamation, .second = '=', .merged = token_type::not_equals},
    two_char_token {.first = token_type::assign, .second = '=', .merged = token_type::equals},
    two_char_token {.first = token_type::less_than, .second = '=', .merged = token_type::less_equal},
    two_char_token {.first = token_type::greater_than, .second = '=', .merged = token_type::greater_equal},
};

constexpr auto keyword_count = 5;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"true", token_type::tru},
        std::pair {"false", token_type::fals},
        std::pair {"nil", token_type::nil},
        std::pair {"var", token_type::var},
        std::pair {"print", token_type::print},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

inline auto is_alpha_numeric(char chr) -> bool
{
    return is_letter(chr) || is_digit(chr);
}

}  // namespace

scanner::scanner(std::string_view input)
    : m_input {input}
{
}

auto scanner::scan_tokens() -> std::vector<token>
{
    if (!m_tokens.empty()) {
        return m_tokens;
    }
    while (!is_at_end()) {
        m_start = m_current;
        m_start_loc = current_loc();
        scan_token();
    }
    m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .literal = std::nullopt, .loc = current_loc()});
    return m_tokens;
}

auto scanner::has_error() const -> bool
{
    return !m_errors.empty();
}

auto scanner::errors() const -> const std::vector<scan_error>&
{
    return m_errors;
}

auto scanner::scan_token() -> void
{
    using enum token_type;
    const auto chr = read_char();
    if (const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(chr)]; char_token_type) {
        if (*char_token_type == slash && match('/')) {
            skip_line_comment();
            return;
        }
        const auto next = peek_char();
        // NOLINTBEGIN(*-qualified-auto)
        const auto itr = std::find_if(two_char_tokens.cbegin(),
                                      two_char_tokens.cend(),
                                      [&](const auto& two) { return two.first == *char_token_type && two.second == next; });
        // NOLINTEND(*-qualified-auto)
        if (itr != two_char_tokens.cend()) {
            read_char();
            add_token(itr->merged);
            return;
        }
        add_token(*char_token_type);
        return;
    }
    switch (chr) {
        case ' ':
        case '\r':
        case '\t':
        case '\n':
            return;
        case '"':
            read_string();
            return;
        default:
            break;
    }
    if (is_digit(chr)) {
        read_number();
        return;
    }
    if (is_letter(chr)) {
        read_identifier_or_keyword();
        return;
    }
    error(m_start_loc, "Unexpected character.");
}

auto scanner::read_char() -> std::string_view::value_type
{
    const auto chr = m_input[m_current];
    m_current++;
    if (chr == '\n') {
        m_line++;
        m_bol = m_current;
    }
    return chr;
}

auto scanner::match(std::string_view::value_type expected) -> bool
{
    if (is_at_end() || m_input[m_current] != expected) {
        return false;
    }
    read_char();
    return true;
}

auto scanner::peek_char() const -> std::string_view::value_type
{
    if (is_at_end()) {
        return '\0';
    }
    return m_input[m_current];
}

auto scanner::peek_next_char() const -> std::string_view::value_type
{
    if (m_current + 1 >= m_input.size()) {
        return '\0';
    }
    return m_input[m_current + 1];
}

auto scanner::is_at_end() const -> bool
{
    return m_current >= m_input.size();
}

auto scanner::skip_line_comment() -> void
{
    while (!is_at_end() && peek_char() != '\n') {
        read_char();
    }
}

auto scanner::read_identifier_or_keyword() -> void
{
    while (is_alpha_numeric(peek_char())) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(m_start, m_current - m_start);
    // MSVC compiler will not be happy with a const auto* const itr here
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr == keyword_tokens.cend()) {
        add_token(token_type::ident);
        return;
    }
    // NOLINTEND(*-qualified-auto)
    switch (itr->second) {
        case token_type::tru:
            add_token(itr->second, object {true});
            return;
        case token_type::fals:
            add_token(itr->second, object {false});
            return;
        case token_type::nil:
            add_token(itr->second, object {});
            return;
        default:
            add_token(itr->second);
    }
}

auto scanner::read_number() -> void
{
    while (is_digit(peek_char())) {
        read_char();
    }
    // a trailing dot without a fractional digit is left for the next token
    if (peek_char() == '.' && is_digit(peek_next_char())) {
        read_char();
        while (is_digit(peek_char())) {
            read_char();
        }
    }
    const auto text = std::string {m_input.substr(m_start, m_current - m_start)};
    // out of range literals saturate to inf or 0 instead of failing
    add_token(token_type::number, object {std::strtod(text.c_str(), nullptr)});
}

auto scanner::read_string() -> void
{
    while (!is_at_end() && peek_char() != '"') {
        read_char();
    }
    if (is_at_end()) {
        error(m_start_loc, "Unterminated string.");
        return;
    }
    read_char();
    const auto count = m_current - m_start - 2;
    add_token(token_type::string, object {std::string {m_input.substr(m_start + 1, count)}});
}

auto scanner::add_token(token_type type, std::optional<object> literal) -> void
{
    m_tokens.push_back(token {
        .type = type,
        .lexeme = std::string {m_input.substr(m_start, m_current - m_start)},
        .literal = std::move(literal),
        .loc = m_start_loc,
    });
}

auto scanner::error(location loc, std::string message) -> void
{
    m_errors.push_back(scan_error {.loc = loc, .message = std::move(message)});
}

auto scanner::current_loc() const -> location
{
    return location {.line = m_line, .column = m_current - m_bol + 1};
}
