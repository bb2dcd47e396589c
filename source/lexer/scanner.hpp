#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <object/object.hpp>

#include "location.hpp"
#include "token.hpp"

struct scan_error final
{
    location loc;
    std::string message;
    auto operator==(const scan_error& other) const -> bool = default;
};

class scanner final
{
  public:
    explicit scanner(std::string_view input);

    auto scan_tokens() -> std::vector<token>;
    [[nodiscard]] auto has_error() const -> bool;
    [[nodiscard]] auto errors() const -> const std::vector<scan_error>&;

  private:
    auto scan_token() -> void;
    auto read_char() -> std::string_view::value_type;
    auto match(std::string_view::value_type expected) -> bool;
    [[nodiscard]] auto peek_char() const -> std::string_view::value_type;
    [[nodiscard]] auto peek_next_char() const -> std::string_view::value_type;
    [[nodiscard]] auto is_at_end() const -> bool;
    auto skip_line_comment() -> void;
    auto read_identifier_or_keyword() -> void;
    auto read_number() -> void;
    auto read_string() -> void;
    auto add_token(token_type type, std::optional<object> literal = std::nullopt) -> void;
    auto error(location loc, std::string message) -> void;
    [[nodiscard]] auto current_loc() const -> location;

    std::string_view m_input;
    std::string_view::size_type m_start {0};
    std::string_view::size_type m_current {0};
    std::string_view::size_type m_bol {0};
    std::size_t m_line {1};
    location m_start_loc;
    std::vector<token> m_tokens;
    std::vector<scan_error> m_errors;
};
