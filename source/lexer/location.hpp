#pragma once
#include <cstddef>
#include <ostream>

#include <fmt/ostream.h>

struct location final
{
    std::size_t line {1};
    std::size_t column {1};
    auto operator==(const location& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const location& l) -> std::ostream&;

template<>
struct fmt::formatter<location> : ostream_formatter
{
};
