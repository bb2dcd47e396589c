#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

#include "program.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

auto program::string() const -> std::string
{
    auto strs = std::vector<std::string>();
    std::transform(statements.cbegin(),
                   statements.cend(),
                   std::back_inserter(strs),
                   [](const auto& stmt) { return stmt.string(); });
    return fmt::format("{}", fmt::join(strs.cbegin(), strs.cend(), ""));
}
