#pragma once

#include <string>
#include <vector>

#include "statements.hpp"

struct program final
{
    [[nodiscard]] auto string() const -> std::string;

    std::vector<statement> statements;
};
