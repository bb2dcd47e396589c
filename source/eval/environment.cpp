#include <optional>
#include <string>
#include <utility>

#include "environment.hpp"

#include <fmt/core.h>
#include <object/object.hpp>

auto environment::get(const std::string& name) const -> std::optional<object>
{
    if (const auto itr = store.find(name); itr != store.end()) {
        return itr->second;
    }
    return std::nullopt;
}

auto environment::set(const std::string& name, object val) -> void
{
    store.insert_or_assign(name, std::move(val));
}

auto environment::debug() const -> void
{
    for (const auto& [k, v] : store) {
        fmt::print("[{}] = {}\n", k, v.inspect());
    }
}
