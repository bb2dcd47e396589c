#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include <object/object.hpp>

// a single flat scope, later bindings of a name replace earlier ones
struct environment final
{
    [[nodiscard]] auto get(const std::string& name) const -> std::optional<object>;
    auto set(const std::string& name, object val) -> void;

    auto debug() const -> void;

    std::unordered_map<std::string, object> store;
};
