#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

#include "lox.hpp"

auto scan(std::string_view source) -> scan_result
{
    auto scnr = scanner {source};
    auto tokens = scnr.scan_tokens();
    return scan_result {.tokens = std::move(tokens), .errors = scnr.errors()};
}

auto parse(std::vector<token> tokens) -> program
{
    auto prsr = parser {std::move(tokens)};
    return prsr.parse_program();
}

auto interpret(const program& prgrm, environment& env, std::ostream& out) -> void
{
    auto evltr = evaluator {env, out};
    evltr.evaluate(prgrm);
}
