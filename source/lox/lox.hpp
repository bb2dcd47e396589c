#pragma once

#include <iostream>
#include <ostream>
#include <string_view>
#include <vector>

#include <ast/program.hpp>
#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <lexer/scanner.hpp>
#include <lexer/token.hpp>
#include <parser/parser.hpp>

struct scan_result final
{
    std::vector<token> tokens;
    std::vector<scan_error> errors;

    [[nodiscard]] auto had_error() const -> bool { return !errors.empty(); }
};

// the tokens always end with a single eof token, even when errors were found
auto scan(std::string_view source) -> scan_result;

// throws parse_error on the first grammar violation
auto parse(std::vector<token> tokens) -> program;

// throws eval_error on the first runtime failure, bindings made before it stay in env
auto interpret(const program& prgrm, environment& env, std::ostream& out = std::cout) -> void;
