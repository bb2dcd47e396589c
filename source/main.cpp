#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <ast/program.hpp>
#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <lexer/scanner.hpp>
#include <lexer/token.hpp>
#include <lox/lox.hpp>
#include <parser/parser.hpp>

namespace
{
constexpr auto prompt = ">> ";

// sysexits.h
enum exit_code : std::uint8_t
{
    ok = 0,
    usage = 64,
    data_error = 65,
    no_input = 66,
    software = 70,
};

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

auto print_scan_errors(const std::vector<scan_error>& errors)
{
    for (const auto& error : errors) {
        fmt::print(stderr, "[line {}] Error: {}\n", error.loc.line, error.message);
    }
}

auto print_error(const std::exception& error)
{
    fmt::print(stderr, "{}\n", error.what());
}

[[noreturn]] auto show_usage(std::string_view program_name, std::string_view error_msg = {})
{
    int code = exit_code::ok;
    if (!error_msg.empty()) {
        fmt::print(stderr, "Error: {}\n", error_msg);
        code = exit_code::usage;
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program_name);
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program_name, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    for (std::string_view arg : std::span(argv, static_cast<size_t>(argc))) {
        if (arg.empty()) {
            continue;
        }
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program_name, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default: {
                    show_usage(program_name, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                show_usage(program_name, fmt::format("unexpected argument {}, already have a file", arg));
            }
        }
    }
    return opts;
}

void debug_tokens(const std::vector<token>& tokens)
{
    std::cout << "Tokens:\n";
    for (const auto& tok : tokens) {
        std::cout << "  " << tok << '\n';
    }
}

// runs one independent unit of source, bindings survive in env
auto run(std::string_view source, environment& env, const command_line_args& opts) -> exit_code
{
    auto [tokens, errors] = scan(source);
    if (!errors.empty()) {
        print_scan_errors(errors);
        return exit_code::data_error;
    }
    if (opts.debug) {
        debug_tokens(tokens);
    }
    program prgrm;
    try {
        prgrm = parse(std::move(tokens));
    } catch (const parse_error& e) {
        print_error(e);
        return exit_code::data_error;
    }
    if (opts.debug) {
        fmt::print("Program:\n  {}\n", prgrm.string());
    }
    try {
        interpret(prgrm, env);
    } catch (const eval_error& e) {
        print_error(e);
        return exit_code::software;
    }
    if (opts.debug) {
        env.debug();
    }
    return exit_code::ok;
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        fmt::print(stderr, "ERROR: could not open file: {}\n", opts.file);
        return exit_code::no_input;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    auto global_env = environment {};
    return run(contents, global_env, opts);
}

auto run_repl(const command_line_args& opts) -> int
{
    auto global_env = environment {};
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        // errors were reported, a failing line does not end the session
        static_cast<void>(run(input, global_env, opts));
        show_prompt();
    }
    std::cout << '\n';
    return exit_code::ok;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program_name = std::string_view(*argv);
    auto opts = parse_command_line(program_name, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program_name);
    }
    try {
        if (!opts.file.empty()) {
            return run_file(opts);
        }
        return run_repl(opts);

    } catch (const std::exception& e) {
        fmt::print(stderr, "Caught an exception: {}\n", e.what());
        return exit_code::software;
    }
}
