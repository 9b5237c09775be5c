#include <cstdio>
#include <string_view>

#include "macro.hpp"
#include "parse.hpp"
#include "util.hpp"

using namespace std::literals;

struct Options {
    bool strict = false;
    bool quiet  = false;
};

// commands:
//   add <n>...  adds every number, skipping words that are not numbers
//   all <n>...  adds the numbers only if every word is a number
//   exit        stops reading
// in strict mode a word that is not a number ends the session with its parse error
auto prompt(std::istream& input, const Options& options) -> Result<long> {
    auto total  = long(0);
    auto status = Result<long>(0);
    while(true) loop_label(lines, status) {
        const auto line = unwrap_break(read_line(input, options.quiet ? ""sv : "> "sv));
        const auto args = split_words(line);
        if(args.empty()) {
            continue;
        }

        const auto command = args[0];
        if(command == "exit") {
            break;
        } else if(command == "add") {
            for(auto i = size_t(1); i < args.size(); i += 1) {
                if(options.strict) {
                    total += unwrap_break_error(parse_int<long>(args[i]), (lines), "not a number: "s + std::string(args[i]));
                } else {
                    total += unwrap_continue(parse_int<long>(args[i]), "skipping "s + std::string(args[i]));
                }
            }
        } else if(command == "all") {
            auto subtotal = long(0);
            for(auto i = size_t(1); i < args.size(); i += 1) {
                subtotal += unwrap_continue(parse_int<long>(args[i]), (lines), "line dropped, not a number: "s + std::string(args[i]));
            }
            total += subtotal;
        } else {
            logger(LogLevel::Warn, "unknown command \"%.*s\"\n", int(command.size()), command.data());
            continue;
        }
        logger(LogLevel::Info, "total %ld\n", total);
    }
    if(!status) {
        return status;
    }
    return total;
}

auto main(const int argc, const char* const argv[]) -> int {
    auto options = Options();
    for(auto i = 1; i < argc; i += 1) {
        const auto arg = std::string_view(argv[i]);
        if(arg == "--strict") {
            options.strict = true;
        } else if(arg == "--quiet") {
            options.quiet = true;
        } else if(arg == "--debug") {
            logger.set_level(LogLevel::Debug);
        } else {
            puts("usage: loop-unwrap [--strict] [--quiet] [--debug]");
            return 1;
        }
    }
    if(options.quiet) {
        logger.set_level(LogLevel::Error);
    }

    logger(LogLevel::Debug, "strict=%d\n", options.strict);
    const auto result = prompt(std::cin, options);
    if(!result) {
        logger(LogLevel::Error, "stopped: %s\n", result.as_error().to_string());
        return 1;
    }
    printf("%ld\n", result.as_value());
    return 0;
}
