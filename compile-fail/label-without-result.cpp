// the labelled loop has no slot for the failure
#include "macro.hpp"
#include "parse.hpp"

auto main() -> int {
    for(auto i = 0; i < 2; i += 1) loop_label(outer) {
        const auto value = unwrap_break_error(parse_int<int>("x"), (outer));
        return value;
    }
    return 0;
}
