// the labelled loop has a slot, but the unlabelled form needs loop_result
#include "macro.hpp"
#include "parse.hpp"

auto main() -> int {
    auto result = Result<int>(0);
    for(auto i = 0; i < 2; i += 1) loop_label(outer, result) {
        const auto value = unwrap_break_error(parse_int<int>("x"));
        return value;
    }
    return 0;
}
