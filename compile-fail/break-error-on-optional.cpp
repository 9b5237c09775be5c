// an optional carries no failure to propagate
#include "macro.hpp"

auto main() -> int {
    auto result = Result<int>(0);
    while(true) {
        loop_result(result);
        const auto value = unwrap_break_error(std::optional<int>());
        result = value;
        break;
    }
    return 0;
}
