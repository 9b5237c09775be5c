#include "macro.hpp"

auto main() -> int {
    for(auto i = 0; i < 2; i += 1) loop_label(outer) {
        const auto value = unwrap_continue(std::optional<int>(), (outer), "message", 1);
        return value;
    }
    return 0;
}
