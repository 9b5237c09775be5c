#include "macro.hpp"

auto main() -> int {
    for(auto i = 0; i < 2; i += 1) loop_label(outer) {
        for(auto j = 0; j < 2; j += 1) loop_label(inner) {
            const auto value = unwrap_continue(std::optional<int>(), (outer), (inner));
            return value;
        }
    }
    return 0;
}
