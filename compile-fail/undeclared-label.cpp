#include "macro.hpp"

auto main() -> int {
    for(auto i = 0; i < 2; i += 1) {
        const auto value = unwrap_break(std::optional<int>(), (outer));
        return value;
    }
    return 0;
}
