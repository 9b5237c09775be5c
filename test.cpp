#include "test.hpp"

auto main() -> int {
    return test() ? 0 : 1;
}
