#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "macro.hpp"
#include "parse.hpp"
#include "util.hpp"

#ifdef assert
#undef assert
#endif

#define assert(a)                                        \
    if(!(a)) {                                           \
        printf("test failed at %d: " #a "\n", __LINE__); \
        return false;                                    \
    }

using namespace std::literals;

// records everything written to the logger while alive
class Capture {
  private:
    Logger::Writer previous;

  public:
    std::vector<std::string> lines;

    Capture(const Capture&)                    = delete;
    auto operator=(const Capture&) -> Capture& = delete;

    Capture() {
        previous = logger.set_writer([this](const std::string_view line) { lines.emplace_back(line); });
    }

    ~Capture() {
        logger.set_writer(std::move(previous));
    }
};

// a sensor sample that may have been dropped
struct Sample {
    bool valid;
    int  value;
};

// a device reply carrying a status byte on failure
struct Reply {
    int     value;
    uint8_t status;
};

template <>
struct loop_unwrap::Container<Sample> {
    using Value = int;

    static auto is_present(const Sample& s) -> bool {
        return s.valid;
    }

    static auto take_value(Sample&& s) -> int {
        return s.value;
    }
};

template <>
struct loop_unwrap::Container<Reply> {
    using Value   = int;
    using Failure = uint8_t;

    static auto is_present(const Reply& r) -> bool {
        return r.status == 0;
    }

    static auto take_value(Reply&& r) -> int {
        return r.value;
    }

    static auto take_failure(Reply&& r) -> uint8_t {
        return r.status;
    }
};

static_assert(loop_unwrap::TwoState<std::optional<int>>);
static_assert(loop_unwrap::TwoState<Result<int>>);
static_assert(loop_unwrap::TwoState<Sample>);
static_assert(!loop_unwrap::TwoState<int>);
static_assert(loop_unwrap::Failable<Result<std::string>>);
static_assert(loop_unwrap::Failable<Reply>);
static_assert(!loop_unwrap::Failable<std::optional<int>>);
static_assert(!loop_unwrap::Failable<Sample>);

inline auto message(int& evaluations, const char* const text) -> std::string {
    evaluations += 1;
    return text;
}

inline auto test_to_option() -> bool {
    assert(loop_unwrap::to_option(std::optional<int>(7)) == 7);
    assert(!loop_unwrap::to_option(std::optional<int>()));
    assert(loop_unwrap::to_option(Result<int>(7)) == 7);
    assert(!loop_unwrap::to_option(Result<int>(Error::Code::InvalidDigit)));

    const auto name = std::optional<std::string>("abc");
    assert(loop_unwrap::to_option(name) == "abc");
    assert(name == "abc");

    assert((loop_unwrap::to_option(Sample{true, 3}) == 3));
    assert((!loop_unwrap::to_option(Sample{false, 3})));
    assert((loop_unwrap::to_option(Reply{5, 0}) == 5));
    assert((!loop_unwrap::to_option(Reply{5, 2})));

    assert(loop_unwrap::take_failure(Result<int>(Error::Code::Empty)) == Error::Code::Empty);
    assert((loop_unwrap::take_failure(Reply{0, 9}) == 9));
    return true;
}

inline auto test_present_values() -> bool {
    auto capture     = Capture();
    auto evaluations = 0;
    auto sum         = 0;
    auto result      = Result<int>(-1);
    for(auto i = 0; i < 1; i += 1) loop_label(once, result) {
        loop_result(result);
        sum += unwrap_continue(std::optional<int>(1));
        sum += unwrap_continue(std::optional<int>(1), (once));
        sum += unwrap_continue(std::optional<int>(1), message(evaluations, "continue"));
        sum += unwrap_continue(std::optional<int>(1), (once), message(evaluations, "continue"));
        sum += unwrap_continue(std::optional<int>(1), message(evaluations, "continue"), (once));

        sum += unwrap_break(Result<int>(10));
        sum += unwrap_break(Result<int>(10), (once));
        sum += unwrap_break(Result<int>(10), message(evaluations, "break"));
        sum += unwrap_break(Result<int>(10), (once), message(evaluations, "break"));
        sum += unwrap_break(Result<int>(10), message(evaluations, "break"), (once));

        sum += unwrap_break_error(Result<int>(100));
        sum += unwrap_break_error(Result<int>(100), (once));
        sum += unwrap_break_error(Result<int>(100), message(evaluations, "break error"));
        sum += unwrap_break_error(Result<int>(100), (once), message(evaluations, "break error"));
        sum += unwrap_break_error(Result<int>(100), message(evaluations, "break error"), (once));

        sum += unwrap_continue((Sample{true, 1000}));
        sum += unwrap_break_error((Reply{1000, 0}), (once));
    }
    assert(sum == 2555);
    assert(evaluations == 0);
    assert(capture.lines.empty());
    assert(result);
    assert(result.as_value() == -1);
    return true;
}

inline auto test_continue_skips_rest_of_iteration() -> bool {
    auto capture    = Capture();
    auto iterations = 0;
    auto counter    = 0;
    for(auto i = 0; i < 3; i += 1) {
        iterations += 1;
        const auto value = unwrap_continue(std::optional<int>());
        counter += 1 + value;
    }
    assert(iterations == 3);
    assert(counter == 0);
    assert(capture.lines.empty());
    return true;
}

inline auto test_continue_uses_next_value() -> bool {
    auto capture = Capture();
    auto numbers = std::vector<int>();
    for(const auto word : split_words("1 two 3 -4 +5 6x")) {
        numbers.push_back(unwrap_continue(parse_int<int>(word)));
    }
    assert((numbers == std::vector<int>{1, 3, -4, 5}));
    assert(capture.lines.empty());
    return true;
}

inline auto test_break_exits_loop() -> bool {
    auto capture    = Capture();
    auto iterations = 0;
    auto after      = 0;
    while(true) {
        iterations += 1;
        const auto value = unwrap_break(parse_int<int>("not a number"));
        after += value;
    }
    assert(iterations == 1);
    assert(after == 0);
    assert(capture.lines.empty());
    return true;
}

inline auto test_message_precedes_escape() -> bool {
    auto capture     = Capture();
    auto evaluations = 0;
    for(auto i = 0; i < 2; i += 1) {
        capture.lines.emplace_back("iteration " + std::to_string(i));
        [[maybe_unused]] const auto value = unwrap_continue(std::optional<int>(), message(evaluations, "skipped"));
        capture.lines.emplace_back("unreachable");
    }
    capture.lines.emplace_back("loop done");
    while(true) {
        [[maybe_unused]] const auto value = unwrap_break(Result<int>(Error::Code::Empty), message(evaluations, "stopped"));
        capture.lines.emplace_back("unreachable");
    }
    capture.lines.emplace_back("exited");

    const auto expected = std::vector<std::string>{"iteration 0", "skipped", "iteration 1", "skipped", "loop done", "stopped", "exited"};
    assert(capture.lines == expected);
    assert(evaluations == 3);
    return true;
}

inline auto test_displayable_messages() -> bool {
    auto capture = Capture();
    for(auto i = 0; i < 1; i += 1) {
        [[maybe_unused]] const auto value = unwrap_continue(std::optional<int>(), 42);
    }
    for(auto i = 0; i < 1; i += 1) {
        [[maybe_unused]] const auto value = unwrap_continue(parse_int<int>(""), Error(Error::Code::Empty));
    }
    for(auto i = 0; i < 1; i += 1) {
        const auto text = std::string("owned text");
        [[maybe_unused]] const auto value = unwrap_break(std::optional<int>(), text);
    }
    const auto expected = std::vector<std::string>{"42", "cannot parse integer from empty string", "owned text"};
    assert(capture.lines == expected);
    return true;
}

inline auto test_label_continue() -> bool {
    auto capture  = Capture();
    auto visited  = std::vector<int>();
    auto row_ends = 0;
    for(auto row = 0; row < 3; row += 1) loop_label(grid) {
        for(auto col = 0; col < 3; col += 1) {
            const auto cell = col == 1 ? std::optional<int>() : std::optional<int>(row * 10 + col);
            visited.push_back(unwrap_continue(cell, (grid)));
        }
        row_ends += 1;
    }
    assert((visited == std::vector<int>{0, 10, 20}));
    assert(row_ends == 0);
    assert(capture.lines.empty());

    // without the label only the inner loop is affected
    visited.clear();
    for(auto row = 0; row < 3; row += 1) loop_label(unused_grid) {
        for(auto col = 0; col < 3; col += 1) {
            const auto cell = col == 1 ? std::optional<int>() : std::optional<int>(row * 10 + col);
            visited.push_back(unwrap_continue(cell));
        }
        row_ends += 1;
    }
    assert((visited == std::vector<int>{0, 2, 10, 12, 20, 22}));
    assert(row_ends == 3);
    return true;
}

inline auto test_label_break() -> bool {
    auto capture  = Capture();
    auto visited  = std::vector<int>();
    auto row_ends = 0;
    for(auto row = 0; row < 3; row += 1) loop_label(table) {
        for(auto col = 0; col < 3; col += 1) {
            const auto cell = row == 1 && col == 1 ? std::optional<int>() : std::optional<int>(row * 10 + col);
            visited.push_back(unwrap_break(cell, (table), "table ended"));
        }
        row_ends += 1;
    }
    assert((visited == std::vector<int>{0, 1, 2, 10}));
    assert(row_ends == 1);
    assert(capture.lines == std::vector<std::string>{"table ended"});
    return true;
}

inline auto test_argument_order() -> bool {
    auto first  = std::vector<std::string>();
    auto second = std::vector<std::string>();
    {
        auto capture = Capture();
        for(auto row = 0; row < 2; row += 1) loop_label(label_first) {
            for(auto col = 0; col < 2; col += 1) {
                capture.lines.emplace_back(std::to_string(row) + std::to_string(col));
                [[maybe_unused]] const auto value = unwrap_continue(std::optional<int>(), (label_first), "skip row");
            }
        }
        for(auto row = 0; row < 2; row += 1) loop_label(label_first_break) {
            for(auto col = 0; col < 2; col += 1) {
                [[maybe_unused]] const auto value = unwrap_break(std::optional<int>(), (label_first_break), "stop");
            }
            capture.lines.emplace_back("unreachable");
        }
        first = capture.lines;
    }
    {
        auto capture = Capture();
        for(auto row = 0; row < 2; row += 1) loop_label(label_second) {
            for(auto col = 0; col < 2; col += 1) {
                capture.lines.emplace_back(std::to_string(row) + std::to_string(col));
                [[maybe_unused]] const auto value = unwrap_continue(std::optional<int>(), "skip row", (label_second));
            }
        }
        for(auto row = 0; row < 2; row += 1) loop_label(label_second_break) {
            for(auto col = 0; col < 2; col += 1) {
                [[maybe_unused]] const auto value = unwrap_break(std::optional<int>(), "stop", (label_second_break));
            }
            capture.lines.emplace_back("unreachable");
        }
        second = capture.lines;
    }
    const auto expected = std::vector<std::string>{"00", "skip row", "10", "skip row", "stop"};
    assert(first == expected);
    assert(second == expected);

    auto capture       = Capture();
    auto result_first  = Result<int>(0);
    auto result_second = Result<int>(0);
    for(auto i = 0; i < 2; i += 1) loop_label(error_first, result_first) {
        for(auto j = 0; j < 2; j += 1) {
            [[maybe_unused]] const auto value = unwrap_break_error(parse_int<int>("-"), (error_first), "bad");
        }
    }
    for(auto i = 0; i < 2; i += 1) loop_label(error_second, result_second) {
        for(auto j = 0; j < 2; j += 1) {
            [[maybe_unused]] const auto value = unwrap_break_error(parse_int<int>("-"), "bad", (error_second));
        }
    }
    assert(!result_first);
    assert(!result_second);
    assert(result_first.as_error() == result_second.as_error());
    assert((capture.lines == std::vector<std::string>{"bad", "bad"}));
    return true;
}

inline auto test_break_error_parse_failure() -> bool {
    auto capture = Capture();
    auto result  = Result<int>(0);
    auto reached = false;
    while(true) {
        loop_result(result);
        const auto n = unwrap_break_error(parse_int<int>("x"));
        reached = true;
        result  = n + 1;
        break;
    }
    assert(!reached);
    assert(!result);
    assert(result.as_error() == Error::Code::InvalidDigit);
    assert(capture.lines.empty());

    // the success path is unaffected
    while(true) {
        loop_result(result);
        const auto n = unwrap_break_error(parse_int<int>("41"), "never printed");
        result = n + 1;
        break;
    }
    assert(result);
    assert(result.as_value() == 42);
    assert(capture.lines.empty());
    return true;
}

inline auto test_break_error_keeps_payload() -> bool {
    auto capture     = Capture();
    auto outcome     = Result<std::vector<int>, std::string>(std::vector<int>());
    auto inner_after = 0;
    auto outer_after = 0;
    for(auto row = 0; row < 3; row += 1) loop_label(cells, outcome) {
        for(auto col = 0; col < 3; col += 1) {
            using Cell        = Result<int, std::string>;
            const auto source = row == 1 && col == 1 ? Cell("bad cell at 1:1"s) : Cell(col);
            const auto value  = unwrap_break_error(source, (cells), "stopping");
            outcome.as_value().push_back(value);
            inner_after += 1;
        }
        outer_after += 1;
    }
    assert(inner_after == 4);
    assert(outer_after == 1);
    assert(!outcome);
    assert(outcome.as_error() == "bad cell at 1:1");
    assert(capture.lines == std::vector<std::string>{"stopping"});

    // a custom failure payload is stored as is
    auto status = std::optional<uint8_t>();
    while(true) {
        loop_result(status);
        [[maybe_unused]] const auto value = unwrap_break_error((Reply{0, 0x7f}));
        status = 0;
    }
    assert(status == 0x7f);
    return true;
}

inline auto test_nested_result_loops() -> bool {
    auto outer_result = Result<int>(0);
    auto inner_result = Result<int>(0);
    auto outer_rounds = 0;
    for(auto i = 0; i < 2; i += 1) {
        loop_result(outer_result);
        for(auto j = 0; j < 2; j += 1) {
            loop_result(inner_result);
            [[maybe_unused]] const auto value = unwrap_break_error(parse_int<int>("99999999999"));
        }
        outer_rounds += 1;
    }
    assert(outer_rounds == 2);
    assert(outer_result);
    assert(!inner_result);
    assert(inner_result.as_error() == Error::Code::PosOverflow);
    return true;
}

inline auto test_break_error_leaves_owning_loop() -> bool {
    // loops without a slot in between are left as well
    auto capture      = Capture();
    auto result       = Result<int>(0);
    auto outer_rounds = 0;
    auto inner_rounds = 0;
    for(auto i = 0; i < 2; i += 1) {
        loop_result(result);
        for(auto j = 0; j < 2; j += 1) {
            inner_rounds += 1;
            [[maybe_unused]] const auto value = unwrap_break_error(parse_int<int>("x"));
            inner_rounds += 100;
        }
        outer_rounds += 1;
    }
    assert(inner_rounds == 1);
    assert(outer_rounds == 0);
    assert(!result);
    assert(result.as_error() == Error::Code::InvalidDigit);

    // a label without a slot in between does not take the failure
    auto labelled        = Result<int>(0);
    auto labelled_rounds = 0;
    for(auto i = 0; i < 2; i += 1) loop_label(owner, labelled) {
        loop_result(labelled);
        for(auto j = 0; j < 2; j += 1) loop_label(plain) {
            [[maybe_unused]] const auto value = unwrap_break_error(parse_int<int>(""), "empty");
        }
        labelled_rounds += 1;
    }
    assert(labelled_rounds == 0);
    assert(!labelled);
    assert(labelled.as_error() == Error::Code::Empty);
    assert(capture.lines == std::vector<std::string>{"empty"});
    return true;
}

inline auto test_break_from_switch() -> bool {
    auto capture = Capture();
    auto events  = std::vector<int>{0, 1, 2};
    auto handled = std::vector<int>();
    auto after   = 0;
    for(const auto event : events) loop_label(dispatch) {
        switch(event) {
        case 0:
            handled.push_back(event);
            break;
        case 1:
            handled.push_back(unwrap_break(std::optional<int>(), (dispatch), "no handler"));
            break;
        default:
            handled.push_back(event);
            break;
        }
        after += 1;
    }
    assert((handled == std::vector<int>{0}));
    assert(after == 1);
    assert(capture.lines == std::vector<std::string>{"no handler"});

    // without a label only the switch is left
    handled.clear();
    after = 0;
    for(const auto event : events) {
        switch(event) {
        case 1:
            handled.push_back(unwrap_break(std::optional<int>()));
            break;
        default:
            handled.push_back(event);
            break;
        }
        after += 1;
    }
    assert((handled == std::vector<int>{0, 2}));
    assert(after == 3);

    // the unlabelled failure exit leaves the loop owning the slot
    auto result = Result<int>(0);
    after       = 0;
    for(const auto event : events) {
        loop_result(result);
        switch(event) {
        case 1:
            result = unwrap_break_error(parse_int<int>("1x"));
            break;
        default:
            break;
        }
        after += 1;
    }
    assert(after == 1);
    assert(!result);
    assert(result.as_error() == Error::Code::InvalidDigit);
    return true;
}

inline auto test_custom_container() -> bool {
    auto capture = Capture();
    auto samples = std::vector<Sample>{{true, 1}, {false, 0}, {true, 2}, {false, 0}, {true, 3}};
    auto total   = 0;
    for(const auto& sample : samples) {
        total += unwrap_continue(sample, "dropped sample");
    }
    assert(total == 6);
    assert((capture.lines == std::vector<std::string>{"dropped sample", "dropped sample"}));
    return true;
}

inline auto test_parse_int() -> bool {
    assert(parse_int<int>("0").as_value() == 0);
    assert(parse_int<int>("-17").as_value() == -17);
    assert(parse_int<int>("+17").as_value() == 17);
    assert(parse_int<uint8_t>("255").as_value() == 255);
    assert(parse_int<int>("").as_error() == Error::Code::Empty);
    assert(parse_int<int>("x").as_error() == Error::Code::InvalidDigit);
    assert(parse_int<int>("-").as_error() == Error::Code::InvalidDigit);
    assert(parse_int<int>("+-1").as_error() == Error::Code::InvalidDigit);
    assert(parse_int<int>("12 ").as_error() == Error::Code::InvalidDigit);
    assert(parse_int<uint8_t>("256").as_error() == Error::Code::PosOverflow);
    assert(parse_int<int8_t>("-129").as_error() == Error::Code::NegOverflow);
    assert(parse_int<unsigned>("-1").as_error() == Error::Code::InvalidDigit);
    return true;
}

inline auto test_logger() -> bool {
    auto capture = Capture();
    logger.write_value("text");
    logger.write_value(3.5);
    logger(LogLevel::Info, "value %d\n", 5);
    logger(LogLevel::Debug, "hidden %d\n", 6);
    logger.set_level(LogLevel::Debug);
    logger(LogLevel::Debug, "shown %d", 7);
    logger.set_level(LogLevel::Info);
    const auto expected = std::vector<std::string>{"text", "3.5", "value 5", "shown 7"};
    assert(capture.lines == expected);

    auto inner = std::vector<std::string>();
    {
        auto nested = Capture();
        logger.write_line("nested");
        inner = nested.lines;
    }
    logger.write_line("restored");
    assert(inner == std::vector<std::string>{"nested"});
    assert(capture.lines.back() == "restored");
    return true;
}

inline auto test() -> bool {
    assert(test_to_option());
    assert(test_present_values());
    assert(test_continue_skips_rest_of_iteration());
    assert(test_continue_uses_next_value());
    assert(test_break_exits_loop());
    assert(test_message_precedes_escape());
    assert(test_displayable_messages());
    assert(test_label_continue());
    assert(test_label_break());
    assert(test_argument_order());
    assert(test_break_error_parse_failure());
    assert(test_break_error_keeps_payload());
    assert(test_nested_result_loops());
    assert(test_break_error_leaves_owning_loop());
    assert(test_break_from_switch());
    assert(test_custom_container());
    assert(test_parse_int());
    assert(test_logger());

    puts("all tests passed");
    return true;
}

#undef assert
