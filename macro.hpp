#pragma once
#include <utility>

#include "log.hpp"
#include "two-state.hpp"

// unwrap_continue(value [, (label)] [, message])
// unwrap_break(value [, (label)] [, message])
// unwrap_break_error(value [, (label)] [, message])
//
// Each evaluates to the value held by a two-state container. When the
// container is absent, the message (if any) is written to the logger and then:
//   unwrap_continue    continues the innermost loop, or the loop marked with loop_label(label)
//   unwrap_break       exits the innermost loop, or the loop marked with loop_label(label)
//   unwrap_break_error stores the failure payload in a result slot and exits the loop owning it,
//                      that is the nearest loop whose body starts with loop_result, or the loop
//                      marked with loop_label(label, result)
// Without a label, unwrap_continue and unwrap_break expand to plain continue and break, so
// inside a switch unwrap_break leaves the switch, not the loop. Give it a label to leave the loop.
//
// A label is written in parentheses and may come before or after the message:
//   unwrap_continue(parse_int<int>(word), (lines), "not a number")
//   unwrap_continue(parse_int<int>(word), "not a number", (lines))
// so a message must not itself start with a parenthesis.
//
// These rely on GNU statement expressions and local labels.
#define unwrap_continue(...)    LOOP_UNWRAP_DISPATCH(LOOP_UNWRAP_CONTINUE __VA_OPT__(, ) __VA_ARGS__)
#define unwrap_break(...)       LOOP_UNWRAP_DISPATCH(LOOP_UNWRAP_BREAK __VA_OPT__(, ) __VA_ARGS__)
#define unwrap_break_error(...) LOOP_UNWRAP_DISPATCH(LOOP_UNWRAP_BREAK_ERROR __VA_OPT__(, ) __VA_ARGS__)

// marks the following loop body as a target for (name)
//   for(auto& row : rows) loop_label(rows) {
//       for(auto& cell : row) {
//           auto v = unwrap_continue(cell, (rows));
//       }
//   }
// loop_label(name, result) also binds result as the slot that
// unwrap_break_error(..., (name)) stores failures into.
// labels share the function's label scope, so each name can be used once per function.
#define loop_label(name, ...)                                                         \
    if(__VA_OPT__([[maybe_unused]] auto& name##_loop_result = __VA_ARGS__;) false) { \
    name##_continue:                                                                  \
        __attribute__((unused));                                                      \
        continue;                                                                     \
    name##_break:                                                                     \
        __attribute__((unused));                                                      \
        break;                                                                        \
    } else

// binds result as the slot of the enclosing loop for an unlabelled unwrap_break_error,
// must be the first statement of the loop body
//   auto sum = Result<int>(0);
//   while(true) {
//       loop_result(sum);
//       const auto n = unwrap_break_error(parse_int<int>(read_line()));
//       ...
//   }
// the exit jumps to this loop even from inside nested loops or a switch.
#define loop_result(result)                                  \
    __label__ loop_unwrap_break;                             \
    [[maybe_unused]] auto& loop_unwrap_result = (result);    \
    if(false) {                                              \
    loop_unwrap_break:                                       \
        __attribute__((unused));                             \
        break;                                               \
    } else                                                   \
        (void)0

// argument shape matching
#define LOOP_UNWRAP_CAT_(a, b)    a##b
#define LOOP_UNWRAP_CAT(a, b)     LOOP_UNWRAP_CAT_(a, b)
#define LOOP_UNWRAP_SELECT_(a, b) a##b
#define LOOP_UNWRAP_SELECT(a, b)  LOOP_UNWRAP_SELECT_(a, b)
#define LOOP_UNWRAP_LABEL_(a, b)  a##b
#define LOOP_UNWRAP_LABEL(a, b)   LOOP_UNWRAP_LABEL_(a, b)
#define LOOP_UNWRAP_STRIP(...)    __VA_ARGS__

// 1 if x starts with a parenthesized group, 0 otherwise
#define LOOP_UNWRAP_IS_PAREN(x)         LOOP_UNWRAP_CHECK(LOOP_UNWRAP_IS_PAREN_MARK x)
#define LOOP_UNWRAP_IS_PAREN_MARK(...)  ~, 1,
#define LOOP_UNWRAP_CHECK(...)          LOOP_UNWRAP_CHECK_N(__VA_ARGS__, 0, )
#define LOOP_UNWRAP_CHECK_N(x, n, ...)  n

// 0..3, or 4 for anything longer
#define LOOP_UNWRAP_NARGS(...)                                        LOOP_UNWRAP_NARGS_(__VA_ARGS__ __VA_OPT__(, ) 4, 4, 4, 4, 4, 4, 3, 2, 1, 0)
#define LOOP_UNWRAP_NARGS_(_1, _2, _3, _4, _5, _6, _7, _8, _9, n, ...) n

#define LOOP_UNWRAP_DISPATCH(family, ...) \
    LOOP_UNWRAP_SELECT(LOOP_UNWRAP_SHAPE_, LOOP_UNWRAP_NARGS(__VA_ARGS__))(family __VA_OPT__(, ) __VA_ARGS__)

#define LOOP_UNWRAP_MALFORMED(message) \
    __extension__({ static_assert(false, message); })

#define LOOP_UNWRAP_SHAPE_0(family) \
    LOOP_UNWRAP_MALFORMED("a value to unwrap is required")
#define LOOP_UNWRAP_SHAPE_4(family, ...) \
    LOOP_UNWRAP_MALFORMED("unwrap macros take (value), (value, (label)), (value, message) or (value, (label), message)")

#define LOOP_UNWRAP_SHAPE_1(family, value) \
    family(value, INNER, ~, )

#define LOOP_UNWRAP_SHAPE_2(family, value, a) \
    LOOP_UNWRAP_CAT(LOOP_UNWRAP_SHAPE_2_, LOOP_UNWRAP_IS_PAREN(a))(family, value, a)
#define LOOP_UNWRAP_SHAPE_2_0(family, value, message) \
    family(value, INNER, ~, LOOP_UNWRAP_REPORT(message))
#define LOOP_UNWRAP_SHAPE_2_1(family, value, label) \
    family(value, LABEL, LOOP_UNWRAP_STRIP label, )

#define LOOP_UNWRAP_SHAPE_3(family, value, a, b) \
    LOOP_UNWRAP_CAT(LOOP_UNWRAP_SHAPE_3_, LOOP_UNWRAP_CAT(LOOP_UNWRAP_IS_PAREN(a), LOOP_UNWRAP_IS_PAREN(b)))(family, value, a, b)
#define LOOP_UNWRAP_SHAPE_3_10(family, value, label, message) \
    family(value, LABEL, LOOP_UNWRAP_STRIP label, LOOP_UNWRAP_REPORT(message))
#define LOOP_UNWRAP_SHAPE_3_01(family, value, message, label) \
    family(value, LABEL, LOOP_UNWRAP_STRIP label, LOOP_UNWRAP_REPORT(message))
#define LOOP_UNWRAP_SHAPE_3_00(family, value, a, b) \
    LOOP_UNWRAP_MALFORMED("two messages given, expected at most one message and one (label)")
#define LOOP_UNWRAP_SHAPE_3_11(family, value, a, b) \
    LOOP_UNWRAP_MALFORMED("two labels given, expected at most one message and one (label)")

// code generation
#define LOOP_UNWRAP_REPORT(message) \
    ::logger.write_value(message);

#define LOOP_UNWRAP_ESCAPE_CONTINUE_INNER(label) continue;
#define LOOP_UNWRAP_ESCAPE_CONTINUE_LABEL(label) goto LOOP_UNWRAP_LABEL(label, _continue);
#define LOOP_UNWRAP_ESCAPE_BREAK_INNER(label)    break;
#define LOOP_UNWRAP_ESCAPE_BREAK_LABEL(label)    goto LOOP_UNWRAP_LABEL(label, _break);

#define LOOP_UNWRAP_ESCAPE_FAILURE_INNER(label) goto loop_unwrap_break;
#define LOOP_UNWRAP_ESCAPE_FAILURE_LABEL(label) goto LOOP_UNWRAP_LABEL(label, _break);

#define LOOP_UNWRAP_SLOT_INNER(label) loop_unwrap_result
#define LOOP_UNWRAP_SLOT_LABEL(label) LOOP_UNWRAP_LABEL(label, _loop_result)

#define LOOP_UNWRAP_CONTINUE(value, target, label, report) \
    LOOP_UNWRAP_OPTION_BODY(value, report LOOP_UNWRAP_ESCAPE_CONTINUE_##target(label))

#define LOOP_UNWRAP_BREAK(value, target, label, report) \
    LOOP_UNWRAP_OPTION_BODY(value, report LOOP_UNWRAP_ESCAPE_BREAK_##target(label))

#define LOOP_UNWRAP_BREAK_ERROR(value, target, label, report) \
    LOOP_UNWRAP_FAILURE_BODY(value, report, LOOP_UNWRAP_SLOT_##target(label), LOOP_UNWRAP_ESCAPE_FAILURE_##target(label))

#define LOOP_UNWRAP_OPTION_BODY(value, on_absent)                               \
    __extension__({                                                             \
        auto loop_unwrap_option = ::loop_unwrap::to_option(value);              \
        if(!loop_unwrap_option) {                                               \
            on_absent                                                           \
        }                                                                       \
        std::move(*loop_unwrap_option);                                         \
    })

#define LOOP_UNWRAP_FAILURE_BODY(value, report, slot, escape)                                     \
    __extension__({                                                                               \
        auto loop_unwrap_container = (value);                                                     \
        static_assert(::loop_unwrap::Failable<decltype(loop_unwrap_container)>,                   \
                      "unwrap_break_error needs a container that carries a failure payload");     \
        if(!::loop_unwrap::is_present(loop_unwrap_container)) {                                   \
            report                                                                                \
            slot = ::loop_unwrap::take_failure(std::move(loop_unwrap_container));                 \
            escape                                                                                \
        }                                                                                         \
        ::loop_unwrap::take_value(std::move(loop_unwrap_container));                              \
    })
