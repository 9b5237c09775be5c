#pragma once
#include <charconv>
#include <concepts>
#include <string_view>
#include <system_error>

#include "error.hpp"

// parses a decimal integer with an optional leading sign
template <std::integral T>
auto parse_int(std::string_view str) -> Result<T> {
    if(str.empty()) {
        return Error::Code::Empty;
    }

    auto negative = false;
    if(str[0] == '+' || str[0] == '-') {
        negative = str[0] == '-';
        str.remove_prefix(1);
        if(str.empty()) {
            return Error::Code::InvalidDigit;
        }
        // from_chars takes '-' but never '+', and a second sign is not a digit
        if(str[0] == '+' || str[0] == '-') {
            return Error::Code::InvalidDigit;
        }
    }

    if(negative && std::unsigned_integral<T>) {
        return Error::Code::InvalidDigit;
    }

    auto       value = T();
    const auto begin = negative ? str.data() - 1 : str.data();
    const auto end   = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if(ec == std::errc::result_out_of_range) {
        return negative ? Error::Code::NegOverflow : Error::Code::PosOverflow;
    }
    if(ec != std::errc() || ptr != end) {
        return Error::Code::InvalidDigit;
    }
    return value;
}
