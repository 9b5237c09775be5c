#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

inline auto read_line(std::istream& input, const std::optional<std::string_view> prompt = std::nullopt) -> Result<std::string> {
    if(prompt) {
        std::cout << *prompt << std::flush;
    }
    auto line = std::string();
    if(!std::getline(input, line)) {
        return Error::Code::EndOfInput;
    }
    return line;
}

inline auto split_words(const std::string_view str) -> std::vector<std::string_view> {
    auto r = std::vector<std::string_view>();

    auto end   = size_t(0);
    auto start = size_t();
    while((start = str.find_first_not_of(" \t\r", end)) != std::string_view::npos) {
        end = str.find_first_of(" \t\r", start);
        r.emplace_back(str.substr(start, end - start));
    }
    return r;
}
