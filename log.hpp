#pragma once
#include <algorithm>
#include <array>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

enum class LogLevel {
    Error = 3,
    Warn  = 4,
    Info  = 6,
    Debug = 7,
};

class Logger {
  public:
    using Writer = std::function<void(std::string_view)>;

  private:
    Writer writer = [](const std::string_view line) {
        std::cout << line << std::endl;
    };
    LogLevel max_level = LogLevel::Info;

  public:
    auto operator()(const LogLevel level, const char* const format, ...) -> int {
        if(level > max_level) {
            return 0;
        }
        static auto buffer = std::array<char, 1024>();

        va_list ap;
        va_start(ap, format);
        const auto result = vsnprintf(buffer.data(), buffer.size(), format, ap);
        va_end(ap);
        if(result < 0) {
            return result;
        }
        auto len = std::min(static_cast<size_t>(result), buffer.size() - 1);
        // writer appends its own newline
        if(len != 0 && buffer[len - 1] == '\n') {
            len -= 1;
        }
        write_line(std::string_view(buffer.data(), len));
        return result;
    }

    auto write_line(const std::string_view line) -> void {
        if(writer) {
            writer(line);
        }
    }

    // accepts anything printable with operator<<
    template <class T>
    auto write_value(const T& value) -> void {
        if constexpr(std::is_convertible_v<const T&, std::string_view>) {
            write_line(std::string_view(value));
        } else {
            auto stream = std::ostringstream();
            stream << value;
            write_line(stream.str());
        }
    }

    auto set_level(const LogLevel level) -> void {
        max_level = level;
    }

    auto set_writer(Writer new_writer) -> Writer {
        std::swap(writer, new_writer);
        return new_writer;
    }
};

inline auto logger = Logger();
