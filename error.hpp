#pragma once
#include <ostream>
#include <utility>
#include <variant>

class Error {
  public:
    enum class Code : int {
        Success = 0,
        // parse
        Empty,
        InvalidDigit,
        PosOverflow,
        NegOverflow,
        // input
        EndOfInput,
    };

  private:
    Code code;

  public:
    operator bool() const {
        return code != Code::Success;
    }

    auto operator==(const Code code) const -> bool {
        return code == this->code;
    }

    auto operator==(const Error& other) const -> bool {
        return code == other.code;
    }

    auto as_code() const -> Code {
        return code;
    }

    auto as_int() const -> unsigned int {
        return static_cast<unsigned int>(code);
    }

    auto to_string() const -> const char* {
        switch(code) {
        case Code::Success:
            return "success";
        case Code::Empty:
            return "cannot parse integer from empty string";
        case Code::InvalidDigit:
            return "invalid digit found in string";
        case Code::PosOverflow:
            return "number too large to fit in target type";
        case Code::NegOverflow:
            return "number too small to fit in target type";
        case Code::EndOfInput:
            return "end of input";
        }
        return "unknown error";
    }

    Error() : code(Code::Success) {}
    Error(const Code code) : code(code) {}
};

inline auto operator<<(std::ostream& stream, const Error& error) -> std::ostream& {
    return stream << error.to_string();
}

// holds either a value or the failure that prevented producing it
template <class T, class E = Error>
class Result {
  private:
    std::variant<T, E> data;

  public:
    auto as_value() -> T& {
        return std::get<0>(data);
    }

    auto as_value() const -> const T& {
        return std::get<0>(data);
    }

    auto as_error() -> E& {
        return std::get<1>(data);
    }

    auto as_error() const -> const E& {
        return std::get<1>(data);
    }

    operator bool() const {
        return data.index() == 0;
    }

    Result(const T& data) : data(std::in_place_index<0>, data) {}
    Result(T&& data) : data(std::in_place_index<0>, std::move(data)) {}

    Result(const E& error) : data(std::in_place_index<1>, error) {}
    Result(E&& error) : data(std::in_place_index<1>, std::move(error)) {}

    template <class C = E>
    Result(const typename C::Code error) : data(std::in_place_index<1>, error) {}
};
