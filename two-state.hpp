#pragma once
#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

#include "error.hpp"

namespace loop_unwrap {
// Container<T> describes how T collapses into present(value) / absent.
//
// A specialization provides:
//   using Value;
//   static auto is_present(const T&) -> bool;
//   static auto take_value(T&&) -> Value;
// and, only if T carries a failure payload:
//   using Failure;
//   static auto take_failure(T&&) -> Failure;
template <class T>
struct Container {};

template <class T>
struct Container<std::optional<T>> {
    using Value = T;

    static auto is_present(const std::optional<T>& o) -> bool {
        return o.has_value();
    }

    static auto take_value(std::optional<T>&& o) -> T {
        return std::move(*o);
    }
};

template <class T, class E>
struct Container<Result<T, E>> {
    using Value   = T;
    using Failure = E;

    static auto is_present(const Result<T, E>& r) -> bool {
        return static_cast<bool>(r);
    }

    static auto take_value(Result<T, E>&& r) -> T {
        return std::move(r.as_value());
    }

    static auto take_failure(Result<T, E>&& r) -> E {
        return std::move(r.as_error());
    }
};

template <class T>
using ContainerOf = Container<std::remove_cvref_t<T>>;

template <class T>
concept TwoState = requires(const std::remove_cvref_t<T>& c, std::remove_cvref_t<T>&& m) {
    typename ContainerOf<T>::Value;
    { ContainerOf<T>::is_present(c) } -> std::convertible_to<bool>;
    { ContainerOf<T>::take_value(std::move(m)) } -> std::convertible_to<typename ContainerOf<T>::Value>;
};

template <class T>
concept Failable = TwoState<T> && requires(std::remove_cvref_t<T>&& m) {
    typename ContainerOf<T>::Failure;
    { ContainerOf<T>::take_failure(std::move(m)) } -> std::convertible_to<typename ContainerOf<T>::Failure>;
};

template <TwoState T>
using ValueOf = typename ContainerOf<T>::Value;

template <Failable T>
using FailureOf = typename ContainerOf<T>::Failure;

template <TwoState T>
auto is_present(const T& container) -> bool {
    return ContainerOf<T>::is_present(container);
}

template <TwoState T>
auto take_value(T&& container) -> ValueOf<T> {
    auto copy = std::remove_cvref_t<T>(std::forward<T>(container));
    return ContainerOf<T>::take_value(std::move(copy));
}

// the failure payload is returned as stored, never converted
template <Failable T>
auto take_failure(T&& container) -> FailureOf<T> {
    auto copy = std::remove_cvref_t<T>(std::forward<T>(container));
    return ContainerOf<T>::take_failure(std::move(copy));
}

// collapses any two-state container into an optional, dropping failure payloads
template <TwoState T>
auto to_option(T&& container) -> std::optional<ValueOf<T>> {
    if(!is_present(container)) {
        return std::nullopt;
    }
    return take_value(std::forward<T>(container));
}
} // namespace loop_unwrap
