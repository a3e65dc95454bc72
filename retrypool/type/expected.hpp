/*
 * expected.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-04-05

Description: An implementation of expected for task results

**************************************************/

#ifndef RETRYPOOL_TYPE_EXPECTED_HPP
#define RETRYPOOL_TYPE_EXPECTED_HPP

#include <concepts>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace retrypool::type {

/**
 * @brief An `unexpected` class template similar to `std::unexpected`.
 *
 * Wraps an error value so it can be returned where an expected<T, E> is
 * required.
 *
 * @tparam E The type of the error
 */
template <typename E>
class unexpected {
public:
    template <typename U = E>
        requires std::constructible_from<E, U> &&
                 (!std::same_as<std::decay_t<U>, unexpected>)
    constexpr explicit unexpected(U&& error) noexcept(
        std::is_nothrow_constructible_v<E, U>)
        : error_(std::forward<U>(error)) {}

    [[nodiscard]] constexpr const E& error() const& noexcept { return error_; }
    [[nodiscard]] constexpr E&& error() && noexcept {
        return std::move(error_);
    }

    constexpr bool operator==(const unexpected& other) const {
        return error_ == other.error_;
    }

private:
    E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

/**
 * @brief A value that may be either a valid value or an error.
 *
 * Similar to std::expected (C++23). `T` must not be void; use
 * `std::monostate` for tasks that produce no value.
 *
 * @tparam T The type of the expected value
 * @tparam E The type of the error (defaults to std::string)
 */
template <typename T, typename E = std::string>
class expected {
    static_assert(!std::is_void_v<T>, "use std::monostate instead of void");

public:
    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    constexpr expected() noexcept(std::is_nothrow_default_constructible_v<T>)
        requires std::is_default_constructible_v<T>
        : value_(std::in_place_index<0>) {}

    template <typename U = T>
        requires std::constructible_from<T, U> &&
                 (!std::same_as<std::decay_t<U>, expected>) &&
                 (!std::same_as<std::decay_t<U>, unexpected<E>>) &&
                 (!std::same_as<std::decay_t<U>, std::in_place_t>)
    constexpr expected(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U>)
        : value_(std::in_place_index<0>, std::forward<U>(value)) {}

    template <typename... Args>
        requires std::constructible_from<T, Args...>
    constexpr explicit expected(std::in_place_t, Args&&... args)
        : value_(std::in_place_index<0>, std::forward<Args>(args)...) {}

    template <typename U>
        requires std::constructible_from<E, const U&>
    constexpr expected(const unexpected<U>& unex)
        : value_(std::in_place_index<1>, unex.error()) {}

    template <typename U>
        requires std::constructible_from<E, U>
    constexpr expected(unexpected<U>&& unex)
        : value_(std::in_place_index<1>, std::move(unex).error()) {}

    expected(const expected&) = default;
    expected(expected&&) = default;
    expected& operator=(const expected&) = default;
    expected& operator=(expected&&) = default;

    [[nodiscard]] constexpr bool has_value() const noexcept {
        return value_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @brief Gets the stored value.
     * @throws std::logic_error if the expected contains an error
     */
    [[nodiscard]] constexpr T& value() & {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr const T& value() const& {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr T&& value() && {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(std::move(value_));
    }

    /**
     * @brief Gets the stored error.
     * @throws std::logic_error if the expected contains a value
     */
    [[nodiscard]] constexpr const E& error() const& {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(value_);
    }

    [[nodiscard]] constexpr E&& error() && {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(std::move(value_));
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) const& {
        return has_value() ? std::get<0>(value_)
                           : static_cast<T>(std::forward<U>(default_value));
    }

    /**
     * @brief Applies `func` to the value, propagating the error untouched.
     */
    template <typename F>
        requires std::invocable<F, const T&>
    [[nodiscard]] auto map(F&& func) const&
        -> expected<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (has_value()) {
            return expected<U, E>(
                std::invoke(std::forward<F>(func), std::get<0>(value_)));
        }
        return expected<U, E>(unexpected<E>(std::get<1>(value_)));
    }

private:
    std::variant<T, E> value_;
};

template <typename T, typename E>
constexpr bool operator==(const expected<T, E>& lhs,
                          const expected<T, E>& rhs) {
    if (lhs.has_value() != rhs.has_value()) {
        return false;
    }
    return lhs.has_value() ? lhs.value() == rhs.value()
                           : lhs.error() == rhs.error();
}

/**
 * @brief Convenience constructor for the error branch.
 */
template <typename E>
constexpr auto make_unexpected(E&& error) -> unexpected<std::decay_t<E>> {
    return unexpected<std::decay_t<E>>(std::forward<E>(error));
}

}  // namespace retrypool::type

#endif  // RETRYPOOL_TYPE_EXPECTED_HPP
