#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace WhisperKit {

template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& { return error_; }
    constexpr E& error() & { return error_; }
    constexpr E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

template<typename T>
struct IsUnexpected : std::false_type {};

template<typename E>
struct IsUnexpected<Unexpected<E>> : std::true_type {};

// Value-or-error result in the shape of std::expected (C++23).
// Errors are only ever constructed through Unexpected, so T and E may be the same type.
template<typename T, typename E>
class Expected {
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>,
                  "Expected does not hold references");

    static constexpr std::size_t ValueIndex = 0;
    static constexpr std::size_t ErrorIndex = 1;

public:
    using value_type = T;
    using error_type = E;

    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    constexpr Expected() : storage_(std::in_place_index<ValueIndex>) {}

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !IsUnexpected<std::decay_t<U>>::value &&
        std::is_constructible_v<T, U&&>>>
    constexpr Expected(U&& value)
        : storage_(std::in_place_index<ValueIndex>, std::forward<U>(value)) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    constexpr Expected(const Unexpected<G>& unexpected)
        : storage_(std::in_place_index<ErrorIndex>, unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    constexpr Expected(Unexpected<G>&& unexpected)
        : storage_(std::in_place_index<ErrorIndex>, std::move(unexpected).error()) {}

    constexpr bool hasValue() const noexcept { return storage_.index() == ValueIndex; }
    constexpr bool hasError() const noexcept { return storage_.index() == ErrorIndex; }
    constexpr explicit operator bool() const noexcept { return hasValue(); }

    constexpr const T& value() const& {
        requireValue();
        return std::get<ValueIndex>(storage_);
    }

    constexpr T& value() & {
        requireValue();
        return std::get<ValueIndex>(storage_);
    }

    constexpr T&& value() && {
        requireValue();
        return std::get<ValueIndex>(std::move(storage_));
    }

    constexpr const E& error() const& {
        requireError();
        return std::get<ErrorIndex>(storage_);
    }

    constexpr E& error() & {
        requireError();
        return std::get<ErrorIndex>(storage_);
    }

    constexpr E&& error() && {
        requireError();
        return std::get<ErrorIndex>(std::move(storage_));
    }

    template<typename U>
    constexpr T valueOr(U&& fallback) const& {
        return hasValue() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename U>
    constexpr T valueOr(U&& fallback) && {
        return hasValue() ? std::move(*this).value() : static_cast<T>(std::forward<U>(fallback));
    }

    // f(const T&) -> R, wrapped into Expected<R, E>
    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        if (hasValue()) {
            return std::forward<F>(f)(value());
        }
        return makeUnexpected(error());
    }

    // f(const T&) -> Expected<R, E>
    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (hasValue()) {
            return std::forward<F>(f)(value());
        }
        return makeUnexpected(error());
    }

private:
    constexpr void requireValue() const {
        if (!hasValue()) {
            throw std::logic_error("Expected holds an error, not a value");
        }
    }

    constexpr void requireError() const {
        if (!hasError()) {
            throw std::logic_error("Expected holds a value, not an error");
        }
    }

    std::variant<T, E> storage_;
};

template<typename E>
class Expected<void, E> {
public:
    using value_type = void;
    using error_type = E;

    constexpr Expected() noexcept = default;

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    constexpr Expected(const Unexpected<G>& unexpected) : error_(unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    constexpr Expected(Unexpected<G>&& unexpected) : error_(std::move(unexpected).error()) {}

    constexpr bool hasValue() const noexcept { return !error_.has_value(); }
    constexpr bool hasError() const noexcept { return error_.has_value(); }
    constexpr explicit operator bool() const noexcept { return hasValue(); }

    constexpr void value() const {
        if (hasError()) {
            throw std::logic_error("Expected holds an error, not a value");
        }
    }

    constexpr const E& error() const& {
        if (!hasError()) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return *error_;
    }

    constexpr E& error() & {
        if (!hasError()) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return *error_;
    }

private:
    std::optional<E> error_;
};

} // namespace WhisperKit
