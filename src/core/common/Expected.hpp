#pragma once

#include <type_traits>
#include <utility>
#include <stdexcept>
#include <new>

namespace RepoGuard {

template<typename E>
class Unexpected;

// Value-or-error result, shaped after std::expected (C++23)
template<typename T, typename E>
class Expected {
public:
    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() noexcept(std::is_nothrow_default_constructible_v<T>)
        : hasValue_(true) {
        new (&value_) T();
    }

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !std::is_same_v<std::decay_t<U>, Unexpected<E>> &&
        std::is_constructible_v<T, U>>>
    Expected(U&& value) noexcept(std::is_nothrow_constructible_v<T, U>)
        : hasValue_(true) {
        new (&value_) T(std::forward<U>(value));
    }

    // Error constructor, only when the argument cannot also build a T
    template<typename G, typename = std::enable_if_t<
        std::is_constructible_v<E, const G&> &&
        !std::is_constructible_v<T, const G&> &&
        !std::is_same_v<std::decay_t<G>, Expected> &&
        !std::is_same_v<std::decay_t<G>, Unexpected<E>>>>
    Expected(const G& error) noexcept(std::is_nothrow_constructible_v<E, const G&>)
        : hasValue_(false) {
        new (&error_) E(error);
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected)
        : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected)
        : hasValue_(false) {
        new (&error_) E(std::move(unexpected.error()));
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(other.value_);
        } else {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (hasValue_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        destroy();
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            destroy();
            new (this) Expected(other);
        }
        return *this;
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            destroy();
            new (this) Expected(std::move(other));
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }

    explicit operator bool() const noexcept { return hasValue_; }

    const T& value() const& {
        if (!hasValue_) {
            throw std::logic_error("Expected holds an error, not a value");
        }
        return value_;
    }

    T& value() & {
        if (!hasValue_) {
            throw std::logic_error("Expected holds an error, not a value");
        }
        return value_;
    }

    T&& value() && {
        if (!hasValue_) {
            throw std::logic_error("Expected holds an error, not a value");
        }
        return std::move(value_);
    }

    const E& error() const& {
        if (hasValue_) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return error_;
    }

    E& error() & {
        if (hasValue_) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return error_;
    }

    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (hasValue_) {
            return std::forward<F>(f)(value_);
        }
        return error_;
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        using Result = Expected<std::invoke_result_t<F, const T&>, E>;
        if (hasValue_) {
            return Result(std::forward<F>(f)(value_));
        }
        return Result(Unexpected<E>(error_));
    }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue_ ? value_ : static_cast<T>(std::forward<U>(fallback));
    }

private:
    void destroy() {
        if (hasValue_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool hasValue_;
    union {
        T value_;
        E error_;
    };
};

template<typename E>
class Unexpected {
public:
    explicit Unexpected(const E& error) : error_(error) {}
    explicit Unexpected(E&& error) : error_(std::move(error)) {}

    const E& error() const& { return error_; }
    E& error() & { return error_; }
    E&& error() && { return std::move(error_); }

private:
    E error_;
};

// Success carries no value
template<typename E>
class Expected<void, E> {
public:
    Expected() noexcept : hasValue_(true) {}

    Expected(const E& error) : hasValue_(false) {
        new (&error_) E(error);
    }

    Expected(E&& error) : hasValue_(false) {
        new (&error_) E(std::move(error));
    }

    template<typename G>
    Expected(const Unexpected<G>& unexpected) : hasValue_(false) {
        new (&error_) E(unexpected.error());
    }

    Expected(const Expected& other) : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(other.error_);
        }
    }

    Expected(Expected&& other) noexcept : hasValue_(other.hasValue_) {
        if (!hasValue_) {
            new (&error_) E(std::move(other.error_));
        }
    }

    ~Expected() {
        if (!hasValue_) {
            error_.~E();
        }
    }

    Expected& operator=(const Expected& other) {
        if (this != &other) {
            this->~Expected();
            new (this) Expected(other);
        }
        return *this;
    }

    bool hasValue() const noexcept { return hasValue_; }
    bool hasError() const noexcept { return !hasValue_; }

    explicit operator bool() const noexcept { return hasValue_; }

    const E& error() const& {
        if (hasValue_) {
            throw std::logic_error("Expected holds a value, not an error");
        }
        return error_;
    }

private:
    bool hasValue_;
    union {
        E error_;
    };
};

} // namespace RepoGuard
