#pragma once

#include <concepts>
#include <string>
#include <utility>
#include <variant>

namespace tiffentry {

/// Error type for entry decoding and reader operations
struct Error {
    enum class Code {
        FileNotFound,
        ReadError,
        InvalidHeader,
        OutOfBounds,
        UnexpectedEndOfFile
    };

    Code code;
    std::string message;

    constexpr Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}
};

/// Result type for operations that may fail without exceptions
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::forward<T>(value)) {}

    constexpr Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(value) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] constexpr T& value() & noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr const T& value() const& noexcept {
        return std::get<T>(data_);
    }

    [[nodiscard]] constexpr T&& value() && noexcept {
        return std::get<T>(std::move(data_));
    }

    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

// Specialization for void
template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    constexpr Result() noexcept : data_(std::monostate{}) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::forward<Error>(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] constexpr bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] constexpr const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

template <typename T>
[[nodiscard]] constexpr Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

} // namespace tiffentry
