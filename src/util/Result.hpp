#pragma once
// Result.hpp - Lightweight value-or-error return type
// Because exceptions across the event loop are a bad time

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace nd {

struct Error {
    std::string message;
};

template <typename T>
class [[nodiscard]] Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message)});
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<T>(data_);
    }
    const T& value() const& {
        return std::get<T>(data_);
    }
    T&& value() && {
        return std::get<T>(std::move(data_));
    }

    T valueOr(T fallback) const {
        return isOk() ? std::get<T>(data_) : std::move(fallback);
    }

    const Error& error() const {
        return std::get<Error>(data_);
    }

    T& operator*() & {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

private:
    explicit Result(T value) : data_(std::move(value)) {
    }
    explicit Result(Error error) : data_(std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    static Result ok() {
        return Result(std::nullopt);
    }
    static Result err(std::string message) {
        return Result(Error{std::move(message)});
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    const Error& error() const {
        return *error_;
    }

private:
    explicit Result(std::optional<Error> error) : error_(std::move(error)) {
    }

    std::optional<Error> error_;
};

} // namespace nd
