#pragma once

#include <phind/error.hpp>
#include <variant>
#include <utility>

namespace phind {

// Either a value of T or a PhindError. Core APIs return this instead of
// throwing; per-entry walk problems go to a Diagnostics sink instead.
template<typename T>
class Result {
    std::variant<T, PhindError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so a function can `return PhindError{...};` or PHIND_TRY
    // across different Result<T> types.
    Result(PhindError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PhindError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PhindError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PhindError& error() & { return std::get<PhindError>(data_); }
    const PhindError& error() const& { return std::get<PhindError>(data_); }
    PhindError&& error() && { return std::get<PhindError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    bool has_code(PhindError::Code c) const {
        return is_err() && error().code == c;
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define PHIND_TRY(expr) \
    do { \
        auto _phind_result = (expr); \
        if (_phind_result.is_err()) return std::move(_phind_result).error(); \
    } while(0)

} // namespace phind
