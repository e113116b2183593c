#pragma once

#include <wharf/error.hpp>
#include <variant>
#include <utility>

namespace wharf {

template<typename T>
class Result {
    std::variant<T, WharfError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from WharfError so WHARF_TRY can return errors across Result<T> types
    Result(WharfError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(WharfError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<WharfError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    WharfError& error() & { return std::get<WharfError>(data_); }
    const WharfError& error() const& { return std::get<WharfError>(data_); }
    WharfError&& error() && { return std::get<WharfError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define WHARF_TRY(expr) \
    do { \
        auto _wharf_result = (expr); \
        if (_wharf_result.is_err()) return std::move(_wharf_result).error(); \
    } while(0)

} // namespace wharf
