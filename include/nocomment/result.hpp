#pragma once

#include <nocomment/error.hpp>
#include <variant>
#include <utility>

namespace nocomment {

template<typename T>
class Result {
    std::variant<T, NocommentError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from NocommentError so NOCOMMENT_TRY can return errors across Result<T> types
    Result(NocommentError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(NocommentError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<NocommentError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    NocommentError& error() & { return std::get<NocommentError>(data_); }
    const NocommentError& error() const& { return std::get<NocommentError>(data_); }
    NocommentError&& error() && { return std::get<NocommentError>(std::move(data_)); }

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

#define NOCOMMENT_TRY(expr) \
    do { \
        auto _nocomment_result = (expr); \
        if (_nocomment_result.is_err()) return std::move(_nocomment_result).error(); \
    } while(0)

} // namespace nocomment
