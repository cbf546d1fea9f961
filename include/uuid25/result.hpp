#pragma once

#include <uuid25/error.hpp>
#include <variant>
#include <functional>

namespace uuid25 {

template<typename T>
class Result {
    std::variant<T, Uuid25Error> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from Uuid25Error so UUID25_TRY can return errors across Result<T> types
    Result(Uuid25Error err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(Uuid25Error e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<Uuid25Error>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    Uuid25Error& error() & { return std::get<Uuid25Error>(data_); }
    const Uuid25Error& error() const& { return std::get<Uuid25Error>(data_); }
    Uuid25Error&& error() && { return std::get<Uuid25Error>(std::move(data_)); }

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

#define UUID25_TRY(expr) \
    do { \
        auto _uuid25_result = (expr); \
        if (_uuid25_result.is_err()) return std::move(_uuid25_result).error(); \
    } while(0)

} // namespace uuid25
