#pragma once

#include <ulidgen/error.hpp>
#include <optional>
#include <utility>
#include <variant>

namespace ulidgen {

template<typename T>
class Result {
    std::variant<T, UlidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from UlidError so ULIDGEN_TRY can return errors across Result<T> types
    Result(UlidError err) : data_(std::move(err)) {}
    // Implicit from a bare code: the codec reports most failures without extra context
    Result(UlidError::Code code) : data_(UlidError(code)) {}

    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(UlidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<UlidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    UlidError& error() & { return std::get<UlidError>(data_); }
    const UlidError& error() const& { return std::get<UlidError>(data_); }
    UlidError&& error() && { return std::get<UlidError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // Drops the error, keeping only presence
    std::optional<T> ok_value() const& {
        if (is_ok()) return value();
        return std::nullopt;
    }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const& -> decltype(f(std::declval<const T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<const T&>()));
        return RetType::err(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define ULIDGEN_TRY(expr) \
    do { \
        auto _ulidgen_result = (expr); \
        if (_ulidgen_result.is_err()) return std::move(_ulidgen_result).error(); \
    } while(0)

} // namespace ulidgen
