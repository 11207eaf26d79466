#pragma once

#include <tnid/error.hpp>
#include <variant>
#include <functional>

namespace tnid {

template<typename T>
class Result {
    std::variant<T, TnidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TnidError so TNID_TRY can return errors across Result<T> types
    Result(TnidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TnidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TnidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TnidError& error() & { return std::get<TnidError>(data_); }
    const TnidError& error() const& { return std::get<TnidError>(data_); }
    TnidError&& error() && { return std::get<TnidError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
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

    // Rewrites the error (e.g. to reclassify a lower-level failure).
    template<typename F>
    Result map_err(F&& f) && {
        if (is_ok()) {
            return std::move(*this);
        }
        return Result(f(std::move(*this).error()));
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define TNID_TRY(expr) \
    do { \
        auto _tnid_result = (expr); \
        if (_tnid_result.is_err()) return std::move(_tnid_result).error(); \
    } while(0)

#define TNID_CONCAT_INNER(a, b) a##b
#define TNID_CONCAT(a, b) TNID_CONCAT_INNER(a, b)

// TNID_TRY_ASSIGN(auto name, Name::parse(s));
#define TNID_TRY_ASSIGN(lhs, expr) \
    TNID_TRY_ASSIGN_IMPL(TNID_CONCAT(_tnid_assign_, __LINE__), lhs, expr)

#define TNID_TRY_ASSIGN_IMPL(tmp, lhs, expr) \
    auto tmp = (expr); \
    if (tmp.is_err()) return std::move(tmp).error(); \
    lhs = std::move(tmp).value()

} // namespace tnid
