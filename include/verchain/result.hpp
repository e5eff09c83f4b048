#pragma once

#include <verchain/error.hpp>
#include <variant>
#include <functional>
#include <string>

namespace verchain {

template<typename T>
class Result {
    std::variant<T, VerchainError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from VerchainError so VERCHAIN_TRY can return errors across Result<T> types
    Result(VerchainError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(VerchainError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<VerchainError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    VerchainError& error() & { return std::get<VerchainError>(data_); }
    const VerchainError& error() const& { return std::get<VerchainError>(data_); }
    VerchainError&& error() && { return std::get<VerchainError>(std::move(data_)); }

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

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    // Attach the file the error originated from, leaving Ok untouched.
    Result& context(const std::string& file) {
        if (is_err() && error().file.empty()) error().file = file;
        return *this;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define VERCHAIN_TRY(expr) \
    do { \
        auto _verchain_result = (expr); \
        if (_verchain_result.is_err()) return std::move(_verchain_result).error(); \
    } while(0)

// Evaluate expr; on error return it, otherwise move the value into decl.
// Expands to several statements and declares a variable, so it cannot be
// wrapped in do/while: always use it inside a braced block, never as the
// body of an unbraced if/else/for.
#define VERCHAIN_TRY_ASSIGN(decl, expr) \
    auto VERCHAIN_CONCAT_(_verchain_r, __LINE__) = (expr); \
    if (VERCHAIN_CONCAT_(_verchain_r, __LINE__).is_err()) \
        return std::move(VERCHAIN_CONCAT_(_verchain_r, __LINE__)).error(); \
    decl = std::move(VERCHAIN_CONCAT_(_verchain_r, __LINE__)).value()

#define VERCHAIN_CONCAT_IMPL_(a, b) a##b
#define VERCHAIN_CONCAT_(a, b) VERCHAIN_CONCAT_IMPL_(a, b)

} // namespace verchain
