#pragma once

#include <locus/error.hpp>
#include <variant>

namespace locus {

template<typename T>
class Result {
    std::variant<T, LocusError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from LocusError so LOCUS_TRY can return errors across Result<T> types
    Result(LocusError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(LocusError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<LocusError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    LocusError& error() & { return std::get<LocusError>(data_); }
    const LocusError& error() const& { return std::get<LocusError>(data_); }
    LocusError&& error() && { return std::get<LocusError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define LOCUS_TRY(expr) \
    do { \
        auto _locus_result = (expr); \
        if (_locus_result.is_err()) return std::move(_locus_result).error(); \
    } while(0)

} // namespace locus
