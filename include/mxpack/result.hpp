#pragma once

#include <mxpack/error.hpp>
#include <variant>

namespace mxpack {

template<typename T>
class Result {
    std::variant<T, PackError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PackError so MXPACK_TRY can return errors across Result<T> types
    Result(PackError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PackError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PackError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PackError& error() & { return std::get<PackError>(data_); }
    const PackError& error() const& { return std::get<PackError>(data_); }
    PackError&& error() && { return std::get<PackError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Replace the error code while keeping the message, e.g. to lift an IO
    // failure into the taxonomy code of the stage it happened in.
    Result with_code(PackError::Code code) && {
        if (is_err()) {
            std::get<PackError>(data_).code = code;
        }
        return std::move(*this);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define MXPACK_TRY(expr) \
    do { \
        auto _mxpack_result = (expr); \
        if (_mxpack_result.is_err()) return std::move(_mxpack_result).error(); \
    } while(0)

} // namespace mxpack
