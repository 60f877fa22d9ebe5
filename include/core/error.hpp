#pragma once

#include "core/errors.h"

#include <optional>
#include <utility>

namespace tickback::core {

enum class ErrorCode {
    Ok = 0,
    Parse,
    Io,
    Range,
    Proto,
    NoMem,
    Invalid
};

inline ErrorCode to_error(TickbackStatus status) {
    switch (status) {
        case TICKBACK_OK: return ErrorCode::Ok;
        case TICKBACK_ERR_PARSE: return ErrorCode::Parse;
        case TICKBACK_ERR_IO: return ErrorCode::Io;
        case TICKBACK_ERR_RANGE: return ErrorCode::Range;
        case TICKBACK_ERR_PROTO: return ErrorCode::Proto;
        case TICKBACK_ERR_NOMEM: return ErrorCode::NoMem;
        case TICKBACK_ERR_INVALID: return ErrorCode::Invalid;
        default: return ErrorCode::Invalid;
    }
}

inline TickbackStatus to_status(ErrorCode error) {
    switch (error) {
        case ErrorCode::Ok: return TICKBACK_OK;
        case ErrorCode::Parse: return TICKBACK_ERR_PARSE;
        case ErrorCode::Io: return TICKBACK_ERR_IO;
        case ErrorCode::Range: return TICKBACK_ERR_RANGE;
        case ErrorCode::Proto: return TICKBACK_ERR_PROTO;
        case ErrorCode::NoMem: return TICKBACK_ERR_NOMEM;
        case ErrorCode::Invalid: return TICKBACK_ERR_INVALID;
        default: return TICKBACK_ERR_INVALID;
    }
}

inline const char* to_string(ErrorCode error) {
    switch (error) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::Parse: return "parse error";
        case ErrorCode::Io: return "i/o error";
        case ErrorCode::Range: return "out of range";
        case ErrorCode::Proto: return "malformed payload";
        case ErrorCode::NoMem: return "out of memory";
        case ErrorCode::Invalid: return "invalid argument";
        default: return "unknown error";
    }
}

template <typename T>
class Expected {
public:
    Expected(const T& value) : value_(value), error_(ErrorCode::Ok) {}
    Expected(T&& value) : value_(std::move(value)), error_(ErrorCode::Ok) {}
    Expected(ErrorCode error) : value_(std::nullopt), error_(error) {}

    [[nodiscard]] bool has_value() const { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    [[nodiscard]] ErrorCode error() const { return error_; }

private:
    std::optional<T> value_;
    ErrorCode error_;
};

} // namespace tickback::core
