#pragma once

#include "peekio/common/expected.hpp"

#include <string_view>

#include <cassert>
#include <cstring>

#include "uv.h"

namespace peekio {

/// Error value carried by every `Result`.
///
/// Codes >= 8000 belong to peekio, non-negative codes below that are errno
/// values, negative codes are libuv status codes passed through verbatim from
/// the byte source.
class Error {
public:
    enum ErrorCode {
        EndOfStream = 8000,
        UnexpectedEOF,
        AbruptClosure,
        ConcurrentAccessViolation,
        InvalidArgument,
        Unclassified,
    };

public:
    explicit Error(int error_code)
        : error_code_{error_code} {}

public:
    [[nodiscard]]
    auto value() const noexcept -> int {
        return error_code_;
    }

    [[nodiscard]]
    auto message() const noexcept -> std::string_view {
        switch (error_code_) {
        case EndOfStream:
            return "End-Of-Stream";
        case UnexpectedEOF:
            return "Read EOF too early";
        case AbruptClosure:
            return "Stream closed";
        case ConcurrentAccessViolation:
            return "Concurrent read operation";
        case InvalidArgument:
            return "Read region exceeds buffer";
        case Unclassified:
            return "Unclassified error";
        default:
            if (error_code_ < 0) {
                return uv_strerror(error_code_);
            }
            return strerror(error_code_);
        }
    }

    auto operator==(const Error &other) const noexcept -> bool = default;

private:
    int error_code_;
};

[[nodiscard]]
static inline auto make_peekio_error(int error_code) -> Error {
    assert(error_code >= 8000);
    return Error{error_code};
}

[[nodiscard]]
static inline auto make_sys_error(int error_code) -> Error {
    assert(error_code >= 0);
    return Error{error_code};
}

[[nodiscard]]
static inline auto make_uv_error(int status) -> Error {
    assert(status < 0);
    return Error{status};
}

template <typename T>
using Result = expected<T, Error>;

} // namespace peekio
