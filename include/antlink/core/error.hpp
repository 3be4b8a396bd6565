#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace antlink {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        TransportError,
        IntegrityError,
        InvalidArgument,
        InvalidState,
        NotRunning,
        Timeout,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error transport(dp::String msg = "") noexcept { return Error(ErrorCode::TransportError, std::move(msg)); }
        static Error integrity(dp::String msg = "") noexcept { return Error(ErrorCode::IntegrityError, std::move(msg)); }
        static Error invalid_argument(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidArgument, std::move(msg));
        }
        static Error bad_length(usize expected, usize actual) noexcept {
            return Error(ErrorCode::InvalidArgument, "data length should be " + dp::String(std::to_string(expected)) +
                                                         " not " + dp::String(std::to_string(actual)));
        }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error not_running() noexcept { return Error(ErrorCode::NotRunning, "session not running"); }
        static Error timeout(dp::String msg = "") noexcept { return Error(ErrorCode::Timeout, std::move(msg)); }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace antlink
