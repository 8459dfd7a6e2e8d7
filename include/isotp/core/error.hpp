#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace isotp {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        FrameLength,     // empty, over-length, or truncated below declared header+length
        Sequence,        // consecutive frame sequence number mismatch
        FlowControl,     // peer reported OVERFLOW
        Protocol,        // any other structural violation
        InvalidArgument, // call-time or construction-time value validation
        InvalidState,    // operation not allowed in the current session state
    };

    inline const char *error_code_name(ErrorCode code) noexcept {
        switch (code) {
        case ErrorCode::Ok:
            return "Ok";
        case ErrorCode::FrameLength:
            return "FrameLengthError";
        case ErrorCode::Sequence:
            return "SequenceError";
        case ErrorCode::FlowControl:
            return "FlowControlError";
        case ErrorCode::Protocol:
            return "ProtocolError";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::InvalidState:
            return "InvalidState";
        }
        return "Unknown";
    }

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error frame_length(dp::String msg = "") noexcept {
            return Error(ErrorCode::FrameLength, std::move(msg));
        }
        static Error sequence(u8 expected, u8 actual) noexcept {
            return Error(ErrorCode::Sequence, "sequence number error: expected " +
                                                  dp::String(std::to_string(expected)) + ", actual " +
                                                  dp::String(std::to_string(actual)));
        }
        static Error flow_control(dp::String msg = "") noexcept {
            return Error(ErrorCode::FlowControl, std::move(msg));
        }
        static Error protocol(dp::String msg = "") noexcept { return Error(ErrorCode::Protocol, std::move(msg)); }
        static Error invalid_argument(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidArgument, std::move(msg));
        }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace isotp
