#pragma once

#include <datapod/datapod.hpp>

namespace isotp {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Byte type alias ─────────────────────────────────────────────────────────
    using dp::byte;

    // ─── Bus frame mode ──────────────────────────────────────────────────────────
    // Classic: 8-byte frames, 1-byte single-frame PCI
    // Extended: 64-byte frames, 2-byte single-frame PCI
    enum class FrameMode : u8 { Classic = 0, Extended = 1 };

    // ─── PCI frame type (high nibble of first PCI byte) ─────────────────────────
    enum class FrameType : u8 { Single = 0, First = 1, Consecutive = 2, FlowControl = 3 };

    // ─── Flow control status (low nibble of flow-control PCI byte) ──────────────
    enum class FlowStatus : u8 { ContinueToSend = 0, Wait = 1, Overflow = 2 };

    inline const char *frame_mode_name(FrameMode mode) noexcept {
        return mode == FrameMode::Extended ? "extended" : "classic";
    }

    inline const char *frame_type_name(FrameType type) noexcept {
        switch (type) {
        case FrameType::Single:
            return "single";
        case FrameType::First:
            return "first";
        case FrameType::Consecutive:
            return "consecutive";
        case FrameType::FlowControl:
            return "flow_control";
        }
        return "unknown";
    }

    inline const char *flow_status_name(FlowStatus status) noexcept {
        switch (status) {
        case FlowStatus::ContinueToSend:
            return "CTS";
        case FlowStatus::Wait:
            return "WAIT";
        case FlowStatus::Overflow:
            return "OVERFLOW";
        }
        return "UNKNOWN";
    }

} // namespace isotp
