#pragma once

#include "../util/data_span.hpp"
#include "constants.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace isotp {

    // ─── Extended-bus DLC helpers ────────────────────────────────────────────────
    // Smallest DLC whose byte count holds `length`; nullopt above 64 bytes
    inline dp::Optional<u8> dlc_for_length(usize length) noexcept {
        for (u8 dlc = 0; dlc < CANFD_DLC_LENGTHS.size(); ++dlc) {
            if (CANFD_DLC_LENGTHS[dlc] >= length)
                return dlc;
        }
        return dp::nullopt;
    }

    inline u8 length_for_dlc(u8 dlc) noexcept { return CANFD_DLC_LENGTHS[dlc & 0x0F]; }

    // ─── Bus frame payload (up to 64 bytes, PCI included) ───────────────────────
    // Only the first `length` bytes are meaningful; bytes beyond are zero.
    struct Frame {
        dp::Array<u8, MAX_FRAME_CAPACITY> data = {};
        u8 length = 0;

        constexpr Frame() = default;

        static Frame from_bytes(const u8 *bytes, usize len) noexcept {
            Frame f;
            f.length = static_cast<u8>(len > MAX_FRAME_CAPACITY ? MAX_FRAME_CAPACITY : len);
            for (u8 i = 0; i < f.length; ++i) {
                f.data[i] = bytes[i];
            }
            return f;
        }

        static Frame from_bytes(const dp::Vector<u8> &bytes) noexcept {
            return from_bytes(bytes.data(), bytes.size());
        }

        // Appends one byte; returns false once the frame is full
        bool push(u8 value) noexcept {
            if (length >= MAX_FRAME_CAPACITY)
                return false;
            data[length++] = value;
            return true;
        }

        void fill_to(u8 target_length, u8 fill) noexcept {
            while (length < target_length && push(fill)) {
            }
        }

        DataSpan view() const noexcept { return DataSpan(data.data(), length); }

        dp::Vector<u8> bytes() const { return view().to_vector(); }

        u8 operator[](usize idx) const noexcept { return view()[idx]; }

        bool empty() const noexcept { return length == 0; }

        // DLC the frame would be sent with on an extended bus
        u8 dlc() const noexcept {
            auto code = dlc_for_length(length);
            return code.has_value() ? *code : 15;
        }

        FrameType type() const noexcept { return static_cast<FrameType>(bitfield::high_nibble(data[0])); }
    };

    inline bool operator==(const Frame &a, const Frame &b) noexcept {
        if (a.length != b.length)
            return false;
        for (u8 i = 0; i < a.length; ++i) {
            if (a.data[i] != b.data[i])
                return false;
        }
        return true;
    }

} // namespace isotp
