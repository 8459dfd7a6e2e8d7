#pragma once

#include "constants.hpp"
#include "types.hpp"

namespace isotp {

    // ─── STmin encoding (ISO 15765-2 §9.6.5.4) ──────────────────────────────────
    //   0x00-0x7F  0-127 ms
    //   0xF1-0xF9  100-900 us
    //   others     reserved
    constexpr bool is_valid_separation_time(u8 st) noexcept {
        return st <= STMIN_MS_MAX || (st >= STMIN_US_FIRST && st <= STMIN_US_LAST);
    }

    // Reserved values decode as the longest legal delay (127 ms), as a receiver of
    // a reserved STmin must assume.
    constexpr u32 separation_time_us(u8 st) noexcept {
        if (st <= STMIN_MS_MAX)
            return static_cast<u32>(st) * 1000;
        if (st >= STMIN_US_FIRST && st <= STMIN_US_LAST)
            return static_cast<u32>(st - 0xF0) * 100;
        return static_cast<u32>(STMIN_MS_MAX) * 1000;
    }

    constexpr u8 normalize_separation_time(u8 st) noexcept { return is_valid_separation_time(st) ? st : STMIN_MS_MAX; }

} // namespace isotp
