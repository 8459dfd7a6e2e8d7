#pragma once

#include "../core/types.hpp"
#include "data_span.hpp"
#include <datapod/datapod.hpp>

namespace isotp {
    namespace util {

        // ─── Uppercase hex rendering for frame dumps ────────────────────────────────
        inline dp::String to_hex(DataSpan bytes, char separator = '\0') {
            static constexpr char DIGITS[] = "0123456789ABCDEF";
            dp::String out;
            for (usize i = 0; i < bytes.size(); ++i) {
                if (separator && i > 0)
                    out += separator;
                out += DIGITS[(bytes[i] >> 4) & 0x0F];
                out += DIGITS[bytes[i] & 0x0F];
            }
            return out;
        }

    } // namespace util
    using namespace util;
} // namespace isotp
