#pragma once

#include "../core/types.hpp"
#include <type_traits>

namespace isotp {
    namespace util {

        // ─── Bit-level access helpers ────────────────────────────────────────────────
        namespace bitfield {

            // Constrain to unsigned integer types to avoid UB with signed shifts
            template <typename T>
            concept UnsignedInt = std::is_unsigned_v<T>;

            template <UnsignedInt T> constexpr T get_bits(T value, u8 start_bit, u8 length) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0 || start_bit >= bit_width) {
                    return 0;
                }
                if (length >= bit_width) {
                    return value >> start_bit;
                }
                T mask = (static_cast<T>(1) << length) - 1;
                return (value >> start_bit) & mask;
            }

            template <UnsignedInt T> constexpr T set_bits(T value, u8 start_bit, u8 length, T field_value) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0 || start_bit >= bit_width) {
                    return value;
                }
                if (length >= bit_width) {
                    return field_value;
                }
                T mask = (static_cast<T>(1) << length) - 1;
                value &= ~(mask << start_bit);
                value |= (field_value & mask) << start_bit;
                return value;
            }

            constexpr u8 high_nibble(u8 value) noexcept { return get_bits<u8>(value, 4, 4); }
            constexpr u8 low_nibble(u8 value) noexcept { return get_bits<u8>(value, 0, 4); }

            constexpr u8 make_byte(u8 high, u8 low) noexcept {
                return set_bits<u8>(set_bits<u8>(0, 4, 4, high), 0, 4, low);
            }

            // 12-bit big-endian field spread over the low nibble of data[0] and all of data[1]
            inline u16 unpack_u12_be(const u8 *data) noexcept {
                return static_cast<u16>((static_cast<u16>(low_nibble(data[0])) << 8) | data[1]);
            }

            // Writes the length bits only; the high nibble of data[0] is preserved
            inline void pack_u12_be(u8 *data, u16 value) noexcept {
                data[0] = set_bits<u8>(data[0], 0, 4, static_cast<u8>((value >> 8) & 0x0F));
                data[1] = static_cast<u8>(value & 0xFF);
            }

        } // namespace bitfield
    } // namespace util
    using namespace util;
} // namespace isotp
