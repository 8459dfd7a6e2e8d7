#pragma once

#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include <datapod/datapod.hpp>

namespace isotp {
    namespace util {

        // ─── Span-like view over raw frame bytes ─────────────────────────────────────
        // Receive paths take a DataSpan so that frames of any physical length
        // (including empty and over-length ones) can be inspected and rejected.
        class DataSpan {
            const u8 *data_ = nullptr;
            usize size_ = 0;

          public:
            constexpr DataSpan() = default;
            constexpr DataSpan(const u8 *data, usize size) : data_(data), size_(size) {}
            DataSpan(const dp::Vector<u8> &vec) : data_(vec.data()), size_(vec.size()) {}

            template <usize N> constexpr DataSpan(const dp::Array<u8, N> &arr) : data_(arr.data()), size_(N) {}

            constexpr const u8 *data() const noexcept { return data_; }
            constexpr usize size() const noexcept { return size_; }
            constexpr bool empty() const noexcept { return size_ == 0; }

            constexpr u8 operator[](usize idx) const noexcept {
                if (idx >= size_)
                    return 0xFF;
                return data_[idx];
            }

            constexpr DataSpan subspan(usize offset, usize count = static_cast<usize>(-1)) const noexcept {
                if (offset >= size_)
                    return {};
                usize actual = (count > size_ - offset) ? (size_ - offset) : count;
                return DataSpan(data_ + offset, actual);
            }

            // Truncate to at most `count` bytes (drops trailing fill bytes)
            constexpr DataSpan first(usize count) const noexcept { return subspan(0, count); }

            dp::Vector<u8> to_vector() const {
                dp::Vector<u8> out;
                out.assign(begin(), end());
                return out;
            }

            // ─── PCI field extraction ────────────────────────────────────────────────
            u8 get_u8(usize offset) const noexcept { return (*this)[offset]; }

            u8 high_nibble(usize offset) const noexcept { return bitfield::high_nibble((*this)[offset]); }

            u8 low_nibble(usize offset) const noexcept { return bitfield::low_nibble((*this)[offset]); }

            u16 get_u12_be(usize offset) const noexcept {
                if (offset + 1 >= size_)
                    return 0xFFFF;
                return bitfield::unpack_u12_be(data_ + offset);
            }

            // Iterator support
            constexpr const u8 *begin() const noexcept { return data_; }
            constexpr const u8 *end() const noexcept { return data_ + size_; }
        };

    } // namespace util
    using namespace util;
} // namespace isotp
