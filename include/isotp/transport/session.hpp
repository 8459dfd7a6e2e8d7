#pragma once

#include "../core/constants.hpp"
#include "../core/separation_time.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace isotp {
    namespace transport {

        // ─── Receiver phase ──────────────────────────────────────────────────────────
        enum class ReceiverPhase : u8 { Idle, Receiving };

        inline const char *receiver_phase_name(ReceiverPhase phase) noexcept {
            return phase == ReceiverPhase::Receiving ? "receiving" : "idle";
        }

        inline constexpr u8 next_sequence_number(u8 sequence) noexcept {
            return static_cast<u8>((sequence + 1) % SEQUENCE_MODULUS);
        }

        // ─── Outbound segmentation state ─────────────────────────────────────────────
        struct SenderState {
            dp::Optional<dp::Vector<u8>> pending; // nullopt when idle
            u32 bytes_sent = 0;
            u8 next_sequence = 0;

            // Learned from the last flow control frame received from the peer
            FlowStatus peer_status = FlowStatus::ContinueToSend;
            u8 peer_block_size = 0;
            u8 peer_separation_time = 0;

            bool is_active() const noexcept { return pending.has_value(); }

            u32 total_bytes() const noexcept { return pending.has_value() ? static_cast<u32>(pending->size()) : 0; }

            u32 bytes_remaining() const noexcept { return total_bytes() - bytes_sent; }

            f32 progress() const noexcept {
                if (total_bytes() == 0)
                    return 0.0f;
                return static_cast<f32>(bytes_sent) / static_cast<f32>(total_bytes());
            }

            u32 peer_separation_time_us() const noexcept { return separation_time_us(peer_separation_time); }

            // Clears the transfer; negotiated peer parameters survive
            void reset() noexcept {
                pending = dp::nullopt;
                bytes_sent = 0;
                next_sequence = 0;
            }
        };

        // ─── Inbound reassembly state ────────────────────────────────────────────────
        struct ReceiverState {
            u8 expected_sequence = 0;
            u16 total_length = 0;
            dp::Vector<u8> accumulated;
            // Unwrapped count of consecutive frames since the first frame
            u32 consecutive_received = 0;

            u32 bytes_remaining() const noexcept {
                return accumulated.size() >= total_length ? 0 : total_length - static_cast<u32>(accumulated.size());
            }

            bool is_complete() const noexcept { return total_length > 0 && accumulated.size() >= total_length; }

            f32 progress() const noexcept {
                if (total_length == 0)
                    return 0.0f;
                return static_cast<f32>(accumulated.size()) / static_cast<f32>(total_length);
            }

            void reset() noexcept {
                expected_sequence = 0;
                total_length = 0;
                accumulated.clear();
                consecutive_received = 0;
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace isotp
