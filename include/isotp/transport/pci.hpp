#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include "../util/data_span.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <variant>

namespace isotp {
    namespace transport {

        // ─── PCI variants (ISO 15765-2 Table 9) ─────────────────────────────────────
        // SF: [0L] or [00 LL]     FF: [1L LL]     CF: [2N]     FC: [3S BS ST]
        struct SingleFramePci {
            static constexpr FrameType TYPE = FrameType::Single;
            u16 length = 0;
        };

        struct FirstFramePci {
            static constexpr FrameType TYPE = FrameType::First;
            u16 total_length = 0;
        };

        struct ConsecutiveFramePci {
            static constexpr FrameType TYPE = FrameType::Consecutive;
            u8 sequence = 0;
        };

        struct FlowControlPci {
            static constexpr FrameType TYPE = FrameType::FlowControl;
            FlowStatus status = FlowStatus::ContinueToSend;
            u8 block_size = 0;
            u8 separation_time = 0;
        };

        // Alternative order matches the FrameType nibble
        using Pci = std::variant<SingleFramePci, FirstFramePci, ConsecutiveFramePci, FlowControlPci>;

        inline FrameType pci_type(const Pci &pci) noexcept { return static_cast<FrameType>(pci.index()); }

        // ─── Header size of each variant ────────────────────────────────────────────
        inline u8 header_size(const SingleFramePci &, FrameMode mode) noexcept { return single_frame_pci_size(mode); }
        inline u8 header_size(const FirstFramePci &, FrameMode) noexcept { return FF_PCI_SIZE; }
        inline u8 header_size(const ConsecutiveFramePci &, FrameMode) noexcept { return CF_PCI_SIZE; }
        inline u8 header_size(const FlowControlPci &, FrameMode) noexcept { return FC_PCI_SIZE; }

        inline u8 header_size(const Pci &pci, FrameMode mode) noexcept {
            return std::visit([mode](const auto &p) { return header_size(p, mode); }, pci);
        }

        // ─── Encoding ───────────────────────────────────────────────────────────────
        inline void write_pci(Frame &frame, const SingleFramePci &pci, FrameMode mode) noexcept {
            if (mode == FrameMode::Extended) {
                frame.push(bitfield::make_byte(0, 0));
                frame.push(0);
                bitfield::pack_u12_be(frame.data.data(), pci.length);
            } else {
                frame.push(bitfield::make_byte(static_cast<u8>(FrameType::Single), static_cast<u8>(pci.length)));
            }
        }

        inline void write_pci(Frame &frame, const FirstFramePci &pci, FrameMode) noexcept {
            frame.push(bitfield::make_byte(static_cast<u8>(FrameType::First), 0));
            frame.push(0);
            bitfield::pack_u12_be(frame.data.data(), pci.total_length);
        }

        inline void write_pci(Frame &frame, const ConsecutiveFramePci &pci, FrameMode) noexcept {
            frame.push(bitfield::make_byte(static_cast<u8>(FrameType::Consecutive), pci.sequence));
        }

        inline void write_pci(Frame &frame, const FlowControlPci &pci, FrameMode) noexcept {
            frame.push(bitfield::make_byte(static_cast<u8>(FrameType::FlowControl), static_cast<u8>(pci.status)));
            frame.push(pci.block_size);
            frame.push(pci.separation_time);
        }

        // Fresh frame holding only the PCI bytes
        inline Frame encode_pci(const Pci &pci, FrameMode mode) noexcept {
            Frame frame;
            std::visit([&](const auto &p) { write_pci(frame, p, mode); }, pci);
            return frame;
        }

        // ─── Decoding ───────────────────────────────────────────────────────────────
        // Validates the physical length against the bus capacity and the PCI's own
        // declared header+length before anything else looks at the frame.
        inline Result<Pci> decode_pci(DataSpan frame, FrameMode mode) {
            const u8 capacity = frame_capacity(mode);
            if (frame.empty()) {
                return Result<Pci>::err(Error::frame_length("received empty frame"));
            }
            if (frame.size() > capacity) {
                return Result<Pci>::err(Error::frame_length("frame length exceeds limit: " +
                                                            dp::String(std::to_string(frame.size())) + " > " +
                                                            dp::String(std::to_string(capacity))));
            }

            const u8 nibble = frame.high_nibble(0);
            switch (nibble) {
            case static_cast<u8>(FrameType::Single): {
                SingleFramePci pci;
                const u8 start = single_frame_pci_size(mode);
                if (mode == FrameMode::Extended) {
                    if (frame.size() < start) {
                        return Result<Pci>::err(Error::frame_length("extended single frame shorter than 2 bytes"));
                    }
                    pci.length = frame.get_u12_be(0);
                } else {
                    pci.length = frame.low_nibble(0);
                }
                if (pci.length == 0) {
                    return Result<Pci>::err(Error::protocol("single frame declares zero length"));
                }
                if (frame.size() < static_cast<usize>(start) + pci.length) {
                    return Result<Pci>::err(Error::frame_length(
                        "single frame data length insufficient: expected at least " +
                        dp::String(std::to_string(start + pci.length)) + " bytes, actual " +
                        dp::String(std::to_string(frame.size()))));
                }
                return Result<Pci>::ok(Pci{pci});
            }
            case static_cast<u8>(FrameType::First): {
                if (frame.size() < 3) {
                    return Result<Pci>::err(Error::frame_length("first frame shorter than 3 bytes"));
                }
                FirstFramePci pci;
                pci.total_length = frame.get_u12_be(0);
                if (pci.total_length <= single_frame_max_data(mode)) {
                    return Result<Pci>::err(
                        Error::protocol("first frame declares " + dp::String(std::to_string(pci.total_length)) +
                                        " bytes, which fits a single frame"));
                }
                return Result<Pci>::ok(Pci{pci});
            }
            case static_cast<u8>(FrameType::Consecutive): {
                ConsecutiveFramePci pci;
                pci.sequence = frame.low_nibble(0);
                return Result<Pci>::ok(Pci{pci});
            }
            case static_cast<u8>(FrameType::FlowControl): {
                if (frame.size() < FC_PCI_SIZE) {
                    return Result<Pci>::err(Error::frame_length("flow control frame shorter than 3 bytes"));
                }
                const u8 status = frame.low_nibble(0);
                if (status > static_cast<u8>(FlowStatus::Overflow)) {
                    return Result<Pci>::err(
                        Error::protocol("invalid flow status: " + dp::String(std::to_string(status))));
                }
                FlowControlPci pci;
                pci.status = static_cast<FlowStatus>(status);
                pci.block_size = frame[1];
                pci.separation_time = frame[2];
                return Result<Pci>::ok(Pci{pci});
            }
            default:
                return Result<Pci>::err(Error::protocol("unknown frame type: " + dp::String(std::to_string(nibble))));
            }
        }

    } // namespace transport
    using namespace transport;
} // namespace isotp
