#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>

namespace isotp {

    // ─── Frame capacities (ISO 15765-2 / ISO 11898-1) ────────────────────────────
    inline constexpr u8 CLASSIC_FRAME_CAPACITY = 8;
    inline constexpr u8 EXTENDED_FRAME_CAPACITY = 64;
    inline constexpr u8 MAX_FRAME_CAPACITY = EXTENDED_FRAME_CAPACITY;

    // ─── PCI sizes ───────────────────────────────────────────────────────────────
    inline constexpr u8 CLASSIC_SF_PCI_SIZE = 1;
    inline constexpr u8 EXTENDED_SF_PCI_SIZE = 2;
    inline constexpr u8 FF_PCI_SIZE = 2;
    inline constexpr u8 CF_PCI_SIZE = 1;
    inline constexpr u8 FC_PCI_SIZE = 3; // PCI + BS + STmin

    // ─── Payload limits ──────────────────────────────────────────────────────────
    inline constexpr u32 MAX_PAYLOAD_LENGTH = 4095; // 12-bit FF_DL
    inline constexpr u8 CLASSIC_SF_MAX_DATA = CLASSIC_FRAME_CAPACITY - CLASSIC_SF_PCI_SIZE;    // 7
    inline constexpr u8 EXTENDED_SF_MAX_DATA = EXTENDED_FRAME_CAPACITY - EXTENDED_SF_PCI_SIZE; // 62

    // ─── Flow control frame is always an 8-byte control frame ───────────────────
    inline constexpr u8 FC_FRAME_LENGTH = 8;

    // ─── Sequence numbers are 4-bit ──────────────────────────────────────────────
    inline constexpr u8 SEQUENCE_MODULUS = 16;

    // ─── Default fill bytes ──────────────────────────────────────────────────────
    inline constexpr u8 DEFAULT_DATA_PADDING_BYTE = 0xAA;
    inline constexpr u8 DEFAULT_FC_PADDING_BYTE = 0x00;

    // ─── STmin encoding (ISO 15765-2 §9.6.5.4) ──────────────────────────────────
    inline constexpr u8 STMIN_MS_MAX = 0x7F;
    inline constexpr u8 STMIN_US_FIRST = 0xF1; // 100 us
    inline constexpr u8 STMIN_US_LAST = 0xF9;  // 900 us

    // ─── Extended-bus DLC to byte-count table ────────────────────────────────────
    inline constexpr dp::Array<u8, 16> CANFD_DLC_LENGTHS = {0, 1, 2, 3, 4, 5, 6, 7, 8, 12, 16, 20, 24, 32, 48, 64};

    // ─── Mode-dependent limits ───────────────────────────────────────────────────
    inline constexpr u8 frame_capacity(FrameMode mode) noexcept {
        return mode == FrameMode::Extended ? EXTENDED_FRAME_CAPACITY : CLASSIC_FRAME_CAPACITY;
    }

    inline constexpr u8 single_frame_pci_size(FrameMode mode) noexcept {
        return mode == FrameMode::Extended ? EXTENDED_SF_PCI_SIZE : CLASSIC_SF_PCI_SIZE;
    }

    inline constexpr u8 single_frame_max_data(FrameMode mode) noexcept {
        return frame_capacity(mode) - single_frame_pci_size(mode);
    }

    inline constexpr u8 first_frame_max_data(FrameMode mode) noexcept { return frame_capacity(mode) - FF_PCI_SIZE; }

    inline constexpr u8 consecutive_frame_max_data(FrameMode mode) noexcept {
        return frame_capacity(mode) - CF_PCI_SIZE;
    }

} // namespace isotp
