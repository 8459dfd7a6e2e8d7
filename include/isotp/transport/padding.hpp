#pragma once

#include "../core/adapter_config.hpp"
#include "../core/constants.hpp"
#include "../core/frame.hpp"
#include "../util/data_span.hpp"
#include "pci.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <variant>

namespace isotp {
    namespace transport {

        // ─── Padding policy per frame variant ───────────────────────────────────────
        // Data frames pad to the bus capacity with the data fill byte.
        // Flow control is an 8-byte control frame on every bus and uses its own fill byte.
        struct PaddingRule {
            u8 target_length = 0;
            u8 fill = 0;
        };

        inline PaddingRule padding_rule(const SingleFramePci &, const AdapterConfig &cfg) noexcept {
            return {cfg.frame_capacity(), cfg.data_padding_byte};
        }
        inline PaddingRule padding_rule(const FirstFramePci &, const AdapterConfig &cfg) noexcept {
            return {cfg.frame_capacity(), cfg.data_padding_byte};
        }
        inline PaddingRule padding_rule(const ConsecutiveFramePci &, const AdapterConfig &cfg) noexcept {
            return {cfg.frame_capacity(), cfg.data_padding_byte};
        }
        inline PaddingRule padding_rule(const FlowControlPci &, const AdapterConfig &cfg) noexcept {
            return {FC_FRAME_LENGTH, cfg.fc_padding_byte};
        }

        inline PaddingRule padding_rule(const Pci &pci, const AdapterConfig &cfg) noexcept {
            return std::visit([&cfg](const auto &p) { return padding_rule(p, cfg); }, pci);
        }

        // ─── Apply padding (no-op when disabled or already full) ────────────────────
        inline void pad_frame(Frame &frame, const Pci &pci, const AdapterConfig &cfg) {
            if (!cfg.padding_enabled)
                return;
            const PaddingRule rule = padding_rule(pci, cfg);
            if (frame.length >= rule.target_length)
                return;
            const u8 before = frame.length;
            frame.fill_to(rule.target_length, rule.fill);
            echo::category("isotp.adapter")
                .trace("padding: ", static_cast<u32>(before), " -> ", static_cast<u32>(frame.length),
                       " bytes, fill=", static_cast<u32>(rule.fill), " type=", frame_type_name(pci_type(pci)));
        }

        // ─── Remove padding ─────────────────────────────────────────────────────────
        // Never trusts the physical length: the declared byte count wins and any
        // trailing fill is dropped. Callers have already verified `body` holds at
        // least `declared` bytes.
        inline DataSpan unpad(DataSpan body, usize declared) noexcept { return body.first(declared); }

        // ─── Assemble PCI + data + padding into one frame ───────────────────────────
        inline Frame build_frame(const Pci &pci, DataSpan body, const AdapterConfig &cfg) {
            Frame frame = encode_pci(pci, cfg.mode);
            for (u8 b : body) {
                frame.push(b);
            }
            pad_frame(frame, pci, cfg);
            return frame;
        }

    } // namespace transport
    using namespace transport;
} // namespace isotp
