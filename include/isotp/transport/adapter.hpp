#pragma once

#include "../core/adapter_config.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/separation_time.hpp"
#include "../util/data_span.hpp"
#include "../util/event.hpp"
#include "../util/hex.hpp"
#include "../util/state_machine.hpp"
#include "padding.hpp"
#include "pci.hpp"
#include "session.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <limits>
#include <string>
#include <variant>

namespace isotp {
    namespace transport {

        // ─── Result of feeding one frame into the adapter ───────────────────────────
        // At most one of the two is set: a completed payload, or a flow control
        // frame the caller must transmit back to the peer.
        struct ReceiveOutcome {
            dp::Optional<dp::Vector<u8>> payload;
            dp::Optional<Frame> flow_control;

            bool has_payload() const noexcept { return payload.has_value(); }
            bool has_flow_control() const noexcept { return flow_control.has_value(); }
            bool empty() const noexcept { return !payload.has_value() && !flow_control.has_value(); }
        };

        // ─── ISO-TP protocol adapter (ISO 15765-2) ───────────────────────────────────
        // Pure in-memory codec: payloads in, frames out (send path) and frames in,
        // payloads plus generated flow control out (receive path). One outbound and
        // one inbound transfer may be in flight at a time. Not thread-safe.
        class ProtocolAdapter {
            AdapterConfig config_;
            SenderState tx_;
            ReceiverState rx_;
            StateMachine<ReceiverPhase> phase_{ReceiverPhase::Idle};

          public:
            // Validates the configuration before constructing
            static Result<ProtocolAdapter> create(const AdapterConfig &config) {
                auto valid = enforce_adapter_config(config);
                if (valid.is_err()) {
                    return Result<ProtocolAdapter>::err(valid.error());
                }
                return Result<ProtocolAdapter>::ok(ProtocolAdapter(config));
            }

            // Accepts any configuration; a reserved STmin is replaced by 0x7F
            explicit ProtocolAdapter(AdapterConfig config = {}) : config_(config) {
                if (!is_valid_separation_time(config_.separation_time)) {
                    echo::category("isotp.adapter")
                        .warn("reserved STmin ", static_cast<u32>(config_.separation_time), " replaced by 0x7F");
                    config_.separation_time = normalize_separation_time(config_.separation_time);
                }
                echo::category("isotp.adapter")
                    .info("protocol adapter initialized: mode=", frame_mode_name(config_.mode),
                          " frame_capacity=", static_cast<u32>(frame_capacity()),
                          " single_frame_max=", static_cast<u32>(single_frame_max()),
                          " padding=", config_.padding_enabled ? "enabled" : "disabled");
            }

            // ─── Accessors ───────────────────────────────────────────────────────────
            const AdapterConfig &config() const noexcept { return config_; }
            u8 frame_capacity() const noexcept { return config_.frame_capacity(); }
            u8 single_frame_max() const noexcept { return config_.single_frame_max(); }

            const SenderState &sender() const noexcept { return tx_; }
            const ReceiverState &receiver() const noexcept { return rx_; }

            bool is_sending() const noexcept { return tx_.is_active(); }
            bool is_receiving() const noexcept { return phase_.is(ReceiverPhase::Receiving); }
            u32 bytes_remaining() const noexcept { return tx_.bytes_remaining(); }

            StateMachine<ReceiverPhase> &receiver_phase() noexcept { return phase_; }
            const StateMachine<ReceiverPhase> &receiver_phase() const noexcept { return phase_; }

            // Local flow control policy advertised on the next first frame
            Result<void> set_flow_control_params(u8 block_size, u8 separation_time) {
                if (!is_valid_separation_time(separation_time)) {
                    return Result<void>::err(Error::invalid_argument(
                        "reserved STmin value: " + dp::String(std::to_string(separation_time))));
                }
                config_.block_size = block_size;
                config_.separation_time = separation_time;
                echo::category("isotp.adapter")
                    .debug("flow control params: BS=", static_cast<u32>(block_size),
                           " STmin=", static_cast<u32>(separation_time));
                return {};
            }

            // ─── Send path ───────────────────────────────────────────────────────────
            // Returns the single frame, or the first frame of a segmented transfer.
            // In the latter case the caller waits for the peer's flow control and then
            // pulls the rest with send_consecutive_frames().
            Result<dp::Vector<Frame>> send(const dp::Vector<u8> &payload) {
                if (payload.empty()) {
                    echo::category("isotp.adapter.tx").error("send data cannot be empty");
                    return Result<dp::Vector<Frame>>::err(Error::invalid_argument("send data cannot be empty"));
                }
                if (payload.size() > MAX_PAYLOAD_LENGTH) {
                    echo::category("isotp.adapter.tx")
                        .error("data length exceeds limit: ", payload.size(), " > ", MAX_PAYLOAD_LENGTH);
                    return Result<dp::Vector<Frame>>::err(
                        Error::invalid_argument("data length exceeds limit: " +
                                                dp::String(std::to_string(payload.size())) + " > " +
                                                dp::String(std::to_string(MAX_PAYLOAD_LENGTH))));
                }

                tx_.reset();
                tx_.peer_status = FlowStatus::ContinueToSend;
                echo::category("isotp.adapter.tx").trace("payload: ", to_hex(payload), " (", payload.size(), " bytes)");

                dp::Vector<Frame> frames;
                const u16 length = static_cast<u16>(payload.size());

                if (length <= single_frame_max()) {
                    SingleFramePci pci;
                    pci.length = length;
                    frames.push_back(build_frame(Pci{pci}, DataSpan(payload), config_));
                    echo::category("isotp.adapter.tx")
                        .debug("single frame: data=", length, " bytes, frame=", static_cast<u32>(frames[0].length),
                               " bytes");
                    echo::category("isotp.adapter.tx").trace("frame: ", to_hex(frames[0].view()));
                    return Result<dp::Vector<Frame>>::ok(std::move(frames));
                }

                FirstFramePci pci;
                pci.total_length = length;
                const u32 chunk = length < first_frame_max_data(config_.mode) ? length
                                                                              : first_frame_max_data(config_.mode);
                frames.push_back(build_frame(Pci{pci}, DataSpan(payload).first(chunk), config_));

                tx_.pending = payload;
                tx_.bytes_sent = chunk;
                tx_.next_sequence = 1;

                echo::category("isotp.adapter.tx")
                    .debug("first frame: total=", length, " bytes, carried=", chunk, " bytes");
                echo::category("isotp.adapter.tx").trace("frame: ", to_hex(frames[0].view()));
                return Result<dp::Vector<Frame>>::ok(std::move(frames));
            }

            // Produces up to `max_frames` consecutive frames; without a limit the peer's
            // block size bounds the batch (0 = everything that remains). A peer WAIT
            // yields an empty batch until the next CTS; a peer OVERFLOW fails every
            // call until send() or reset_sender().
            Result<dp::Vector<Frame>> send_consecutive_frames(dp::Optional<u32> max_frames = dp::nullopt) {
                if (!tx_.is_active()) {
                    echo::category("isotp.adapter.tx").error("no pending data, call send() first");
                    return Result<dp::Vector<Frame>>::err(Error::invalid_state("no pending data, call send() first"));
                }
                if (max_frames.has_value() && *max_frames == 0) {
                    return Result<dp::Vector<Frame>>::err(Error::invalid_argument("max_frames must be positive"));
                }

                if (tx_.peer_status == FlowStatus::Overflow) {
                    echo::category("isotp.adapter.tx").error("peer reported overflow, transfer aborted");
                    return Result<dp::Vector<Frame>>::err(Error::flow_control("receiver buffer overflow"));
                }

                dp::Vector<Frame> frames;
                if (tx_.peer_status == FlowStatus::Wait) {
                    echo::category("isotp.adapter.tx").warn("peer requested WAIT, holding consecutive frames");
                    return Result<dp::Vector<Frame>>::ok(std::move(frames));
                }

                u32 budget = std::numeric_limits<u32>::max();
                if (max_frames.has_value()) {
                    budget = *max_frames;
                } else if (tx_.peer_block_size > 0) {
                    budget = tx_.peer_block_size;
                }

                const dp::Vector<u8> &payload = *tx_.pending;
                const u32 total = static_cast<u32>(payload.size());
                const u32 cf_max = consecutive_frame_max_data(config_.mode);
                echo::category("isotp.adapter.tx")
                    .debug("consecutive frames: remaining=", total - tx_.bytes_sent, " bytes, budget=", budget);

                while (tx_.bytes_sent < total && frames.size() < budget) {
                    const u32 remaining = total - tx_.bytes_sent;
                    const u32 chunk = remaining < cf_max ? remaining : cf_max;

                    ConsecutiveFramePci pci;
                    pci.sequence = tx_.next_sequence;
                    frames.push_back(build_frame(Pci{pci}, DataSpan(payload).subspan(tx_.bytes_sent, chunk), config_));
                    echo::category("isotp.adapter.tx")
                        .trace("CF SN=", static_cast<u32>(pci.sequence), ": ", to_hex(frames.back().view()));

                    tx_.bytes_sent += chunk;
                    tx_.next_sequence = next_sequence_number(tx_.next_sequence);
                }

                if (tx_.bytes_sent >= total) {
                    echo::category("isotp.adapter.tx").info("multi-frame transmission complete: ", total, " bytes");
                    tx_.reset();
                }
                return Result<dp::Vector<Frame>>::ok(std::move(frames));
            }

            Result<Frame> create_flow_control_frame(FlowStatus status = FlowStatus::ContinueToSend, u8 block_size = 0,
                                                    u8 separation_time = 0) const {
                if (static_cast<u8>(status) > static_cast<u8>(FlowStatus::Overflow)) {
                    return Result<Frame>::err(Error::invalid_argument(
                        "invalid flow status: " + dp::String(std::to_string(static_cast<u32>(status)))));
                }
                if (!is_valid_separation_time(separation_time)) {
                    return Result<Frame>::err(Error::invalid_argument(
                        "reserved STmin value: " + dp::String(std::to_string(separation_time))));
                }
                return Result<Frame>::ok(make_flow_control(status, block_size, separation_time));
            }

            // Abandons the outbound transfer and forgets a peer WAIT/OVERFLOW
            void reset_sender() noexcept {
                tx_.reset();
                tx_.peer_status = FlowStatus::ContinueToSend;
            }

            // ─── Receive path ────────────────────────────────────────────────────────
            Result<ReceiveOutcome> receive(const Frame &frame) { return receive(frame.view()); }

            Result<ReceiveOutcome> receive(DataSpan frame) {
                echo::category("isotp.adapter.rx")
                    .trace("receive frame: length=", frame.size(), " content=", to_hex(frame));

                auto decoded = decode_pci(frame, config_.mode);
                if (decoded.is_err()) {
                    // A malformed flow control frame belongs to the send direction
                    const bool flow_control = !frame.empty() && frame.size() <= frame_capacity() &&
                                              frame.high_nibble(0) == static_cast<u8>(FrameType::FlowControl);
                    return fail(decoded.error(), !flow_control);
                }

                const Pci pci = decoded.value();
                return std::visit([this, frame](const auto &p) { return handle(p, frame); }, pci);
            }

            // Forces the receiver back to idle, discarding any partial payload
            void reset() {
                rx_.reset();
                phase_.transition(ReceiverPhase::Idle);
                echo::category("isotp.adapter.rx").debug("receiver state reset");
            }

            Event<const dp::Vector<u8> &> on_payload; // completed inbound payload
            Event<const Error &> on_abort;             // partial inbound payload discarded

          private:
            Frame make_flow_control(FlowStatus status, u8 block_size, u8 separation_time) const {
                FlowControlPci pci;
                pci.status = status;
                pci.block_size = block_size;
                pci.separation_time = separation_time;
                Frame frame = build_frame(Pci{pci}, DataSpan(), config_);
                echo::category("isotp.adapter")
                    .debug("flow control frame: FS=", flow_status_name(status), " BS=", static_cast<u32>(block_size),
                           " STmin=", static_cast<u32>(separation_time), " length=", static_cast<u32>(frame.length));
                return frame;
            }

            Frame own_flow_control() const {
                return make_flow_control(FlowStatus::ContinueToSend, config_.block_size, config_.separation_time);
            }

            void abort_reception(const Error &reason) {
                if (!is_receiving())
                    return;
                echo::category("isotp.adapter.rx")
                    .warn("reassembly aborted at ", rx_.accumulated.size(), "/", rx_.total_length,
                          " bytes: ", reason.message);
                on_abort.emit(reason);
                reset();
            }

            Result<ReceiveOutcome> fail(const Error &error, bool reset_receiver) {
                echo::category("isotp.adapter.rx").error(error_code_name(error.code), ": ", error.message);
                if (reset_receiver) {
                    abort_reception(error);
                }
                return Result<ReceiveOutcome>::err(error);
            }

            Result<ReceiveOutcome> deliver(dp::Vector<u8> payload) {
                echo::category("isotp.adapter.rx").info("payload complete: ", payload.size(), " bytes");
                on_payload.emit(payload);
                ReceiveOutcome outcome;
                outcome.payload = std::move(payload);
                return Result<ReceiveOutcome>::ok(std::move(outcome));
            }

            // ─── SINGLE: complete payload in one frame ───────────────────────────────
            Result<ReceiveOutcome> handle(const SingleFramePci &pci, DataSpan frame) {
                abort_reception(Error::protocol("reassembly interrupted by single frame"));
                const u8 start = header_size(pci, config_.mode);
                DataSpan data = unpad(frame.subspan(start), pci.length);
                echo::category("isotp.adapter.rx")
                    .debug("single frame: data=", pci.length, " bytes, frame=", frame.size(), " bytes");
                return deliver(data.to_vector());
            }

            // ─── FIRST: open a reassembly and grant the peer ─────────────────────────
            Result<ReceiveOutcome> handle(const FirstFramePci &pci, DataSpan frame) {
                abort_reception(Error::protocol("reassembly interrupted by new first frame"));

                const u32 ff_max = first_frame_max_data(config_.mode);
                const u32 chunk = pci.total_length < ff_max ? pci.total_length : ff_max;
                if (frame.size() < FF_PCI_SIZE + chunk) {
                    return fail(Error::frame_length("first frame carries " + dp::String(std::to_string(frame.size())) +
                                                    " bytes, expected " +
                                                    dp::String(std::to_string(FF_PCI_SIZE + chunk))),
                                true);
                }

                rx_.reset();
                rx_.total_length = pci.total_length;
                rx_.accumulated = unpad(frame.subspan(FF_PCI_SIZE), chunk).to_vector();
                rx_.expected_sequence = 1;
                phase_.transition(ReceiverPhase::Receiving);

                echo::category("isotp.adapter.rx")
                    .debug("first frame: total=", pci.total_length, " bytes, carried=", chunk, " bytes");

                ReceiveOutcome outcome;
                outcome.flow_control = own_flow_control();
                return Result<ReceiveOutcome>::ok(std::move(outcome));
            }

            // ─── CONSECUTIVE: append, complete, or re-grant at block boundaries ──────
            Result<ReceiveOutcome> handle(const ConsecutiveFramePci &pci, DataSpan frame) {
                if (!is_receiving()) {
                    return fail(Error::protocol("not in receiving state, cannot accept consecutive frame"), true);
                }
                if (pci.sequence != rx_.expected_sequence) {
                    return fail(Error::sequence(rx_.expected_sequence, pci.sequence), true);
                }

                const u32 cf_max = consecutive_frame_max_data(config_.mode);
                const u32 remaining = rx_.bytes_remaining();
                const u32 chunk = remaining < cf_max ? remaining : cf_max;
                if (frame.size() < CF_PCI_SIZE + chunk) {
                    return fail(Error::frame_length("consecutive frame carries " +
                                                    dp::String(std::to_string(frame.size())) + " bytes, expected " +
                                                    dp::String(std::to_string(CF_PCI_SIZE + chunk))),
                                true);
                }

                DataSpan data = unpad(frame.subspan(CF_PCI_SIZE), chunk);
                rx_.accumulated.insert(rx_.accumulated.end(), data.begin(), data.end());
                rx_.expected_sequence = next_sequence_number(rx_.expected_sequence);
                ++rx_.consecutive_received;

                echo::category("isotp.adapter.rx")
                    .debug("CF SN=", static_cast<u32>(pci.sequence), ": data=", chunk, " bytes, accumulated=",
                           rx_.accumulated.size(), "/", rx_.total_length);

                if (rx_.is_complete()) {
                    dp::Vector<u8> payload = std::move(rx_.accumulated);
                    payload.resize(rx_.total_length);
                    reset();
                    return deliver(std::move(payload));
                }

                ReceiveOutcome outcome;
                if (config_.block_size > 0 && rx_.consecutive_received % config_.block_size == 0) {
                    echo::category("isotp.adapter.rx")
                        .debug("block boundary after ", rx_.consecutive_received, " frames, re-granting");
                    outcome.flow_control = own_flow_control();
                }
                return Result<ReceiveOutcome>::ok(std::move(outcome));
            }

            // ─── FLOW_CONTROL: peer pacing for our outbound transfer ─────────────────
            Result<ReceiveOutcome> handle(const FlowControlPci &pci, DataSpan) {
                tx_.peer_status = pci.status;
                tx_.peer_block_size = pci.block_size;
                tx_.peer_separation_time = pci.separation_time;
                echo::category("isotp.adapter.tx")
                    .debug("flow control received: FS=", flow_status_name(pci.status),
                           " BS=", static_cast<u32>(pci.block_size), " STmin=", static_cast<u32>(pci.separation_time));

                // The pending payload stays until the caller sends again or resets
                if (pci.status == FlowStatus::Overflow) {
                    return fail(Error::flow_control("receiver buffer overflow"), false);
                }
                if (pci.status == FlowStatus::Wait) {
                    echo::category("isotp.adapter.tx").warn("peer requested WAIT");
                }
                return Result<ReceiveOutcome>::ok(ReceiveOutcome{});
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace isotp
