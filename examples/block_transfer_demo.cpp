#include <isotp.hpp>
#include <echo/echo.hpp>

using namespace isotp;

int main() {
    echo::info("=== ISO-TP Block Transfer Demo ===");

    // Receiver grants 4 frames at a time with 1 ms separation
    auto rx_result = ProtocolAdapter::create(AdapterConfig{}.set_block_size(4).set_separation_time(0x01));
    if (!rx_result) {
        echo::error("invalid receiver config: ", rx_result.error().message);
        return 1;
    }
    ProtocolAdapter rx = std::move(rx_result.value());
    ProtocolAdapter tx;

    rx.receiver_phase().on_transition.subscribe([](ReceiverPhase from, ReceiverPhase to) {
        echo::info("receiver: ", receiver_phase_name(from), " -> ", receiver_phase_name(to));
    });

    dp::Vector<u8> payload(6 + 7 * 20);
    for (usize i = 0; i < payload.size(); ++i) payload[i] = static_cast<u8>(i * 3);

    auto first = tx.send(payload);
    if (!first) {
        echo::error("send failed: ", first.error().message);
        return 1;
    }
    echo::info("FF: ", to_hex(first.value()[0].view(), ' '));

    auto outcome = rx.receive(first.value()[0]);
    if (!outcome || !outcome.value().has_flow_control()) {
        echo::error("receiver did not grant");
        return 1;
    }

    // Peer answers WAIT first, then grants
    auto wait = rx.create_flow_control_frame(FlowStatus::Wait);
    if (wait && tx.receive(wait.value())) {
        auto held = tx.send_consecutive_frames();
        if (held) {
            echo::info("after WAIT: ", held.value().size(), " frames released");
        }
    }

    dp::Optional<Frame> grant = outcome.value().flow_control;
    usize blocks = 0;
    while (grant.has_value()) {
        if (!tx.receive(grant.value()))
            return 1;
        grant = dp::nullopt;

        auto batch = tx.send_consecutive_frames();
        if (!batch)
            return 1;
        ++blocks;
        echo::info("block ", blocks, ": ", batch.value().size(), " frames, STmin=",
                   tx.sender().peer_separation_time_us(), " us, remaining=", tx.bytes_remaining(), " bytes");

        for (const auto &cf : batch.value()) {
            auto step = rx.receive(cf);
            if (!step) {
                echo::error("receive failed: ", step.error().message);
                return 1;
            }
            if (step.value().has_payload()) {
                echo::info("complete: ", step.value().payload.value().size(), " bytes in ", blocks, " blocks");
            } else if (step.value().has_flow_control()) {
                grant = step.value().flow_control;
            }
        }
    }

    // Peer overflow aborts the send
    echo::info("\n--- Overflow ---");
    if (tx.send(payload)) {
        auto overflow = rx.create_flow_control_frame(FlowStatus::Overflow);
        if (overflow) {
            auto r = tx.receive(overflow.value());
            if (!r) {
                echo::warn("send aborted: ", r.error().message, ", pending=", tx.sender().total_bytes(), " bytes");
                auto after = tx.send_consecutive_frames();
                if (!after) {
                    echo::info("further frames refused: ", error_code_name(after.error().code));
                }
                tx.reset_sender();
            }
        }
    }

    return 0;
}
