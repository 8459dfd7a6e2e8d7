#include <isotp.hpp>
#include <echo/echo.hpp>

using namespace isotp;

// Runs one payload from a sender adapter to a receiver adapter, relaying flow
// control back as it is produced.
static bool relay(ProtocolAdapter &tx, ProtocolAdapter &rx, const dp::Vector<u8> &payload) {
    auto first = tx.send(payload);
    if (!first) {
        echo::error("send failed: ", first.error().message);
        return false;
    }

    auto outcome = rx.receive(first.value()[0]);
    if (!outcome) {
        echo::error("receive failed: ", outcome.error().message);
        return false;
    }
    if (outcome.value().has_payload())
        return true;

    dp::Optional<Frame> grant = outcome.value().flow_control;
    while (grant.has_value()) {
        echo::info("  flow control: ", to_hex(grant.value().view(), ' '));
        if (!tx.receive(grant.value()))
            return false;
        grant = dp::nullopt;

        auto batch = tx.send_consecutive_frames();
        if (!batch)
            return false;
        for (const auto &cf : batch.value()) {
            auto step = rx.receive(cf);
            if (!step)
                return false;
            if (step.value().has_payload())
                return true;
            if (step.value().has_flow_control())
                grant = step.value().flow_control;
        }
    }
    return false;
}

int main() {
    echo::info("=== ISO-TP Loopback Demo ===");

    ProtocolAdapter tx;
    ProtocolAdapter rx;
    rx.on_payload.subscribe([](const dp::Vector<u8> &payload) {
        echo::info("received ", payload.size(), " bytes: ", to_hex(DataSpan(payload).first(16), ' '),
                   payload.size() > 16 ? " ..." : "");
    });
    rx.on_abort.subscribe([](const Error &reason) { echo::warn("reception aborted: ", reason.message); });

    // --- Single frame ---
    echo::info("\n--- Single frame ---");
    dp::Vector<u8> request = {0x22, 0xF1, 0x90};
    auto sf = tx.send(request);
    if (sf) {
        echo::info("SF: ", to_hex(sf.value()[0].view(), ' '));
    }
    relay(tx, rx, request);

    // --- Multi-frame ---
    echo::info("\n--- Multi-frame (classic) ---");
    dp::Vector<u8> vin(20);
    for (usize i = 0; i < vin.size(); ++i) vin[i] = static_cast<u8>('A' + i);
    auto ff = tx.send(vin);
    if (ff) {
        echo::info("FF: ", to_hex(ff.value()[0].view(), ' '));
        tx.reset_sender();
    }
    echo::info("Transfer: ", relay(tx, rx, vin) ? "OK" : "FAIL");

    // --- Extended bus ---
    echo::info("\n--- Multi-frame (extended) ---");
    ProtocolAdapter fd_tx(AdapterConfig::extended());
    ProtocolAdapter fd_rx(AdapterConfig::extended());
    fd_rx.on_payload.subscribe(
        [](const dp::Vector<u8> &payload) { echo::info("extended bus received ", payload.size(), " bytes"); });
    dp::Vector<u8> block(500);
    for (usize i = 0; i < block.size(); ++i) block[i] = static_cast<u8>(i);
    echo::info("Transfer: ", relay(fd_tx, fd_rx, block) ? "OK" : "FAIL");

    // --- Error handling ---
    echo::info("\n--- Errors ---");
    dp::Vector<u8> stray_cf = {0x21, 1, 2, 3, 4, 5, 6, 7};
    auto stray = rx.receive(DataSpan(stray_cf));
    if (!stray) {
        echo::info("stray CF rejected: ", error_code_name(stray.error().code), " (", stray.error().message, ")");
    }
    dp::Vector<u8> too_big(MAX_PAYLOAD_LENGTH + 1);
    auto oversized = tx.send(too_big);
    if (!oversized) {
        echo::info("oversized payload rejected: ", oversized.error().message);
    }

    return 0;
}
