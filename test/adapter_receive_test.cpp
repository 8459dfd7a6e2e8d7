#include "test_helpers.hpp"
#include <doctest/doctest.h>

using namespace isotp;
using isotp_test::make_payload;
using isotp_test::same_bytes;

TEST_CASE("Receive frame length validation") {
    SUBCASE("empty frame") {
        ProtocolAdapter rx;
        auto r = rx.receive(DataSpan());
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::FrameLength);
    }

    SUBCASE("classic over-length frame") {
        ProtocolAdapter rx;
        dp::Vector<u8> nine(9, 0x00);
        auto r = rx.receive(DataSpan(nine));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::FrameLength);
    }

    SUBCASE("extended over-length frame") {
        ProtocolAdapter rx(AdapterConfig::extended());
        dp::Vector<u8> big(65, 0x00);
        auto r = rx.receive(DataSpan(big));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::FrameLength);
    }
}

TEST_CASE("Receive single frame") {
    ProtocolAdapter rx;

    SUBCASE("padded frame is unpadded by declared length") {
        dp::Vector<u8> raw = {0x03, 0x10, 0x01, 0x02, 0xAA, 0xAA, 0xAA, 0xAA};
        auto r = rx.receive(DataSpan(raw));
        REQUIRE(r.is_ok());
        REQUIRE(r.value().has_payload());
        CHECK_FALSE(r.value().has_flow_control());
        dp::Vector<u8> expected = {0x10, 0x01, 0x02};
        CHECK(same_bytes(*r.value().payload, expected));
    }

    SUBCASE("unpadded frame") {
        dp::Vector<u8> raw = {0x02, 0x3E, 0x00};
        auto r = rx.receive(DataSpan(raw));
        REQUIRE(r.is_ok());
        CHECK(r.value().payload->size() == 2);
    }

    SUBCASE("fires on_payload") {
        usize delivered = 0;
        rx.on_payload.subscribe([&](const dp::Vector<u8> &p) { delivered = p.size(); });
        dp::Vector<u8> raw = {0x05, 1, 2, 3, 4, 5};
        REQUIRE(rx.receive(DataSpan(raw)).is_ok());
        CHECK(delivered == 5);
    }
}

TEST_CASE("Receive first frame") {
    ProtocolAdapter rx(AdapterConfig{}.set_block_size(4).set_separation_time(0x14));
    dp::Vector<u8> raw = {0x10, 0x14, 1, 2, 3, 4, 5, 6};
    auto r = rx.receive(DataSpan(raw));
    REQUIRE(r.is_ok());
    CHECK_FALSE(r.value().has_payload());
    REQUIRE(r.value().has_flow_control());

    const Frame &fc = *r.value().flow_control;
    CHECK(fc.length == 8);
    CHECK(fc[0] == 0x30);
    CHECK(fc[1] == 4);
    CHECK(fc[2] == 0x14);
    CHECK(fc[7] == 0x00);

    CHECK(rx.is_receiving());
    CHECK(rx.receiver().total_length == 20);
    CHECK(rx.receiver().accumulated.size() == 6);
    CHECK(rx.receiver().expected_sequence == 1);
    CHECK(rx.receiver_phase().state() == ReceiverPhase::Receiving);
}

TEST_CASE("Receive truncated first frame") {
    ProtocolAdapter rx;
    dp::Vector<u8> raw = {0x10, 0x14, 1, 2, 3};
    auto r = rx.receive(DataSpan(raw));
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::FrameLength);
    CHECK_FALSE(rx.is_receiving());
}

TEST_CASE("Receive consecutive frame while idle") {
    ProtocolAdapter rx;
    dp::Vector<u8> raw = {0x21, 1, 2, 3, 4, 5, 6, 7};
    auto r = rx.receive(DataSpan(raw));
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::Protocol);
    CHECK_FALSE(rx.is_receiving());
}

TEST_CASE("Receive out-of-order consecutive frames") {
    ProtocolAdapter tx;
    ProtocolAdapter rx;
    auto payload = make_payload(30);

    auto first = tx.send(payload);
    REQUIRE(first.is_ok());
    auto fc = rx.receive(first.value()[0]);
    REQUIRE(fc.is_ok());
    REQUIRE(tx.receive(*fc.value().flow_control).is_ok());

    auto cfs = tx.send_consecutive_frames();
    REQUIRE(cfs.is_ok());
    REQUIRE(cfs.value().size() == 4);

    i32 aborts = 0;
    rx.on_abort.subscribe([&](const Error &e) {
        aborts++;
        CHECK(e.code == ErrorCode::Sequence);
    });

    REQUIRE(rx.receive(cfs.value()[0]).is_ok());
    auto skipped = rx.receive(cfs.value()[2]);
    REQUIRE(skipped.is_err());
    CHECK(skipped.error().code == ErrorCode::Sequence);
    CHECK(skipped.error().message == "sequence number error: expected 2, actual 3");
    CHECK_FALSE(rx.is_receiving());
    CHECK(rx.receiver().accumulated.empty());
    CHECK(aborts == 1);

    SUBCASE("next first frame starts clean") {
        auto again = tx.send(payload);
        REQUIRE(again.is_ok());
        auto r = rx.receive(again.value()[0]);
        REQUIRE(r.is_ok());
        CHECK(r.value().has_flow_control());
        CHECK(rx.is_receiving());
    }
}

TEST_CASE("Receive truncated consecutive frame") {
    ProtocolAdapter rx;
    dp::Vector<u8> ff = {0x10, 0x14, 1, 2, 3, 4, 5, 6};
    REQUIRE(rx.receive(DataSpan(ff)).is_ok());

    dp::Vector<u8> cf = {0x21, 7, 8, 9}; // needs 7 data bytes
    auto r = rx.receive(DataSpan(cf));
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::FrameLength);
    CHECK_FALSE(rx.is_receiving());
}

TEST_CASE("Receive discards partial payload on interruption") {
    ProtocolAdapter rx;
    dp::Vector<u8> ff = {0x10, 0x14, 1, 2, 3, 4, 5, 6};
    REQUIRE(rx.receive(DataSpan(ff)).is_ok());

    i32 aborts = 0;
    rx.on_abort.subscribe([&](const Error &) { aborts++; });

    SUBCASE("single frame wins") {
        dp::Vector<u8> sf = {0x01, 0x42};
        auto r = rx.receive(DataSpan(sf));
        REQUIRE(r.is_ok());
        REQUIRE(r.value().has_payload());
        CHECK((*r.value().payload)[0] == 0x42);
        CHECK_FALSE(rx.is_receiving());
        CHECK(aborts == 1);
    }

    SUBCASE("new first frame restarts") {
        dp::Vector<u8> ff2 = {0x10, 0x0A, 9, 9, 9, 9, 9, 9};
        auto r = rx.receive(DataSpan(ff2));
        REQUIRE(r.is_ok());
        CHECK(r.value().has_flow_control());
        CHECK(rx.is_receiving());
        CHECK(rx.receiver().total_length == 10);
        CHECK(aborts == 1);
    }

    SUBCASE("empty frame aborts") {
        CHECK(rx.receive(DataSpan()).is_err());
        CHECK_FALSE(rx.is_receiving());
        CHECK(aborts == 1);
    }
}

TEST_CASE("Receive unknown frame type") {
    ProtocolAdapter rx;
    dp::Vector<u8> raw = {0x7E, 0x00};
    auto r = rx.receive(DataSpan(raw));
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::Protocol);
}

TEST_CASE("Receive trusts declared length over fill bytes") {
    ProtocolAdapter tx;
    ProtocolAdapter rx;
    dp::Vector<u8> payload(10, 0xAA); // payload equal to the fill byte

    auto first = tx.send(payload);
    REQUIRE(first.is_ok());
    auto fc = rx.receive(first.value()[0]);
    REQUIRE(fc.is_ok());
    REQUIRE(tx.receive(*fc.value().flow_control).is_ok());
    auto cfs = tx.send_consecutive_frames();
    REQUIRE(cfs.is_ok());
    REQUIRE(cfs.value().size() == 1);

    auto done = rx.receive(cfs.value()[0]);
    REQUIRE(done.is_ok());
    REQUIRE(done.value().has_payload());
    CHECK(same_bytes(*done.value().payload, payload));
}

TEST_CASE("Reset forces receiver idle") {
    ProtocolAdapter rx;
    dp::Vector<u8> ff = {0x10, 0x14, 1, 2, 3, 4, 5, 6};
    REQUIRE(rx.receive(DataSpan(ff)).is_ok());

    ReceiverPhase seen_from = ReceiverPhase::Idle;
    rx.receiver_phase().on_transition.subscribe([&](ReceiverPhase from, ReceiverPhase) { seen_from = from; });

    rx.reset();
    CHECK_FALSE(rx.is_receiving());
    CHECK(rx.receiver().total_length == 0);
    CHECK(seen_from == ReceiverPhase::Receiving);

    dp::Vector<u8> cf = {0x21, 7, 8, 9, 10, 11, 12, 13};
    auto r = rx.receive(DataSpan(cf));
    REQUIRE(r.is_err());
    CHECK(r.error().code == ErrorCode::Protocol);
}
