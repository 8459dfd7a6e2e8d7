#include <doctest/doctest.h>
#include <isotp/util/bitfield.hpp>
#include <isotp/util/data_span.hpp>
#include <isotp/util/event.hpp>
#include <isotp/util/hex.hpp>
#include <isotp/util/state_machine.hpp>

using namespace isotp;

TEST_CASE("Bitfield nibble helpers") {
    CHECK(bitfield::high_nibble(0x3A) == 0x3);
    CHECK(bitfield::low_nibble(0x3A) == 0xA);
    CHECK(bitfield::make_byte(0x2, 0xF) == 0x2F);
    CHECK(bitfield::make_byte(0x1, 0x1F) == 0x1F); // low value masked to 4 bits

    SUBCASE("12-bit big-endian length") {
        u8 buf[2] = {0x10, 0x00};
        bitfield::pack_u12_be(buf, 0xFFF);
        CHECK(buf[0] == 0x1F); // frame type nibble preserved
        CHECK(buf[1] == 0xFF);
        CHECK(bitfield::unpack_u12_be(buf) == 4095);

        bitfield::pack_u12_be(buf, 0x123);
        CHECK(buf[0] == 0x11);
        CHECK(buf[1] == 0x23);
        CHECK(bitfield::unpack_u12_be(buf) == 0x123);
    }
}

TEST_CASE("DataSpan views") {
    dp::Vector<u8> bytes = {0x21, 0x01, 0x02, 0x03, 0xAA, 0xAA};
    DataSpan span(bytes);

    CHECK(span.size() == 6);
    CHECK(span.high_nibble(0) == 2);
    CHECK(span.low_nibble(0) == 1);
    CHECK(span[10] == 0xFF); // out of range reads as fill

    SUBCASE("first truncates") {
        auto head = span.subspan(1).first(3);
        CHECK(head.size() == 3);
        CHECK(head[2] == 0x03);
        CHECK(span.first(100).size() == 6);
    }

    SUBCASE("subspan past end is empty") { CHECK(span.subspan(6).empty()); }

    SUBCASE("to_vector copies") {
        auto copy = span.subspan(1, 3).to_vector();
        CHECK(copy.size() == 3);
        CHECK(copy[0] == 0x01);
        CHECK(copy[2] == 0x03);
    }

    SUBCASE("u12 needs two bytes") {
        u8 one = 0x10;
        CHECK(DataSpan(&one, 1).get_u12_be(0) == 0xFFFF);
    }
}

TEST_CASE("Hex rendering") {
    dp::Vector<u8> bytes = {0x02, 0xAB, 0xF0};
    CHECK(to_hex(bytes) == "02ABF0");
    CHECK(to_hex(bytes, ' ') == "02 AB F0");
    CHECK(to_hex(DataSpan()) == "");
}

TEST_CASE("Event subscribe/emit") {
    SUBCASE("multiple listeners") {
        Event<i32> event;
        i32 sum = 0;
        event.subscribe([&](i32 val) { sum += val; });
        event += [&](i32 val) { sum += val * 2; };
        event.emit(10);
        CHECK(sum == 30);
        CHECK(event.count() == 2);
    }

    SUBCASE("unsubscribe by token") {
        Event<> event;
        i32 calls = 0;
        auto token = event.subscribe([&]() { calls++; });
        CHECK(event.unsubscribe(token));
        CHECK_FALSE(event.unsubscribe(token));
        event.emit();
        CHECK(calls == 0);
        CHECK(event.count() == 0);
    }

    SUBCASE("unsubscribe during dispatch is deferred") {
        Event<i32> event;
        i32 first = 0;
        i32 second = 0;
        ListenerToken second_token = INVALID_TOKEN;
        event.subscribe([&](i32 v) {
            first += v;
            event.unsubscribe(second_token);
        });
        second_token = event.subscribe([&](i32 v) { second += v; });
        event.emit(1);
        event.emit(1);
        CHECK(first == 2);
        CHECK(second == 0);
        CHECK(event.count() == 1);
    }

    SUBCASE("clear") {
        Event<i32> event;
        i32 val = 0;
        event.subscribe([&](i32 v) { val = v; });
        event.clear();
        event.emit(99);
        CHECK(val == 0);
    }
}

TEST_CASE("StateMachine transitions") {
    enum class Phase { A, B };
    StateMachine<Phase> sm(Phase::A);

    Phase from = Phase::B;
    Phase to = Phase::A;
    i32 fired = 0;
    sm.on_transition.subscribe([&](Phase f, Phase t) {
        from = f;
        to = t;
        fired++;
    });

    CHECK_FALSE(sm.transition(Phase::A));
    CHECK(fired == 0);

    CHECK(sm.transition(Phase::B));
    CHECK(sm.is(Phase::B));
    CHECK(sm.previous() == Phase::A);
    CHECK(from == Phase::A);
    CHECK(to == Phase::B);
    CHECK(sm.transitions() == 1);
}
