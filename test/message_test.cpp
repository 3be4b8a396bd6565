#include <doctest/doctest.h>
#include <antlink/core/message.hpp>

using namespace antlink;

TEST_CASE("Message data extraction") {
    Message msg(msg_id::CHANNEL_ID, {0x02, 0x34, 0x12, 0x78, 0x05});

    SUBCASE("get_u8") {
        CHECK(msg.get_u8(0) == 0x02);
        CHECK(msg.get_u8(4) == 0x05);
        CHECK(msg.get_u8(5) == 0xFF); // out of bounds
    }

    SUBCASE("get_u16_le") {
        CHECK(msg.get_u16_le(1) == 0x1234);
        CHECK(msg.get_u16_le(4) == 0xFFFF);
    }

    SUBCASE("get_u32_le") {
        CHECK(msg.get_u32_le(1) == 0x05781234);
        CHECK(msg.get_u32_le(2) == 0xFFFFFFFF);
    }

    SUBCASE("channel is the first payload byte") { CHECK(msg.channel() == 2); }
}

TEST_CASE("Message data setters grow the payload") {
    Message msg(msg_id::CHANNEL_MESG_PERIOD, {0x01});

    msg.set_u16_le(1, 8070);
    CHECK(msg.size() == 3);
    CHECK(msg.data[1] == 0x86);
    CHECK(msg.data[2] == 0x1F);

    msg.set_u8(5, 0xAA);
    CHECK(msg.size() == 6);
    CHECK(msg.data[3] == 0x00);
    CHECK(msg.data[5] == 0xAA);
}

TEST_CASE("Message equality compares id and payload") {
    Message a(msg_id::OPEN_CHANNEL, {0x01});
    Message b(msg_id::OPEN_CHANNEL, {0x01});
    Message c(msg_id::CLOSE_CHANNEL, {0x01});
    Message d(msg_id::OPEN_CHANNEL, {0x02});

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != d);
}

TEST_CASE("make_message rejects payloads that do not fit the length byte") {
    auto ok = make_message(msg_id::BURST_DATA, dp::Vector<u8>(255, 0x11));
    CHECK(ok.is_ok());
    CHECK(ok.value().size() == 255);

    auto too_big = make_message(msg_id::BURST_DATA, dp::Vector<u8>(256, 0x11));
    CHECK(too_big.is_err());
    CHECK(too_big.error().code == ErrorCode::InvalidArgument);
}
