#include <doctest/doctest.h>
#include "mock_driver.hpp"
#include <antlink/command/commands.hpp>

using namespace antlink;
using antlink::test::MockDriver;
using antlink::test::wait_until;

TEST_CASE("Channel assignment layouts") {
    SUBCASE("assign") {
        auto msg = command::assign_channel(1, channel_type::SLAVE_RECEIVE_ONLY, 0);
        REQUIRE(msg.is_ok());
        CHECK(msg.value() == Message(msg_id::ASSIGN_CHANNEL, {1, 0x40, 0}));
    }

    SUBCASE("assign with extended flags") {
        auto msg = command::assign_channel_ext(0, channel_type::BIDIRECTIONAL_SLAVE, 1, ext_assign::BACKGROUND_SCANNING);
        REQUIRE(msg.is_ok());
        CHECK(msg.value() == Message(msg_id::ASSIGN_CHANNEL, {0, 0x00, 1, 0x01}));
    }

    SUBCASE("unassign") {
        auto msg = command::unassign_channel(4);
        REQUIRE(msg.is_ok());
        CHECK(msg.value() == Message(msg_id::UNASSIGN_CHANNEL, {4}));
    }
}

TEST_CASE("Channel parameters are little-endian") {
    SUBCASE("channel id") {
        auto msg = command::set_channel_id(0, 0x1234, 0x78, 0x01);
        REQUIRE(msg.is_ok());
        CHECK(msg.value() == Message(msg_id::CHANNEL_ID, {0, 0x34, 0x12, 0x78, 0x01}));
    }

    SUBCASE("period") {
        auto msg = command::set_channel_period(2, 8070);
        REQUIRE(msg.is_ok());
        CHECK(msg.value() == Message(msg_id::CHANNEL_MESG_PERIOD, {2, 0x86, 0x1F}));
    }

    SUBCASE("search timeouts and rf frequency") {
        CHECK(command::set_channel_search_timeout(1, 12).value() == Message(msg_id::CHANNEL_SEARCH_TIMEOUT, {1, 12}));
        CHECK(command::set_low_priority_search_timeout(1, 2).value() == Message(msg_id::LP_SEARCH_TIMEOUT, {1, 2}));
        CHECK(command::set_channel_rf_freq(0, 57).value() == Message(msg_id::CHANNEL_RADIO_FREQ, {0, 57}));
    }
}

TEST_CASE("Network key must be exactly 8 bytes") {
    dp::Vector<u8> key = {0xB9, 0xA5, 0x21, 0xFB, 0xBD, 0x72, 0xC3, 0x45};
    auto msg = command::set_network_key(0, key);
    REQUIRE(msg.is_ok());
    CHECK(msg.value() == Message(msg_id::NETWORK_KEY, {0, 0xB9, 0xA5, 0x21, 0xFB, 0xBD, 0x72, 0xC3, 0x45}));

    dp::Vector<u8> short_key = {1, 2, 3};
    auto bad = command::set_network_key(0, short_key);
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Transmit power is masked to two bits") {
    CHECK(command::set_transmit_power(3).value() == Message(msg_id::RADIO_TX_POWER, {0, 3}));
    CHECK(command::set_transmit_power(0xFE).value() == Message(msg_id::RADIO_TX_POWER, {0, 2}));
    CHECK(command::set_channel_transmit_power(1, 7).value() == Message(msg_id::CHANNEL_RADIO_TX_POWER, {1, 3}));
}

TEST_CASE("Search waveform accepts only 97 and 316") {
    auto fast = command::set_search_waveform(0, SEARCH_WAVEFORM_FAST);
    REQUIRE(fast.is_ok());
    CHECK(fast.value() == Message(msg_id::SEARCH_WAVEFORM, {0, 97, 0}));

    auto standard = command::set_search_waveform(1, SEARCH_WAVEFORM_STANDARD);
    REQUIRE(standard.is_ok());
    CHECK(standard.value() == Message(msg_id::SEARCH_WAVEFORM, {1, 0x3C, 0x01}));

    auto bad = command::set_search_waveform(0, 100);
    REQUIRE(bad.is_err());
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Control message layouts") {
    CHECK(command::reset_system().value() == Message(msg_id::SYSTEM_RESET, {0}));
    CHECK(command::open_channel(3).value() == Message(msg_id::OPEN_CHANNEL, {3}));
    CHECK(command::close_channel(3).value() == Message(msg_id::CLOSE_CHANNEL, {3}));
    CHECK(command::request_message(0, msg_id::CAPABILITIES).value() == Message(msg_id::REQUEST, {0, 0x54}));
    CHECK(command::open_rx_scan_mode().value() == Message(msg_id::OPEN_RX_SCAN, {0, 1}));
    CHECK(command::enable_extended_messages(true).value() == Message(msg_id::RX_EXT_MESGS_ENABLE, {0, 1}));
    CHECK(command::enable_extended_messages(false).value() == Message(msg_id::RX_EXT_MESGS_ENABLE, {0, 0}));
}

TEST_CASE("Channel ID list layouts") {
    auto add = command::add_channel_id(0, 0xBEEF, 0x78, 0x05, 2);
    REQUIRE(add.is_ok());
    CHECK(add.value() == Message(msg_id::ID_LIST_ADD, {0, 0xEF, 0xBE, 0x78, 0x05, 2}));

    auto cfg = command::config_id_list(0, 4, true);
    REQUIRE(cfg.is_ok());
    CHECK(cfg.value() == Message(msg_id::ID_LIST_CONFIG, {0, 4, 1}));
}

TEST_CASE("Data messages require exactly 8 bytes") {
    dp::Vector<u8> data = {1, 2, 3, 4, 5, 6, 7, 8};
    auto broadcast = command::broadcast_data(1, data);
    REQUIRE(broadcast.is_ok());
    CHECK(broadcast.value() == Message(msg_id::BROADCAST_DATA, {1, 1, 2, 3, 4, 5, 6, 7, 8}));

    auto ack = command::acknowledged_data(1, data);
    REQUIRE(ack.is_ok());
    CHECK(ack.value().id == msg_id::ACKNOWLEDGED_DATA);

    auto burst = command::burst_packet(0x22, data);
    REQUIRE(burst.is_ok());
    CHECK(burst.value().get_u8(0) == 0x22);

    dp::Vector<u8> seven = {1, 2, 3, 4, 5, 6, 7};
    dp::Vector<u8> nine = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    CHECK(command::broadcast_data(1, seven).is_err());
    CHECK(command::acknowledged_data(1, nine).is_err());
    CHECK(command::burst_packet(0, seven).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Raw messages are limited to 255 payload bytes") {
    CHECK(command::raw_message(0x99, dp::Vector<u8>(255, 0)).is_ok());
    auto big = command::raw_message(0x99, dp::Vector<u8>(256, 0));
    REQUIRE(big.is_err());
    CHECK(big.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("Commands route configuration to the queued channel and data to the timeslot channel") {
    MockDriver driver;
    NullSink sink;
    Session session(driver, sink, SessionConfig{}.idle_backoff(100));
    Commands commands(session);
    REQUIRE(session.start().is_ok());

    dp::Vector<u8> key = {0xB9, 0xA5, 0x21, 0xFB, 0xBD, 0x72, 0xC3, 0x45};
    REQUIRE(commands.reset_system().is_ok());
    REQUIRE(commands.set_network_key(0, key).is_ok());
    REQUIRE(commands.assign_channel(0, channel_type::BIDIRECTIONAL_SLAVE, 0).is_ok());
    REQUIRE(commands.set_channel_id(0, 0, 0x78, 0).is_ok());
    REQUIRE(commands.set_channel_period(0, 8070).is_ok());
    REQUIRE(commands.set_channel_rf_freq(0, 57).is_ok());
    REQUIRE(commands.open_channel(0).is_ok());
    REQUIRE(commands.send_acknowledged_data(0, {1, 2, 3, 4, 5, 6, 7, 8}).is_ok());

    REQUIRE(wait_until([&] { return driver.write_count() == 8; }));
    REQUIRE(session.stop().is_ok());

    // The acknowledged frame may overtake queued ones; queued frames keep their order
    dp::Vector<dp::Vector<u8>> queued;
    usize ack_frames = 0;
    for (const auto &frame : driver.written()) {
        if (frame[2] == msg_id::ACKNOWLEDGED_DATA)
            ack_frames++;
        else
            queued.push_back(frame);
    }
    REQUIRE(queued.size() == 7);
    CHECK(queued[0] == codec::encode(Message(msg_id::SYSTEM_RESET, {0})));
    CHECK(queued[1][2] == msg_id::NETWORK_KEY);
    CHECK(queued[2][2] == msg_id::ASSIGN_CHANNEL);
    CHECK(queued[6] == codec::encode(Message(msg_id::OPEN_CHANNEL, {0})));
    CHECK(ack_frames == 1);
}

TEST_CASE("Commands reject invalid input without writing") {
    MockDriver driver;
    NullSink sink;
    Session session(driver, sink, SessionConfig{}.idle_backoff(100));
    Commands commands(session);
    REQUIRE(session.start().is_ok());

    CHECK(commands.set_search_waveform(0, 200).error().code == ErrorCode::InvalidArgument);
    CHECK(commands.send_broadcast_data(0, {1, 2, 3}).error().code == ErrorCode::InvalidArgument);
    CHECK(commands.send_burst_transfer_packet(0, {1}).error().code == ErrorCode::InvalidArgument);
    CHECK(commands.write_message(0x10, dp::Vector<u8>(300, 0)).error().code == ErrorCode::InvalidArgument);

    REQUIRE(session.stop().is_ok());
    CHECK(driver.write_count() == 0);
}

TEST_CASE("Commands report NotRunning before start") {
    MockDriver driver;
    NullSink sink;
    Session session(driver, sink);
    Commands commands(session);

    CHECK(commands.open_channel(0).error().code == ErrorCode::NotRunning);
    CHECK(commands.send_broadcast_data(0, {1, 2, 3, 4, 5, 6, 7, 8}).error().code == ErrorCode::NotRunning);
    CHECK(driver.open_count() == 0);
}
