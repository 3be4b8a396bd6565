#include <doctest/doctest.h>
#include "mock_driver.hpp"
#include <antlink/core/codec.hpp>
#include <antlink/session/io_pump.hpp>
#include <thread>

using namespace antlink;
using antlink::test::MockDriver;
using antlink::test::wait_until;

namespace {

    struct PumpRig {
        MockDriver driver;
        Channel<Message> queued{8};
        Channel<Message> timeslot{8};
        Channel<u8> bytes{256};
        Signal shutdown;
        RecordingSink sink;
        Signal done;
        IoPump pump{driver, queued, timeslot, bytes, shutdown, sink, &done};

        void stop(std::thread &worker) {
            shutdown.notify();
            worker.join();
        }
    };

} // namespace

TEST_CASE("Pump writes queued messages in enqueue order") {
    PumpRig rig;
    Message m1(msg_id::ASSIGN_CHANNEL, {0x00, 0x00, 0x00});
    Message m2(msg_id::CHANNEL_MESG_PERIOD, {0x00, 0x86, 0x1F});
    Message m3(msg_id::OPEN_CHANNEL, {0x00});
    rig.queued.send(m1);
    rig.queued.send(m2);
    rig.queued.send(m3);

    std::thread worker([&] { rig.pump.run(); });
    REQUIRE(wait_until([&] { return rig.driver.write_count() == 3; }));
    rig.stop(worker);

    auto written = rig.driver.written();
    REQUIRE(written.size() == 3);
    CHECK(written[0] == codec::encode(m1));
    CHECK(written[1] == codec::encode(m2));
    CHECK(written[2] == codec::encode(m3));
    CHECK(rig.pump.frames_written() == 3);
    CHECK(rig.sink.count(SessionEventKind::FrameWritten) == 3);
}

TEST_CASE("Pump services the timeslot channel before the queued channel") {
    PumpRig rig;
    Message config(msg_id::CHANNEL_RADIO_FREQ, {0x00, 57});
    Message ack(msg_id::ACKNOWLEDGED_DATA, {0x00, 1, 2, 3, 4, 5, 6, 7, 8});
    Message burst(msg_id::BURST_DATA, {0x80, 1, 2, 3, 4, 5, 6, 7, 8});
    rig.queued.send(config);
    rig.timeslot.send(ack);
    rig.timeslot.send(burst);

    std::thread worker([&] { rig.pump.run(); });
    REQUIRE(wait_until([&] { return rig.driver.write_count() == 3; }));
    rig.stop(worker);

    auto written = rig.driver.written();
    REQUIRE(written.size() == 3);
    CHECK(written[0] == codec::encode(ack));
    CHECK(written[1] == codec::encode(burst));
    CHECK(written[2] == codec::encode(config));
}

TEST_CASE("Pump forwards every byte it reads in order") {
    PumpRig rig;
    rig.driver.inject({SYNC, 0x01});
    rig.driver.inject({0x6F, 0x20, static_cast<u8>(SYNC ^ 0x01 ^ 0x6F ^ 0x20)});

    std::thread worker([&] { rig.pump.run(); });
    REQUIRE(wait_until([&] { return rig.pump.bytes_read() == 5; }));
    rig.stop(worker);

    dp::Vector<u8> forwarded;
    while (auto b = rig.bytes.try_recv())
        forwarded.push_back(*b);
    REQUIRE(forwarded.size() == 5);
    CHECK(forwarded[0] == SYNC);
    CHECK(forwarded[2] == 0x6F);
    CHECK(forwarded[4] == (SYNC ^ 0x01 ^ 0x6F ^ 0x20));
}

TEST_CASE("Pump sizes its scratch buffer from the driver") {
    MockDriver driver(17);
    Channel<Message> queued(1), timeslot(1);
    Channel<u8> bytes(1);
    Signal shutdown;
    NullSink sink;
    IoPump pump(driver, queued, timeslot, bytes, shutdown, sink);
    CHECK(pump.buffer_size() == 17);
}

TEST_CASE("Pump exits without writing when shutdown is already requested") {
    PumpRig rig;
    rig.queued.send(Message(msg_id::OPEN_CHANNEL, {0x00}));
    rig.shutdown.notify();

    rig.pump.run();

    CHECK(rig.driver.write_count() == 0);
    CHECK(rig.driver.close_count() == 1);
    CHECK(rig.bytes.is_closed());
    CHECK(rig.queued.is_closed());
    CHECK(rig.timeslot.is_closed());
    CHECK(rig.done.is_set());
    CHECK_FALSE(rig.pump.fault().has_value());
    CHECK(rig.sink.count(SessionEventKind::PumpStopped) == 1);
}

TEST_CASE("Pump stops on a failed write") {
    PumpRig rig;
    rig.driver.fail_writes(true);
    rig.queued.send(Message(msg_id::OPEN_CHANNEL, {0x00}));
    rig.queued.send(Message(msg_id::CLOSE_CHANNEL, {0x00}));

    rig.pump.run();

    REQUIRE(rig.pump.fault().has_value());
    CHECK(rig.pump.fault()->code == ErrorCode::TransportError);
    CHECK(rig.pump.frames_written() == 0);
    CHECK(rig.sink.count(SessionEventKind::WriteFailed) == 1);
    CHECK(rig.queued.is_closed());
    CHECK(rig.bytes.is_closed());
    CHECK(rig.done.is_set());
}

TEST_CASE("Pump treats a short write as fatal") {
    PumpRig rig;
    rig.driver.short_writes(true);
    rig.timeslot.send(Message(msg_id::ACKNOWLEDGED_DATA, {0x00, 1, 2, 3, 4, 5, 6, 7, 8}));

    rig.pump.run();

    REQUIRE(rig.pump.fault().has_value());
    CHECK(rig.pump.fault()->code == ErrorCode::TransportError);
    CHECK(rig.driver.write_count() == 1);
    CHECK(rig.timeslot.is_closed());
    CHECK(rig.driver.close_count() == 1);
}

TEST_CASE("Closed outbound channels reject senders after the pump stops") {
    PumpRig rig;
    rig.shutdown.notify();
    rig.pump.run();

    CHECK_FALSE(rig.queued.send(Message(msg_id::OPEN_CHANNEL, {0x00})));
    CHECK_FALSE(rig.timeslot.try_send(Message(msg_id::OPEN_CHANNEL, {0x00})));
}
