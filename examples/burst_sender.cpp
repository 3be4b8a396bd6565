#include <antlink.hpp>
#include <echo/echo.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace antlink;

static std::atomic<bool> running{true};
void signal_handler(int) { running = false; }

// Opens a master channel and sends a 48-byte burst once per second.
// Usage: burst_sender [/dev/ttyUSB0]
int main(int argc, char **argv) {
    echo::info("=== ANT Burst Sender ===");

    SerialDriver driver(SerialDriverConfig{}.port(argc > 1 ? argv[1] : "/dev/ttyUSB0"));
    Session session(driver, SessionConfig{}.idle_backoff(500));
    Commands ant(session);
    Dispatcher rx(session);

    constexpr ChannelNumber channel = 0;

    bool channel_closed = false;
    rx.on_response.subscribe([&channel_closed](const ChannelResponse &r) {
        if (!r.is_event())
            return;
        switch (r.code) {
        case response_code::EVENT_CHANNEL_CLOSED:
            if (r.channel == channel)
                channel_closed = true;
            break;
        case response_code::EVENT_TRANSFER_TX_COMPLETED:
            echo::info("Burst delivered on channel ", static_cast<u32>(r.channel));
            break;
        case response_code::EVENT_TRANSFER_TX_FAILED:
            echo::warn("Burst failed on channel ", static_cast<u32>(r.channel));
            break;
        default:
            break;
        }
    });

    auto started = session.start();
    if (!started.is_ok()) {
        echo::error("Cannot start session: ", started.error().message);
        return 1;
    }

    dp::Vector<u8> key = {0xB9, 0xA5, 0x21, 0xFB, 0xBD, 0x72, 0xC3, 0x45};
    dp::Vector<Result<void>> setup;
    setup.push_back(ant.reset_system());
    setup.push_back(ant.set_network_key(0, key));
    setup.push_back(ant.assign_channel(channel, channel_type::BIDIRECTIONAL_MASTER, 0));
    setup.push_back(ant.set_channel_id(channel, 4242, 0x01, 0x01));
    setup.push_back(ant.set_channel_period(channel, 8192));
    setup.push_back(ant.set_channel_rf_freq(channel, 66));
    setup.push_back(ant.set_transmit_power(3));
    setup.push_back(ant.open_channel(channel));
    for (const auto &r : setup) {
        if (!r.is_ok()) {
            echo::error("Setup failed: ", r.error().message);
            return 1;
        }
    }

    signal(SIGINT, signal_handler);

    u8 counter = 0;
    auto next_send = std::chrono::steady_clock::now();
    while (running) {
        rx.poll();

        if (std::chrono::steady_clock::now() >= next_send) {
            dp::Vector<u8> payload(48);
            for (usize i = 0; i < payload.size(); ++i)
                payload[i] = static_cast<u8>(counter + i);

            auto sent = ant.send_burst(channel, payload);
            if (!sent.is_ok()) {
                echo::error("Burst rejected: ", sent.error().message);
                break;
            }
            echo::debug("Queued burst #", static_cast<u32>(counter));
            counter++;
            next_send += std::chrono::seconds(1);
        }

        if (session.fault().has_value())
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // stop() discards whatever the pump has not written, so let the close reach the radio first
    if (!session.fault().has_value()) {
        auto closed = ant.close_channel(channel);
        if (closed.is_ok()) {
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (!channel_closed && std::chrono::steady_clock::now() < deadline) {
                rx.poll();
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!channel_closed)
                echo::warn("No close confirmation from the radio");
        } else {
            echo::warn("Close channel: ", closed.error().message);
        }
    }

    auto stopped = session.stop();
    if (!stopped.is_ok()) {
        echo::error("Session ended with: ", stopped.error().message);
        return 1;
    }
    auto stats = session.stats();
    echo::info("Frames written: ", stats.frames_written, ", discarded at stop: ", stats.outbound_discarded);
    return 0;
}
