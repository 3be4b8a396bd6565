#include <antlink.hpp>
#include <echo/echo.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

using namespace antlink;

static std::atomic<bool> running{true};
void signal_handler(int) { running = false; }

// Continuous RX scan: reports every device heard on the ANT+ network.
// Usage: scan_receiver [/dev/ttyUSB0] [baud]
int main(int argc, char **argv) {
    echo::info("=== ANT+ Scan Receiver ===");

    SerialDriverConfig cfg;
    if (argc > 1)
        cfg.port(argv[1]);
    if (argc > 2) {
        auto baud = parse_baud(argv[2]);
        if (!baud.is_ok()) {
            echo::error(baud.error().message);
            return 1;
        }
        cfg.baud_rate(baud.value());
    }

    SerialDriver driver(cfg);
    Session session(driver, SessionConfig{}.inbound(128).idle_backoff(500));
    Commands ant(session);
    Dispatcher rx(session);

    rx.on_startup.subscribe([](const StartupInfo &s) {
        echo::info("Radio started, reason=0x", static_cast<u32>(s.reason));
    });

    rx.on_broadcast.subscribe([](const DataPayload &p) {
        if (p.device.has_value()) {
            echo::info("Device ", p.device->device_number, " type=", static_cast<u32>(p.device->device_type),
                       " page=", static_cast<u32>(p.data[0]));
        } else {
            echo::debug("Broadcast on channel ", static_cast<u32>(p.channel));
        }
    });

    bool channel_closed = false;
    rx.on_response.subscribe([&channel_closed](const ChannelResponse &r) {
        if (r.is_error()) {
            echo::warn("Command 0x", static_cast<u32>(r.message_id), " failed: code=0x", static_cast<u32>(r.code));
        }
        if (r.channel == 0 && r.is_event() && r.code == response_code::EVENT_CHANNEL_CLOSED)
            channel_closed = true;
    });

    auto started = session.start();
    if (!started.is_ok()) {
        echo::error("Cannot start session: ", started.error().message);
        return 1;
    }

    // ANT+ public network key
    dp::Vector<u8> key = {0xB9, 0xA5, 0x21, 0xFB, 0xBD, 0x72, 0xC3, 0x45};

    dp::Vector<Result<void>> setup;
    setup.push_back(ant.reset_system());
    setup.push_back(ant.set_network_key(0, key));
    setup.push_back(ant.assign_channel(0, channel_type::SLAVE_RECEIVE_ONLY, 0));
    setup.push_back(ant.set_channel_id(0, 0, 0, 0));
    setup.push_back(ant.set_channel_rf_freq(0, 57));
    setup.push_back(ant.enable_extended_messages(true));
    setup.push_back(ant.open_rx_scan_mode());
    for (const auto &r : setup) {
        if (!r.is_ok()) {
            echo::error("Setup failed: ", r.error().message);
            return 1;
        }
    }

    signal(SIGINT, signal_handler);
    echo::info("Scanning... (Ctrl+C to stop)");

    while (running) {
        rx.poll();
        if (auto fault = session.fault()) {
            echo::error("Transport fault: ", fault->message);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // stop() discards whatever the pump has not written, so let the close reach the radio first
    if (!session.fault().has_value()) {
        auto closed = ant.close_channel(0);
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
    auto stats = session.stats();
    echo::info("Decoded ", stats.frames_decoded, " frames, dropped ", stats.integrity_drops, " corrupt and ",
               stats.contention_drops, " undelivered");
    if (!stopped.is_ok()) {
        echo::error("Session ended with: ", stopped.error().message);
        return 1;
    }
    return 0;
}
