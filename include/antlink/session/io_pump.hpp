#pragma once

#include "../core/codec.hpp"
#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../driver/driver.hpp"
#include "../util/channel.hpp"
#include "../util/signal.hpp"
#include "event_sink.hpp"
#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>
#include <string>
#include <thread>

namespace antlink {
    namespace session {

        // ─── Single point of contact with the driver ─────────────────────────────────
        // Each iteration takes exactly one action, in priority order:
        //   1. shutdown requested  -> tear down and exit
        //   2. timeslot message    -> encode and write
        //   3. queued message      -> encode and write
        //   4. otherwise           -> non-blocking read, forward bytes to the decoder
        // A failed or short write is fatal: the pump records the error and tears down.
        class IoPump {
            Driver &driver_;
            Channel<Message> &queued_;
            Channel<Message> &timeslot_;
            Channel<u8> &bytes_;
            Signal &shutdown_;
            EventSink &sink_;
            Signal *done_ = nullptr;

            dp::Vector<u8> buffer_;
            u32 idle_backoff_us_ = 0;
            dp::Optional<Error> fault_;

            std::atomic<u64> bytes_read_{0};
            std::atomic<u32> frames_written_{0};

          public:
            IoPump(Driver &driver, Channel<Message> &queued, Channel<Message> &timeslot, Channel<u8> &bytes,
                   Signal &shutdown, EventSink &sink, Signal *done = nullptr, u32 idle_backoff_us = 0)
                : driver_(driver), queued_(queued), timeslot_(timeslot), bytes_(bytes), shutdown_(shutdown),
                  sink_(sink), done_(done), buffer_(driver.buffer_size(), 0), idle_backoff_us_(idle_backoff_us) {}

            IoPump(const IoPump &) = delete;
            IoPump &operator=(const IoPump &) = delete;

            void run() {
                sink_.record({SessionEventKind::PumpStarted, 0, 0, ""});
                pump_loop();
                teardown();
            }

            // Set only when the pump stopped on a write failure; read after completion
            const dp::Optional<Error> &fault() const noexcept { return fault_; }

            u64 bytes_read() const noexcept { return bytes_read_.load(); }
            u32 frames_written() const noexcept { return frames_written_.load(); }
            usize buffer_size() const noexcept { return buffer_.size(); }

          private:
            void pump_loop() {
                for (;;) {
                    if (shutdown_.is_set())
                        return;

                    if (auto msg = timeslot_.try_recv()) {
                        if (!write_message(*msg))
                            return;
                        continue;
                    }

                    if (auto msg = queued_.try_recv()) {
                        if (!write_message(*msg))
                            return;
                        continue;
                    }

                    poll_read();
                }
            }

            bool write_message(const Message &msg) {
                auto frame = codec::encode(msg);
                auto result = driver_.write(frame.data(), frame.size());
                if (!result.is_ok()) {
                    fault_ = Error::transport("write failed: " + result.error().message);
                } else if (result.value() != frame.size()) {
                    fault_ = Error::transport("short write: " + dp::String(std::to_string(result.value())) + " of " +
                                              dp::String(std::to_string(frame.size())) + " bytes");
                }
                if (fault_.has_value()) {
                    sink_.record({SessionEventKind::WriteFailed, msg.id, frame.size(), fault_->message});
                    return false;
                }
                frames_written_++;
                sink_.record({SessionEventKind::FrameWritten, msg.id, frame.size(), ""});
                return true;
            }

            void poll_read() {
                usize n = 0;
                if (!buffer_.empty()) {
                    auto result = driver_.read(buffer_.data(), buffer_.size());
                    // Read errors mean "nothing available"
                    if (result.is_ok())
                        n = result.value() < buffer_.size() ? result.value() : buffer_.size();
                }

                for (usize i = 0; i < n; ++i) {
                    if (!bytes_.send(buffer_[i]))
                        break;
                }
                bytes_read_ += n;

                if (n == 0 && idle_backoff_us_ > 0)
                    std::this_thread::sleep_for(std::chrono::microseconds(idle_backoff_us_));
            }

            void teardown() {
                driver_.close();
                bytes_.close();
                queued_.close();
                timeslot_.close();
                sink_.record({SessionEventKind::PumpStopped, 0, 0, fault_.has_value() ? fault_->message : dp::String()});
                if (done_)
                    done_->notify();
            }
        };

    } // namespace session
    using namespace session;
} // namespace antlink
