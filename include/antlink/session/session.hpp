#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../driver/driver.hpp"
#include "../util/channel.hpp"
#include "../util/signal.hpp"
#include "event_sink.hpp"
#include "frame_decoder.hpp"
#include "io_pump.hpp"
#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>
#include <memory>
#include <thread>

namespace antlink {
    namespace session {

        // ─── Session configuration ───────────────────────────────────────────────────
        struct SessionConfig {
            usize outbound_capacity = 16; // messages per outbound channel
            usize inbound_capacity = 64;  // decoded messages awaiting the consumer
            usize byte_capacity = 512;    // bytes between pump and decoder
            bool spawn_on_open_failure = false;
            u32 idle_backoff_us = 0; // sleep after an empty read; 0 = busy-poll

            // Fluent API
            SessionConfig &outbound(usize n) {
                outbound_capacity = n;
                return *this;
            }
            SessionConfig &inbound(usize n) {
                inbound_capacity = n;
                return *this;
            }
            SessionConfig &bytes(usize n) {
                byte_capacity = n;
                return *this;
            }
            SessionConfig &spawn_on_failure(bool enable) {
                spawn_on_open_failure = enable;
                return *this;
            }
            SessionConfig &idle_backoff(u32 us) {
                idle_backoff_us = us;
                return *this;
            }
        };

        struct SessionStats {
            u64 bytes_read = 0;
            u32 frames_written = 0;
            u32 frames_decoded = 0;
            u32 integrity_drops = 0;
            u32 contention_drops = 0;
            u32 outbound_discarded = 0; // left in the outbound channels when the pump stopped
        };

        // ─── Session: owns one driver and the two execution units ────────────────────
        // start() opens the driver and spawns the I/O pump and frame decoder threads;
        // stop() signals shutdown and returns once both have finished. start(), stop(),
        // stats() and fault() belong to the controlling thread. enqueue*() and
        // receive*() may be called from any thread while the session runs.
        class Session {
            Driver &driver_;
            EchoSink default_sink_;
            EventSink &sink_;
            SessionConfig config_;

            Channel<Message> queued_;
            Channel<Message> timeslot_;
            Channel<Message> inbound_;
            Channel<u8> bytes_;

            Signal shutdown_;
            Signal pump_done_;
            Signal decoder_done_;

            std::unique_ptr<IoPump> pump_;
            std::unique_ptr<FrameDecoder> decoder_;
            std::thread pump_thread_;
            std::thread decoder_thread_;

            std::atomic<bool> running_{false};
            dp::Optional<Error> fault_;
            SessionStats last_stats_;

          public:
            explicit Session(Driver &driver, SessionConfig config = {})
                : driver_(driver), sink_(default_sink_), config_(config), queued_(config.outbound_capacity),
                  timeslot_(config.outbound_capacity), inbound_(config.inbound_capacity),
                  bytes_(config.byte_capacity) {}

            Session(Driver &driver, EventSink &sink, SessionConfig config = {})
                : driver_(driver), sink_(sink), config_(config), queued_(config.outbound_capacity),
                  timeslot_(config.outbound_capacity), inbound_(config.inbound_capacity),
                  bytes_(config.byte_capacity) {}

            Session(const Session &) = delete;
            Session &operator=(const Session &) = delete;

            ~Session() {
                if (running_)
                    halt();
            }

            // ─── Lifecycle ───────────────────────────────────────────────────────────
            Result<void> start() {
                if (running_) {
                    return Result<void>::err(Error::invalid_state("session already running"));
                }

                dp::Optional<Error> open_error;
                auto opened = driver_.open();
                if (!opened.is_ok()) {
                    open_error = Error::transport("open failed: " + opened.error().message);
                    sink_.record({SessionEventKind::OpenFailed, 0, 0, open_error->message});
                    if (!config_.spawn_on_open_failure)
                        return Result<void>::err(*open_error);
                }

                queued_.reopen();
                timeslot_.reopen();
                inbound_.reopen();
                bytes_.reopen();
                shutdown_.reset();
                pump_done_.reset();
                decoder_done_.reset();
                fault_ = dp::nullopt;
                last_stats_ = {};

                pump_ = std::make_unique<IoPump>(driver_, queued_, timeslot_, bytes_, shutdown_, sink_, &pump_done_,
                                                 config_.idle_backoff_us);
                decoder_ = std::make_unique<FrameDecoder>(bytes_, inbound_, sink_, &decoder_done_);

                pump_thread_ = std::thread([this] { pump_->run(); });
                decoder_thread_ = std::thread([this] { decoder_->run(); });
                running_ = true;
                sink_.record({SessionEventKind::Started, 0, 0, ""});

                if (open_error.has_value())
                    return Result<void>::err(*open_error);
                return {};
            }

            // Shutdown takes priority over outbound traffic: messages still waiting in
            // either outbound channel when stop() is called are discarded, even though
            // their enqueue succeeded. stats().outbound_discarded reports how many.
            // Callers that need a command on the air (close_channel before exit) must
            // wait for its response or for frames_written to advance first.
            Result<void> stop() {
                if (!running_) {
                    return Result<void>::err(Error::invalid_state("session not running"));
                }
                halt();
                if (fault_.has_value())
                    return Result<void>::err(*fault_);
                return {};
            }

            bool is_running() const noexcept { return running_.load(); }

            // ─── Outbound ────────────────────────────────────────────────────────────
            // Configuration and control traffic
            Result<void> enqueue(Message msg) { return send_on(queued_, std::move(msg)); }

            // Acknowledged and burst data, serviced ahead of the queued channel
            Result<void> enqueue_timeslot(Message msg) { return send_on(timeslot_, std::move(msg)); }

            // ─── Inbound ─────────────────────────────────────────────────────────────
            dp::Optional<Message> try_receive() { return inbound_.try_recv(); }

            template <typename Rep, typename Period>
            dp::Optional<Message> receive_for(std::chrono::duration<Rep, Period> timeout) {
                if (!running_)
                    return inbound_.try_recv();
                return inbound_.recv_for(timeout);
            }

            // ─── Diagnostics ─────────────────────────────────────────────────────────
            // Fatal pump error of the current or last run. Set once the pump has
            // stopped on a write failure.
            dp::Optional<Error> fault() const {
                if (pump_ && pump_done_.is_set())
                    return pump_->fault();
                return fault_;
            }

            SessionStats stats() const {
                if (pump_ && decoder_)
                    return collect_stats();
                return last_stats_;
            }

            const SessionConfig &config() const noexcept { return config_; }

          private:
            void halt() {
                shutdown_.notify();

                // The decoder only finishes after the pump closes the byte channel
                pump_done_.wait();
                decoder_done_.wait();
                pump_thread_.join();
                decoder_thread_.join();

                last_stats_ = collect_stats();
                // The pump closed both outbound channels; nothing can be added any more
                last_stats_.outbound_discarded = static_cast<u32>(queued_.size() + timeslot_.size());
                queued_.clear();
                timeslot_.clear();
                fault_ = pump_->fault();
                pump_.reset();
                decoder_.reset();
                inbound_.clear();

                running_ = false;
                sink_.record({SessionEventKind::Stopped, 0, 0, fault_.has_value() ? fault_->message : dp::String()});
            }

            Result<void> send_on(Channel<Message> &channel, Message msg) {
                if (!running_) {
                    return Result<void>::err(Error::not_running());
                }
                if (msg.data.size() > MAX_PAYLOAD) {
                    return Result<void>::err(Error::invalid_argument("payload exceeds 255 bytes"));
                }
                if (!channel.send(std::move(msg))) {
                    return Result<void>::err(Error::not_running());
                }
                return {};
            }

            SessionStats collect_stats() const {
                SessionStats s;
                s.bytes_read = pump_->bytes_read();
                s.frames_written = pump_->frames_written();
                s.frames_decoded = decoder_->frames_decoded();
                s.integrity_drops = decoder_->integrity_drops();
                s.contention_drops = decoder_->contention_drops();
                return s;
            }
        };

    } // namespace session
    using namespace session;
} // namespace antlink
