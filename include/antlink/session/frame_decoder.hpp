#pragma once

#include "../core/codec.hpp"
#include "../core/constants.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../util/channel.hpp"
#include "../util/signal.hpp"
#include "event_sink.hpp"
#include <atomic>
#include <datapod/datapod.hpp>

namespace antlink {
    namespace session {

        enum class DecoderState : u8 { SeekingSync, ReadingLength, Assembling, Validating, Publishing, Stopped };

        // ─── Byte stream to message state machine ────────────────────────────────────
        // Consumes the pump's byte channel one byte at a time and publishes each valid
        // frame to the inbound channel. Publishing never blocks: when the inbound
        // channel is full the message is dropped. Runs until the byte channel is
        // closed and drained.
        class FrameDecoder {
            Channel<u8> &input_;
            Channel<Message> &output_;
            EventSink &sink_;
            Signal *done_ = nullptr;

            std::atomic<DecoderState> state_{DecoderState::SeekingSync};
            std::atomic<u32> frames_decoded_{0};
            std::atomic<u32> integrity_drops_{0};
            std::atomic<u32> contention_drops_{0};

          public:
            FrameDecoder(Channel<u8> &input, Channel<Message> &output, EventSink &sink, Signal *done = nullptr)
                : input_(input), output_(output), sink_(sink), done_(done) {}

            FrameDecoder(const FrameDecoder &) = delete;
            FrameDecoder &operator=(const FrameDecoder &) = delete;

            void run() {
                sink_.record({SessionEventKind::DecoderStarted, 0, 0, ""});
                decode_loop();
                state_ = DecoderState::Stopped;
                output_.close();
                sink_.record({SessionEventKind::DecoderStopped, 0, 0, ""});
                if (done_)
                    done_->notify();
            }

            DecoderState state() const noexcept { return state_.load(); }
            u32 frames_decoded() const noexcept { return frames_decoded_.load(); }
            u32 integrity_drops() const noexcept { return integrity_drops_.load(); }
            u32 contention_drops() const noexcept { return contention_drops_.load(); }

          private:
            void decode_loop() {
                for (;;) {
                    state_ = DecoderState::SeekingSync;
                    auto sync = input_.recv();
                    if (!sync.has_value())
                        return;
                    if (*sync != SYNC)
                        continue;

                    state_ = DecoderState::ReadingLength;
                    auto length = input_.recv();
                    if (!length.has_value())
                        return;

                    // SYNC and LENGTH are in place; ID, payload and checksum follow
                    state_ = DecoderState::Assembling;
                    usize total = codec::frame_size(*length);
                    dp::Vector<u8> frame(total, 0);
                    frame[0] = SYNC;
                    frame[1] = *length;
                    for (usize i = 2; i < total; ++i) {
                        auto b = input_.recv();
                        if (!b.has_value())
                            return;
                        frame[i] = *b;
                    }

                    state_ = DecoderState::Validating;
                    auto decoded = codec::decode(frame);
                    if (!decoded.is_ok()) {
                        integrity_drops_++;
                        sink_.record({SessionEventKind::IntegrityDropped, frame[2], total, decoded.error().message});
                        continue;
                    }

                    frames_decoded_++;
                    state_ = DecoderState::Publishing;
                    Message msg = std::move(decoded.value());
                    MessageId id = msg.id;
                    if (output_.try_send(std::move(msg))) {
                        sink_.record({SessionEventKind::FrameDecoded, id, total, ""});
                    } else {
                        contention_drops_++;
                        sink_.record({SessionEventKind::ContentionDropped, id, total, "inbound channel full"});
                    }
                }
            }
        };

    } // namespace session
    using namespace session;
} // namespace antlink
