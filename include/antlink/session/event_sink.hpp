#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <mutex>

namespace antlink {
    namespace session {

        enum class SessionEventKind : u8 {
            Started,
            OpenFailed,
            Stopped,
            PumpStarted,
            PumpStopped,
            DecoderStarted,
            DecoderStopped,
            FrameWritten,
            WriteFailed,
            FrameDecoded,
            IntegrityDropped,
            ContentionDropped,
        };

        inline const char *to_string(SessionEventKind kind) noexcept {
            switch (kind) {
            case SessionEventKind::Started:
                return "started";
            case SessionEventKind::OpenFailed:
                return "open_failed";
            case SessionEventKind::Stopped:
                return "stopped";
            case SessionEventKind::PumpStarted:
                return "pump_started";
            case SessionEventKind::PumpStopped:
                return "pump_stopped";
            case SessionEventKind::DecoderStarted:
                return "decoder_started";
            case SessionEventKind::DecoderStopped:
                return "decoder_stopped";
            case SessionEventKind::FrameWritten:
                return "frame_written";
            case SessionEventKind::WriteFailed:
                return "write_failed";
            case SessionEventKind::FrameDecoded:
                return "frame_decoded";
            case SessionEventKind::IntegrityDropped:
                return "integrity_dropped";
            case SessionEventKind::ContentionDropped:
                return "contention_dropped";
            }
            return "unknown";
        }

        struct SessionEvent {
            SessionEventKind kind = SessionEventKind::Started;
            MessageId message_id = 0;
            usize size = 0;
            dp::String detail;
        };

        // ─── Observability collaborator injected into a Session ──────────────────────
        // record() is called from the I/O pump and the frame decoder concurrently.
        class EventSink {
          public:
            virtual ~EventSink() = default;
            virtual void record(const SessionEvent &event) = 0;
        };

        class NullSink : public EventSink {
          public:
            void record(const SessionEvent &) override {}
        };

        // Forwards events to an echo category; per-frame traffic logs at trace level
        class EchoSink : public EventSink {
            dp::String category_;

          public:
            explicit EchoSink(dp::String category = "antlink.session") : category_(std::move(category)) {}

            void record(const SessionEvent &event) override {
                auto log = echo::category(category_.c_str());
                switch (event.kind) {
                case SessionEventKind::OpenFailed:
                case SessionEventKind::WriteFailed:
                    log.error(to_string(event.kind), ": ", event.detail);
                    break;
                case SessionEventKind::IntegrityDropped:
                case SessionEventKind::ContentionDropped:
                    log.debug(to_string(event.kind), ": id=", static_cast<u32>(event.message_id),
                              " size=", event.size, " ", event.detail);
                    break;
                case SessionEventKind::FrameWritten:
                case SessionEventKind::FrameDecoded:
                    log.trace(to_string(event.kind), ": id=", static_cast<u32>(event.message_id),
                              " size=", event.size);
                    break;
                default:
                    if (event.detail.empty())
                        log.info(to_string(event.kind));
                    else
                        log.info(to_string(event.kind), ": ", event.detail);
                    break;
                }
            }
        };

        // Keeps every event; used to observe a running session from tests
        class RecordingSink : public EventSink {
            mutable std::mutex mutex_;
            dp::Vector<SessionEvent> events_;

          public:
            void record(const SessionEvent &event) override {
                std::lock_guard<std::mutex> lock(mutex_);
                events_.push_back(event);
            }

            dp::Vector<SessionEvent> events() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return events_;
            }

            usize count(SessionEventKind kind) const {
                std::lock_guard<std::mutex> lock(mutex_);
                usize n = 0;
                for (const auto &e : events_) {
                    if (e.kind == kind)
                        n++;
                }
                return n;
            }

            void clear() {
                std::lock_guard<std::mutex> lock(mutex_);
                events_.clear();
            }
        };

    } // namespace session
    using namespace session;
} // namespace antlink
