#pragma once

#include "../core/constants.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../session/session.hpp"
#include "../util/event.hpp"
#include "responses.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace antlink {
    namespace protocol {

        // ─── Inbound dispatcher (consumer thread) ────────────────────────────────────
        // Drains decoded messages from a session and emits them as typed events.
        // Burst packets are additionally reassembled per channel: sequence 0 opens a
        // transfer, the last-packet flag completes it, a counter gap discards it.
        //
        // Usage:
        //   Dispatcher rx(session);
        //   rx.on_broadcast.subscribe([](const DataPayload &p) { ... });
        //   while (running) rx.poll();
        class Dispatcher {
            struct BurstAssembly {
                dp::Vector<u8> data;
                u8 last_counter = 0;
            };

            Session *session_ = nullptr;
            dp::Map<ChannelNumber, BurstAssembly> bursts_;

          public:
            Dispatcher() = default;
            explicit Dispatcher(Session &session) : session_(&session) {}

            // Dispatch up to `max` waiting messages (0 = all waiting). Never blocks.
            usize poll(usize max = 0) {
                if (!session_)
                    return 0;
                usize handled = 0;
                while (max == 0 || handled < max) {
                    auto msg = session_->try_receive();
                    if (!msg.has_value())
                        break;
                    dispatch(*msg);
                    handled++;
                }
                return handled;
            }

            void dispatch(const Message &msg) {
                on_message.emit(msg);

                switch (msg.id) {
                case msg_id::RESPONSE_EVENT:
                    if (auto r = ChannelResponse::decode(msg))
                        handle_response(*r);
                    break;
                case msg_id::BROADCAST_DATA:
                    if (auto p = DataPayload::decode(msg))
                        on_broadcast.emit(*p);
                    break;
                case msg_id::ACKNOWLEDGED_DATA:
                    if (auto p = DataPayload::decode(msg))
                        on_acknowledged.emit(*p);
                    break;
                case msg_id::BURST_DATA:
                    if (auto p = DataPayload::decode(msg)) {
                        on_burst.emit(*p);
                        assemble_burst(*p);
                    }
                    break;
                case msg_id::CHANNEL_STATUS:
                    if (auto s = ChannelStatus::decode(msg))
                        on_channel_status.emit(*s);
                    break;
                case msg_id::CHANNEL_ID:
                    if (auto c = ChannelIdInfo::decode(msg))
                        on_channel_id.emit(*c);
                    break;
                case msg_id::CAPABILITIES:
                    if (auto c = Capabilities::decode(msg))
                        on_capabilities.emit(*c);
                    break;
                case msg_id::VERSION:
                    if (auto v = VersionInfo::decode(msg))
                        on_version.emit(*v);
                    break;
                case msg_id::STARTUP:
                    if (auto s = StartupInfo::decode(msg))
                        on_startup.emit(*s);
                    break;
                case msg_id::SERIAL_NUMBER:
                    if (auto s = SerialNumber::decode(msg))
                        on_serial_number.emit(*s);
                    break;
                default:
                    echo::category("antlink.dispatcher").trace("unhandled message id=", static_cast<u32>(msg.id));
                    break;
                }
            }

            bool burst_in_progress(ChannelNumber channel) const { return bursts_.find(channel) != bursts_.end(); }

            // ─── Events ──────────────────────────────────────────────────────────────
            Event<const Message &> on_message;
            Event<const ChannelResponse &> on_response;
            Event<const DataPayload &> on_broadcast;
            Event<const DataPayload &> on_acknowledged;
            Event<const DataPayload &> on_burst;
            Event<ChannelNumber, const dp::Vector<u8> &> on_burst_complete;
            Event<const ChannelStatus &> on_channel_status;
            Event<const ChannelIdInfo &> on_channel_id;
            Event<const Capabilities &> on_capabilities;
            Event<const VersionInfo &> on_version;
            Event<const StartupInfo &> on_startup;
            Event<const SerialNumber &> on_serial_number;

          private:
            void handle_response(const ChannelResponse &r) {
                if (r.is_event() && r.code == response_code::EVENT_TRANSFER_RX_FAILED) {
                    auto it = bursts_.find(r.channel);
                    if (it != bursts_.end()) {
                        echo::category("antlink.dispatcher")
                            .debug("burst rx failed on channel ", static_cast<u32>(r.channel));
                        bursts_.erase(it);
                    }
                }
                on_response.emit(r);
            }

            void assemble_burst(const DataPayload &p) {
                u8 counter = p.packet_counter();
                auto it = bursts_.find(p.channel);

                if (counter == 0) {
                    // First packet restarts any transfer left open on this channel
                    BurstAssembly fresh;
                    fresh.data.assign(p.data.begin(), p.data.end());
                    bursts_[p.channel] = std::move(fresh);
                } else {
                    if (it == bursts_.end()) {
                        echo::category("antlink.dispatcher")
                            .debug("burst packet without start on channel ", static_cast<u32>(p.channel));
                        return;
                    }
                    u8 expected = it->second.last_counter == 3 ? 1 : static_cast<u8>(it->second.last_counter + 1);
                    if (counter != expected) {
                        echo::category("antlink.dispatcher")
                            .debug("burst sequence gap on channel ", static_cast<u32>(p.channel), ": expected ",
                                   static_cast<u32>(expected), " got ", static_cast<u32>(counter));
                        bursts_.erase(it);
                        return;
                    }
                    it->second.data.insert(it->second.data.end(), p.data.begin(), p.data.end());
                    it->second.last_counter = counter;
                }

                if (p.last_packet()) {
                    auto done = bursts_.find(p.channel);
                    dp::Vector<u8> bytes = std::move(done->second.data);
                    bursts_.erase(done);
                    on_burst_complete.emit(p.channel, bytes);
                }
            }
        };

    } // namespace protocol
    using namespace protocol;
} // namespace antlink
