#pragma once

#include "../core/constants.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace antlink {
    namespace protocol {

        // ─── Channel response / RF event (0x40) ──────────────────────────────────────
        struct ChannelResponse {
            ChannelNumber channel = 0;
            MessageId message_id = 0; // 0x01 for RF events, else the message responded to
            u8 code = response_code::NO_ERROR;

            bool is_event() const noexcept { return message_id == msg_id::EVENT; }
            bool is_error() const noexcept { return !is_event() && code != response_code::NO_ERROR; }

            static dp::Optional<ChannelResponse> decode(const Message &msg) {
                if (msg.id != msg_id::RESPONSE_EVENT || msg.size() < 3)
                    return dp::nullopt;
                ChannelResponse r;
                r.channel = msg.get_u8(0);
                r.message_id = msg.get_u8(1);
                r.code = msg.get_u8(2);
                return r;
            }
        };

        // ─── Channel status (0x52) ───────────────────────────────────────────────────
        struct ChannelStatus {
            ChannelNumber channel = 0;
            ChannelState state = ChannelState::Unassigned;
            NetworkNumber network = 0;
            u8 channel_type = 0;

            static dp::Optional<ChannelStatus> decode(const Message &msg) {
                if (msg.id != msg_id::CHANNEL_STATUS || msg.size() < 2)
                    return dp::nullopt;
                u8 status = msg.get_u8(1);
                ChannelStatus s;
                s.channel = msg.get_u8(0);
                s.state = static_cast<ChannelState>(status & 0x03);
                s.network = static_cast<NetworkNumber>((status >> 2) & 0x03);
                s.channel_type = status & 0xF0;
                return s;
            }
        };

        // ─── Channel ID (0x51) ───────────────────────────────────────────────────────
        struct ChannelIdInfo {
            ChannelNumber channel = 0;
            u16 device_number = 0;
            u8 device_type = 0; // bit 7 is the pairing bit
            u8 transmission_type = 0;

            bool pairing() const noexcept { return (device_type & 0x80) != 0; }

            static dp::Optional<ChannelIdInfo> decode(const Message &msg) {
                if (msg.id != msg_id::CHANNEL_ID || msg.size() < 5)
                    return dp::nullopt;
                ChannelIdInfo info;
                info.channel = msg.get_u8(0);
                info.device_number = msg.get_u16_le(1);
                info.device_type = msg.get_u8(3);
                info.transmission_type = msg.get_u8(4);
                return info;
            }
        };

        // ─── Capabilities (0x54) ─────────────────────────────────────────────────────
        struct Capabilities {
            u8 max_channels = 0;
            u8 max_networks = 0;
            u8 standard_options = 0;
            u8 advanced_options = 0;
            dp::Optional<u8> advanced_options2;

            static dp::Optional<Capabilities> decode(const Message &msg) {
                if (msg.id != msg_id::CAPABILITIES || msg.size() < 4)
                    return dp::nullopt;
                Capabilities caps;
                caps.max_channels = msg.get_u8(0);
                caps.max_networks = msg.get_u8(1);
                caps.standard_options = msg.get_u8(2);
                caps.advanced_options = msg.get_u8(3);
                if (msg.size() >= 5)
                    caps.advanced_options2 = msg.get_u8(4);
                return caps;
            }
        };

        // ─── Version string (0x3E), NUL terminated ───────────────────────────────────
        struct VersionInfo {
            dp::String version;

            static dp::Optional<VersionInfo> decode(const Message &msg) {
                if (msg.id != msg_id::VERSION)
                    return dp::nullopt;
                VersionInfo v;
                for (auto c : msg.data) {
                    if (c == 0)
                        break;
                    v.version += static_cast<char>(c);
                }
                return v;
            }
        };

        // ─── Startup message (0x6F) ──────────────────────────────────────────────────
        namespace startup_reason {
            inline constexpr u8 POWER_ON = 0x00;
            inline constexpr u8 HARDWARE_LINE = 0x01;
            inline constexpr u8 WATCHDOG = 0x02;
            inline constexpr u8 COMMAND = 0x20;
            inline constexpr u8 SYNCHRONOUS = 0x40;
            inline constexpr u8 SUSPEND = 0x80;
        } // namespace startup_reason

        struct StartupInfo {
            u8 reason = startup_reason::POWER_ON;

            bool power_on() const noexcept { return reason == startup_reason::POWER_ON; }
            bool command_reset() const noexcept { return (reason & startup_reason::COMMAND) != 0; }

            static dp::Optional<StartupInfo> decode(const Message &msg) {
                if (msg.id != msg_id::STARTUP || msg.size() < 1)
                    return dp::nullopt;
                return StartupInfo{msg.get_u8(0)};
            }
        };

        // ─── Serial number (0x61) ────────────────────────────────────────────────────
        struct SerialNumber {
            u32 value = 0;

            static dp::Optional<SerialNumber> decode(const Message &msg) {
                if (msg.id != msg_id::SERIAL_NUMBER || msg.size() < 4)
                    return dp::nullopt;
                return SerialNumber{msg.get_u32_le(0)};
            }
        };

        // ─── Broadcast / acknowledged / burst data (0x4E / 0x4F / 0x50) ──────────────
        // For burst data the first byte is channel | (sequence << 5). An extended
        // payload appends a flag byte; 0x80 means a channel ID follows.
        struct DataPayload {
            MessageId kind = msg_id::BROADCAST_DATA;
            ChannelNumber channel = 0;
            u8 sequence = 0;
            dp::Array<u8, DATA_PAYLOAD_SIZE> data = {};
            dp::Optional<ChannelIdInfo> device;

            bool is_burst() const noexcept { return kind == msg_id::BURST_DATA; }
            bool last_packet() const noexcept { return is_burst() && (sequence & BURST_LAST_FLAG) != 0; }
            u8 packet_counter() const noexcept { return sequence & 0x03; }

            static dp::Optional<DataPayload> decode(const Message &msg) {
                if (msg.id != msg_id::BROADCAST_DATA && msg.id != msg_id::ACKNOWLEDGED_DATA &&
                    msg.id != msg_id::BURST_DATA)
                    return dp::nullopt;
                if (msg.size() < 1 + DATA_PAYLOAD_SIZE)
                    return dp::nullopt;

                DataPayload p;
                p.kind = msg.id;
                u8 first = msg.get_u8(0);
                if (p.is_burst()) {
                    p.channel = first & CHANNEL_NUMBER_MASK;
                    p.sequence = static_cast<u8>(first >> BURST_SEQUENCE_SHIFT);
                } else {
                    p.channel = first;
                }
                for (usize i = 0; i < DATA_PAYLOAD_SIZE; ++i)
                    p.data[i] = msg.data[1 + i];

                usize flag_at = 1 + DATA_PAYLOAD_SIZE;
                if (msg.size() >= flag_at + 5 && (msg.get_u8(flag_at) & EXT_FLAG_CHANNEL_ID) != 0) {
                    ChannelIdInfo dev;
                    dev.channel = p.channel;
                    dev.device_number = msg.get_u16_le(flag_at + 1);
                    dev.device_type = msg.get_u8(flag_at + 3);
                    dev.transmission_type = msg.get_u8(flag_at + 4);
                    p.device = dev;
                }
                return p;
            }
        };

    } // namespace protocol
    using namespace protocol;
} // namespace antlink
