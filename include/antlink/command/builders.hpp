#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace antlink {
    namespace command {

        // ─── Configuration messages ──────────────────────────────────────────────────
        inline Result<Message> unassign_channel(ChannelNumber channel) {
            return Result<Message>::ok(Message(msg_id::UNASSIGN_CHANNEL, {channel}));
        }

        inline Result<Message> assign_channel(ChannelNumber channel, u8 channel_type, NetworkNumber network) {
            return Result<Message>::ok(Message(msg_id::ASSIGN_CHANNEL, {channel, channel_type, network}));
        }

        inline Result<Message> assign_channel_ext(ChannelNumber channel, u8 channel_type, NetworkNumber network,
                                                  u8 ext_flags) {
            return Result<Message>::ok(Message(msg_id::ASSIGN_CHANNEL, {channel, channel_type, network, ext_flags}));
        }

        inline Result<Message> set_channel_id(ChannelNumber channel, u16 device_number, u8 device_type,
                                              u8 transmission_type) {
            Message msg(msg_id::CHANNEL_ID, {channel});
            msg.set_u16_le(1, device_number);
            msg.set_u8(3, device_type);
            msg.set_u8(4, transmission_type);
            return Result<Message>::ok(std::move(msg));
        }

        // Period in 1/32768 s units (8070 = 4.06 Hz)
        inline Result<Message> set_channel_period(ChannelNumber channel, u16 period) {
            Message msg(msg_id::CHANNEL_MESG_PERIOD, {channel});
            msg.set_u16_le(1, period);
            return Result<Message>::ok(std::move(msg));
        }

        // Timeout in 2.5 s units, 255 = infinite
        inline Result<Message> set_channel_search_timeout(ChannelNumber channel, u8 timeout) {
            return Result<Message>::ok(Message(msg_id::CHANNEL_SEARCH_TIMEOUT, {channel, timeout}));
        }

        inline Result<Message> set_low_priority_search_timeout(ChannelNumber channel, u8 timeout) {
            return Result<Message>::ok(Message(msg_id::LP_SEARCH_TIMEOUT, {channel, timeout}));
        }

        // RF channel offset from 2400 MHz
        inline Result<Message> set_channel_rf_freq(ChannelNumber channel, u8 rf_freq) {
            return Result<Message>::ok(Message(msg_id::CHANNEL_RADIO_FREQ, {channel, rf_freq}));
        }

        inline Result<Message> set_network_key(NetworkNumber network, const dp::Vector<u8> &key) {
            if (key.size() != DATA_PAYLOAD_SIZE) {
                return Result<Message>::err(Error::bad_length(DATA_PAYLOAD_SIZE, key.size()));
            }
            Message msg(msg_id::NETWORK_KEY, {network});
            msg.data.insert(msg.data.end(), key.begin(), key.end());
            return Result<Message>::ok(std::move(msg));
        }

        inline Result<Message> set_transmit_power(u8 power) {
            return Result<Message>::ok(Message(msg_id::RADIO_TX_POWER, {0, static_cast<u8>(power & TX_POWER_MASK)}));
        }

        inline Result<Message> set_channel_transmit_power(ChannelNumber channel, u8 power) {
            return Result<Message>::ok(
                Message(msg_id::CHANNEL_RADIO_TX_POWER, {channel, static_cast<u8>(power & TX_POWER_MASK)}));
        }

        inline Result<Message> set_search_waveform(ChannelNumber channel, u16 waveform) {
            if (waveform != SEARCH_WAVEFORM_FAST && waveform != SEARCH_WAVEFORM_STANDARD) {
                return Result<Message>::err(Error::invalid_argument("search waveform must be 97 or 316"));
            }
            Message msg(msg_id::SEARCH_WAVEFORM, {channel});
            msg.set_u16_le(1, waveform);
            return Result<Message>::ok(std::move(msg));
        }

        // ─── Control messages ────────────────────────────────────────────────────────
        inline Result<Message> reset_system() { return Result<Message>::ok(Message(msg_id::SYSTEM_RESET, {0})); }

        inline Result<Message> open_channel(ChannelNumber channel) {
            return Result<Message>::ok(Message(msg_id::OPEN_CHANNEL, {channel}));
        }

        inline Result<Message> close_channel(ChannelNumber channel) {
            return Result<Message>::ok(Message(msg_id::CLOSE_CHANNEL, {channel}));
        }

        inline Result<Message> request_message(ChannelNumber channel, MessageId requested) {
            return Result<Message>::ok(Message(msg_id::REQUEST, {channel, requested}));
        }

        inline Result<Message> open_rx_scan_mode() {
            // channel 0, enable
            return Result<Message>::ok(Message(msg_id::OPEN_RX_SCAN, {0, 1}));
        }

        inline Result<Message> enable_extended_messages(bool enable) {
            return Result<Message>::ok(Message(msg_id::RX_EXT_MESGS_ENABLE, {0, static_cast<u8>(enable ? 1 : 0)}));
        }

        inline Result<Message> raw_message(MessageId id, dp::Vector<u8> data) {
            return make_message(id, std::move(data));
        }

        // ─── Channel ID list (inclusion / exclusion) ─────────────────────────────────
        inline Result<Message> add_channel_id(ChannelNumber channel, u16 device_number, u8 device_type,
                                              u8 transmission_type, u8 list_index) {
            Message msg(msg_id::ID_LIST_ADD, {channel});
            msg.set_u16_le(1, device_number);
            msg.set_u8(3, device_type);
            msg.set_u8(4, transmission_type);
            msg.set_u8(5, list_index);
            return Result<Message>::ok(std::move(msg));
        }

        inline Result<Message> config_id_list(ChannelNumber channel, u8 list_size, bool exclude) {
            return Result<Message>::ok(
                Message(msg_id::ID_LIST_CONFIG, {channel, list_size, static_cast<u8>(exclude ? 1 : 0)}));
        }

        // ─── Synchronous RF data ─────────────────────────────────────────────────────
        namespace detail {
            inline Result<Message> data_message(MessageId id, u8 channel_or_seq, const dp::Vector<u8> &data) {
                if (data.size() != DATA_PAYLOAD_SIZE) {
                    return Result<Message>::err(Error::bad_length(DATA_PAYLOAD_SIZE, data.size()));
                }
                Message msg(id, {channel_or_seq});
                msg.data.insert(msg.data.end(), data.begin(), data.end());
                return Result<Message>::ok(std::move(msg));
            }
        } // namespace detail

        inline Result<Message> broadcast_data(ChannelNumber channel, const dp::Vector<u8> &data) {
            return detail::data_message(msg_id::BROADCAST_DATA, channel, data);
        }

        inline Result<Message> acknowledged_data(ChannelNumber channel, const dp::Vector<u8> &data) {
            return detail::data_message(msg_id::ACKNOWLEDGED_DATA, channel, data);
        }

        // channel_seq = channel | (sequence << 5)
        inline Result<Message> burst_packet(u8 channel_seq, const dp::Vector<u8> &data) {
            return detail::data_message(msg_id::BURST_DATA, channel_seq, data);
        }

    } // namespace command
} // namespace antlink
