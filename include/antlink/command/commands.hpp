#pragma once

#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../session/session.hpp"
#include "builders.hpp"
#include "burst.hpp"
#include <datapod/datapod.hpp>

namespace antlink {
    namespace command {

        // ─── Command layer bound to a running session ────────────────────────────────
        // Configuration, control and broadcast data go to the queued channel;
        // acknowledged and burst data go to the timeslot channel. A message that
        // fails validation is never enqueued.
        class Commands {
            Session &session_;

          public:
            explicit Commands(Session &session) : session_(session) {}

            // ─── Configuration ───────────────────────────────────────────────────────
            Result<void> unassign_channel(ChannelNumber channel) { return queue(command::unassign_channel(channel)); }

            Result<void> assign_channel(ChannelNumber channel, u8 channel_type, NetworkNumber network) {
                return queue(command::assign_channel(channel, channel_type, network));
            }

            Result<void> assign_channel_ext(ChannelNumber channel, u8 channel_type, NetworkNumber network,
                                            u8 ext_flags) {
                return queue(command::assign_channel_ext(channel, channel_type, network, ext_flags));
            }

            Result<void> set_channel_id(ChannelNumber channel, u16 device_number, u8 device_type,
                                        u8 transmission_type) {
                return queue(command::set_channel_id(channel, device_number, device_type, transmission_type));
            }

            Result<void> set_channel_period(ChannelNumber channel, u16 period) {
                return queue(command::set_channel_period(channel, period));
            }

            Result<void> set_channel_search_timeout(ChannelNumber channel, u8 timeout) {
                return queue(command::set_channel_search_timeout(channel, timeout));
            }

            Result<void> set_low_priority_search_timeout(ChannelNumber channel, u8 timeout) {
                return queue(command::set_low_priority_search_timeout(channel, timeout));
            }

            Result<void> set_channel_rf_freq(ChannelNumber channel, u8 rf_freq) {
                return queue(command::set_channel_rf_freq(channel, rf_freq));
            }

            Result<void> set_network_key(NetworkNumber network, const dp::Vector<u8> &key) {
                return queue(command::set_network_key(network, key));
            }

            Result<void> set_transmit_power(u8 power) { return queue(command::set_transmit_power(power)); }

            Result<void> set_channel_transmit_power(ChannelNumber channel, u8 power) {
                return queue(command::set_channel_transmit_power(channel, power));
            }

            Result<void> set_search_waveform(ChannelNumber channel, u16 waveform) {
                return queue(command::set_search_waveform(channel, waveform));
            }

            // ─── Control ─────────────────────────────────────────────────────────────
            Result<void> reset_system() { return queue(command::reset_system()); }
            Result<void> open_channel(ChannelNumber channel) { return queue(command::open_channel(channel)); }
            Result<void> close_channel(ChannelNumber channel) { return queue(command::close_channel(channel)); }

            Result<void> request_message(ChannelNumber channel, MessageId requested) {
                return queue(command::request_message(channel, requested));
            }

            Result<void> write_message(MessageId id, dp::Vector<u8> data) {
                return queue(command::raw_message(id, std::move(data)));
            }

            // ─── Channel ID list / scan mode ─────────────────────────────────────────
            Result<void> add_channel_id(ChannelNumber channel, u16 device_number, u8 device_type,
                                        u8 transmission_type, u8 list_index) {
                return queue(
                    command::add_channel_id(channel, device_number, device_type, transmission_type, list_index));
            }

            Result<void> config_id_list(ChannelNumber channel, u8 list_size, bool exclude) {
                return queue(command::config_id_list(channel, list_size, exclude));
            }

            Result<void> open_rx_scan_mode() { return queue(command::open_rx_scan_mode()); }

            Result<void> enable_extended_messages(bool enable) {
                return queue(command::enable_extended_messages(enable));
            }

            // ─── Synchronous RF data ─────────────────────────────────────────────────
            Result<void> send_broadcast_data(ChannelNumber channel, const dp::Vector<u8> &data) {
                return queue(command::broadcast_data(channel, data));
            }

            Result<void> send_acknowledged_data(ChannelNumber channel, const dp::Vector<u8> &data) {
                return timeslot(command::acknowledged_data(channel, data));
            }

            Result<void> send_burst_transfer_packet(u8 channel_seq, const dp::Vector<u8> &data) {
                return timeslot(command::burst_packet(channel_seq, data));
            }

            // Validates the whole payload, then enqueues every packet in order without
            // waiting for acknowledgement in between
            Result<void> send_burst(ChannelNumber channel, const dp::Vector<u8> &data) {
                auto packets = command::burst_packets(channel, data);
                if (!packets.is_ok()) {
                    return Result<void>::err(packets.error());
                }
                for (auto &packet : packets.value()) {
                    auto sent = session_.enqueue_timeslot(std::move(packet));
                    if (!sent.is_ok())
                        return sent;
                }
                return {};
            }

          private:
            Result<void> queue(Result<Message> built) {
                if (!built.is_ok()) {
                    return Result<void>::err(built.error());
                }
                return session_.enqueue(std::move(built.value()));
            }

            Result<void> timeslot(Result<Message> built) {
                if (!built.is_ok()) {
                    return Result<void>::err(built.error());
                }
                return session_.enqueue_timeslot(std::move(built.value()));
            }
        };

    } // namespace command
    using command::Commands;
} // namespace antlink
