#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "builders.hpp"
#include <datapod/datapod.hpp>

namespace antlink {
    namespace command {

        // ─── Burst sequence field for packet `index` of `count` ──────────────────────
        // First packet 0, then 1,2,3,1,2,3,... The last packet carries the 0b100 flag,
        // including a single-packet transfer (0b100).
        inline u8 burst_sequence(usize index, usize count) noexcept {
            u8 sequence = index == 0 ? 0 : static_cast<u8>(((index - 1) % 3) + 1);
            if (count > 0 && index == count - 1)
                sequence |= BURST_LAST_FLAG;
            return sequence;
        }

        inline u8 burst_channel_sequence(ChannelNumber channel, u8 sequence) noexcept {
            return static_cast<u8>(channel | (sequence << BURST_SEQUENCE_SHIFT));
        }

        // ─── Split a payload into burst packets, in send order ───────────────────────
        inline Result<dp::Vector<Message>> burst_packets(ChannelNumber channel, const dp::Vector<u8> &data) {
            if (channel > CHANNEL_NUMBER_MASK) {
                return Result<dp::Vector<Message>>::err(
                    Error::invalid_argument("burst channel must fit in the low five bits"));
            }
            if (data.empty() || data.size() % DATA_PAYLOAD_SIZE != 0) {
                return Result<dp::Vector<Message>>::err(
                    Error::invalid_argument("burst data length should be a non-zero multiple of 8 not " +
                                            dp::String(std::to_string(data.size()))));
            }

            usize count = data.size() / DATA_PAYLOAD_SIZE;
            dp::Vector<Message> packets;
            packets.reserve(count);
            for (usize i = 0; i < count; ++i) {
                auto begin = data.begin() + static_cast<isize>(i * DATA_PAYLOAD_SIZE);
                dp::Vector<u8> chunk;
                chunk.assign(begin, begin + static_cast<isize>(DATA_PAYLOAD_SIZE));
                u8 channel_seq = burst_channel_sequence(channel, burst_sequence(i, count));

                auto packet = burst_packet(channel_seq, chunk);
                if (!packet.is_ok()) {
                    return Result<dp::Vector<Message>>::err(packet.error());
                }
                packets.push_back(std::move(packet.value()));
            }
            return Result<dp::Vector<Message>>::ok(std::move(packets));
        }

    } // namespace command
} // namespace antlink
