#pragma once

#include "constants.hpp"
#include "error.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace antlink {

    // ─── ANT message (message ID + payload, carried by one serial frame) ────────
    struct Message {
        MessageId id = msg_id::INVALID;
        dp::Vector<u8> data;

        Message() = default;

        Message(MessageId mid, dp::Vector<u8> d) : id(mid), data(std::move(d)) {}

        // ─── Data extraction helpers ─────────────────────────────────────────────
        u8 get_u8(usize offset) const noexcept {
            if (offset >= data.size())
                return 0xFF;
            return data[offset];
        }

        u16 get_u16_le(usize offset) const noexcept {
            if (offset + 1 >= data.size())
                return 0xFFFF;
            return static_cast<u16>(data[offset]) | (static_cast<u16>(data[offset + 1]) << 8);
        }

        u32 get_u32_le(usize offset) const noexcept {
            if (offset + 3 >= data.size())
                return 0xFFFFFFFF;
            return static_cast<u32>(data[offset]) | (static_cast<u32>(data[offset + 1]) << 8) |
                   (static_cast<u32>(data[offset + 2]) << 16) | (static_cast<u32>(data[offset + 3]) << 24);
        }

        // Most channel-scoped messages carry the channel number in the first byte
        ChannelNumber channel() const noexcept { return get_u8(0); }

        usize size() const noexcept { return data.size(); }

        // ─── Data setter helpers ─────────────────────────────────────────────────
        void set_u8(usize offset, u8 val) {
            if (offset >= data.size())
                data.resize(offset + 1, 0x00);
            data[offset] = val;
        }

        void set_u16_le(usize offset, u16 val) {
            if (offset + 1 >= data.size())
                data.resize(offset + 2, 0x00);
            data[offset] = static_cast<u8>(val & 0xFF);
            data[offset + 1] = static_cast<u8>((val >> 8) & 0xFF);
        }

        bool operator==(const Message &other) const noexcept { return id == other.id && data == other.data; }
        bool operator!=(const Message &other) const noexcept { return !(*this == other); }
    };

    // ─── Checked constructor (payload must fit the one-byte LENGTH field) ────────
    inline Result<Message> make_message(MessageId id, dp::Vector<u8> data) {
        if (data.size() > MAX_PAYLOAD) {
            return Result<Message>::err(Error::invalid_argument("payload exceeds 255 bytes"));
        }
        return Result<Message>::ok(Message(id, std::move(data)));
    }

} // namespace antlink
