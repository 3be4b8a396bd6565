#pragma once

#include "constants.hpp"
#include "error.hpp"
#include "message.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace antlink {
    namespace codec {

        // XOR of every byte from SYNC through the last payload byte
        inline u8 checksum(const u8 *bytes, usize len) noexcept {
            u8 sum = 0;
            for (usize i = 0; i < len; ++i)
                sum ^= bytes[i];
            return sum;
        }

        inline usize frame_size(usize payload_len) noexcept { return payload_len + FRAME_OVERHEAD; }

        // ─── Serialize: [SYNC][LENGTH][MESSAGE_ID][PAYLOAD...][CHECKSUM] ─────────
        inline dp::Vector<u8> encode(const Message &msg) {
            dp::Vector<u8> frame;
            frame.reserve(frame_size(msg.data.size()));
            frame.push_back(SYNC);
            frame.push_back(static_cast<u8>(msg.data.size()));
            frame.push_back(msg.id);
            for (auto b : msg.data)
                frame.push_back(b);
            frame.push_back(checksum(frame.data(), frame.size()));
            return frame;
        }

        // ─── Validate a complete raw frame and extract its message ───────────────
        inline Result<Message> decode(const dp::Vector<u8> &frame) {
            if (frame.size() < FRAME_OVERHEAD) {
                return Result<Message>::err(Error::integrity("frame too short"));
            }
            if (frame[0] != SYNC) {
                return Result<Message>::err(Error::integrity("missing sync byte"));
            }
            usize len = frame[1];
            if (frame.size() != frame_size(len)) {
                return Result<Message>::err(Error::integrity("length field does not match frame size"));
            }
            if (checksum(frame.data(), frame.size() - 1) != frame.back()) {
                return Result<Message>::err(Error::integrity("checksum mismatch"));
            }

            Message msg;
            msg.id = frame[2];
            msg.data.assign(frame.begin() + 3, frame.begin() + 3 + static_cast<isize>(len));
            return Result<Message>::ok(std::move(msg));
        }

    } // namespace codec
} // namespace antlink
