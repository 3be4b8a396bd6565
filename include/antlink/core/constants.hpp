#pragma once

#include "types.hpp"

namespace antlink {

    // ─── Framing (ANT serial message protocol) ───────────────────────────────────
    inline constexpr u8 SYNC = 0xA4;
    inline constexpr usize FRAME_OVERHEAD = 4; // SYNC + LENGTH + MESSAGE_ID + CHECKSUM
    inline constexpr usize MAX_PAYLOAD = 255;
    inline constexpr usize DATA_PAYLOAD_SIZE = 8;

    // ─── Radio limits ────────────────────────────────────────────────────────────
    inline constexpr u8 TX_POWER_MASK = 0x03;
    inline constexpr u16 SEARCH_WAVEFORM_FAST = 97;
    inline constexpr u16 SEARCH_WAVEFORM_STANDARD = 316;

    // ─── Burst channel-sequence byte ─────────────────────────────────────────────
    inline constexpr u8 BURST_SEQUENCE_SHIFT = 5;
    inline constexpr u8 BURST_LAST_FLAG = 0b100;
    inline constexpr u8 CHANNEL_NUMBER_MASK = 0x1F;

    // ─── Extended data flag byte (follows the 8 data bytes) ──────────────────────
    inline constexpr u8 EXT_FLAG_CHANNEL_ID = 0x80;

    // ─── Message IDs ─────────────────────────────────────────────────────────────
    namespace msg_id {
        inline constexpr MessageId INVALID = 0x00;
        inline constexpr MessageId EVENT = 0x01;
        inline constexpr MessageId VERSION = 0x3E;
        inline constexpr MessageId RESPONSE_EVENT = 0x40;
        inline constexpr MessageId UNASSIGN_CHANNEL = 0x41;
        inline constexpr MessageId ASSIGN_CHANNEL = 0x42;
        inline constexpr MessageId CHANNEL_MESG_PERIOD = 0x43;
        inline constexpr MessageId CHANNEL_SEARCH_TIMEOUT = 0x44;
        inline constexpr MessageId CHANNEL_RADIO_FREQ = 0x45;
        inline constexpr MessageId NETWORK_KEY = 0x46;
        inline constexpr MessageId RADIO_TX_POWER = 0x47;
        inline constexpr MessageId SEARCH_WAVEFORM = 0x49;
        inline constexpr MessageId SYSTEM_RESET = 0x4A;
        inline constexpr MessageId OPEN_CHANNEL = 0x4B;
        inline constexpr MessageId CLOSE_CHANNEL = 0x4C;
        inline constexpr MessageId REQUEST = 0x4D;
        inline constexpr MessageId BROADCAST_DATA = 0x4E;
        inline constexpr MessageId ACKNOWLEDGED_DATA = 0x4F;
        inline constexpr MessageId BURST_DATA = 0x50;
        inline constexpr MessageId CHANNEL_ID = 0x51;
        inline constexpr MessageId CHANNEL_STATUS = 0x52;
        inline constexpr MessageId CAPABILITIES = 0x54;
        inline constexpr MessageId ID_LIST_ADD = 0x59;
        inline constexpr MessageId ID_LIST_CONFIG = 0x5A;
        inline constexpr MessageId OPEN_RX_SCAN = 0x5B;
        inline constexpr MessageId EXT_BROADCAST_DATA = 0x5D;
        inline constexpr MessageId EXT_ACKNOWLEDGED_DATA = 0x5E;
        inline constexpr MessageId EXT_BURST_DATA = 0x5F;
        inline constexpr MessageId CHANNEL_RADIO_TX_POWER = 0x60;
        inline constexpr MessageId SERIAL_NUMBER = 0x61;
        inline constexpr MessageId LP_SEARCH_TIMEOUT = 0x63;
        inline constexpr MessageId RX_EXT_MESGS_ENABLE = 0x66;
        inline constexpr MessageId STARTUP = 0x6F;
    } // namespace msg_id

    // ─── Channel types (assign channel) ──────────────────────────────────────────
    namespace channel_type {
        inline constexpr u8 BIDIRECTIONAL_SLAVE = 0x00;
        inline constexpr u8 BIDIRECTIONAL_MASTER = 0x10;
        inline constexpr u8 SHARED_BIDIRECTIONAL_SLAVE = 0x20;
        inline constexpr u8 SHARED_BIDIRECTIONAL_MASTER = 0x30;
        inline constexpr u8 SLAVE_RECEIVE_ONLY = 0x40;
        inline constexpr u8 MASTER_TRANSMIT_ONLY = 0x50;
    } // namespace channel_type

    // ─── Extended assignment flags ───────────────────────────────────────────────
    namespace ext_assign {
        inline constexpr u8 BACKGROUND_SCANNING = 0x01;
        inline constexpr u8 FREQUENCY_AGILITY = 0x04;
    } // namespace ext_assign

    // ─── Channel response / event codes ──────────────────────────────────────────
    namespace response_code {
        inline constexpr u8 NO_ERROR = 0x00;
        inline constexpr u8 EVENT_RX_SEARCH_TIMEOUT = 0x01;
        inline constexpr u8 EVENT_RX_FAIL = 0x02;
        inline constexpr u8 EVENT_TX = 0x03;
        inline constexpr u8 EVENT_TRANSFER_RX_FAILED = 0x04;
        inline constexpr u8 EVENT_TRANSFER_TX_COMPLETED = 0x05;
        inline constexpr u8 EVENT_TRANSFER_TX_FAILED = 0x06;
        inline constexpr u8 EVENT_CHANNEL_CLOSED = 0x07;
        inline constexpr u8 EVENT_RX_FAIL_GO_TO_SEARCH = 0x08;
        inline constexpr u8 EVENT_CHANNEL_COLLISION = 0x09;
        inline constexpr u8 EVENT_TRANSFER_TX_START = 0x0A;
        inline constexpr u8 CHANNEL_IN_WRONG_STATE = 0x15;
        inline constexpr u8 CHANNEL_NOT_OPENED = 0x16;
        inline constexpr u8 CHANNEL_ID_NOT_SET = 0x18;
        inline constexpr u8 CLOSE_ALL_CHANNELS = 0x19;
        inline constexpr u8 TRANSFER_IN_PROGRESS = 0x1F;
        inline constexpr u8 TRANSFER_SEQUENCE_NUMBER_ERROR = 0x20;
        inline constexpr u8 TRANSFER_IN_ERROR = 0x21;
        inline constexpr u8 INVALID_MESSAGE = 0x28;
        inline constexpr u8 INVALID_NETWORK_NUMBER = 0x29;
        inline constexpr u8 INVALID_LIST_ID = 0x30;
        inline constexpr u8 INVALID_SCAN_TX_CHANNEL = 0x31;
        inline constexpr u8 INVALID_PARAMETER_PROVIDED = 0x33;
        inline constexpr u8 EVENT_QUE_OVERFLOW = 0x35;
    } // namespace response_code

    // ─── Channel status states (low two bits of channel status byte) ─────────────
    enum class ChannelState : u8 { Unassigned = 0, Assigned = 1, Searching = 2, Tracking = 3 };

} // namespace antlink
