#pragma once

#include <datapod/datapod.hpp>

namespace antlink {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Radio handles ───────────────────────────────────────────────────────────
    using ChannelNumber = u8; // 0..31 on current parts; burst packets reserve the upper 3 bits
    using MessageId = u8;
    using NetworkNumber = u8; // index into the radio's network key table

} // namespace antlink
