#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"

namespace antlink {
    namespace driver {

        // ─── Byte-stream transport to the radio (USB stick, UART, PTY) ───────────────
        // One Session owns one Driver for its lifetime. Only the session's I/O pump
        // calls into it once the session is started.
        class Driver {
          public:
            virtual ~Driver() = default;

            virtual Result<void> open() = 0;
            virtual void close() = 0;

            // Short-timeout read. Ok(0) and errors both mean "no data yet".
            virtual Result<usize> read(u8 *buffer, usize len) = 0;

            // Returns the number of bytes accepted by the transport
            virtual Result<usize> write(const u8 *data, usize len) = 0;

            virtual usize buffer_size() const = 0;
        };

    } // namespace driver
    using namespace driver;
} // namespace antlink
