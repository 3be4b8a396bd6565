#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "antlink/core/codec.hpp"
#include "antlink/core/constants.hpp"
#include "antlink/core/error.hpp"
#include "antlink/core/message.hpp"
#include "antlink/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "antlink/util/channel.hpp"
#include "antlink/util/event.hpp"
#include "antlink/util/signal.hpp"

// ─── Drivers ─────────────────────────────────────────────────────────────────
#include "antlink/driver/driver.hpp"
#include "antlink/driver/serial_driver.hpp"

// ─── Session (I/O pump + frame decoder) ──────────────────────────────────────
#include "antlink/session/event_sink.hpp"
#include "antlink/session/frame_decoder.hpp"
#include "antlink/session/io_pump.hpp"
#include "antlink/session/session.hpp"

// ─── Commands ────────────────────────────────────────────────────────────────
#include "antlink/command/builders.hpp"
#include "antlink/command/burst.hpp"
#include "antlink/command/commands.hpp"

// ─── Inbound protocol ────────────────────────────────────────────────────────
#include "antlink/protocol/dispatcher.hpp"
#include "antlink/protocol/responses.hpp"
