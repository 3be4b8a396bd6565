#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "driver.hpp"
#include <cerrno>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <memory>
#include <wirebit/serial/serial_endpoint.hpp>
#include <wirebit/serial/tty_link.hpp>

namespace antlink {
    namespace driver {

        // ─── Serial driver configuration ─────────────────────────────────────────────
        // ANT USB-m sticks enumerate as a CP210x UART at 57600 baud, USB2 sticks
        // behind a USB-serial bridge at 115200.
        inline constexpr u32 MAX_BAUD = 4000000;

        struct SerialDriverConfig {
            dp::String device = "/dev/ttyUSB0";
            u32 baud = 57600;
            u8 data_bits = 8;
            u8 stop_bits = 1;
            char parity = 'N';
            usize read_buffer = 64;

            SerialDriverConfig &port(dp::String path) {
                device = std::move(path);
                return *this;
            }
            SerialDriverConfig &baud_rate(u32 rate) {
                baud = rate;
                return *this;
            }
            SerialDriverConfig &buffer(usize n) {
                read_buffer = n;
                return *this;
            }
        };

        // Decimal baud rate as given on a command line, e.g. "115200"
        inline Result<u32> parse_baud(const char *text) {
            if (text == nullptr || *text < '0' || *text > '9') {
                return Result<u32>::err(Error::invalid_argument("baud rate must be a decimal number"));
            }
            errno = 0;
            char *end = nullptr;
            unsigned long value = std::strtoul(text, &end, 10);
            if (*end != '\0' || errno == ERANGE || value == 0 || value > MAX_BAUD) {
                return Result<u32>::err(Error::invalid_argument("invalid baud rate: " + dp::String(text)));
            }
            return Result<u32>::ok(static_cast<u32>(value));
        }

        // ─── Driver over a wirebit serial endpoint ───────────────────────────────────
        // open() creates a TtyLink on the configured device unless a link was
        // injected (PTY, shared memory, test double). Bytes received beyond the
        // caller's buffer are kept for the next read().
        class SerialDriver : public Driver {
            SerialDriverConfig config_;
            std::shared_ptr<wirebit::Link> link_;
            bool link_injected_ = false;
            std::unique_ptr<wirebit::SerialEndpoint> endpoint_;
            dp::Vector<u8> pending_;

          public:
            explicit SerialDriver(SerialDriverConfig config = {}) : config_(std::move(config)) {}

            SerialDriver(std::shared_ptr<wirebit::Link> link, SerialDriverConfig config = {})
                : config_(std::move(config)), link_(std::move(link)), link_injected_(link_ != nullptr) {}

            ~SerialDriver() override { close(); }

            Result<void> open() override {
                if (endpoint_) {
                    return {};
                }

                if (!link_) {
                    auto tty = wirebit::TtyLink::create({.device = config_.device, .baud = config_.baud});
                    if (!tty.is_ok()) {
                        echo::category("antlink.driver.serial")
                            .error("cannot open ", config_.device, ": ", tty.error().message);
                        return Result<void>::err(Error::transport("cannot open " + config_.device));
                    }
                    link_ = std::make_shared<wirebit::TtyLink>(std::move(tty.value()));
                }

                wirebit::SerialConfig serial{.baud = config_.baud,
                                             .data_bits = config_.data_bits,
                                             .stop_bits = config_.stop_bits,
                                             .parity = config_.parity};
                endpoint_ = std::make_unique<wirebit::SerialEndpoint>(link_, serial, 1);
                echo::category("antlink.driver.serial").info("opened ", link_->name(), " @ ", config_.baud, " baud");
                return {};
            }

            void close() override {
                if (!endpoint_)
                    return;
                endpoint_.reset();
                if (!link_injected_)
                    link_.reset();
                pending_.clear();
                echo::category("antlink.driver.serial").debug("closed");
            }

            Result<usize> read(u8 *buffer, usize len) override {
                if (!endpoint_) {
                    return Result<usize>::err(Error::transport("serial port not open"));
                }

                if (pending_.empty()) {
                    auto received = endpoint_->recv();
                    if (!received.is_ok()) {
                        return Result<usize>::err(Error::timeout("no data"));
                    }
                    auto &bytes = received.value();
                    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
                }

                usize n = pending_.size() < len ? pending_.size() : len;
                for (usize i = 0; i < n; ++i)
                    buffer[i] = pending_[i];
                pending_.erase(pending_.begin(), pending_.begin() + static_cast<isize>(n));
                return Result<usize>::ok(n);
            }

            Result<usize> write(const u8 *data, usize len) override {
                if (!endpoint_) {
                    return Result<usize>::err(Error::transport("serial port not open"));
                }

                wirebit::Bytes bytes(len);
                for (usize i = 0; i < len; ++i)
                    bytes[i] = data[i];
                auto sent = endpoint_->send(bytes);
                if (!sent.is_ok()) {
                    echo::category("antlink.driver.serial").warn("write failed: ", sent.error().message);
                    return Result<usize>::err(Error::transport(sent.error().message));
                }
                return Result<usize>::ok(len);
            }

            usize buffer_size() const override { return config_.read_buffer; }

            bool is_open() const noexcept { return endpoint_ != nullptr; }
            const SerialDriverConfig &config() const noexcept { return config_; }
        };

    } // namespace driver
    using namespace driver;
} // namespace antlink
