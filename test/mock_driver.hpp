#pragma once

#include <antlink/core/codec.hpp>
#include <antlink/core/message.hpp>
#include <antlink/driver/driver.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace antlink::test {

    // Mock driver for running sessions without hardware. Reads are served from
    // scripted chunks, writes are recorded.
    class MockDriver : public Driver {
        mutable std::mutex mutex_;
        std::deque<dp::Vector<u8>> rx_chunks_;
        dp::Vector<dp::Vector<u8>> tx_log_;
        usize buffer_size_;
        bool open_ = false;
        bool fail_open_ = false;
        bool fail_writes_ = false;
        bool short_writes_ = false;
        usize open_count_ = 0;
        usize close_count_ = 0;
        usize read_count_ = 0;

      public:
        explicit MockDriver(usize buffer_size = 64) : buffer_size_(buffer_size) {}

        Result<void> open() override {
            std::lock_guard<std::mutex> lock(mutex_);
            open_count_++;
            if (fail_open_)
                return Result<void>::err(Error::transport("no device"));
            open_ = true;
            return {};
        }

        void close() override {
            std::lock_guard<std::mutex> lock(mutex_);
            close_count_++;
            open_ = false;
        }

        Result<usize> read(u8 *buffer, usize len) override {
            std::lock_guard<std::mutex> lock(mutex_);
            read_count_++;
            if (rx_chunks_.empty())
                return Result<usize>::err(Error::timeout("empty"));

            auto &chunk = rx_chunks_.front();
            usize n = chunk.size() < len ? chunk.size() : len;
            for (usize i = 0; i < n; ++i)
                buffer[i] = chunk[i];
            if (n == chunk.size())
                rx_chunks_.pop_front();
            else
                chunk.erase(chunk.begin(), chunk.begin() + static_cast<isize>(n));
            return Result<usize>::ok(n);
        }

        Result<usize> write(const u8 *data, usize len) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_writes_)
                return Result<usize>::err(Error::transport("device unplugged"));
            dp::Vector<u8> bytes;
            bytes.assign(data, data + len);
            tx_log_.push_back(std::move(bytes));
            if (short_writes_ && len > 0)
                return Result<usize>::ok(len - 1);
            return Result<usize>::ok(len);
        }

        usize buffer_size() const override { return buffer_size_; }

        // Test helpers
        void inject(dp::Vector<u8> bytes) {
            std::lock_guard<std::mutex> lock(mutex_);
            rx_chunks_.push_back(std::move(bytes));
        }

        void inject_message(const Message &msg) { inject(codec::encode(msg)); }

        void fail_open(bool fail) {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_open_ = fail;
        }

        void fail_writes(bool fail) {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_writes_ = fail;
        }

        void short_writes(bool enable) {
            std::lock_guard<std::mutex> lock(mutex_);
            short_writes_ = enable;
        }

        dp::Vector<dp::Vector<u8>> written() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return tx_log_;
        }

        usize write_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return tx_log_.size();
        }

        bool is_open() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return open_;
        }

        usize open_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return open_count_;
        }

        usize close_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return close_count_;
        }

        usize read_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return read_count_;
        }
    };

    inline bool wait_until(const std::function<bool()> &pred,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return pred();
    }

} // namespace antlink::test
