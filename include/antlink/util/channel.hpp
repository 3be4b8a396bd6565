#pragma once

#include "../core/types.hpp"
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <deque>
#include <mutex>

namespace antlink {
    namespace util {

        // ─── Bounded point-to-point hand-off between two threads ─────────────────────
        // Items move whole: a send either transfers the complete item or nothing.
        // After close() no send succeeds; receivers still drain what was queued
        // before the close and then observe closure.
        template <typename T> class Channel {
            mutable std::mutex mutex_;
            std::condition_variable not_empty_;
            std::condition_variable not_full_;
            std::deque<T> items_;
            usize capacity_;
            bool closed_ = false;

          public:
            explicit Channel(usize capacity = 1) : capacity_(capacity == 0 ? 1 : capacity) {}

            Channel(const Channel &) = delete;
            Channel &operator=(const Channel &) = delete;

            // Blocks while full. Returns false once the channel is closed.
            bool send(T item) {
                std::unique_lock<std::mutex> lock(mutex_);
                not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
                if (closed_)
                    return false;
                items_.push_back(std::move(item));
                lock.unlock();
                not_empty_.notify_one();
                return true;
            }

            // Never blocks. Returns false when full or closed; the item is dropped.
            bool try_send(T item) {
                std::unique_lock<std::mutex> lock(mutex_);
                if (closed_ || items_.size() >= capacity_)
                    return false;
                items_.push_back(std::move(item));
                lock.unlock();
                not_empty_.notify_one();
                return true;
            }

            // Blocks until an item arrives. Empty optional means closed and drained.
            dp::Optional<T> recv() {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
                return pop_locked(lock);
            }

            dp::Optional<T> try_recv() {
                std::unique_lock<std::mutex> lock(mutex_);
                return pop_locked(lock);
            }

            template <typename Rep, typename Period> dp::Optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
                return pop_locked(lock);
            }

            void close() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    closed_ = true;
                }
                not_empty_.notify_all();
                not_full_.notify_all();
            }

            // Drops queued items. Wakes blocked senders.
            void clear() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    items_.clear();
                }
                not_full_.notify_all();
            }

            // Re-arms a closed channel for another session run
            void reopen() {
                std::lock_guard<std::mutex> lock(mutex_);
                items_.clear();
                closed_ = false;
            }

            bool is_closed() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return closed_;
            }

            usize size() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return items_.size();
            }

            usize capacity() const noexcept { return capacity_; }

          private:
            dp::Optional<T> pop_locked(std::unique_lock<std::mutex> &lock) {
                if (items_.empty())
                    return dp::nullopt;
                T item = std::move(items_.front());
                items_.pop_front();
                lock.unlock();
                not_full_.notify_one();
                return item;
            }
        };

    } // namespace util
    using namespace util;
} // namespace antlink
