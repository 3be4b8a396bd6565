#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace antlink {
    namespace util {

        // ─── One-shot notification ───────────────────────────────────────────────────
        class Signal {
            mutable std::mutex mutex_;
            std::condition_variable cv_;
            bool set_ = false;

          public:
            Signal() = default;
            Signal(const Signal &) = delete;
            Signal &operator=(const Signal &) = delete;

            void notify() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    set_ = true;
                }
                cv_.notify_all();
            }

            bool is_set() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return set_;
            }

            void wait() {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return set_; });
            }

            template <typename Rep, typename Period> bool wait_for(std::chrono::duration<Rep, Period> timeout) {
                std::unique_lock<std::mutex> lock(mutex_);
                return cv_.wait_for(lock, timeout, [this] { return set_; });
            }

            // Only valid while no thread waits on the signal
            void reset() {
                std::lock_guard<std::mutex> lock(mutex_);
                set_ = false;
            }
        };

    } // namespace util
    using namespace util;
} // namespace antlink
