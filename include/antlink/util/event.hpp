#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace antlink {
    namespace util {

        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Callback list for the consumer thread ───────────────────────────────────
        // Not thread-safe: subscribe, unsubscribe and emit happen on the thread that
        // drains the session. Unsubscribing from inside a callback is deferred until
        // the current emit returns.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = INVALID_TOKEN;
                std::function<void(Args...)> fn;
                bool removed = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            bool emitting_ = false;

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                if (!fn)
                    return INVALID_TOKEN;
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token != token || it->removed)
                        continue;
                    if (emitting_)
                        it->removed = true;
                    else
                        listeners_.erase(it);
                    return true;
                }
                return false;
            }

            void emit(Args... args) {
                emitting_ = true;
                // Listeners added during emit are not called until the next emit
                usize n = listeners_.size();
                for (usize i = 0; i < n; ++i) {
                    if (listeners_[i].removed)
                        continue;
                    // A callback may subscribe and reallocate the list under us
                    auto fn = listeners_[i].fn;
                    fn(args...);
                }
                emitting_ = false;

                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    if (it->removed)
                        it = listeners_.erase(it);
                    else
                        ++it;
                }
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.removed)
                        active++;
                }
                return active;
            }

            bool empty() const noexcept { return count() == 0; }

            void clear() { listeners_.clear(); }
        };

    } // namespace util
    using namespace util;
} // namespace antlink
