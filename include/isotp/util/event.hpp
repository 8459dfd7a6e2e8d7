#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace isotp {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Type-safe event dispatcher ──────────────────────────────────────────────
        // Listeners removed while the event is dispatching are only marked and get
        // erased once the dispatch loop finishes.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = INVALID_TOKEN;
                std::function<void(Args...)> fn;
                bool removed = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            u32 depth_ = 0;

            void compact() {
                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    it = it->removed ? listeners_.erase(it) : it + 1;
                }
            }

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }

            bool unsubscribe(ListenerToken token) {
                for (auto &l : listeners_) {
                    if (l.token == token && !l.removed) {
                        l.removed = true;
                        if (depth_ == 0)
                            compact();
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                ++depth_;
                // Index loop: listeners subscribed during dispatch may reallocate the vector
                for (usize i = 0; i < listeners_.size(); ++i) {
                    if (!listeners_[i].removed && listeners_[i].fn)
                        listeners_[i].fn(args...);
                }
                if (--depth_ == 0)
                    compact();
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.removed)
                        ++active;
                }
                return active;
            }

            void clear() {
                if (depth_ == 0) {
                    listeners_.clear();
                    return;
                }
                for (auto &l : listeners_)
                    l.removed = true;
            }
        };

    } // namespace util
    using namespace util;
} // namespace isotp
