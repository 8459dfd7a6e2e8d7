#pragma once

#include "event.hpp"

namespace isotp {
    namespace util {

        // ─── Enum-driven state holder with transition notification ──────────────────
        template <typename StateEnum> class StateMachine {
            StateEnum state_;
            StateEnum previous_;
            u32 transitions_ = 0;

          public:
            explicit StateMachine(StateEnum initial) : state_(initial), previous_(initial) {}

            StateEnum state() const noexcept { return state_; }
            StateEnum previous() const noexcept { return previous_; }
            u32 transitions() const noexcept { return transitions_; }

            bool is(StateEnum s) const noexcept { return state_ == s; }

            // Returns false (and emits nothing) when already in `next`
            bool transition(StateEnum next) {
                if (next == state_)
                    return false;
                previous_ = state_;
                state_ = next;
                ++transitions_;
                on_transition.emit(previous_, state_);
                return true;
            }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace isotp
