#pragma once

#include <functional>
#include <utility>

namespace HG {

/**
 * Single-slot holder for one user callback.
 *
 * invoke() moves the callback out of the slot before running it and puts it
 * back afterwards only if nothing was written to the slot in the meantime.
 * This lets a callback replace or clear itself while it runs, and makes a
 * nested invoke() of the same slot a no-op instead of a recursive call. No
 * reference into the slot is held while user code runs.
 */
template <typename... Args>
class CallbackSlot {
public:
    using Function = std::function<void(Args...)>;

    enum class State {
        Empty,
        Filled,
        Executing,
    };

    CallbackSlot() = default;

    CallbackSlot(CallbackSlot const&)            = delete;
    CallbackSlot& operator=(CallbackSlot const&) = delete;

    // While the slot is executing, the value applies to later invocations only.
    auto set(Function fn) -> void {
        if (fn) {
            this->function = std::move(fn);
            this->state    = State::Filled;
        } else {
            this->function = nullptr;
            this->state    = State::Empty;
        }
    }

    auto clear() -> void { this->set(nullptr); }

    // Returns true when a callback ran. Exceptions thrown by the callback
    // propagate after the slot has been restored.
    auto invoke(Args... args) -> bool {
        if (this->state != State::Filled) {
            return false;
        }
        Function detached = std::exchange(this->function, nullptr);
        this->state       = State::Executing;

        Reattach guard{*this, detached};
        detached(args...);
        return true;
    }

    [[nodiscard]] auto current() const -> State { return this->state; }
    [[nodiscard]] auto empty() const -> bool { return this->state == State::Empty; }
    [[nodiscard]] auto executing() const -> bool { return this->state == State::Executing; }

private:
    struct Reattach {
        CallbackSlot& slot;
        Function&     detached;

        ~Reattach() {
            if (slot.state == State::Executing) {
                slot.function = std::move(detached);
                slot.state    = State::Filled;
            }
        }
    };

    Function function;
    State    state = State::Empty;
};

} // namespace HG
