#pragma once

#include <handleguard/native/NativeTypes.hpp>

namespace HG {

/**
 * Holds the current native identity of one windowing object.
 *
 * Lifecycle: Absent -> Present (once) -> Absent (terminal). After clear() the
 * cell is retired and refuses every later set(), so a late or replayed
 * creation notification can never resurrect a destroyed peer.
 *
 * Shared between the window node and its dispatch state; reads and writes
 * from nested dispatch calls are plain loads and stores.
 */
class HandleCell {
public:
    HandleCell() = default;

    HandleCell(HandleCell const&)            = delete;
    HandleCell& operator=(HandleCell const&) = delete;

    // Returns false and leaves the cell untouched unless it has never been set.
    [[nodiscard]] auto set(Native::NativeHandle identity) -> bool {
        if (identity.is_none() || this->retired_ || !this->handle_.is_none()) {
            return false;
        }
        this->handle_ = identity;
        return true;
    }

    auto clear() -> void {
        this->handle_  = Native::NativeHandle::none();
        this->retired_ = true;
    }

    [[nodiscard]] auto get() const -> Native::NativeHandle { return this->handle_; }
    [[nodiscard]] auto present() const -> bool { return !this->handle_.is_none(); }
    [[nodiscard]] auto retired() const -> bool { return this->retired_; }

private:
    Native::NativeHandle handle_  = Native::NativeHandle::none();
    bool                 retired_ = false;
};

} // namespace HG
