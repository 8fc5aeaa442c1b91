#pragma once

#include <handleguard/native/NativeTypes.hpp>

#include <cstdint>

namespace HG::Dispatch {

using DefaultProcFn = Native::LResult (*)(Native::NativeHandle, Native::MessageId, Native::WParam, Native::LParam);

// One routed native notification as seen by user dispatch logic.
struct DispatchCall {
    Native::NativeHandle handle  = Native::NativeHandle::none();
    Native::MessageId    message = 0;
    Native::WParam       wparam  = 0;
    Native::LParam       lparam  = 0;
    // True when the call arrived through the subclass entry point of a
    // native control rather than a window class procedure.
    bool                 subclassed = false;
    // Number of live dispatch frames for this object, this one included.
    std::uint32_t        depth = 0;
    DefaultProcFn        default_proc = nullptr;

    // Hands the message to the native default handler bound for this entry point.
    [[nodiscard]] auto forward() const -> Native::LResult {
        return default_proc(handle, message, wparam, lparam);
    }
};

/**
 * User dispatch logic owned by a DispatchState.
 *
 * handle_message may call arbitrary user code, which may in turn destroy the
 * window (directly or through a parent) and re-enter the router before this
 * call returns. The handle in `call` is valid on entry only. Unhandled
 * messages should go to call.forward(). Exceptions are allowed: the router
 * contains them and tears the association down.
 */
class WindowProc {
public:
    virtual ~WindowProc() = default;

    virtual auto handle_message(DispatchCall const& call) -> Native::LResult = 0;
};

} // namespace HG::Dispatch
