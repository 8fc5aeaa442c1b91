#pragma once

#include <handleguard/native/NativeTypes.hpp>

#include <cstdint>
#include <functional>
#include <string>

namespace HG::Dispatch {

// Identifier under which the router registers itself in a control's
// subclass chain.
inline constexpr std::uintptr_t kSubclassId = 0;

struct FaultReport {
    Native::NativeHandle handle  = Native::NativeHandle::none();
    Native::MessageId    message = 0;
    bool                 subclassed = false;
    std::string          what;
};

using FaultObserver = std::function<void(FaultReport const&)>;

// Replaces the fault observer and returns the previous one. An empty
// observer restores the default, which logs the fault. The observer runs
// inside the no-throw boundary: if it throws, the process terminates.
auto SetFaultObserver(FaultObserver observer) -> FaultObserver;

/**
 * Raw entry point for windows of classes registered by this library.
 *
 * The pre-creation message carries a PendingAdoption in its creation
 * parameters; the router adopts the DispatchState from it and records it in
 * the window's user-data slot for every later call. Never throws.
 */
auto PrimaryEntry(Native::NativeHandle handle,
                  Native::MessageId message,
                  Native::WParam wparam,
                  Native::LParam lparam) noexcept -> Native::LResult;

/**
 * Raw entry point registered in the subclass chain of native controls.
 * `ref_data` is the DispatchState supplied at registration. Never throws.
 */
auto SubclassEntry(Native::NativeHandle handle,
                   Native::MessageId message,
                   Native::WParam wparam,
                   Native::LParam lparam,
                   std::uintptr_t id,
                   std::uintptr_t ref_data) noexcept -> Native::LResult;

// Default handlers bound into DispatchCall for each entry point.
auto DefaultWindowProc(Native::NativeHandle handle,
                       Native::MessageId message,
                       Native::WParam wparam,
                       Native::LParam lparam) -> Native::LResult;

auto DefaultSubclassProc(Native::NativeHandle handle,
                         Native::MessageId message,
                         Native::WParam wparam,
                         Native::LParam lparam) -> Native::LResult;

} // namespace HG::Dispatch
