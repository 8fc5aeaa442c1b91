#include <handleguard/dispatch/Router.hpp>

#include <handleguard/config/Flags.hpp>
#include <handleguard/dispatch/DispatchState.hpp>
#include <handleguard/log/TaggedLogger.hpp>
#include <handleguard/native/NativeRuntime.hpp>

#include <exception>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace HG::Dispatch {
namespace {

using Native::LParam;
using Native::LResult;
using Native::MessageId;
using Native::NativeHandle;
using Native::WParam;

auto fault_observer_slot() -> FaultObserver& {
    static FaultObserver observer;
    return observer;
}

auto describe_call(NativeHandle handle, MessageId message, bool subclassed) -> std::string {
    std::ostringstream oss;
    oss << (subclassed ? "subclass" : "primary") << " handle=0x" << std::hex << handle.value
        << " message=0x" << message;
    return oss.str();
}

auto report_fault(FaultReport const& report) -> void {
    auto observer = fault_observer_slot();
    if (observer) {
        observer(report);
        return;
    }
    hg_log("Contained fault (" + describe_call(report.handle, report.message, report.subclassed) + "): " + report.what,
           "Fault",
           "ERROR");
}

// Steps shared by both entry points once the state is resolved: count the
// frame, run the user logic inside the fault boundary, schedule teardown on
// the terminal message or a fault, and release the state when the last frame
// unwinds.
template <typename Detach>
auto run_dispatch(DispatchState* state, DispatchCall& call, Detach&& detach) noexcept -> LResult {
    call.depth = state->enter();
    if (Config::DispatchTraceEnabled()) {
        hg_log("enter " + describe_call(call.handle, call.message, call.subclassed) + " depth=" + std::to_string(call.depth),
               "Dispatch");
    }

    LResult     result  = 0;
    bool        faulted = false;
    std::string what;
    try {
        result = state->proc().handle_message(call);
    } catch (std::exception const& ex) {
        faulted = true;
        what    = ex.what();
    } catch (...) {
        faulted = true;
        what    = "non-standard exception";
    }

    if (faulted) {
        report_fault(FaultReport{.handle = call.handle, .message = call.message, .subclassed = call.subclassed, .what = std::move(what)});
        result = 0;
    }

    if (faulted || call.message == Native::Msg::kNcDestroy) {
        if (!state->teardown_pending()) {
            state->schedule_teardown();
            detach();
            state->cell().clear();
        }
    }

    if (state->leave()) {
        if (Config::DispatchTraceEnabled()) {
            hg_log("release " + describe_call(call.handle, call.message, call.subclassed), "Dispatch");
        }
        std::unique_ptr<DispatchState> release{state};
    }
    return result;
}

} // namespace

auto SetFaultObserver(FaultObserver observer) -> FaultObserver {
    return std::exchange(fault_observer_slot(), std::move(observer));
}

auto DefaultWindowProc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult {
    return Native::CurrentRuntime().default_proc(handle, message, wparam, lparam);
}

auto DefaultSubclassProc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult {
    return Native::CurrentRuntime().default_subclass_proc(handle, message, wparam, lparam);
}

auto PrimaryEntry(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) noexcept -> LResult {
    auto& runtime = Native::CurrentRuntime();

    DispatchState* state = nullptr;
    if (message == Native::Msg::kNcCreate) {
        // No association exists yet; the pointer travels in the creation block.
        auto* pending = static_cast<PendingAdoption*>(runtime.creation_param(lparam));
        if (pending != nullptr && pending->state) {
            state = pending->state.release();
            runtime.set_user_data(handle, state);
            // A retired cell stays retired: a replayed creation cannot revive it.
            if (!state->cell().set(handle) && state->cell().get() != handle) {
                hg_log("Handle cell refused identity " + describe_call(handle, message, false), "Router", "ERROR");
            }
        }
    }
    // A replayed pre-creation message without a block keeps the existing association.
    if (state == nullptr) {
        state = static_cast<DispatchState*>(runtime.user_data(handle));
    }

    if (state == nullptr) {
        return runtime.default_proc(handle, message, wparam, lparam);
    }

    DispatchCall call{.handle       = handle,
                      .message      = message,
                      .wparam       = wparam,
                      .lparam       = lparam,
                      .subclassed   = false,
                      .depth        = 0,
                      .default_proc = &DefaultWindowProc};
    return run_dispatch(state, call, [&runtime, handle, state] {
        if (runtime.user_data(handle) == state) {
            runtime.set_user_data(handle, nullptr);
        }
    });
}

auto SubclassEntry(NativeHandle handle,
                   MessageId message,
                   WParam wparam,
                   LParam lparam,
                   std::uintptr_t id,
                   std::uintptr_t ref_data) noexcept -> LResult {
    auto& runtime = Native::CurrentRuntime();

    auto* state = reinterpret_cast<DispatchState*>(ref_data);
    if (state == nullptr) {
        return runtime.default_subclass_proc(handle, message, wparam, lparam);
    }

    DispatchCall call{.handle       = handle,
                      .message      = message,
                      .wparam       = wparam,
                      .lparam       = lparam,
                      .subclassed   = true,
                      .depth        = 0,
                      .default_proc = &DefaultSubclassProc};
    return run_dispatch(state, call, [&runtime, handle, id] {
        runtime.remove_subclass(handle, &SubclassEntry, id);
    });
}

} // namespace HG::Dispatch
