#include <handleguard/native/NativeRuntime.hpp>

#include <handleguard/log/TaggedLogger.hpp>
#include <handleguard/native/HeadlessRuntime.hpp>

#include <utility>

namespace HG::Native {
namespace {

// Single-threaded by contract: the runtime belongs to the event-loop thread.
auto active_slot() -> std::shared_ptr<NativeRuntime>& {
    // Constructed first so it outlives the runtime, which logs while tearing down.
    (void)logger();
    static std::shared_ptr<NativeRuntime> active;
    return active;
}

NativeRuntime* gDelivering = nullptr;

} // namespace

auto CurrentRuntimeShared() -> std::shared_ptr<NativeRuntime> {
    auto& slot = active_slot();
    if (!slot) {
        hg_log("No runtime installed; falling back to the in-process headless runtime", "Runtime", "WARN");
        slot = std::make_shared<HeadlessRuntime>();
    }
    return slot;
}

auto CurrentRuntime() -> NativeRuntime& {
    if (gDelivering != nullptr) {
        return *gDelivering;
    }
    auto& slot = active_slot();
    if (!slot) {
        return *CurrentRuntimeShared();
    }
    return *slot;
}

auto InstallRuntime(std::shared_ptr<NativeRuntime> runtime) -> std::shared_ptr<NativeRuntime> {
    return std::exchange(active_slot(), std::move(runtime));
}

RuntimeScope::RuntimeScope(std::shared_ptr<NativeRuntime> runtime)
    : current(std::move(runtime)) {
    if (!current) {
        current = std::make_shared<HeadlessRuntime>();
    }
    previous = InstallRuntime(current);
}

RuntimeScope::~RuntimeScope() {
    InstallRuntime(std::move(previous));
}

DeliveryScope::DeliveryScope(NativeRuntime& runtime) noexcept
    : previous(std::exchange(gDelivering, &runtime)) {}

DeliveryScope::~DeliveryScope() {
    gDelivering = previous;
}

} // namespace HG::Native
