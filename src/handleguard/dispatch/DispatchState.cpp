#include <handleguard/dispatch/DispatchState.hpp>

#include <handleguard/core/Fatal.hpp>

#include <limits>
#include <utility>

namespace HG::Dispatch {
namespace {

std::size_t gLiveStates = 0;

} // namespace

DispatchState::DispatchState(std::shared_ptr<HandleCell> cell, std::unique_ptr<WindowProc> proc)
    : windowProc(std::move(proc)), handleCell(std::move(cell)) {
    ++gLiveStates;
}

DispatchState::~DispatchState() {
    --gLiveStates;
}

auto DispatchState::enter() -> std::uint32_t {
    if (this->entryCount == std::numeric_limits<std::uint32_t>::max()) {
        FatalError("dispatch entry counter overflow");
    }
    return ++this->entryCount;
}

auto DispatchState::leave() -> bool {
    --this->entryCount;
    return this->entryCount == 0 && this->teardownPending;
}

auto DispatchState::live_count() -> std::size_t {
    return gLiveStates;
}

} // namespace HG::Dispatch
