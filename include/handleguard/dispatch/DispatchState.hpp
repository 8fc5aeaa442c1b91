#pragma once

#include <handleguard/core/HandleCell.hpp>
#include <handleguard/dispatch/WindowProc.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace HG::Testing {
struct DispatchStateAccess;
} // namespace HG::Testing

namespace HG::Dispatch {

/**
 * Recursion-counted owner of one native object's dispatch logic.
 *
 * Allocated when the object is created and handed to the runtime as a raw
 * pointer (user-data slot or subclass reference data). From then on the
 * router owns it: every dispatch call brackets its work with enter()/leave(),
 * and the state is released by the router exactly once, when leave() reports
 * that the last frame has unwound with teardown pending.
 */
class DispatchState {
public:
    DispatchState(std::shared_ptr<HandleCell> cell, std::unique_ptr<WindowProc> proc);
    ~DispatchState();

    DispatchState(DispatchState const&)            = delete;
    DispatchState& operator=(DispatchState const&) = delete;

    // Aborts the process instead of wrapping when the counter is exhausted.
    auto enter() -> std::uint32_t;
    // Returns true when the caller must release the state.
    [[nodiscard]] auto leave() -> bool;

    auto schedule_teardown() -> void { this->teardownPending = true; }

    [[nodiscard]] auto entries() const -> std::uint32_t { return this->entryCount; }
    [[nodiscard]] auto teardown_pending() const -> bool { return this->teardownPending; }
    [[nodiscard]] auto cell() const -> HandleCell& { return *this->handleCell; }
    [[nodiscard]] auto proc() const -> WindowProc& { return *this->windowProc; }

    // Number of states currently allocated in the process.
    [[nodiscard]] static auto live_count() -> std::size_t;

private:
    friend struct Testing::DispatchStateAccess;

    std::unique_ptr<WindowProc> windowProc;
    std::shared_ptr<HandleCell> handleCell;
    std::uint32_t               entryCount      = 0;
    bool                        teardownPending = false;
};

// Creation-parameter block for the primary entry point. The creator keeps
// it on its stack across the creation call; the router takes the state out
// of it on the pre-creation message. A state still present afterwards was
// never adopted and is released with the block.
struct PendingAdoption {
    std::unique_ptr<DispatchState> state;
};

} // namespace HG::Dispatch
