#pragma once

#include <handleguard/core/CallbackSlot.hpp>
#include <handleguard/dispatch/WindowProc.hpp>
#include <handleguard/native/NativeRuntime.hpp>
#include <handleguard/window/Painter.hpp>
#include <handleguard/window/WindowNode.hpp>

#include <memory>
#include <optional>
#include <vector>

namespace HG::UI {

// Per-node data shared between the WindowNode and its dispatch logic. It
// outlives whichever of the two goes first.
struct NodeState {
    explicit NodeState(std::shared_ptr<Native::NativeRuntime> runtime);

    std::shared_ptr<Native::NativeRuntime> runtime;
    CallbackSlot<Window const&>            onClose;
    CallbackSlot<Window const&>            onDestroy;
    std::optional<Native::Color>           background;
    std::shared_ptr<Painter>               painter;
    std::vector<Window>                    children;
    std::weak_ptr<WindowNode>              self;
};

class NodeProc final : public Dispatch::WindowProc {
public:
    explicit NodeProc(std::shared_ptr<NodeState> state);

    auto handle_message(Dispatch::DispatchCall const& call) -> Native::LResult override;

private:
    auto close() -> Native::LResult;
    auto release(Dispatch::DispatchCall const& call) -> Native::LResult;
    auto paint(Dispatch::DispatchCall const& call) -> Native::LResult;

    std::shared_ptr<NodeState> state;
};

} // namespace HG::UI
