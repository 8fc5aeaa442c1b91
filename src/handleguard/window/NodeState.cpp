#include "NodeState.hpp"

#include <handleguard/log/TaggedLogger.hpp>

#include <utility>

namespace HG::UI {
namespace {

// Ends the paint also when the painter throws.
struct PaintScope {
    Native::NativeRuntime& runtime;
    Native::NativeHandle   handle;
    Native::DrawContext    context;

    ~PaintScope() { runtime.end_paint(handle, context); }
};

} // namespace

NodeState::NodeState(std::shared_ptr<Native::NativeRuntime> runtime)
    : runtime(std::move(runtime)), painter(std::make_shared<SolidBackgroundPainter>()) {}

NodeProc::NodeProc(std::shared_ptr<NodeState> state)
    : state(std::move(state)) {}

auto NodeProc::handle_message(Dispatch::DispatchCall const& call) -> Native::LResult {
    switch (call.message) {
    case Native::Msg::kClose:
        return this->close();
    case Native::Msg::kDestroy: {
        auto self = this->state->self.lock();
        this->state->onDestroy.invoke(self);
        return call.forward();
    }
    case Native::Msg::kNcDestroy:
        return this->release(call);
    case Native::Msg::kPaint:
        if (call.subclassed) {
            return call.forward();
        }
        return this->paint(call);
    default:
        return call.forward();
    }
}

// A close request only notifies; destroying the window is up to the handler.
auto NodeProc::close() -> Native::LResult {
    auto self = this->state->self.lock();
    this->state->onClose.invoke(self);
    return 0;
}

auto NodeProc::release(Dispatch::DispatchCall const& call) -> Native::LResult {
    // Moved out first: releasing a child can run arbitrary code that reaches
    // back into this node.
    auto released = std::exchange(this->state->children, {});
    released.clear();
    this->state->onClose.clear();
    this->state->onDestroy.clear();
    return call.forward();
}

auto NodeProc::paint(Dispatch::DispatchCall const& call) -> Native::LResult {
    auto& runtime = *this->state->runtime;
    auto  context = runtime.begin_paint(call.handle);
    if (!context) {
        hg_log("begin_paint failed: " + describeError(context.error()), "Window", "ERROR");
        return 0;
    }
    PaintScope scope{runtime, call.handle, *context};

    auto client = runtime.client_rect(call.handle);
    if (!client) {
        hg_log("client_rect failed: " + describeError(client.error()), "Window", "ERROR");
        return 0;
    }
    auto painter = this->state->painter;
    if (!painter) {
        return 0;
    }
    auto painted = painter->paint(PaintRequest{runtime, *context, *client, this->state->background});
    if (!painted) {
        hg_log("Painter failed: " + describeError(painted.error()), "Window", "ERROR");
    }
    return 0;
}

} // namespace HG::UI
