#include <handleguard/window/WindowNode.hpp>

#include "NodeState.hpp"

#include <handleguard/dispatch/CreatedWindow.hpp>
#include <handleguard/log/TaggedLogger.hpp>

#include <algorithm>
#include <utility>

namespace HG::UI {
namespace {

constexpr int kOffscreenMargin = 10;

} // namespace

WindowNode::WindowNode(std::shared_ptr<NodeState> state, std::unique_ptr<Dispatch::CreatedWindow> created)
    : state(std::move(state)), created(std::move(created)) {}

// Members go in reverse order: the native peer is destroyed while the
// callbacks it may still reach are alive.
WindowNode::~WindowNode() = default;

auto WindowNode::Build(std::shared_ptr<Native::NativeRuntime> runtime, Dispatch::WindowSpec const& spec) -> Expected<Window> {
    auto state   = std::make_shared<NodeState>(runtime);
    auto created = Dispatch::CreatedWindow::Create(std::move(runtime), std::make_unique<NodeProc>(state), spec);
    if (!created) {
        return std::unexpected(created.error());
    }
    auto node   = Window(new WindowNode(state, std::move(*created)));
    state->self = node;
    return node;
}

auto WindowNode::CreateMain(std::shared_ptr<Native::NativeRuntime> runtime, MainWindowOptions const& options) -> Expected<Window> {
    if (!runtime) {
        runtime = Native::CurrentRuntimeShared();
    }
    if (options.size && (options.size->width < 0 || options.size->height < 0)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "new_main: negative size"});
    }
    Dispatch::WindowSpec spec;
    spec.text     = options.title;
    spec.style    = Native::Style::kOverlappedWindow | Native::Style::kClipChildren
                 | (options.visible ? Native::Style::kVisible : 0u);
    spec.ex_style = Native::ExStyle::kOverlappedWindow;
    spec.position = options.position;
    spec.size     = options.size;

    auto node = Build(std::move(runtime), spec);
    if (node) {
        hg_log("Created main window " + std::to_string((*node)->handle().value), "Window", "INFO");
    }
    return node;
}

auto WindowNode::live() const -> bool {
    return this->created->live();
}

auto WindowNode::handle() const -> Native::NativeHandle {
    return this->created->handle();
}

auto WindowNode::runtime() const -> Native::NativeRuntime& {
    return *this->state->runtime;
}

auto WindowNode::require_live(std::string_view operation) const -> Expected<void> {
    if (!this->created->live()) {
        return std::unexpected(destroyedError(operation));
    }
    return {};
}

auto WindowNode::destroy() -> Expected<void> {
    return this->created->destroy();
}

auto WindowNode::prune_children() -> void {
    std::erase_if(this->state->children, [](Window const& child) { return !child || !child->live(); });
}

auto WindowNode::create_child(ChildKind kind, ChildOptions const& options) -> Expected<Window> {
    if (auto ok = this->require_live("create_child"); !ok) {
        return std::unexpected(ok.error());
    }
    if (options.size && (options.size->width < 0 || options.size->height < 0)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "create_child: negative size"});
    }
    this->prune_children();

    auto const control = ControlSpecFor(kind, options.edit);
    Dispatch::WindowSpec spec;
    spec.control_class = control.control_class;
    spec.text          = options.text;
    spec.style         = control.style;
    spec.parent        = this->handle();
    spec.position      = options.position;
    spec.size          = options.size;

    auto child = Build(this->state->runtime, spec);
    if (!child) {
        return std::unexpected(child.error());
    }
    hg_log("Created " + std::string{childKindToString(kind)} + " child " + std::to_string((*child)->handle().value), "Window", "INFO");
    this->state->children.push_back(*child);
    return child;
}

auto WindowNode::children() -> std::vector<Window> {
    this->prune_children();
    return this->state->children;
}

auto WindowNode::set_text(std::string_view text) -> Expected<void> {
    if (auto ok = this->require_live("set_text"); !ok) {
        return ok;
    }
    return this->runtime().set_text(this->handle(), text);
}

auto WindowNode::text() const -> Expected<std::string> {
    if (auto ok = this->require_live("text"); !ok) {
        return std::unexpected(ok.error());
    }
    return this->runtime().window_text(this->handle());
}

auto WindowNode::set_bounds(std::optional<Native::Point> position, std::optional<Native::Size> size) -> Expected<void> {
    if (auto ok = this->require_live("set_bounds"); !ok) {
        return ok;
    }
    if (size && (size->width < 0 || size->height < 0)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "set_bounds: negative size"});
    }
    auto rect = this->runtime().window_rect(this->handle());
    if (!rect) {
        return std::unexpected(rect.error());
    }
    if (position) {
        rect->x = position->x;
        rect->y = position->y;
    }
    if (size) {
        rect->width  = size->width;
        rect->height = size->height;
    }
    return this->runtime().set_window_pos(this->handle(), *rect);
}

auto WindowNode::bounds() const -> Expected<Native::Rect> {
    if (auto ok = this->require_live("bounds"); !ok) {
        return std::unexpected(ok.error());
    }
    return this->runtime().window_rect(this->handle());
}

auto WindowNode::set_background(Native::Color color) -> Expected<void> {
    if (auto ok = this->require_live("set_background"); !ok) {
        return ok;
    }
    this->state->background = color;
    return this->runtime().invalidate(this->handle());
}

auto WindowNode::set_painter(std::shared_ptr<Painter> painter) -> Expected<void> {
    if (auto ok = this->require_live("set_painter"); !ok) {
        return ok;
    }
    if (!painter) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "set_painter: painter is required"});
    }
    this->state->painter = std::move(painter);
    return this->runtime().invalidate(this->handle());
}

auto WindowNode::set_visible(bool visible) -> Expected<void> {
    if (auto ok = this->require_live("set_visible"); !ok) {
        return ok;
    }
    return this->runtime().show_window(this->handle(), visible);
}

auto WindowNode::move_offscreen() -> Expected<void> {
    if (auto ok = this->require_live("move_offscreen"); !ok) {
        return ok;
    }
    auto rect = this->runtime().window_rect(this->handle());
    if (!rect) {
        return std::unexpected(rect.error());
    }
    auto const screen = this->runtime().virtual_screen();
    rect->x           = screen.x + screen.width + kOffscreenMargin;
    rect->y           = 0;
    return this->runtime().set_window_pos(this->handle(), *rect);
}

auto WindowNode::redraw() -> Expected<void> {
    if (auto ok = this->require_live("redraw"); !ok) {
        return ok;
    }
    return this->runtime().invalidate(this->handle());
}

auto WindowNode::render() -> void {
    // Paints self and descendants synchronously, the way a print request would.
    this->runtime().send_message(this->handle(), Native::Msg::kPaint, 0, 0);
    for (auto const& child : this->children()) {
        if (child->live()) {
            child->render();
        }
    }
}

auto WindowNode::snapshot() -> Expected<Bitmap> {
    if (auto ok = this->require_live("snapshot"); !ok) {
        return std::unexpected(ok.error());
    }
    this->render();
    if (auto ok = this->require_live("snapshot"); !ok) {
        return std::unexpected(ok.error());
    }
    auto capture = this->runtime().capture(this->handle());
    if (!capture) {
        return std::unexpected(capture.error());
    }
    return BitmapFromCapture(*capture);
}

auto WindowNode::on_close(WindowCallback callback) -> void {
    if (!this->live()) {
        return;
    }
    this->state->onClose.set(std::move(callback));
}

auto WindowNode::on_destroy(WindowCallback callback) -> void {
    if (!this->live()) {
        return;
    }
    this->state->onDestroy.set(std::move(callback));
}

} // namespace HG::UI
