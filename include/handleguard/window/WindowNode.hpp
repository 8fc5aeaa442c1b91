#pragma once

#include <handleguard/core/Error.hpp>
#include <handleguard/native/NativeRuntime.hpp>
#include <handleguard/window/Bitmap.hpp>
#include <handleguard/window/ChildKind.hpp>
#include <handleguard/window/Painter.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HG::Dispatch {
class CreatedWindow;
struct WindowSpec;
} // namespace HG::Dispatch

namespace HG::UI {

class WindowNode;
struct NodeState;

using Window         = std::shared_ptr<WindowNode>;
using WindowCallback = std::function<void(Window const& self)>;

struct MainWindowOptions {
    std::string                  title;
    std::optional<Native::Point> position;
    std::optional<Native::Size>  size;
    bool                         visible = false;
};

/**
 * One native window together with its callbacks and owned children.
 *
 * A node is Live from successful creation until its native peer receives the
 * terminal notification, which can happen through destroy(), release of the
 * last Window holding a Live node, or destruction of an ancestor by the
 * runtime. Every mutating operation fails with Error::Code::Destroyed once
 * the node is no longer Live and issues no native call in that case.
 *
 * Callbacks get the node itself as a temporary Window; it is empty when the
 * node is being released by its last holder.
 */
class WindowNode {
public:
    ~WindowNode();

    WindowNode(WindowNode const&)            = delete;
    WindowNode& operator=(WindowNode const&) = delete;

    static auto CreateMain(std::shared_ptr<Native::NativeRuntime> runtime, MainWindowOptions const& options) -> Expected<Window>;

    [[nodiscard]] auto live() const -> bool;
    [[nodiscard]] auto handle() const -> Native::NativeHandle;
    [[nodiscard]] auto runtime() const -> Native::NativeRuntime&;

    auto destroy() -> Expected<void>;

    auto create_child(ChildKind kind, ChildOptions const& options = {}) -> Expected<Window>;
    // Live children in creation order.
    auto children() -> std::vector<Window>;

    auto set_text(std::string_view text) -> Expected<void>;
    auto text() const -> Expected<std::string>;
    // Unset parts keep their current value.
    auto set_bounds(std::optional<Native::Point> position, std::optional<Native::Size> size) -> Expected<void>;
    auto bounds() const -> Expected<Native::Rect>;
    auto set_background(Native::Color color) -> Expected<void>;
    auto set_painter(std::shared_ptr<Painter> painter) -> Expected<void>;
    auto set_visible(bool visible) -> Expected<void>;
    auto move_offscreen() -> Expected<void>;
    auto redraw() -> Expected<void>;
    auto snapshot() -> Expected<Bitmap>;

    // Ignored once the node is no longer Live.
    auto on_close(WindowCallback callback) -> void;
    auto on_destroy(WindowCallback callback) -> void;

private:
    WindowNode(std::shared_ptr<NodeState> state, std::unique_ptr<Dispatch::CreatedWindow> created);

    static auto Build(std::shared_ptr<Native::NativeRuntime> runtime, Dispatch::WindowSpec const& spec) -> Expected<Window>;

    auto require_live(std::string_view operation) const -> Expected<void>;
    auto prune_children() -> void;
    auto render() -> void;

    std::shared_ptr<NodeState>               state;
    std::unique_ptr<Dispatch::CreatedWindow> created;
};

} // namespace HG::UI
