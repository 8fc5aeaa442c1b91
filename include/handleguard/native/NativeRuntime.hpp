#pragma once

#include <handleguard/core/Error.hpp>
#include <handleguard/native/NativeTypes.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace HG::Native {

/**
 * NativeRuntime is the narrow surface through which the dispatch core and
 * the window nodes talk to the foreign windowing runtime. It mirrors the
 * Win32 user32/comctl32 contract:
 * - handles are issued by the runtime and may be invalidated by it at any
 *   time (destroying a parent destroys its children);
 * - messages are delivered synchronously on the calling thread, so any call
 *   below may re-enter a registered window procedure before it returns;
 * - every window carries one pointer-sized user-data slot and an ordered
 *   chain of subclass procedures with per-registration reference data.
 *
 * All calls must happen on the thread that owns the event loop.
 */
class NativeRuntime {
public:
    virtual ~NativeRuntime() = default;

    // Window classes
    [[nodiscard]] virtual auto class_registered(std::string_view name) const -> bool = 0;
    virtual auto register_class(WindowClass const& cls) -> Expected<void>             = 0;
    virtual auto init_common_controls() -> Expected<void>                              = 0;

    // Lifetime
    virtual auto create_window(CreateRequest const& request) -> Expected<NativeHandle> = 0;
    virtual auto destroy_window(NativeHandle handle) -> Expected<void>                 = 0;
    [[nodiscard]] virtual auto is_window(NativeHandle handle) const -> bool            = 0;
    [[nodiscard]] virtual auto parent_of(NativeHandle handle) const -> NativeHandle    = 0;

    // Association slots
    virtual auto set_user_data(NativeHandle handle, void* data) -> void*                 = 0;
    [[nodiscard]] virtual auto user_data(NativeHandle handle) const -> void*             = 0;
    virtual auto set_subclass(NativeHandle handle,
                              SubclassProcFn proc,
                              std::uintptr_t id,
                              std::uintptr_t ref_data) -> Expected<void>                 = 0;
    virtual auto remove_subclass(NativeHandle handle, SubclassProcFn proc, std::uintptr_t id) -> bool = 0;
    [[nodiscard]] virtual auto creation_param(LParam lparam) const -> void*              = 0;

    // Default handling
    virtual auto default_proc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult          = 0;
    virtual auto default_subclass_proc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult = 0;

    // Messaging
    virtual auto send_message(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult        = 0;
    virtual auto post_message(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> Expected<void> = 0;
    virtual auto get_message(NativeMessage& out) -> PumpResult                                                        = 0;
    virtual auto dispatch_message(NativeMessage const& message) -> LResult                                           = 0;
    virtual auto post_quit(int exit_code) -> void                                                                     = 0;
    [[nodiscard]] virtual auto quit_code() const -> int                                                               = 0;

    // Surface
    virtual auto set_text(NativeHandle handle, std::string_view text) -> Expected<void>     = 0;
    virtual auto window_text(NativeHandle handle) const -> Expected<std::string>            = 0;
    virtual auto window_rect(NativeHandle handle) const -> Expected<Rect>                   = 0;
    virtual auto client_rect(NativeHandle handle) const -> Expected<Rect>                   = 0;
    virtual auto set_window_pos(NativeHandle handle, Rect const& rect) -> Expected<void>    = 0;
    virtual auto show_window(NativeHandle handle, bool visible) -> Expected<void>           = 0;
    [[nodiscard]] virtual auto is_visible(NativeHandle handle) const -> bool                = 0;
    virtual auto invalidate(NativeHandle handle) -> Expected<void>                          = 0;
    virtual auto begin_paint(NativeHandle handle) -> Expected<DrawContext>                  = 0;
    virtual auto end_paint(NativeHandle handle, DrawContext context) -> void                = 0;
    virtual auto fill_rect(DrawContext context, Rect const& rect, Color color) -> Expected<void> = 0;
    virtual auto capture(NativeHandle handle) const -> Expected<NativeBitmap>               = 0;
    [[nodiscard]] virtual auto virtual_screen() const -> Rect                               = 0;
};

// Runtime the raw entry points talk to: the runtime currently delivering a
// message if any, otherwise the installed one. A HeadlessRuntime is
// installed lazily when nothing else was.
[[nodiscard]] auto CurrentRuntime() -> NativeRuntime&;
[[nodiscard]] auto CurrentRuntimeShared() -> std::shared_ptr<NativeRuntime>;

// Installs `runtime` as the current runtime and returns the previous one.
auto InstallRuntime(std::shared_ptr<NativeRuntime> runtime) -> std::shared_ptr<NativeRuntime>;

// Installs a runtime for the lifetime of the scope and restores the previous
// one afterwards.
class RuntimeScope {
public:
    explicit RuntimeScope(std::shared_ptr<NativeRuntime> runtime);
    ~RuntimeScope();

    RuntimeScope(RuntimeScope const&)            = delete;
    RuntimeScope& operator=(RuntimeScope const&) = delete;

    [[nodiscard]] auto runtime() const -> NativeRuntime& { return *current; }

private:
    std::shared_ptr<NativeRuntime> current;
    std::shared_ptr<NativeRuntime> previous;
};

// Held by a runtime while it calls into a window procedure, so that entry
// points reached from that call resolve to the delivering runtime.
class DeliveryScope {
public:
    explicit DeliveryScope(NativeRuntime& runtime) noexcept;
    ~DeliveryScope();

    DeliveryScope(DeliveryScope const&)            = delete;
    DeliveryScope& operator=(DeliveryScope const&) = delete;

private:
    NativeRuntime* previous;
};

} // namespace HG::Native
