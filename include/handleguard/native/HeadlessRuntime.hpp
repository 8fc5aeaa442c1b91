#pragma once

#include <handleguard/native/NativeRuntime.hpp>

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace HG::Native {

struct HeadlessOptions {
    Rect          virtual_screen{0, 0, 1920, 1080};
    // Used for top-level windows created without an explicit position or size.
    Rect          default_window{100, 100, 640, 480};
    // Bit depth reported by capture(); anything but 32 describes a layout the
    // snapshot path does not understand.
    std::uint16_t capture_bits_per_pixel = 32;
};

/**
 * In-process windowing runtime with Win32 message semantics.
 *
 * - Handles come from a strictly increasing counter and are never reused.
 * - create_window sends kNcCreate then kCreate synchronously; a zero result
 *   from kNcCreate or -1 from kCreate aborts the creation.
 * - destroy_window hides the window, sends kDestroy to it and then to its
 *   descendants (pre-order), and finally kNcDestroy to the descendants and
 *   the window (post-order). Destroying a parent therefore destroys every
 *   child without consulting their owners.
 * - Subclass procedures are called newest first; default_subclass_proc
 *   continues with the next registration that is still installed, ending at
 *   the class procedure.
 * - get_message returns posted messages first, then a pending quit, then one
 *   synthesized kPaint for a visible window with an invalid surface, and
 *   reports Idle when there is nothing left.
 * - Each window owns a 32-bit surface of its client size that fill_rect paints
 *   into and capture() copies out.
 *
 * The built-in control classes (BUTTON, EDIT, STATIC) paint their face and
 * otherwise behave like default_proc.
 */
class HeadlessRuntime final : public NativeRuntime {
public:
    explicit HeadlessRuntime(HeadlessOptions options = {});
    ~HeadlessRuntime() override;

    HeadlessRuntime(HeadlessRuntime const&)            = delete;
    HeadlessRuntime& operator=(HeadlessRuntime const&) = delete;

    [[nodiscard]] auto class_registered(std::string_view name) const -> bool override;
    auto register_class(WindowClass const& cls) -> Expected<void> override;
    auto init_common_controls() -> Expected<void> override;

    auto create_window(CreateRequest const& request) -> Expected<NativeHandle> override;
    auto destroy_window(NativeHandle handle) -> Expected<void> override;
    [[nodiscard]] auto is_window(NativeHandle handle) const -> bool override;
    [[nodiscard]] auto parent_of(NativeHandle handle) const -> NativeHandle override;

    auto set_user_data(NativeHandle handle, void* data) -> void* override;
    [[nodiscard]] auto user_data(NativeHandle handle) const -> void* override;
    auto set_subclass(NativeHandle handle, SubclassProcFn proc, std::uintptr_t id, std::uintptr_t ref_data) -> Expected<void> override;
    auto remove_subclass(NativeHandle handle, SubclassProcFn proc, std::uintptr_t id) -> bool override;
    [[nodiscard]] auto creation_param(LParam lparam) const -> void* override;

    auto default_proc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult override;
    auto default_subclass_proc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult override;

    auto send_message(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult override;
    auto post_message(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> Expected<void> override;
    auto get_message(NativeMessage& out) -> PumpResult override;
    auto dispatch_message(NativeMessage const& message) -> LResult override;
    auto post_quit(int exit_code) -> void override;
    [[nodiscard]] auto quit_code() const -> int override;

    auto set_text(NativeHandle handle, std::string_view text) -> Expected<void> override;
    auto window_text(NativeHandle handle) const -> Expected<std::string> override;
    auto window_rect(NativeHandle handle) const -> Expected<Rect> override;
    auto client_rect(NativeHandle handle) const -> Expected<Rect> override;
    auto set_window_pos(NativeHandle handle, Rect const& rect) -> Expected<void> override;
    auto show_window(NativeHandle handle, bool visible) -> Expected<void> override;
    [[nodiscard]] auto is_visible(NativeHandle handle) const -> bool override;
    auto invalidate(NativeHandle handle) -> Expected<void> override;
    auto begin_paint(NativeHandle handle) -> Expected<DrawContext> override;
    auto end_paint(NativeHandle handle, DrawContext context) -> void override;
    auto fill_rect(DrawContext context, Rect const& rect, Color color) -> Expected<void> override;
    auto capture(NativeHandle handle) const -> Expected<NativeBitmap> override;
    [[nodiscard]] auto virtual_screen() const -> Rect override;

    // Inspection helpers for tests and diagnostics.
    [[nodiscard]] auto window_count() const -> std::size_t;
    [[nodiscard]] auto children_of(NativeHandle handle) const -> std::vector<NativeHandle>;
    [[nodiscard]] auto style_of(NativeHandle handle) const -> std::uint32_t;
    [[nodiscard]] auto class_of(NativeHandle handle) const -> std::string;
    [[nodiscard]] auto subclass_count(NativeHandle handle) const -> std::size_t;
    [[nodiscard]] auto pending_messages() const -> std::size_t;
    [[nodiscard]] auto last_issued() const -> NativeHandle;

private:
    struct Subclass {
        SubclassProcFn proc     = nullptr;
        std::uintptr_t id       = 0;
        std::uintptr_t ref_data = 0;
    };

    struct WindowRecord {
        NativeHandle               handle;
        NativeHandle               parent;
        std::vector<NativeHandle>  children;
        std::string                class_name;
        WindowProcFn               proc = nullptr;
        std::string                text;
        std::uint32_t              style    = 0;
        std::uint32_t              ex_style = 0;
        Rect                       rect;
        bool                       visible    = false;
        bool                       dirty      = false;
        bool                       destroying = false;
        bool                       destroySent = false;
        bool                       painting   = false;
        void*                      user_data  = nullptr;
        std::vector<Subclass>      subclasses;
        std::vector<std::uint32_t> surface;
    };

    // Position in a subclass chain for one in-flight message.
    struct ChainFrame {
        NativeHandle          handle;
        std::vector<Subclass> snapshot;
        std::size_t           next = 0;
    };

    auto find(NativeHandle handle) -> WindowRecord*;
    auto find(NativeHandle handle) const -> WindowRecord const*;
    auto deliver(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult;
    auto call_chain(ChainFrame& frame, MessageId message, WParam wparam, LParam lparam) -> LResult;
    auto installed(NativeHandle handle, Subclass const& entry) const -> Subclass const*;
    auto class_proc(NativeHandle handle) const -> WindowProcFn;
    auto mark_destroying(NativeHandle handle) -> void;
    auto send_destroy_tree(NativeHandle handle) -> void;
    auto free_tree(NativeHandle handle) -> void;
    auto composite(WindowRecord const& record, std::vector<std::uint32_t>& target, int target_width, int target_height, Point origin) const -> void;
    auto resize_surface(WindowRecord& record) -> void;
    auto default_rect(CreateRequest const& request) const -> Rect;

    static auto control_proc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult;

    HeadlessOptions                                options;
    std::map<std::uintptr_t, std::unique_ptr<WindowRecord>> windows;
    std::unordered_map<std::string, WindowClass>   classes;
    std::deque<NativeMessage>                      posted;
    std::vector<ChainFrame*>                       chainStack;
    std::optional<int>                             quitRequested;
    int                                            lastQuitCode = 0;
    std::uintptr_t                                 nextHandle   = 0x10;
    NativeHandle                                   lastHandle   = NativeHandle::none();
};

} // namespace HG::Native
