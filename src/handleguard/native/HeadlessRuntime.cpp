#include <handleguard/native/HeadlessRuntime.hpp>

#include <handleguard/log/TaggedLogger.hpp>

#include <algorithm>
#include <array>
#include <ranges>
#include <utility>

namespace HG::Native {
namespace {

constexpr std::uint32_t kBlankPixel   = 0x00FFFFFF;
constexpr Color         kControlFace{192, 192, 192};

constexpr auto builtin_control_classes = std::to_array<std::string_view>({"BUTTON", "EDIT", "STATIC"});

auto pack_pixel(Color const& color) -> std::uint32_t {
    return (static_cast<std::uint32_t>(color.r) << 16) | (static_cast<std::uint32_t>(color.g) << 8)
           | static_cast<std::uint32_t>(color.b);
}

auto pack_words(int low, int high) -> LParam {
    auto const lo = static_cast<std::uint32_t>(low) & 0xFFFFu;
    auto const hi = static_cast<std::uint32_t>(high) & 0xFFFFu;
    return static_cast<LParam>((hi << 16) | lo);
}

auto invalid_handle(std::string_view operation) -> Error {
    return nativeError(ErrorCode::kInvalidWindowHandle, std::string{operation} + ": invalid window handle");
}

auto hex(std::uintptr_t value) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    do {
        out.insert(out.begin(), digits[value & 0xF]);
        value >>= 4;
    } while (value != 0);
    return "0x" + out;
}

} // namespace

HeadlessRuntime::HeadlessRuntime(HeadlessOptions opts)
    : options(std::move(opts)) {}

HeadlessRuntime::~HeadlessRuntime() {
    std::vector<NativeHandle> roots;
    for (auto const& [value, record] : this->windows) {
        if (record->parent.is_none()) {
            roots.push_back(record->handle);
        }
    }
    for (auto handle : roots) {
        if (!this->is_window(handle)) {
            continue;
        }
        if (auto destroyed = this->destroy_window(handle); !destroyed) {
            hg_log("Teardown of " + hex(handle.value) + " failed: " + describeError(destroyed.error()), "Runtime", "ERROR");
        }
    }
}

auto HeadlessRuntime::find(NativeHandle handle) -> WindowRecord* {
    auto it = this->windows.find(handle.value);
    return it == this->windows.end() ? nullptr : it->second.get();
}

auto HeadlessRuntime::find(NativeHandle handle) const -> WindowRecord const* {
    auto it = this->windows.find(handle.value);
    return it == this->windows.end() ? nullptr : it->second.get();
}

auto HeadlessRuntime::class_registered(std::string_view name) const -> bool {
    return this->classes.contains(std::string{name});
}

auto HeadlessRuntime::register_class(WindowClass const& cls) -> Expected<void> {
    if (cls.name.empty() || cls.proc == nullptr) {
        return std::unexpected(nativeError(ErrorCode::kInvalidParameter, "register_class: name and procedure are required"));
    }
    if (this->classes.contains(cls.name)) {
        return std::unexpected(nativeError(ErrorCode::kClassAlreadyExists, "register_class: '" + cls.name + "' already exists"));
    }
    this->classes.emplace(cls.name, cls);
    return {};
}

auto HeadlessRuntime::init_common_controls() -> Expected<void> {
    for (auto name : builtin_control_classes) {
        if (this->class_registered(name)) {
            continue;
        }
        if (auto registered = this->register_class(WindowClass{std::string{name}, &HeadlessRuntime::control_proc}); !registered) {
            return std::unexpected(registered.error());
        }
    }
    return {};
}

auto HeadlessRuntime::default_rect(CreateRequest const& request) const -> Rect {
    Rect rect;
    if (request.parent.is_none()) {
        rect = this->options.default_window;
    }
    if (request.position) {
        rect.x = request.position->x;
        rect.y = request.position->y;
    }
    if (request.size) {
        rect.width  = request.size->width;
        rect.height = request.size->height;
    }
    return rect;
}

auto HeadlessRuntime::resize_surface(WindowRecord& record) -> void {
    auto const width  = std::max(record.rect.width, 0);
    auto const height = std::max(record.rect.height, 0);
    record.surface.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), kBlankPixel);
    record.dirty = true;
}

auto HeadlessRuntime::create_window(CreateRequest const& request) -> Expected<NativeHandle> {
    auto cls = this->classes.find(request.class_name);
    if (cls == this->classes.end()) {
        return std::unexpected(
                nativeError(ErrorCode::kClassNotFound, "create_window: class '" + request.class_name + "' is not registered"));
    }
    if (request.size && (request.size->width < 0 || request.size->height < 0)) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "create_window: negative size"});
    }
    if (request.parent.is_none() && (request.style & Style::kChild) != 0) {
        return std::unexpected(nativeError(ErrorCode::kTopLevelWithChild, "create_window: child style without a parent"));
    }
    if (!request.parent.is_none()) {
        auto* parent = this->find(request.parent);
        if (parent == nullptr || parent->destroying) {
            return std::unexpected(invalid_handle("create_window(parent)"));
        }
    }

    auto const handle = NativeHandle{this->nextHandle++};
    this->lastHandle  = handle;

    auto record        = std::make_unique<WindowRecord>();
    record->handle     = handle;
    record->parent     = request.parent;
    record->class_name = request.class_name;
    record->proc       = cls->second.proc;
    record->text       = request.text;
    record->style      = request.style;
    record->ex_style   = request.ex_style;
    record->rect       = this->default_rect(request);
    record->visible    = (request.style & Style::kVisible) != 0;
    this->resize_surface(*record);
    this->windows.emplace(handle.value, std::move(record));
    if (auto* parent = this->find(request.parent)) {
        parent->children.push_back(handle);
    }

    CreateStruct block{.create_params = request.create_params,
                       .parent        = request.parent,
                       .style         = request.style,
                       .ex_style      = request.ex_style,
                       .rect          = this->find(handle)->rect,
                       .class_name    = request.class_name,
                       .text          = request.text};

    auto const accepted = this->deliver(handle, Msg::kNcCreate, 0, reinterpret_cast<LParam>(&block));
    if (accepted == 0) {
        if (auto* self = this->find(handle); self != nullptr && !self->destroying) {
            this->mark_destroying(handle);
            this->free_tree(handle);
        }
        return std::unexpected(nativeError(ErrorCode::kCancelled, "create_window: creation refused"));
    }

    auto const created = this->deliver(handle, Msg::kCreate, 0, reinterpret_cast<LParam>(&block));
    if (created == -1) {
        if (auto* self = this->find(handle); self != nullptr && !self->destroying) {
            if (auto destroyed = this->destroy_window(handle); !destroyed) {
                hg_log("Cleanup after refused creation failed: " + describeError(destroyed.error()), "Runtime", "ERROR");
            }
        }
        return std::unexpected(nativeError(ErrorCode::kCancelled, "create_window: creation refused"));
    }

    auto const* self = this->find(handle);
    if (self == nullptr || self->destroying) {
        return std::unexpected(invalid_handle("create_window(destroyed during creation)"));
    }
    return handle;
}

auto HeadlessRuntime::mark_destroying(NativeHandle handle) -> void {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return;
    }
    record->destroying = true;
    record->visible    = false;
    for (auto child : record->children) {
        this->mark_destroying(child);
    }
}

auto HeadlessRuntime::send_destroy_tree(NativeHandle handle) -> void {
    auto* record = this->find(handle);
    if (record == nullptr || record->destroySent) {
        return;
    }
    record->destroySent = true;
    this->deliver(handle, Msg::kDestroy, 0, 0);

    // The procedure may have created or destroyed windows; look everything up again.
    record = this->find(handle);
    if (record == nullptr) {
        return;
    }
    auto const children = record->children;
    for (auto child : children) {
        this->send_destroy_tree(child);
    }
}

auto HeadlessRuntime::free_tree(NativeHandle handle) -> void {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return;
    }
    auto const children = record->children;
    for (auto child : children) {
        this->free_tree(child);
    }
    if (this->find(handle) == nullptr) {
        return;
    }
    this->deliver(handle, Msg::kNcDestroy, 0, 0);

    record = this->find(handle);
    if (record == nullptr) {
        return;
    }
    // Children created while the tree was coming down go with it.
    auto const late = record->children;
    for (auto child : late) {
        this->mark_destroying(child);
        this->free_tree(child);
    }
    if (auto* parent = this->find(record->parent)) {
        std::erase(parent->children, handle);
    }
    this->windows.erase(handle.value);
}

auto HeadlessRuntime::destroy_window(NativeHandle handle) -> Expected<void> {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("destroy_window"));
    }
    if (record->destroying) {
        return {};
    }
    hg_log("destroy_window " + hex(handle.value), "Runtime", "INFO");
    this->mark_destroying(handle);
    this->send_destroy_tree(handle);
    this->free_tree(handle);
    return {};
}

auto HeadlessRuntime::is_window(NativeHandle handle) const -> bool {
    return this->find(handle) != nullptr;
}

auto HeadlessRuntime::parent_of(NativeHandle handle) const -> NativeHandle {
    auto const* record = this->find(handle);
    return record == nullptr ? NativeHandle::none() : record->parent;
}

auto HeadlessRuntime::set_user_data(NativeHandle handle, void* data) -> void* {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return nullptr;
    }
    return std::exchange(record->user_data, data);
}

auto HeadlessRuntime::user_data(NativeHandle handle) const -> void* {
    auto const* record = this->find(handle);
    return record == nullptr ? nullptr : record->user_data;
}

auto HeadlessRuntime::set_subclass(NativeHandle handle, SubclassProcFn proc, std::uintptr_t id, std::uintptr_t ref_data)
        -> Expected<void> {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("set_subclass"));
    }
    if (proc == nullptr) {
        return std::unexpected(nativeError(ErrorCode::kInvalidParameter, "set_subclass: procedure is required"));
    }
    for (auto& entry : record->subclasses) {
        if (entry.proc == proc && entry.id == id) {
            entry.ref_data = ref_data;
            return {};
        }
    }
    record->subclasses.push_back(Subclass{proc, id, ref_data});
    return {};
}

auto HeadlessRuntime::remove_subclass(NativeHandle handle, SubclassProcFn proc, std::uintptr_t id) -> bool {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return false;
    }
    auto const removed = std::erase_if(record->subclasses, [&](Subclass const& entry) { return entry.proc == proc && entry.id == id; });
    return removed != 0;
}

auto HeadlessRuntime::creation_param(LParam lparam) const -> void* {
    if (lparam == 0) {
        return nullptr;
    }
    return reinterpret_cast<CreateStruct const*>(lparam)->create_params;
}

auto HeadlessRuntime::installed(NativeHandle handle, Subclass const& entry) const -> Subclass const* {
    auto const* record = this->find(handle);
    if (record == nullptr) {
        return nullptr;
    }
    for (auto const& live : record->subclasses) {
        if (live.proc == entry.proc && live.id == entry.id) {
            return &live;
        }
    }
    return nullptr;
}

auto HeadlessRuntime::class_proc(NativeHandle handle) const -> WindowProcFn {
    auto const* record = this->find(handle);
    return record == nullptr ? nullptr : record->proc;
}

auto HeadlessRuntime::call_chain(ChainFrame& frame, MessageId message, WParam wparam, LParam lparam) -> LResult {
    while (frame.next < frame.snapshot.size()) {
        auto const& entry = frame.snapshot[frame.next++];
        if (auto const* live = this->installed(frame.handle, entry)) {
            auto const proc     = live->proc;
            auto const id       = live->id;
            auto const ref_data = live->ref_data;
            return proc(frame.handle, message, wparam, lparam, id, ref_data);
        }
    }
    if (auto proc = this->class_proc(frame.handle)) {
        return proc(frame.handle, message, wparam, lparam);
    }
    return this->default_proc(frame.handle, message, wparam, lparam);
}

auto HeadlessRuntime::deliver(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return 0;
    }
    DeliveryScope scope{*this};

    if (record->subclasses.empty()) {
        auto proc = record->proc;
        return proc(handle, message, wparam, lparam);
    }

    ChainFrame frame{.handle   = handle,
                     .snapshot = std::vector<Subclass>(record->subclasses.rbegin(), record->subclasses.rend()),
                     .next     = 0};
    this->chainStack.push_back(&frame);
    // Pops the frame also when the procedure throws.
    struct Pop {
        std::vector<ChainFrame*>& stack;
        ~Pop() { stack.pop_back(); }
    } pop{this->chainStack};
    return this->call_chain(frame, message, wparam, lparam);
}

auto HeadlessRuntime::default_subclass_proc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult {
    for (auto* frame : std::views::reverse(this->chainStack)) {
        if (frame->handle == handle) {
            return this->call_chain(*frame, message, wparam, lparam);
        }
    }
    if (auto proc = this->class_proc(handle)) {
        DeliveryScope scope{*this};
        return proc(handle, message, wparam, lparam);
    }
    return this->default_proc(handle, message, wparam, lparam);
}

auto HeadlessRuntime::default_proc(NativeHandle handle, MessageId message, WParam, LParam lparam) -> LResult {
    switch (message) {
    case Msg::kNcCreate:
        return 1;
    case Msg::kClose:
        if (auto destroyed = this->destroy_window(handle); !destroyed) {
            hg_log("Default close handling failed: " + describeError(destroyed.error()), "Runtime", "ERROR");
        }
        return 0;
    case Msg::kSetText: {
        auto* record = this->find(handle);
        if (record == nullptr || lparam == 0) {
            return 0;
        }
        record->text  = *reinterpret_cast<std::string const*>(lparam);
        record->dirty = true;
        return 1;
    }
    case Msg::kPaint: {
        auto context = this->begin_paint(handle);
        if (context) {
            this->end_paint(handle, *context);
        }
        return 0;
    }
    default:
        return 0;
    }
}

auto HeadlessRuntime::control_proc(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult {
    auto& runtime = CurrentRuntime();
    if (message != Msg::kPaint) {
        return runtime.default_proc(handle, message, wparam, lparam);
    }
    auto context = runtime.begin_paint(handle);
    if (!context) {
        return 0;
    }
    if (auto client = runtime.client_rect(handle)) {
        if (auto filled = runtime.fill_rect(*context, *client, kControlFace); !filled) {
            hg_log("Control face paint failed: " + describeError(filled.error()), "Runtime", "ERROR");
        }
    }
    runtime.end_paint(handle, *context);
    return 0;
}

auto HeadlessRuntime::send_message(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> LResult {
    return this->deliver(handle, message, wparam, lparam);
}

auto HeadlessRuntime::post_message(NativeHandle handle, MessageId message, WParam wparam, LParam lparam) -> Expected<void> {
    if (!handle.is_none() && this->find(handle) == nullptr) {
        return std::unexpected(invalid_handle("post_message"));
    }
    this->posted.push_back(NativeMessage{handle, message, wparam, lparam});
    return {};
}

auto HeadlessRuntime::get_message(NativeMessage& out) -> PumpResult {
    while (!this->posted.empty()) {
        auto next = this->posted.front();
        this->posted.pop_front();
        if (next.handle.is_none() || this->find(next.handle) != nullptr) {
            out = next;
            return PumpResult::Message;
        }
    }
    if (this->quitRequested) {
        auto const code = *std::exchange(this->quitRequested, std::nullopt);
        this->lastQuitCode = code;
        out                = NativeMessage{NativeHandle::none(), Msg::kQuit, static_cast<WParam>(code), 0};
        return PumpResult::Quit;
    }
    for (auto& [value, record] : this->windows) {
        if (record->visible && record->dirty && !record->destroying) {
            // Validated here so a procedure that never paints cannot stall the pump.
            record->dirty = false;
            out           = NativeMessage{record->handle, Msg::kPaint, 0, 0};
            return PumpResult::Message;
        }
    }
    return PumpResult::Idle;
}

auto HeadlessRuntime::dispatch_message(NativeMessage const& message) -> LResult {
    if (message.handle.is_none()) {
        return 0;
    }
    return this->deliver(message.handle, message.message, message.wparam, message.lparam);
}

auto HeadlessRuntime::post_quit(int exit_code) -> void {
    this->quitRequested = exit_code;
    this->lastQuitCode  = exit_code;
}

auto HeadlessRuntime::quit_code() const -> int {
    return this->lastQuitCode;
}

auto HeadlessRuntime::set_text(NativeHandle handle, std::string_view text) -> Expected<void> {
    if (this->find(handle) == nullptr) {
        return std::unexpected(invalid_handle("set_text"));
    }
    std::string copy{text};
    auto const  stored = this->deliver(handle, Msg::kSetText, 0, reinterpret_cast<LParam>(&copy));
    if (stored == 0 && this->find(handle) == nullptr) {
        return std::unexpected(invalid_handle("set_text"));
    }
    return {};
}

auto HeadlessRuntime::window_text(NativeHandle handle) const -> Expected<std::string> {
    auto const* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("window_text"));
    }
    return record->text;
}

auto HeadlessRuntime::window_rect(NativeHandle handle) const -> Expected<Rect> {
    auto const* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("window_rect"));
    }
    return record->rect;
}

auto HeadlessRuntime::client_rect(NativeHandle handle) const -> Expected<Rect> {
    auto const* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("client_rect"));
    }
    return Rect{0, 0, record->rect.width, record->rect.height};
}

auto HeadlessRuntime::set_window_pos(NativeHandle handle, Rect const& rect) -> Expected<void> {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("set_window_pos"));
    }
    if (rect.width < 0 || rect.height < 0) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "set_window_pos: negative size"});
    }
    auto const resized = record->rect.width != rect.width || record->rect.height != rect.height;
    record->rect       = rect;
    if (resized) {
        this->resize_surface(*record);
    } else {
        record->dirty = true;
    }
    this->deliver(handle, Msg::kMove, 0, pack_words(rect.x, rect.y));
    if (resized) {
        this->deliver(handle, Msg::kSize, 0, pack_words(rect.width, rect.height));
    }
    return {};
}

auto HeadlessRuntime::show_window(NativeHandle handle, bool visible) -> Expected<void> {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("show_window"));
    }
    if (record->destroying) {
        return {};
    }
    auto const changed = record->visible != visible;
    record->visible    = visible;
    if (visible) {
        record->dirty = true;
    }
    if (changed) {
        this->deliver(handle, Msg::kShowWindow, visible ? 1 : 0, 0);
    }
    return {};
}

auto HeadlessRuntime::is_visible(NativeHandle handle) const -> bool {
    auto const* record = this->find(handle);
    return record != nullptr && record->visible && !record->destroying;
}

auto HeadlessRuntime::invalidate(NativeHandle handle) -> Expected<void> {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("invalidate"));
    }
    record->dirty = true;
    return {};
}

auto HeadlessRuntime::begin_paint(NativeHandle handle) -> Expected<DrawContext> {
    auto* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("begin_paint"));
    }
    record->painting = true;
    record->dirty    = false;
    return DrawContext{handle.value};
}

auto HeadlessRuntime::end_paint(NativeHandle handle, DrawContext context) -> void {
    if (context.value != handle.value) {
        return;
    }
    if (auto* record = this->find(handle)) {
        record->painting = false;
    }
}

auto HeadlessRuntime::fill_rect(DrawContext context, Rect const& rect, Color color) -> Expected<void> {
    auto* record = this->find(NativeHandle{context.value});
    if (record == nullptr) {
        return std::unexpected(invalid_handle("fill_rect"));
    }
    if (!record->painting) {
        return std::unexpected(nativeError(ErrorCode::kNotPainting, "fill_rect: no paint in progress"));
    }
    auto const width  = record->rect.width;
    auto const height = record->rect.height;
    auto const left   = std::clamp(rect.x, 0, width);
    auto const top    = std::clamp(rect.y, 0, height);
    auto const right  = std::clamp(rect.x + rect.width, 0, width);
    auto const bottom = std::clamp(rect.y + rect.height, 0, height);
    auto const pixel  = pack_pixel(color);
    for (int y = top; y < bottom; ++y) {
        auto row = record->surface.begin() + static_cast<std::ptrdiff_t>(y) * width;
        std::fill(row + left, row + right, pixel);
    }
    return {};
}

auto HeadlessRuntime::composite(WindowRecord const& record,
                                std::vector<std::uint32_t>& target,
                                int target_width,
                                int target_height,
                                Point origin) const -> void {
    auto const width  = record.rect.width;
    auto const height = record.rect.height;
    for (int y = 0; y < height; ++y) {
        auto const ty = origin.y + y;
        if (ty < 0 || ty >= target_height) {
            continue;
        }
        for (int x = 0; x < width; ++x) {
            auto const tx = origin.x + x;
            if (tx < 0 || tx >= target_width) {
                continue;
            }
            target[static_cast<std::size_t>(ty) * target_width + tx] = record.surface[static_cast<std::size_t>(y) * width + x];
        }
    }
    for (auto child : record.children) {
        auto const* nested = this->find(child);
        if (nested == nullptr || !nested->visible || nested->destroying) {
            continue;
        }
        this->composite(*nested, target, target_width, target_height, Point{origin.x + nested->rect.x, origin.y + nested->rect.y});
    }
}

auto HeadlessRuntime::capture(NativeHandle handle) const -> Expected<NativeBitmap> {
    auto const* record = this->find(handle);
    if (record == nullptr) {
        return std::unexpected(invalid_handle("capture"));
    }
    NativeBitmap bitmap;
    bitmap.width          = record->rect.width;
    bitmap.height         = record->rect.height;
    bitmap.bits_per_pixel = this->options.capture_bits_per_pixel;
    bitmap.planes         = 1;
    bitmap.size_bytes     = static_cast<std::uint32_t>(static_cast<std::uint64_t>(bitmap.width) * bitmap.height
                                                   * bitmap.bits_per_pixel / 8);
    bitmap.pixels.assign(static_cast<std::size_t>(bitmap.width) * static_cast<std::size_t>(bitmap.height), kBlankPixel);
    this->composite(*record, bitmap.pixels, bitmap.width, bitmap.height, Point{0, 0});
    return bitmap;
}

auto HeadlessRuntime::virtual_screen() const -> Rect {
    return this->options.virtual_screen;
}

auto HeadlessRuntime::window_count() const -> std::size_t {
    return this->windows.size();
}

auto HeadlessRuntime::children_of(NativeHandle handle) const -> std::vector<NativeHandle> {
    auto const* record = this->find(handle);
    return record == nullptr ? std::vector<NativeHandle>{} : record->children;
}

auto HeadlessRuntime::style_of(NativeHandle handle) const -> std::uint32_t {
    auto const* record = this->find(handle);
    return record == nullptr ? 0 : record->style;
}

auto HeadlessRuntime::class_of(NativeHandle handle) const -> std::string {
    auto const* record = this->find(handle);
    return record == nullptr ? std::string{} : record->class_name;
}

auto HeadlessRuntime::subclass_count(NativeHandle handle) const -> std::size_t {
    auto const* record = this->find(handle);
    return record == nullptr ? 0 : record->subclasses.size();
}

auto HeadlessRuntime::pending_messages() const -> std::size_t {
    return this->posted.size();
}

auto HeadlessRuntime::last_issued() const -> NativeHandle {
    return this->lastHandle;
}

} // namespace HG::Native
