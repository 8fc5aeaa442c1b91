#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace HG::Native {

// Opaque identity of one object inside the native runtime. Managed code only
// ever compares and forwards it; the value 0 is reserved for "no object".
struct NativeHandle {
    std::uintptr_t value = 0;

    [[nodiscard]] static constexpr auto none() -> NativeHandle { return NativeHandle{}; }

    [[nodiscard]] constexpr auto is_none() const -> bool { return value == 0; }
    constexpr explicit operator bool() const { return value != 0; }

    friend constexpr auto operator==(NativeHandle const&, NativeHandle const&) -> bool = default;
};

using MessageId = std::uint32_t;
using WParam    = std::uintptr_t;
using LParam    = std::intptr_t;
using LResult   = std::intptr_t;

// Message identifiers follow the Win32 numbering.
namespace Msg {
inline constexpr MessageId kCreate     = 0x0001;
inline constexpr MessageId kDestroy    = 0x0002;
inline constexpr MessageId kMove       = 0x0003;
inline constexpr MessageId kSize       = 0x0005;
inline constexpr MessageId kSetText    = 0x000C;
inline constexpr MessageId kPaint      = 0x000F;
inline constexpr MessageId kClose      = 0x0010;
inline constexpr MessageId kQuit       = 0x0012;
inline constexpr MessageId kShowWindow = 0x0018;
inline constexpr MessageId kNcCreate   = 0x0081;
inline constexpr MessageId kNcDestroy  = 0x0082;
inline constexpr MessageId kUser       = 0x0400;
} // namespace Msg

namespace Style {
inline constexpr std::uint32_t kOverlapped       = 0x00000000;
inline constexpr std::uint32_t kHScroll          = 0x00100000;
inline constexpr std::uint32_t kVScroll          = 0x00200000;
inline constexpr std::uint32_t kBorder           = 0x00800000;
inline constexpr std::uint32_t kOverlappedWindow = 0x00CF0000;
inline constexpr std::uint32_t kClipChildren     = 0x02000000;
inline constexpr std::uint32_t kClipSiblings     = 0x04000000;
inline constexpr std::uint32_t kVisible          = 0x10000000;
inline constexpr std::uint32_t kChild            = 0x40000000;
} // namespace Style

namespace ExStyle {
inline constexpr std::uint32_t kOverlappedWindow = 0x00000300;
inline constexpr std::uint32_t kControlParent    = 0x00010000;
} // namespace ExStyle

// Native error codes reported inside Error::native_code.
namespace ErrorCode {
inline constexpr std::uint32_t kInvalidParameter    = 87;
inline constexpr std::uint32_t kCancelled           = 1223;
inline constexpr std::uint32_t kInvalidWindowHandle = 1400;
inline constexpr std::uint32_t kTopLevelWithChild   = 1406;
inline constexpr std::uint32_t kClassNotFound       = 1407;
inline constexpr std::uint32_t kClassAlreadyExists  = 1410;
inline constexpr std::uint32_t kNotPainting         = 1413;
} // namespace ErrorCode

struct Point {
    int x = 0;
    int y = 0;
};

struct Size {
    int width  = 0;
    int height = 0;
};

struct Rect {
    int x      = 0;
    int y      = 0;
    int width  = 0;
    int height = 0;

    friend constexpr auto operator==(Rect const&, Rect const&) -> bool = default;
};

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    friend constexpr auto operator==(Color const&, Color const&) -> bool = default;
};

// Drawing context handed out between begin_paint and end_paint.
struct DrawContext {
    std::uintptr_t value = 0;
    constexpr explicit operator bool() const { return value != 0; }
};

using WindowProcFn   = LResult (*)(NativeHandle, MessageId, WParam, LParam);
using SubclassProcFn = LResult (*)(NativeHandle, MessageId, WParam, LParam, std::uintptr_t id, std::uintptr_t ref_data);

struct WindowClass {
    std::string  name;
    WindowProcFn proc = nullptr;
};

struct CreateRequest {
    std::string              class_name;
    std::string              text;
    std::uint32_t            style    = 0;
    std::uint32_t            ex_style = 0;
    NativeHandle             parent   = NativeHandle::none();
    std::optional<Point>     position;
    std::optional<Size>      size;
    void*                    create_params = nullptr;
};

// Block referenced by the lparam of kNcCreate and kCreate.
struct CreateStruct {
    void*         create_params = nullptr;
    NativeHandle  parent        = NativeHandle::none();
    std::uint32_t style         = 0;
    std::uint32_t ex_style      = 0;
    Rect          rect;
    std::string   class_name;
    std::string   text;
};

struct NativeMessage {
    NativeHandle handle  = NativeHandle::none();
    MessageId    message = 0;
    WParam       wparam  = 0;
    LParam       lparam  = 0;
};

enum class PumpResult {
    Message,
    Quit,
    Idle,
};

// Raw capture of a window surface. Pixels are 0x00RRGGBB words when the
// layout is 32 bits per pixel.
struct NativeBitmap {
    int                        width          = 0;
    int                        height         = 0;
    std::uint16_t              bits_per_pixel = 0;
    std::uint16_t              planes         = 0;
    std::uint32_t              size_bytes     = 0;
    std::vector<std::uint32_t> pixels;
};

} // namespace HG::Native
