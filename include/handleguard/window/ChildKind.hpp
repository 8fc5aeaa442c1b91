#pragma once

#include <handleguard/native/NativeTypes.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace HG::UI {

enum class ChildKind {
    Custom,
    Button,
    DefaultButton,
    Checkbox,
    TristateCheckbox,
    Groupbox,
    Radio,
    Edit,
};

// Style switches of an edit control; only read for ChildKind::Edit.
struct EditOptions {
    bool border       = false;
    bool hscroll      = false;
    bool vscroll      = false;
    bool auto_hscroll = false;
    bool auto_vscroll = false;
    bool center       = false;
    bool lower_case   = false;
    bool multiline    = false;
    bool password     = false;
    bool readonly     = false;
    bool uppercase    = false;
    bool want_return  = false;
};

struct ChildOptions {
    EditOptions                  edit;
    std::string                  text;
    std::optional<Native::Point> position;
    std::optional<Native::Size>  size;
};

// Native button and edit style bits (Win32 BS_* and ES_* values).
namespace ControlStyle {
inline constexpr std::uint32_t kPushButton    = 0x0000;
inline constexpr std::uint32_t kDefPushButton = 0x0001;
inline constexpr std::uint32_t kCheckbox      = 0x0002;
inline constexpr std::uint32_t kRadioButton   = 0x0004;
inline constexpr std::uint32_t k3State        = 0x0005;
inline constexpr std::uint32_t kGroupbox      = 0x0007;

inline constexpr std::uint32_t kEditCenter      = 0x0001;
inline constexpr std::uint32_t kEditMultiline   = 0x0004;
inline constexpr std::uint32_t kEditUppercase   = 0x0008;
inline constexpr std::uint32_t kEditLowercase   = 0x0010;
inline constexpr std::uint32_t kEditPassword    = 0x0020;
inline constexpr std::uint32_t kEditAutoVScroll = 0x0040;
inline constexpr std::uint32_t kEditAutoHScroll = 0x0080;
inline constexpr std::uint32_t kEditReadOnly    = 0x0800;
inline constexpr std::uint32_t kEditWantReturn  = 0x1000;
} // namespace ControlStyle

struct ControlSpec {
    // Native control class, or empty for a custom child of our own class.
    std::optional<std::string> control_class;
    std::uint32_t              style = 0;
};

// Translates a child kind into the native class and style bits it is created with.
[[nodiscard]] auto ControlSpecFor(ChildKind kind, EditOptions const& edit = {}) -> ControlSpec;

[[nodiscard]] auto childKindToString(ChildKind kind) -> std::string_view;

} // namespace HG::UI
