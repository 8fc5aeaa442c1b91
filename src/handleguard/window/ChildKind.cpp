#include <handleguard/window/ChildKind.hpp>

namespace HG::UI {
namespace {

constexpr std::uint32_t kControlBase = Native::Style::kVisible | Native::Style::kChild;

auto edit_style(EditOptions const& edit) -> std::uint32_t {
    std::uint32_t style = kControlBase;
    if (edit.border)
        style |= Native::Style::kBorder;
    if (edit.hscroll)
        style |= Native::Style::kHScroll;
    if (edit.vscroll)
        style |= Native::Style::kVScroll;
    if (edit.auto_hscroll)
        style |= ControlStyle::kEditAutoHScroll;
    if (edit.auto_vscroll)
        style |= ControlStyle::kEditAutoVScroll;
    if (edit.center)
        style |= ControlStyle::kEditCenter;
    if (edit.lower_case)
        style |= ControlStyle::kEditLowercase;
    if (edit.multiline)
        style |= ControlStyle::kEditMultiline;
    if (edit.password)
        style |= ControlStyle::kEditPassword;
    if (edit.readonly)
        style |= ControlStyle::kEditReadOnly;
    if (edit.uppercase)
        style |= ControlStyle::kEditUppercase;
    if (edit.want_return)
        style |= ControlStyle::kEditWantReturn;
    return style;
}

auto button(std::uint32_t bits) -> ControlSpec {
    return ControlSpec{.control_class = std::string{"BUTTON"}, .style = kControlBase | bits};
}

} // namespace

auto ControlSpecFor(ChildKind kind, EditOptions const& edit) -> ControlSpec {
    switch (kind) {
    case ChildKind::Custom:
        return ControlSpec{.control_class = std::nullopt, .style = kControlBase | Native::Style::kClipSiblings};
    case ChildKind::Button:
        return button(ControlStyle::kPushButton);
    case ChildKind::DefaultButton:
        return button(ControlStyle::kDefPushButton);
    case ChildKind::Checkbox:
        return button(ControlStyle::kCheckbox);
    case ChildKind::TristateCheckbox:
        return button(ControlStyle::k3State);
    case ChildKind::Groupbox:
        return button(ControlStyle::kGroupbox);
    case ChildKind::Radio:
        return button(ControlStyle::kRadioButton);
    case ChildKind::Edit:
        return ControlSpec{.control_class = std::string{"EDIT"}, .style = edit_style(edit)};
    }
    return ControlSpec{.control_class = std::nullopt, .style = kControlBase};
}

auto childKindToString(ChildKind kind) -> std::string_view {
    switch (kind) {
    case ChildKind::Custom:
        return "custom";
    case ChildKind::Button:
        return "button";
    case ChildKind::DefaultButton:
        return "default_button";
    case ChildKind::Checkbox:
        return "checkbox";
    case ChildKind::TristateCheckbox:
        return "tristate_checkbox";
    case ChildKind::Groupbox:
        return "groupbox";
    case ChildKind::Radio:
        return "radio";
    case ChildKind::Edit:
        return "edit";
    }
    return "unknown";
}

} // namespace HG::UI
