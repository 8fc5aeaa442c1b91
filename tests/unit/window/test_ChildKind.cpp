#include <handleguard/window/ChildKind.hpp>

#include <doctest/doctest.h>

using namespace HG;
using namespace HG::UI;

namespace {

constexpr std::uint32_t kBase = Native::Style::kVisible | Native::Style::kChild;

} // namespace

TEST_SUITE("window.child_kind") {
    TEST_CASE("Custom children use the library window class") {
        auto spec = ControlSpecFor(ChildKind::Custom);
        CHECK_FALSE(spec.control_class.has_value());
        CHECK(spec.style == (kBase | Native::Style::kClipSiblings));
    }

    TEST_CASE("Button kinds map to button styles") {
        struct Row {
            ChildKind     kind;
            std::uint32_t bits;
        };
        Row const rows[] = {
                {ChildKind::Button, ControlStyle::kPushButton},
                {ChildKind::DefaultButton, ControlStyle::kDefPushButton},
                {ChildKind::Checkbox, ControlStyle::kCheckbox},
                {ChildKind::TristateCheckbox, ControlStyle::k3State},
                {ChildKind::Groupbox, ControlStyle::kGroupbox},
                {ChildKind::Radio, ControlStyle::kRadioButton},
        };
        for (auto const& row : rows) {
            CAPTURE(childKindToString(row.kind));
            auto spec = ControlSpecFor(row.kind);
            REQUIRE(spec.control_class.has_value());
            CHECK(*spec.control_class == "BUTTON");
            CHECK(spec.style == (kBase | row.bits));
        }
    }

    TEST_CASE("Edit options map to edit styles") {
        auto plain = ControlSpecFor(ChildKind::Edit);
        REQUIRE(plain.control_class.has_value());
        CHECK(*plain.control_class == "EDIT");
        CHECK(plain.style == kBase);

        auto multi = ControlSpecFor(ChildKind::Edit, EditOptions{.border = true, .vscroll = true, .multiline = true, .want_return = true});
        CHECK(multi.style
              == (kBase | Native::Style::kBorder | Native::Style::kVScroll | ControlStyle::kEditMultiline
                  | ControlStyle::kEditWantReturn));

        auto secret = ControlSpecFor(ChildKind::Edit, EditOptions{.center = true, .password = true, .readonly = true});
        CHECK(secret.style == (kBase | ControlStyle::kEditCenter | ControlStyle::kEditPassword | ControlStyle::kEditReadOnly));

        auto cased = ControlSpecFor(ChildKind::Edit,
                                    EditOptions{.hscroll      = true,
                                                .auto_hscroll = true,
                                                .auto_vscroll = true,
                                                .lower_case   = true,
                                                .uppercase    = true});
        CHECK(cased.style
              == (kBase | Native::Style::kHScroll | ControlStyle::kEditAutoHScroll | ControlStyle::kEditAutoVScroll
                  | ControlStyle::kEditLowercase | ControlStyle::kEditUppercase));
    }

    TEST_CASE("Edit options are ignored for other kinds") {
        auto spec = ControlSpecFor(ChildKind::Button, EditOptions{.multiline = true});
        CHECK(spec.style == kBase);
    }

    TEST_CASE("Kind names") {
        CHECK(childKindToString(ChildKind::Custom) == "custom");
        CHECK(childKindToString(ChildKind::TristateCheckbox) == "tristate_checkbox");
        CHECK(childKindToString(ChildKind::Edit) == "edit");
    }
}
