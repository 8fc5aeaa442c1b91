#include <handleguard/native/HeadlessRuntime.hpp>
#include <handleguard/window/WindowNode.hpp>

#include <doctest/doctest.h>

#include <memory>

using namespace HG;
using namespace HG::Native;
using namespace HG::UI;

namespace {

auto makeMain(std::shared_ptr<HeadlessRuntime> const& runtime, MainWindowOptions const& options = {}) -> Window {
    auto main = WindowNode::CreateMain(runtime, options);
    REQUIRE(main.has_value());
    return *main;
}

class CountingPainter final : public Painter {
public:
    auto paint(PaintRequest const& request) -> Expected<void> override {
        ++this->calls;
        this->lastClient = request.client;
        return request.runtime.fill_rect(request.context, request.client, Color{0, 0, 255});
    }

    int  calls = 0;
    Rect lastClient;
};

} // namespace

TEST_SUITE("window.node") {
    TEST_CASE("Main window takes its options") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime, MainWindowOptions{.title = "Hello", .position = Point{5, 6}, .size = Size{320, 200}});

        CHECK(main->live());
        CHECK(runtime->is_window(main->handle()));
        CHECK(main->text().value() == "Hello");
        CHECK(main->bounds().value() == Rect{5, 6, 320, 200});
        auto const style = runtime->style_of(main->handle());
        CHECK((style & Style::kOverlappedWindow) == Style::kOverlappedWindow);
        CHECK((style & Style::kClipChildren) != 0);
        CHECK_FALSE(runtime->is_visible(main->handle()));
    }

    TEST_CASE("Unset geometry falls back to the runtime default") {
        auto runtime = std::make_shared<HeadlessRuntime>(HeadlessOptions{.default_window = Rect{1, 2, 30, 40}});
        auto main    = makeMain(runtime);
        CHECK(main->bounds().value() == Rect{1, 2, 30, 40});
    }

    TEST_CASE("Negative sizes are rejected") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto bad     = WindowNode::CreateMain(runtime, MainWindowOptions{.size = Size{-1, 10}});
        REQUIRE_FALSE(bad.has_value());
        CHECK(bad.error().code == Error::Code::InvalidArgument);
        CHECK(runtime->window_count() == 0);

        auto main  = makeMain(runtime);
        auto child = main->create_child(ChildKind::Custom, ChildOptions{.size = Size{4, -4}});
        REQUIRE_FALSE(child.has_value());
        CHECK(child.error().code == Error::Code::InvalidArgument);
        CHECK(main->set_bounds(std::nullopt, Size{-2, 2}).error().code == Error::Code::InvalidArgument);
    }

    TEST_CASE("Operations on a destroyed node fail without native calls") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime);
        auto handle  = main->handle();

        REQUIRE(main->destroy());
        CHECK_FALSE(main->live());
        CHECK(main->handle().is_none());
        CHECK_FALSE(runtime->is_window(handle));
        auto const windows = runtime->window_count();
        auto const issued  = runtime->last_issued();

        CHECK(main->set_text("x").error().code == Error::Code::Destroyed);
        CHECK(main->text().error().code == Error::Code::Destroyed);
        CHECK(main->set_bounds(Point{1, 1}, std::nullopt).error().code == Error::Code::Destroyed);
        CHECK(main->bounds().error().code == Error::Code::Destroyed);
        CHECK(main->set_background(Color{1, 2, 3}).error().code == Error::Code::Destroyed);
        CHECK(main->set_visible(true).error().code == Error::Code::Destroyed);
        CHECK(main->move_offscreen().error().code == Error::Code::Destroyed);
        CHECK(main->redraw().error().code == Error::Code::Destroyed);
        CHECK(main->snapshot().error().code == Error::Code::Destroyed);
        CHECK(main->set_painter(std::make_shared<SolidBackgroundPainter>()).error().code == Error::Code::Destroyed);

        auto child = main->create_child(ChildKind::Button);
        REQUIRE_FALSE(child.has_value());
        CHECK(child.error().code == Error::Code::Destroyed);
        CHECK(runtime->window_count() == windows);
        CHECK(runtime->last_issued() == issued);

        // Destroying twice is a successful no-op.
        CHECK(main->destroy().has_value());
    }

    TEST_CASE("Callbacks registered after destruction are ignored") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime);
        REQUIRE(main->destroy());

        bool called = false;
        main->on_close([&](Window const&) { called = true; });
        main->on_destroy([&](Window const&) { called = true; });
        CHECK_FALSE(called);
    }

    TEST_CASE("Children are kept in creation order and pruned once destroyed") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime);

        auto first  = main->create_child(ChildKind::Custom);
        auto second = main->create_child(ChildKind::Button, ChildOptions{.text = "OK"});
        auto third  = main->create_child(ChildKind::Edit, ChildOptions{.edit = EditOptions{.multiline = true}});
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        REQUIRE(third.has_value());

        auto children = main->children();
        REQUIRE(children.size() == 3);
        CHECK(children[0] == *first);
        CHECK(children[1] == *second);
        CHECK(children[2] == *third);
        CHECK(runtime->children_of(main->handle()).size() == 3);
        CHECK(runtime->class_of((*second)->handle()) == "BUTTON");
        CHECK((*second)->text().value() == "OK");
        CHECK((runtime->style_of((*third)->handle()) & ControlStyle::kEditMultiline) != 0);

        REQUIRE((*second)->destroy());
        children = main->children();
        REQUIRE(children.size() == 2);
        CHECK(children[0] == *first);
        CHECK(children[1] == *third);
    }

    TEST_CASE("Parent owns its children") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime);
        NativeHandle childHandle;
        {
            auto child = main->create_child(ChildKind::Custom);
            REQUIRE(child.has_value());
            childHandle = (*child)->handle();
        }
        // Dropping the caller's handle does not destroy the child.
        CHECK(runtime->is_window(childHandle));
        CHECK(main->children().size() == 1);

        auto const mainHandle = main->handle();
        main.reset();
        CHECK_FALSE(runtime->is_window(mainHandle));
        CHECK_FALSE(runtime->is_window(childHandle));
        CHECK(runtime->window_count() == 0);
    }

    TEST_CASE("Destroying a parent destroys children still held elsewhere") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime);
        auto child   = main->create_child(ChildKind::Custom);
        auto button  = main->create_child(ChildKind::Checkbox);
        REQUIRE(child.has_value());
        REQUIRE(button.has_value());

        int destroyed = 0;
        (*child)->on_destroy([&](Window const& self) {
            CHECK(self == *child);
            ++destroyed;
        });

        REQUIRE(main->destroy());
        CHECK(destroyed == 1);
        CHECK_FALSE((*child)->live());
        CHECK_FALSE((*button)->live());
        CHECK((*child)->set_text("late").error().code == Error::Code::Destroyed);
        CHECK((*button)->set_visible(true).error().code == Error::Code::Destroyed);
        CHECK(runtime->window_count() == 0);
    }

    TEST_CASE("Releasing the last handle destroys the native window") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime);
        auto handle  = main->handle();

        bool destroyedWithoutSelf = false;
        main->on_destroy([&](Window const& self) { destroyedWithoutSelf = (self == nullptr); });
        main.reset();
        CHECK(destroyedWithoutSelf);
        CHECK_FALSE(runtime->is_window(handle));
    }

    TEST_CASE("Handles are never reused") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto first   = makeMain(runtime);
        auto handle  = first->handle();
        REQUIRE(first->destroy());

        auto second = makeMain(runtime);
        CHECK(second->handle() != handle);
        CHECK(second->handle().value > handle.value);
    }

    TEST_CASE("Bounds, text and visibility") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime, MainWindowOptions{.position = Point{0, 0}, .size = Size{100, 50}});

        REQUIRE(main->set_bounds(Point{7, 8}, std::nullopt));
        CHECK(main->bounds().value() == Rect{7, 8, 100, 50});
        REQUIRE(main->set_bounds(std::nullopt, Size{20, 10}));
        CHECK(main->bounds().value() == Rect{7, 8, 20, 10});

        REQUIRE(main->set_text("renamed"));
        CHECK(main->text().value() == "renamed");

        REQUIRE(main->set_visible(true));
        CHECK(runtime->is_visible(main->handle()));
        REQUIRE(main->set_visible(false));
        CHECK_FALSE(runtime->is_visible(main->handle()));

        REQUIRE(main->redraw());
    }

    TEST_CASE("Moving offscreen places the window past the virtual screen") {
        auto runtime = std::make_shared<HeadlessRuntime>(HeadlessOptions{.virtual_screen = Rect{-100, 0, 1000, 800}});
        auto main    = makeMain(runtime, MainWindowOptions{.position = Point{30, 40}, .size = Size{64, 48}});

        REQUIRE(main->move_offscreen());
        CHECK(main->bounds().value() == Rect{910, 0, 64, 48});
    }

    TEST_CASE("Snapshot renders the background and children") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime, MainWindowOptions{.position = Point{0, 0}, .size = Size{40, 30}});
        REQUIRE(main->set_background(Color{255, 0, 0}));

        auto blue = main->create_child(ChildKind::Custom, ChildOptions{.position = Point{10, 10}, .size = Size{5, 5}});
        REQUIRE(blue.has_value());
        REQUIRE((*blue)->set_background(Color{0, 0, 255}));
        auto button = main->create_child(ChildKind::Button, ChildOptions{.position = Point{20, 0}, .size = Size{4, 4}});
        REQUIRE(button.has_value());

        auto image = main->snapshot();
        REQUIRE(image.has_value());
        CHECK(image->width == 40);
        CHECK(image->height == 30);
        CHECK(image->data.size() == 40u * 30u);
        CHECK(image->pixel(0, 0) == Color{255, 0, 0});
        CHECK(image->pixel(39, 29) == Color{255, 0, 0});
        CHECK(image->pixel(12, 12) == Color{0, 0, 255});
        CHECK(image->pixel(21, 1) == Color{192, 192, 192});
        CHECK(image->data[0] == 0xFF0000FFu);

        REQUIRE((*blue)->set_visible(false));
        image = main->snapshot();
        REQUIRE(image.has_value());
        CHECK(image->pixel(12, 12) == Color{255, 0, 0});
    }

    TEST_CASE("Snapshot without a background is blank") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime, MainWindowOptions{.size = Size{3, 2}});
        auto image   = main->snapshot();
        REQUIRE(image.has_value());
        CHECK(image->pixel(1, 1) == Color{255, 255, 255});
    }

    TEST_CASE("Snapshot reports an unsupported capture layout") {
        auto runtime = std::make_shared<HeadlessRuntime>(HeadlessOptions{.capture_bits_per_pixel = 24});
        auto main    = makeMain(runtime, MainWindowOptions{.size = Size{8, 8}});
        auto image   = main->snapshot();
        REQUIRE_FALSE(image.has_value());
        CHECK(image.error().code == Error::Code::UnsupportedFormat);
        CHECK(main->live());
    }

    TEST_CASE("Custom painters receive the client rectangle") {
        auto runtime = std::make_shared<HeadlessRuntime>();
        auto main    = makeMain(runtime, MainWindowOptions{.position = Point{50, 60}, .size = Size{6, 4}});

        CHECK(main->set_painter(nullptr).error().code == Error::Code::InvalidArgument);

        auto painter = std::make_shared<CountingPainter>();
        REQUIRE(main->set_painter(painter));
        auto image = main->snapshot();
        REQUIRE(image.has_value());
        CHECK(painter->calls == 1);
        CHECK(painter->lastClient == Rect{0, 0, 6, 4});
        CHECK(image->pixel(5, 3) == Color{0, 0, 255});
    }
}
