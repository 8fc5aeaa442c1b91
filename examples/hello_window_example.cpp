#include <handleguard/core/Error.hpp>
#include <handleguard/examples/cli/ExampleCli.hpp>
#include <handleguard/log/TaggedLogger.hpp>
#include <handleguard/native/NativeRuntime.hpp>
#include <handleguard/window/System.hpp>
#include <handleguard/window/WindowNode.hpp>

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

using namespace HG;
using namespace HG::UI;

namespace {

struct DemoWindow {
    Window main;
    Window red;
    Window green;
    Window blue;
    Window first_button;
    Window second_button;
    Window edit;
};

auto make_child(Window const& parent, ChildKind kind, ChildOptions const& options) -> Expected<Window> {
    auto child = parent->create_child(kind, options);
    if (!child) {
        std::cerr << "create_child(" << childKindToString(kind) << ") failed: " << describeError(child.error()) << '\n';
    }
    return child;
}

auto make_swatch(Window const& parent, Native::Point position, Native::Color color) -> Expected<Window> {
    auto swatch = make_child(parent, ChildKind::Custom, {.position = position, .size = Native::Size{50, 50}});
    if (!swatch) {
        return swatch;
    }
    if (auto painted = (*swatch)->set_background(color); !painted) {
        return std::unexpected(painted.error());
    }
    return swatch;
}

auto build(System const& system, Examples::CLI::DemoOptions const& options) -> Expected<DemoWindow> {
    auto main = system.new_main({.title = options.title, .size = Native::Size{options.width, options.height}});
    if (!main) {
        return std::unexpected(main.error());
    }
    if (auto painted = (*main)->set_background(Native::Color{128, 128, 128}); !painted) {
        return std::unexpected(painted.error());
    }

    DemoWindow demo{.main = *main};
    auto red   = make_swatch(demo.main, {10, 10}, Native::Color{255, 0, 0});
    auto green = make_swatch(demo.main, {70, 10}, Native::Color{0, 255, 0});
    auto blue  = make_swatch(demo.main, {130, 10}, Native::Color{0, 0, 255});
    auto first = make_child(demo.main, ChildKind::Button,
                            {.text = "A &Button 1", .position = Native::Point{100, 70}, .size = Native::Size{100, 40}});
    auto second = make_child(demo.main, ChildKind::Button,
                             {.text = "A &Button 2", .position = Native::Point{100, 120}, .size = Native::Size{100, 40}});
    auto edit = make_child(demo.main,
                           ChildKind::Edit,
                           {.edit     = EditOptions{.border       = true,
                                                    .vscroll      = true,
                                                    .auto_vscroll = true,
                                                    .multiline    = true,
                                                    .want_return  = true},
                            .text     = "Here is some text and some more and more\r\nAnother line",
                            .position = Native::Point{210, 120},
                            .size     = Native::Size{200, 100}});
    for (auto const* child : {&red, &green, &blue, &first, &second, &edit}) {
        if (!*child) {
            return std::unexpected(child->error());
        }
    }
    demo.red           = *red;
    demo.green         = *green;
    demo.blue          = *blue;
    demo.first_button  = *first;
    demo.second_button = *second;
    demo.edit          = *edit;

    // The close handler must not own the window it is stored in.
    auto closes = std::make_shared<int>(0);
    demo.main->on_close([closes, limit = options.close_after](Window const& self) {
        ++*closes;
        hg_log("Close request " + std::to_string(*closes) + " of " + std::to_string(limit), "Demo", "INFO");
        if (*closes < limit) {
            if (auto posted = self->runtime().post_message(self->handle(), Native::Msg::kClose, 0, 0); !posted) {
                std::cerr << "post_message failed: " << describeError(posted.error()) << '\n';
            }
            return;
        }
        if (auto destroyed = self->destroy(); !destroyed) {
            std::cerr << "destroy failed: " << describeError(destroyed.error()) << '\n';
        }
    });
    demo.main->on_destroy([system, closes](Window const&) { system.exit_loop(*closes); });
    return demo;
}

auto print_snapshot(DemoWindow const& demo) -> Expected<void> {
    auto image = demo.main->snapshot();
    if (!image) {
        return std::unexpected(image.error());
    }
    std::printf("snapshot %ux%u\n", image->width, image->height);
    auto report = [&](char const* name, Window const& node) {
        auto bounds = node->bounds();
        if (!bounds) {
            return;
        }
        auto const x = bounds->x + bounds->width / 2;
        auto const y = bounds->y + bounds->height / 2;
        if (x < 0 || y < 0 || static_cast<std::uint32_t>(x) >= image->width || static_cast<std::uint32_t>(y) >= image->height) {
            std::printf("  %-14s outside the window\n", name);
            return;
        }
        auto const pixel = image->pixel(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y));
        std::printf("  %-14s rgba(%u, %u, %u, %u)\n", name, pixel.r, pixel.g, pixel.b, pixel.a);
    };
    report("red", demo.red);
    report("green", demo.green);
    report("blue", demo.blue);
    report("button", demo.first_button);
    return {};
}

} // namespace

int main(int argc, char** argv) {
    auto options = Examples::CLI::ParseDemoOptions(argc, argv);
    if (!options) {
        std::cerr << "Usage: " << (argc > 0 ? argv[0] : "hello_window_example")
                  << " [--width N] [--height N] [--title TEXT] [--close-after N] [--snapshot] [--offscreen]\n";
        std::cerr << describeError(options.error()) << '\n';
        return 1;
    }

    System system;
    auto   demo = build(system, *options);
    if (!demo) {
        std::cerr << "Building the window failed: " << describeError(demo.error()) << '\n';
        return 1;
    }

    if (options->offscreen) {
        if (auto moved = demo->main->move_offscreen(); !moved) {
            std::cerr << "move_offscreen failed: " << describeError(moved.error()) << '\n';
            return 1;
        }
    }
    if (auto shown = demo->main->set_visible(true); !shown) {
        std::cerr << "set_visible failed: " << describeError(shown.error()) << '\n';
        return 1;
    }
    if (options->snapshot) {
        if (auto printed = print_snapshot(*demo); !printed) {
            std::cerr << "snapshot failed: " << describeError(printed.error()) << '\n';
            return 1;
        }
    }

    // Headless: stand in for the user closing the window.
    if (auto posted = system.runtime()->post_message(demo->main->handle(), Native::Msg::kClose, 0, 0); !posted) {
        std::cerr << "post_message failed: " << describeError(posted.error()) << '\n';
        return 1;
    }

    auto code = system.event_loop();
    if (!code) {
        std::cerr << "Event loop failed: " << describeError(code.error()) << '\n';
        return 1;
    }
    std::printf("event loop finished after %d close request(s)\n", *code);
    logger().flush();
    return 0;
}
