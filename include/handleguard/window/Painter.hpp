#pragma once

#include <handleguard/core/Error.hpp>
#include <handleguard/native/NativeRuntime.hpp>

#include <optional>

namespace HG::UI {

struct PaintRequest {
    Native::NativeRuntime&       runtime;
    Native::DrawContext          context;
    Native::Rect                 client;
    std::optional<Native::Color> background;
};

// Draws the client area of a custom window between begin_paint and end_paint.
class Painter {
public:
    virtual ~Painter() = default;

    virtual auto paint(PaintRequest const& request) -> Expected<void> = 0;
};

// Fills the client area with the background colour, if one is set.
class SolidBackgroundPainter final : public Painter {
public:
    auto paint(PaintRequest const& request) -> Expected<void> override;
};

} // namespace HG::UI
