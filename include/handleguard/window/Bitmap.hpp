#pragma once

#include <handleguard/core/Error.hpp>
#include <handleguard/native/NativeTypes.hpp>

#include <cstdint>
#include <vector>

namespace HG::UI {

struct Bitmap {
    std::uint32_t width  = 0;
    std::uint32_t height = 0;

    // 0xAABBGGRR, length = width * height
    std::vector<std::uint32_t> data;

    [[nodiscard]] auto pixel(std::uint32_t x, std::uint32_t y) const -> Native::Color;
};

// Converts a raw capture into RGBA words. Anything but a non-empty,
// single-plane 32 bpp layout of exactly width * height * 4 bytes fails with
// UnsupportedFormat.
[[nodiscard]] auto BitmapFromCapture(Native::NativeBitmap const& capture) -> Expected<Bitmap>;

} // namespace HG::UI
