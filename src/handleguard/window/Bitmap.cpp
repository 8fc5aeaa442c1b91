#include <handleguard/window/Bitmap.hpp>

#include <string>

namespace HG::UI {
namespace {

auto unsupported(std::string detail) -> Error {
    return Error{Error::Code::UnsupportedFormat, "snapshot: " + std::move(detail)};
}

} // namespace

auto Bitmap::pixel(std::uint32_t x, std::uint32_t y) const -> Native::Color {
    auto const word = this->data.at(static_cast<std::size_t>(y) * this->width + x);
    return Native::Color{static_cast<std::uint8_t>(word & 0xFF),
                         static_cast<std::uint8_t>((word >> 8) & 0xFF),
                         static_cast<std::uint8_t>((word >> 16) & 0xFF),
                         static_cast<std::uint8_t>((word >> 24) & 0xFF)};
}

auto BitmapFromCapture(Native::NativeBitmap const& capture) -> Expected<Bitmap> {
    if (capture.bits_per_pixel != 32) {
        return std::unexpected(unsupported(std::to_string(capture.bits_per_pixel) + " bits per pixel"));
    }
    if (capture.planes != 1) {
        return std::unexpected(unsupported(std::to_string(capture.planes) + " planes"));
    }
    if (capture.width <= 0 || capture.height <= 0 || capture.size_bytes == 0) {
        return std::unexpected(unsupported("empty image"));
    }
    auto const pixels = static_cast<std::uint64_t>(capture.width) * static_cast<std::uint64_t>(capture.height);
    if ((capture.size_bytes & 3) != 0 || capture.size_bytes != pixels * 4 || capture.pixels.size() != pixels) {
        return std::unexpected(unsupported("size " + std::to_string(capture.size_bytes) + " does not match "
                                           + std::to_string(capture.width) + "x" + std::to_string(capture.height)));
    }

    Bitmap bitmap;
    bitmap.width  = static_cast<std::uint32_t>(capture.width);
    bitmap.height = static_cast<std::uint32_t>(capture.height);
    bitmap.data.reserve(capture.pixels.size());
    for (auto word : capture.pixels) {
        bitmap.data.push_back(0xFF000000u | ((word & 0xFFu) << 16) | (word & 0xFF00u) | ((word & 0xFF0000u) >> 16));
    }
    return bitmap;
}

} // namespace HG::UI
