#include <handleguard/window/Painter.hpp>

namespace HG::UI {

auto SolidBackgroundPainter::paint(PaintRequest const& request) -> Expected<void> {
    if (!request.background) {
        return {};
    }
    return request.runtime.fill_rect(request.context, request.client, *request.background);
}

} // namespace HG::UI
