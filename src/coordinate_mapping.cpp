#include "scribble/coordinate_mapping.hpp"
#include <cmath>

namespace scribble {

bool isMappable(Size logical) {
    return std::isfinite(logical.width) && std::isfinite(logical.height) &&
           logical.width > 0 && logical.height > 0;
}

std::optional<Point> toPixel(Point point, Size logicalSize, Size pixelSize) {
    if (!isMappable(logicalSize)) return std::nullopt;

    Point out{pixelSize.width * point.x / logicalSize.width,
              pixelSize.height * point.y / logicalSize.height};
    if (!std::isfinite(out.x) || !std::isfinite(out.y)) return std::nullopt;
    return out;
}

} // namespace scribble
