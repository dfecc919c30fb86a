#include "coordinate_resolver.h"
#include "../common/error_handler.h"

namespace calcpilot {

ClickTarget CoordinateResolver::resolve(const ElementDescriptor& descriptor,
                                        const std::optional<WindowFrame>& frame,
                                        const ButtonSymbol& symbol) const {
    if (!frame) {
        throw WindowUnavailableError("Calculator window not found", descriptor.id);
    }
    if (!frame->visible) {
        throw WindowUnavailableError("Calculator window is not visible", descriptor.id);
    }

    const BoundingBox& box = descriptor.boundingBox;

    ClickTarget target;
    target.x = frame->originX + box.left + box.width / 2;
    target.y = frame->originY + box.top + box.height / 2;
    target.symbol = symbol;
    target.element = descriptor;
    return target;
}

} // namespace calcpilot
