#ifndef CALCPILOT_COORDINATE_RESOLVER_H
#define CALCPILOT_COORDINATE_RESOLVER_H

#include <optional>
#include "../common/types.h"

namespace calcpilot {

/**
 * @brief Element centroid in screen coordinates.
 *
 * x = originX + left + width / 2, y = originY + top + height / 2 (integer division).
 * Throws WindowUnavailableError for a missing or hidden frame.
 */
class CoordinateResolver {
public:
    ClickTarget resolve(const ElementDescriptor& descriptor,
                        const std::optional<WindowFrame>& frame,
                        const ButtonSymbol& symbol = ButtonSymbol()) const;
};

} // namespace calcpilot

#endif // CALCPILOT_COORDINATE_RESOLVER_H
