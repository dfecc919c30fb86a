#ifndef CALCPILOT_CLICK_PRIMITIVE_H
#define CALCPILOT_CLICK_PRIMITIVE_H

#include "../common/types.h"

namespace calcpilot {
namespace ocal {

class IClickPrimitive {
public:
    virtual ~IClickPrimitive() = default;

    // Left click at absolute screen coordinates. Failures are returned, not thrown.
    virtual ClickResult click(int x, int y) = 0;
};

} // namespace ocal
} // namespace calcpilot

#endif // CALCPILOT_CLICK_PRIMITIVE_H
