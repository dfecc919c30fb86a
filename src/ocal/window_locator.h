#ifndef CALCPILOT_WINDOW_LOCATOR_H
#define CALCPILOT_WINDOW_LOCATOR_H

#include <optional>
#include "../common/types.h"

namespace calcpilot {
namespace ocal {

/**
 * @brief Finds, launches and focuses the calculator window
 */
class IWindowLocator {
public:
    virtual ~IWindowLocator() = default;

    // Current frame, empty if the window does not exist. Side-effect free.
    virtual std::optional<WindowFrame> getFrame() = 0;

    // Launches the application if needed; throws WindowUnavailableError on timeout
    virtual void ensureOpen() = 0;

    virtual bool focus() = 0;
};

} // namespace ocal
} // namespace calcpilot

#endif // CALCPILOT_WINDOW_LOCATOR_H
