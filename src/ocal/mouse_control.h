#ifndef CALCPILOT_MOUSE_CONTROL_H
#define CALCPILOT_MOUSE_CONTROL_H

#include <string>

namespace calcpilot {
namespace ocal {
namespace mouse {

// Left button press and release at an absolute screen position.
// Returns false and fills error (when given) if the platform refuses the input.
bool clickAt(int x, int y, int pressDelayMs, std::string* error = nullptr);

// False when this build has no input backend (neither Win32 nor X11/XTest)
bool isSupported();

} // namespace mouse
} // namespace ocal
} // namespace calcpilot

#endif // CALCPILOT_MOUSE_CONTROL_H
