#include "mouse_control.h"
#include "../common/structured_logger.h"
#include "../common/raii_wrappers.h"
#include <thread>
#include <chrono>

#if !defined(_WIN32) && defined(CALCPILOT_USE_X11)
#include <X11/extensions/XTest.h>
#endif

namespace calcpilot {
namespace ocal {
namespace mouse {

namespace {

    void setError(std::string* error, const std::string& message) {
        if (error) {
            *error = message;
        }
    }

#if defined(_WIN32) || defined(CALCPILOT_USE_X11)
    void pressDelay(int delayMs) {
        if (delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
        }
    }
#endif

#ifdef _WIN32
    bool sendButton(DWORD flag) {
        INPUT input;
        ZeroMemory(&input, sizeof(input));
        input.type = INPUT_MOUSE;
        input.mi.dwFlags = flag;
        return SendInput(1, &input, sizeof(INPUT)) == 1;
    }

    bool moveMousePlatformSpecific(int x, int y, std::string* error) {
        if (!SetCursorPos(x, y)) {
            setError(error, "SetCursorPos failed with error " + std::to_string(GetLastError()));
            return false;
        }
        return true;
    }

    bool clickMousePlatformSpecific(int x, int y, int delayMs, std::string* error) {
        if (!moveMousePlatformSpecific(x, y, error)) {
            return false;
        }
        if (!sendButton(MOUSEEVENTF_LEFTDOWN)) {
            setError(error, "SendInput rejected the button press");
            return false;
        }
        pressDelay(delayMs);
        if (!sendButton(MOUSEEVENTF_LEFTUP)) {
            setError(error, "SendInput rejected the button release");
            return false;
        }
        return true;
    }

#elif defined(CALCPILOT_USE_X11)
    void warpPointer(Display* display, int x, int y) {
        Window root = DefaultRootWindow(display);
        XWarpPointer(display, None, root, 0, 0, 0, 0, x, y);
        XFlush(display);
    }

    bool clickMousePlatformSpecific(int x, int y, int delayMs, std::string* error) {
        raii::DisplayConnection display;
        if (!display.isOpen()) {
            setError(error, "Cannot open X display");
            return false;
        }

        int eventBase = 0, errorBase = 0, major = 0, minor = 0;
        if (!XTestQueryExtension(display.get(), &eventBase, &errorBase, &major, &minor)) {
            setError(error, "XTest extension is not available on this display");
            return false;
        }

        warpPointer(display.get(), x, y);
        XTestFakeButtonEvent(display.get(), 1, True, CurrentTime);
        XFlush(display.get());
        pressDelay(delayMs);
        XTestFakeButtonEvent(display.get(), 1, False, CurrentTime);
        XFlush(display.get());
        return true;
    }

#else
    bool clickMousePlatformSpecific(int x, int y, int delayMs, std::string* error) {
        (void)x; (void)y; (void)delayMs;
        setError(error, "Mouse input is not supported on this platform build");
        return false;
    }
#endif

} // namespace

bool clickAt(int x, int y, int pressDelayMs, std::string* error) {
    SLOG_DEBUG().component("mouse").message("Mouse click").context("x", x).context("y", y);

    std::string failure;
    if (!clickMousePlatformSpecific(x, y, pressDelayMs, &failure)) {
        SLOG_WARNING().component("mouse")
            .message("Mouse click failed")
            .context("x", x)
            .context("y", y)
            .context("error", failure);
        setError(error, failure);
        return false;
    }
    return true;
}

bool isSupported() {
#if defined(_WIN32) || defined(CALCPILOT_USE_X11)
    return true;
#else
    return false;
#endif
}

} // namespace mouse
} // namespace ocal
} // namespace calcpilot
