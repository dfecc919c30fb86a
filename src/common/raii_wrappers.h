#ifndef CALCPILOT_RAII_WRAPPERS_H
#define CALCPILOT_RAII_WRAPPERS_H

#include <memory>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#undef ERROR
#elif defined(CALCPILOT_USE_X11)
#include <X11/Xlib.h>
#endif

namespace calcpilot {
namespace raii {

#ifdef _WIN32

// Closes process and thread handles returned by CreateProcessW
class ProcessHandles {
public:
    explicit ProcessHandles(const PROCESS_INFORMATION& info)
        : m_process(info.hProcess), m_thread(info.hThread) {}

    ~ProcessHandles() {
        if (m_thread) CloseHandle(m_thread);
        if (m_process) CloseHandle(m_process);
    }

    ProcessHandles(const ProcessHandles&) = delete;
    ProcessHandles& operator=(const ProcessHandles&) = delete;

    HANDLE process() const { return m_process; }

private:
    HANDLE m_process;
    HANDLE m_thread;
};

#elif defined(CALCPILOT_USE_X11)

/**
 * @brief Connection to the X server, closed on destruction.
 *
 * Opens the display named by $DISPLAY. Check isOpen() before use.
 */
class DisplayConnection {
public:
    DisplayConnection() : m_display(XOpenDisplay(nullptr)) {}

    ~DisplayConnection() {
        if (m_display) {
            XCloseDisplay(m_display);
        }
    }

    DisplayConnection(const DisplayConnection&) = delete;
    DisplayConnection& operator=(const DisplayConnection&) = delete;

    bool isOpen() const { return m_display != nullptr; }
    Display* get() const { return m_display; }

private:
    Display* m_display;
};

// Memory returned by Xlib (XFetchName, XQueryTree)
struct XFreeDeleter {
    void operator()(void* data) const {
        if (data) {
            XFree(data);
        }
    }
};

template<typename T>
using XPtr = std::unique_ptr<T, XFreeDeleter>;

#endif

} // namespace raii
} // namespace calcpilot

#endif // CALCPILOT_RAII_WRAPPERS_H
