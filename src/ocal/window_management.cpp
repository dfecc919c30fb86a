#include "window_management.h"
#include "../common/structured_logger.h"
#include "../common/string_utils.h"
#include "../common/raii_wrappers.h"
#include <algorithm>
#include <functional>

#if !defined(_WIN32) && defined(CALCPILOT_USE_X11)
#include <X11/Xutil.h>
#endif

namespace calcpilot {
namespace ocal {
namespace window {

using utils::StringUtils;

#ifdef _WIN32
namespace {
    std::string wideToUtf8(const wchar_t* text) {
        int size = WideCharToMultiByte(CP_UTF8, 0, text, -1, nullptr, 0, nullptr, nullptr);
        if (size <= 1) {
            return "";
        }
        std::string result(static_cast<size_t>(size - 1), '\0');
        WideCharToMultiByte(CP_UTF8, 0, text, -1, &result[0], size, nullptr, nullptr);
        return result;
    }

    WindowInfo describe(HWND hwnd) {
        WindowInfo info;
        info.handle = hwnd;

        wchar_t title[256];
        GetWindowTextW(hwnd, title, sizeof(title) / sizeof(wchar_t));
        info.title = wideToUtf8(title);

        RECT rect;
        if (GetWindowRect(hwnd, &rect)) {
            info.x = rect.left;
            info.y = rect.top;
            info.width = rect.right - rect.left;
            info.height = rect.bottom - rect.top;
        }

        info.isVisible = IsWindowVisible(hwnd) != FALSE;
        info.isMinimized = IsIconic(hwnd) != FALSE;
        return info;
    }

    BOOL CALLBACK enumWindowsProc(HWND hwnd, LPARAM lParam) {
        auto* windows = reinterpret_cast<std::vector<WindowInfo>*>(lParam);
        if (GetWindowTextLengthW(hwnd) == 0) {
            return TRUE;
        }
        windows->push_back(describe(hwnd));
        return TRUE;
    }
}

#elif defined(CALCPILOT_USE_X11)
namespace {
    // Windows can vanish between XQueryTree and the next request
    int ignoreXErrors(Display* display, XErrorEvent* event) {
        (void)display;
        SLOG_DEBUG().component("window").message("X request failed").context("error_code", event->error_code);
        return 0;
    }

    void installErrorHandler() {
        static bool installed = false;
        if (!installed) {
            XSetErrorHandler(ignoreXErrors);
            installed = true;
        }
    }

    std::string fetchTitle(Display* display, Window window) {
        char* rawName = nullptr;
        if (!XFetchName(display, window, &rawName) || !rawName) {
            return "";
        }
        raii::XPtr<char> name(rawName);
        return std::string(name.get());
    }

    bool describe(Display* display, Window window, WindowInfo& info) {
        XWindowAttributes attributes;
        if (!XGetWindowAttributes(display, window, &attributes)) {
            return false;
        }

        int rootX = 0, rootY = 0;
        Window child = 0;
        XTranslateCoordinates(display, window, DefaultRootWindow(display), 0, 0, &rootX, &rootY, &child);

        info.handle = window;
        info.x = rootX;
        info.y = rootY;
        info.width = attributes.width;
        info.height = attributes.height;
        info.isVisible = attributes.map_state == IsViewable;
        info.isMinimized = attributes.map_state == IsUnmapped;
        return true;
    }

    // Reparenting window managers put the titled client one or two levels below root
    void collectTitled(Display* display, Window parent, int depth, std::vector<WindowInfo>& windows) {
        Window root = 0, parentOut = 0;
        Window* rawChildren = nullptr;
        unsigned int count = 0;
        if (!XQueryTree(display, parent, &root, &parentOut, &rawChildren, &count)) {
            return;
        }
        raii::XPtr<Window> children(rawChildren);

        for (unsigned int i = 0; i < count; ++i) {
            Window window = children.get()[i];
            std::string title = fetchTitle(display, window);
            if (!title.empty()) {
                WindowInfo info;
                if (describe(display, window, info)) {
                    info.title = title;
                    windows.push_back(info);
                }
            } else if (depth > 0) {
                collectTitled(display, window, depth - 1, windows);
            }
        }
    }
}
#endif

std::vector<WindowInfo> enumerateTitled() {
    std::vector<WindowInfo> windows;

#ifdef _WIN32
    EnumWindows(enumWindowsProc, reinterpret_cast<LPARAM>(&windows));
#elif defined(CALCPILOT_USE_X11)
    raii::DisplayConnection display;
    if (!display.isOpen()) {
        SLOG_WARNING().component("window").message("Cannot open X display");
        return windows;
    }
    installErrorHandler();
    collectTitled(display.get(), DefaultRootWindow(display.get()), 2, windows);
#else
    SLOG_DEBUG().component("window").message("Window enumeration is not supported on this platform build");
#endif

    SLOG_DEBUG().component("window").message("Enumerated windows").context("count", windows.size());
    return windows;
}

bool titleMatches(const std::string& title, const std::string& prefix,
                  const std::vector<std::string>& excludedTitles) {
    std::string lowered = StringUtils::toLowerCase(StringUtils::trim(title));
    if (lowered.empty() || !StringUtils::startsWith(lowered, StringUtils::toLowerCase(prefix))) {
        return false;
    }
    return std::none_of(excludedTitles.begin(), excludedTitles.end(), [&lowered](const std::string& excluded) {
        std::string fragment = StringUtils::toLowerCase(excluded);
        return !fragment.empty() && lowered.find(fragment) != std::string::npos;
    });
}

std::optional<WindowInfo> findByTitlePrefix(const std::string& prefix,
                                            const std::vector<std::string>& excludedTitles) {
    std::optional<WindowInfo> hidden;
    for (const auto& info : enumerateTitled()) {
        if (!titleMatches(info.title, prefix, excludedTitles)) {
            continue;
        }
        if (info.isVisible && !info.isMinimized) {
            return info;
        }
        if (!hidden) {
            hidden = info;
        }
    }
    return hidden;
}

std::optional<WindowInfo> getInfo(WindowHandle handle) {
    if (handle == INVALID_WINDOW_HANDLE) {
        return std::nullopt;
    }

#ifdef _WIN32
    HWND hwnd = static_cast<HWND>(handle);
    if (!IsWindow(hwnd)) {
        return std::nullopt;
    }
    return describe(hwnd);
#elif defined(CALCPILOT_USE_X11)
    raii::DisplayConnection display;
    if (!display.isOpen()) {
        return std::nullopt;
    }
    installErrorHandler();
    WindowInfo info;
    if (!describe(display.get(), static_cast<Window>(handle), info)) {
        return std::nullopt;
    }
    info.title = fetchTitle(display.get(), static_cast<Window>(handle));
    return info;
#else
    return std::nullopt;
#endif
}

bool bringToFront(WindowHandle handle) {
    if (handle == INVALID_WINDOW_HANDLE) {
        return false;
    }

#ifdef _WIN32
    HWND hwnd = static_cast<HWND>(handle);
    if (IsIconic(hwnd)) {
        ShowWindow(hwnd, SW_RESTORE);
    }
    if (SetForegroundWindow(hwnd)) {
        return true;
    }

    // Foreground lock: attach to the foreground thread and try again
    HWND foregroundWindow = GetForegroundWindow();
    DWORD foregroundThreadId = GetWindowThreadProcessId(foregroundWindow, nullptr);
    DWORD currentThreadId = GetCurrentThreadId();
    if (foregroundThreadId != currentThreadId) {
        AttachThreadInput(currentThreadId, foregroundThreadId, TRUE);
        BOOL result = SetForegroundWindow(hwnd);
        AttachThreadInput(currentThreadId, foregroundThreadId, FALSE);
        if (result) {
            return true;
        }
    }
    return BringWindowToTop(hwnd) != FALSE && GetForegroundWindow() == hwnd;
#elif defined(CALCPILOT_USE_X11)
    raii::DisplayConnection display;
    if (!display.isOpen()) {
        return false;
    }
    installErrorHandler();
    Window window = static_cast<Window>(handle);

    XWindowAttributes attributes;
    if (!XGetWindowAttributes(display.get(), window, &attributes)) {
        return false;
    }
    if (attributes.map_state != IsViewable) {
        XMapRaised(display.get(), window);
        XSync(display.get(), False);
        return false;
    }
    XRaiseWindow(display.get(), window);
    XSetInputFocus(display.get(), window, RevertToParent, CurrentTime);
    XSync(display.get(), False);
    return true;
#else
    return false;
#endif
}

} // namespace window
} // namespace ocal
} // namespace calcpilot
