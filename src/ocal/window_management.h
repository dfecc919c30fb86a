#ifndef CALCPILOT_WINDOW_MANAGEMENT_H
#define CALCPILOT_WINDOW_MANAGEMENT_H

#include <string>
#include <vector>
#include <optional>

namespace calcpilot {
namespace ocal {
namespace window {

#ifdef _WIN32
using WindowHandle = void*; // HWND on Windows
constexpr WindowHandle INVALID_WINDOW_HANDLE = nullptr;
#else
using WindowHandle = unsigned long; // X11 Window id
constexpr WindowHandle INVALID_WINDOW_HANDLE = 0;
#endif

struct WindowInfo {
    WindowHandle handle;
    std::string title;
    int x, y;           // Screen position of the window's top-left corner
    int width, height;
    bool isVisible;
    bool isMinimized;

    WindowInfo() : handle(INVALID_WINDOW_HANDLE), x(0), y(0), width(0), height(0),
                   isVisible(false), isMinimized(false) {}
};

// Top-level windows that carry a title
std::vector<WindowInfo> enumerateTitled();

/**
 * @brief Case-insensitive title test used to pick the calculator window.
 *
 * A title matches when it starts with prefix and contains none of the
 * excluded fragments (IDE windows with "calculator" in an open file name).
 */
bool titleMatches(const std::string& title, const std::string& prefix,
                  const std::vector<std::string>& excludedTitles);

// First titled window that satisfies titleMatches(); visible windows are preferred
std::optional<WindowInfo> findByTitlePrefix(const std::string& prefix,
                                            const std::vector<std::string>& excludedTitles);

std::optional<WindowInfo> getInfo(WindowHandle handle);

// Restores, raises and focuses; false if the window manager refused
bool bringToFront(WindowHandle handle);

} // namespace window
} // namespace ocal
} // namespace calcpilot

#endif // CALCPILOT_WINDOW_MANAGEMENT_H
