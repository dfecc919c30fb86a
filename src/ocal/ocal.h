#ifndef CALCPILOT_OCAL_H
#define CALCPILOT_OCAL_H

#include <string>
#include <vector>
#include "window_locator.h"
#include "click_primitive.h"
#include "window_management.h"

namespace calcpilot {
namespace ocal {

// Object-oriented desktop implementations of the locator and click interfaces

class DesktopWindowLocator : public IWindowLocator {
public:
    struct Settings {
        std::string windowTitle = "Calculator";
        std::string launchCommand;
        int launchTimeoutMs = 5000;
        int pollIntervalMs = 250;
        std::vector<std::string> excludedTitles;
    };

    explicit DesktopWindowLocator(const Settings& settings);

    std::optional<WindowFrame> getFrame() override;
    void ensureOpen() override;
    bool focus() override;

private:
    Settings m_settings;
    window::WindowHandle m_handle = window::INVALID_WINDOW_HANDLE;

    std::optional<window::WindowInfo> locate();
    bool waitForWindow(unsigned long processId);
};

class DesktopClickPrimitive : public IClickPrimitive {
public:
    explicit DesktopClickPrimitive(int pressDelayMs = 10) : m_pressDelayMs(pressDelayMs) {}

    ClickResult click(int x, int y) override;

private:
    int m_pressDelayMs;
};

} // namespace ocal
} // namespace calcpilot

#endif // CALCPILOT_OCAL_H
