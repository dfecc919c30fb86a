#include "ocal.h"
#include "mouse_control.h"
#include "system_command.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <thread>
#include <chrono>

namespace calcpilot {
namespace ocal {

DesktopWindowLocator::DesktopWindowLocator(const Settings& settings)
    : m_settings(settings) {}

std::optional<window::WindowInfo> DesktopWindowLocator::locate() {
    if (m_handle != window::INVALID_WINDOW_HANDLE) {
        auto cached = window::getInfo(m_handle);
        if (cached && window::titleMatches(cached->title, m_settings.windowTitle, m_settings.excludedTitles)) {
            return cached;
        }
        m_handle = window::INVALID_WINDOW_HANDLE;
    }

    auto found = window::findByTitlePrefix(m_settings.windowTitle, m_settings.excludedTitles);
    if (found) {
        m_handle = found->handle;
        SLOG_DEBUG().component("window_locator")
            .message("Calculator window found")
            .context("title", found->title)
            .context("x", found->x)
            .context("y", found->y);
    }
    return found;
}

std::optional<WindowFrame> DesktopWindowLocator::getFrame() {
    auto info = locate();
    if (!info) {
        return std::nullopt;
    }

    WindowFrame frame;
    frame.originX = info->x;
    frame.originY = info->y;
    frame.visible = info->isVisible && !info->isMinimized;
    return frame;
}

void DesktopWindowLocator::ensureOpen() {
    SCOPED_TIMER("ensure_open");

    auto info = locate();
    if (info) {
        if (!info->isVisible || info->isMinimized) {
            if (!window::bringToFront(info->handle)) {
                SLOG_WARNING().component("window_locator").message("Could not restore calculator window");
            }
        }
        return;
    }

    SLOG_INFO().component("window_locator")
        .message("Calculator not running, launching")
        .context("command", m_settings.launchCommand);

    system::CommandResult launched = system::launchDetached(m_settings.launchCommand);
    if (!launched.success) {
        throw WindowUnavailableError("Failed to launch calculator", launched.error, launched.command);
    }

    if (!waitForWindow(launched.processId)) {
        throw WindowUnavailableError("Calculator window did not appear",
                                     "timeout " + std::to_string(m_settings.launchTimeoutMs) + " ms",
                                     m_settings.windowTitle);
    }
}

bool DesktopWindowLocator::waitForWindow(unsigned long processId) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_settings.launchTimeoutMs);
    bool exitReported = false;

    while (true) {
        auto info = locate();
        if (info && info->isVisible) {
            return true;
        }
        if (!exitReported) {
            system::ProcessStatus status = system::queryProcess(processId);
            if (status.exitCode && system::isLaunchFailureExitCode(*status.exitCode)) {
                throw WindowUnavailableError("Failed to launch calculator",
                                             "exit " + std::to_string(*status.exitCode),
                                             m_settings.launchCommand);
            }
            if (!status.running) {
                // Single-instance applications hand off to an existing process and exit
                SLOG_DEBUG().component("window_locator")
                    .message("Launcher process exited, still waiting for window")
                    .context("pid", processId);
                exitReported = true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(m_settings.pollIntervalMs));
    }
}

bool DesktopWindowLocator::focus() {
    auto info = locate();
    if (!info) {
        return false;
    }
    return window::bringToFront(info->handle);
}

ClickResult DesktopClickPrimitive::click(int x, int y) {
    std::string error;
    if (!mouse::clickAt(x, y, m_pressDelayMs, &error)) {
        return ClickResult::failed(error);
    }
    return ClickResult::ok();
}

} // namespace ocal
} // namespace calcpilot
