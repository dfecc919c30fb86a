#ifndef CALCPILOT_ACTION_EXECUTOR_H
#define CALCPILOT_ACTION_EXECUTOR_H

#include <vector>
#include <functional>
#include "../common/types.h"
#include "../common/error_handler.h"
#include "../coordinate_resolver/coordinate_resolver.h"
#include "../ocal/window_locator.h"
#include "../ocal/click_primitive.h"

namespace calcpilot {

/**
 * @brief Clicks resolved targets one at a time.
 *
 * Before every click: cancellation check, fresh window frame, optional
 * focus, re-resolution of the target. The first failure stops the run;
 * clicks already issued are not undone.
 */
class ActionExecutor {
public:
    struct Settings {
        int settleDelayMs = 500;
        bool focusBeforeClick = true;
        int focusDelayMs = 100;
    };

    using CancellationCheck = std::function<bool()>;
    using Sleeper = std::function<void(int delayMs)>;

    ActionExecutor(ocal::IWindowLocator& locator,
                   ocal::IClickPrimitive& clicker,
                   const Settings& settings,
                   CancellationCheck cancelled = nullptr);

    ExecutionReport execute(const std::vector<ClickTarget>& targets) const;

    // Replaces std::this_thread::sleep_for, used by tests to observe pacing
    void setSleeper(Sleeper sleeper);

    const Settings& getSettings() const { return m_settings; }

private:
    ocal::IWindowLocator& m_locator;
    ocal::IClickPrimitive& m_clicker;
    Settings m_settings;
    CancellationCheck m_cancelled;
    Sleeper m_sleeper;
    CoordinateResolver m_resolver;

    void pause(int delayMs) const;
    static void recordFailure(ExecutionReport& report, size_t index, const ErrorInfo& error);
};

} // namespace calcpilot

#endif // CALCPILOT_ACTION_EXECUTOR_H
