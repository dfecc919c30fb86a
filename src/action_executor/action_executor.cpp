#include "action_executor.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <thread>
#include <chrono>

namespace calcpilot {

ActionExecutor::ActionExecutor(ocal::IWindowLocator& locator,
                               ocal::IClickPrimitive& clicker,
                               const Settings& settings,
                               CancellationCheck cancelled)
    : m_locator(locator)
    , m_clicker(clicker)
    , m_settings(settings)
    , m_cancelled(std::move(cancelled)) {}

void ActionExecutor::setSleeper(Sleeper sleeper) {
    m_sleeper = std::move(sleeper);
}

ExecutionReport ActionExecutor::execute(const std::vector<ClickTarget>& targets) const {
    SCOPED_TIMER("execute_clicks");

    ExecutionReport report;
    report.total = targets.size();
    for (const auto& target : targets) {
        report.symbols.push_back(target.symbol.name);
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        const ClickTarget& planned = targets[i];

        if (m_cancelled && m_cancelled()) {
            report.cancelled = true;
            SLOG_WARNING().component("action_executor")
                .message("Click sequence cancelled")
                .context("completed", report.succeeded.size())
                .context("total", report.total);
            break;
        }

        // The window may have moved since planning
        ClickTarget target;
        try {
            target = m_resolver.resolve(planned.element, m_locator.getFrame(), planned.symbol);
        } catch (const WindowUnavailableError& e) {
            ErrorHandler::getInstance().handleException(e, "click " + std::to_string(i));
            recordFailure(report, i, e.getErrorInfo());
            break;
        }

        if (m_settings.focusBeforeClick) {
            if (!m_locator.focus()) {
                SLOG_WARNING().component("action_executor")
                    .message("Could not focus calculator window, clicking anyway")
                    .context("index", i);
            }
            pause(m_settings.focusDelayMs);
        }

        ClickResult result = m_clicker.click(target.x, target.y);
        if (!result.success) {
            ClickError error("Click failed on button '" + planned.symbol.name + "'",
                             result.error,
                             "index " + std::to_string(i) + " at (" + std::to_string(target.x) +
                             ", " + std::to_string(target.y) + ")");
            ErrorHandler::getInstance().handleError(error.getErrorInfo());
            recordFailure(report, i, error.getErrorInfo());
            break;
        }

        report.succeeded.push_back(i);
        SLOG_DEBUG().component("action_executor")
            .message("Clicked")
            .context("index", i)
            .context("button", planned.symbol.name)
            .context("x", target.x)
            .context("y", target.y);

        if (i + 1 < targets.size()) {
            pause(m_settings.settleDelayMs);
        }
    }

    SLOG_INFO().component("action_executor")
        .message(report.success() ? "Click sequence completed" : "Click sequence stopped")
        .context("buttons", utils::StringUtils::join(report.symbols, " → "))
        .context("succeeded", report.succeeded.size())
        .context("total", report.total);

    return report;
}

void ActionExecutor::pause(int delayMs) const {
    if (delayMs <= 0) {
        return;
    }
    if (m_sleeper) {
        m_sleeper(delayMs);
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
}

void ActionExecutor::recordFailure(ExecutionReport& report, size_t index, const ErrorInfo& error) {
    report.failedIndex = index;
    report.failedSymbol = report.symbols.at(index);
    report.errorType = ErrorHandler::errorTypeToString(error.type);
    report.errorMessage = error.details.empty() ? error.message : error.message + ": " + error.details;
}

} // namespace calcpilot
