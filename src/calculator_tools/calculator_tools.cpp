#include "calculator_tools.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <thread>
#include <chrono>

namespace calcpilot {

CalculatorTools::CalculatorTools(std::shared_ptr<const ElementRegistry> registry,
                                 ocal::IWindowLocator& locator,
                                 ocal::IClickPrimitive& clicker,
                                 const ActionExecutor::Settings& settings,
                                 ActionExecutor::CancellationCheck cancelled)
    : m_registry(std::move(registry))
    , m_locator(locator)
    , m_executor(locator, clicker, settings, std::move(cancelled)) {
    if (!m_registry) {
        throw RegistryLoadError("Calculator tools need an element registry");
    }
}

WindowFrame CalculatorTools::openApplication() {
    SCOPED_TIMER("open_application");

    m_locator.ensureOpen();
    if (!m_locator.focus()) {
        SLOG_WARNING().component("calculator_tools").message("Calculator opened but could not be focused");
    }

    auto frame = m_locator.getFrame();
    if (!frame || !frame->visible) {
        throw WindowUnavailableError("Calculator window is not visible after opening");
    }

    SLOG_INFO().component("calculator_tools")
        .message("Calculator ready")
        .context("x", frame->originX)
        .context("y", frame->originY);
    return *frame;
}

ExecutionReport CalculatorTools::runInstruction(const std::string& text) {
    SCOPED_TIMER("run_instruction");

    auto symbols = compileInstruction(text);
    SLOG_INFO().component("calculator_tools")
        .message("Instruction compiled")
        .context("instruction", text)
        .context("buttons", ButtonCompiler::describe(symbols));

    ExecutionReport report = m_executor.execute(plan(symbols));
    report.instruction = text;
    return report;
}

ExecutionReport CalculatorTools::pressButton(const std::string& name) {
    SCOPED_TIMER("press_button");

    ButtonSymbol symbol = symbolForButton(name);
    return m_executor.execute(plan({symbol}));
}

std::vector<ButtonSymbol> CalculatorTools::compileInstruction(const std::string& text) const {
    return m_compiler.compile(m_parser.parse(text));
}

ButtonSymbol CalculatorTools::symbolForButton(const std::string& name) const {
    std::string trimmed = utils::StringUtils::trim(name);
    if (trimmed.empty()) {
        throw UnsupportedInstructionError("Button name is empty");
    }
    auto known = Lexicon::standard().symbolForName(trimmed);
    return known ? *known : ButtonSymbol::named(trimmed);
}

void CalculatorTools::setSleeper(ActionExecutor::Sleeper sleeper) {
    m_sleeper = sleeper;
    m_executor.setSleeper(std::move(sleeper));
}

std::vector<ClickTarget> CalculatorTools::plan(const std::vector<ButtonSymbol>& symbols) {
    // Registry lookups first: a missing button is never worth a window retry
    std::vector<const ElementDescriptor*> elements;
    elements.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        elements.push_back(&m_registry->resolve(symbol));
    }

    ErrorHandler& errors = ErrorHandler::getInstance();
    for (int attempt = 0;; ++attempt) {
        try {
            return resolveAgainstCurrentFrame(symbols, elements);
        } catch (const WindowUnavailableError& e) {
            if (!errors.shouldRetry(e.getErrorInfo(), attempt)) {
                errors.handleException(e, "planning clicks");
                throw;
            }
            SLOG_WARNING().component("calculator_tools")
                .message("Calculator window unavailable, reopening")
                .context("attempt", attempt + 1)
                .context("error", e.what());
            m_locator.ensureOpen();
            pause(errors.getRetryDelay(ErrorType::WINDOW_UNAVAILABLE));
        }
    }
}

std::vector<ClickTarget> CalculatorTools::resolveAgainstCurrentFrame(
        const std::vector<ButtonSymbol>& symbols,
        const std::vector<const ElementDescriptor*>& elements) {
    auto frame = m_locator.getFrame();

    std::vector<ClickTarget> targets;
    targets.reserve(symbols.size());
    for (size_t i = 0; i < symbols.size(); ++i) {
        targets.push_back(m_resolver.resolve(*elements[i], frame, symbols[i]));
    }
    return targets;
}

void CalculatorTools::pause(int delayMs) const {
    if (delayMs <= 0) {
        return;
    }
    if (m_sleeper) {
        m_sleeper(delayMs);
        return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
}

} // namespace calcpilot
