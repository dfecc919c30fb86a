#ifndef CALCPILOT_CALCULATOR_TOOLS_H
#define CALCPILOT_CALCULATOR_TOOLS_H

#include <string>
#include <vector>
#include <memory>
#include "../common/types.h"
#include "../instruction_parser/instruction_parser.h"
#include "../button_compiler/button_compiler.h"
#include "../element_registry/element_registry.h"
#include "../coordinate_resolver/coordinate_resolver.h"
#include "../action_executor/action_executor.h"
#include "../ocal/window_locator.h"
#include "../ocal/click_primitive.h"

namespace calcpilot {

/**
 * @brief The three operations exposed to callers: open, run an instruction, press one button.
 *
 * Parse and registry errors surface before any click. A missing window
 * during planning is retried through ensureOpen() according to the
 * ErrorHandler retry policy for WINDOW_UNAVAILABLE.
 */
class CalculatorTools {
public:
    CalculatorTools(std::shared_ptr<const ElementRegistry> registry,
                    ocal::IWindowLocator& locator,
                    ocal::IClickPrimitive& clicker,
                    const ActionExecutor::Settings& settings,
                    ActionExecutor::CancellationCheck cancelled = nullptr);

    WindowFrame openApplication();
    ExecutionReport runInstruction(const std::string& text);
    ExecutionReport pressButton(const std::string& name);

    // Parse and compile only; touches neither the registry nor the desktop
    std::vector<ButtonSymbol> compileInstruction(const std::string& text) const;

    // Known synonym, or a NAMED symbol carrying the trimmed name
    ButtonSymbol symbolForButton(const std::string& name) const;

    void setSleeper(ActionExecutor::Sleeper sleeper);

    const ElementRegistry& registry() const { return *m_registry; }

private:
    std::shared_ptr<const ElementRegistry> m_registry;
    ocal::IWindowLocator& m_locator;
    InstructionParser m_parser;
    ButtonCompiler m_compiler;
    CoordinateResolver m_resolver;
    ActionExecutor m_executor;
    ActionExecutor::Sleeper m_sleeper;

    std::vector<ClickTarget> plan(const std::vector<ButtonSymbol>& symbols);
    std::vector<ClickTarget> resolveAgainstCurrentFrame(const std::vector<ButtonSymbol>& symbols,
                                                        const std::vector<const ElementDescriptor*>& elements);
    void pause(int delayMs) const;
};

} // namespace calcpilot

#endif // CALCPILOT_CALCULATOR_TOOLS_H
