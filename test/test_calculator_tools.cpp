#include <iostream>
#include <cassert>
#include "calculator_tools/calculator_tools.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"
#include "test_fakes.h"

using namespace calcpilot;
using namespace calcpilot::testing;

namespace {

ActionExecutor::Settings quickSettings() {
    ActionExecutor::Settings settings;
    settings.settleDelayMs = 0;
    settings.focusDelayMs = 0;
    return settings;
}

void setWindowRetries(int count) {
    ErrorHandler::getInstance().setMaxRetries(ErrorType::WINDOW_UNAVAILABLE, count);
    ErrorHandler::getInstance().setRetryDelay(ErrorType::WINDOW_UNAVAILABLE, 0);
}

} // namespace

void testRunInstruction() {
    std::cout << "[TEST] Run Instruction\n";

    FakeWindowLocator locator;
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    auto report = tools.runInstruction("Add 2 and 3 and then find the square of the result");
    assert(report.success());
    assert(report.instruction == "Add 2 and 3 and then find the square of the result");
    assert((report.symbols == std::vector<std::string>{"2", "+", "3", "=", "square"}));
    assert(clicker.clicks.size() == 5);
    assert((clicker.clicks[4] == std::pair<int, int>{220, 342}));
    assert(locator.openCalls == 0);

    std::cout << "[OK] Run instruction test passed\n\n";
}

void testErrorsBeforeAnyClick() {
    std::cout << "[TEST] Errors Before Any Click\n";

    FakeWindowLocator locator;
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    bool threw = false;
    try {
        tools.runInstruction("hello there");
    } catch (const UnsupportedInstructionError&) {
        threw = true;
    }
    assert(threw);

    // The sample registry has no "5" button
    threw = false;
    try {
        tools.runInstruction("add 5 and 1");
    } catch (const ButtonNotFoundError& e) {
        threw = true;
        assert(std::string(e.what()).find("'5'") != std::string::npos);
    }
    assert(threw);

    assert(clicker.clicks.empty());
    assert(locator.frameCalls == 0);

    std::cout << "[OK] Errors before any click test passed\n\n";
}

void testWindowRetry() {
    std::cout << "[TEST] Window Retry\n";

    setWindowRetries(2);
    FakeWindowLocator locator(std::nullopt);
    locator.frameAfterOpen = WindowFrame{100, 50, true};
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    auto report = tools.runInstruction("add 2 and 3");
    assert(report.success());
    assert(locator.openCalls == 1);
    assert(clicker.clicks.size() == 4);

    std::cout << "[OK] Window retry test passed\n\n";
}

void testWindowRetryExhausted() {
    std::cout << "[TEST] Window Retry Exhausted\n";

    setWindowRetries(2);
    FakeWindowLocator locator(std::nullopt);
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    std::vector<int> delays;
    ErrorHandler::getInstance().setRetryDelay(ErrorType::WINDOW_UNAVAILABLE, 250);
    tools.setSleeper([&delays](int ms) { delays.push_back(ms); });

    bool threw = false;
    try {
        tools.runInstruction("add 2 and 3");
    } catch (const WindowUnavailableError&) {
        threw = true;
    }
    assert(threw);
    assert(locator.openCalls == 2);
    assert((delays == std::vector<int>{250, 250}));
    assert(clicker.clicks.empty());

    setWindowRetries(0);
    FakeWindowLocator hidden(WindowFrame{0, 0, false});
    CalculatorTools noRetry(sampleRegistry(), hidden, clicker, quickSettings());
    threw = false;
    try {
        noRetry.pressButton("=");
    } catch (const WindowUnavailableError&) {
        threw = true;
    }
    assert(threw);
    assert(hidden.openCalls == 0);

    setWindowRetries(2);
    std::cout << "[OK] Window retry exhausted test passed\n\n";
}

void testPressButton() {
    std::cout << "[TEST] Press Button\n";

    FakeWindowLocator locator;
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    auto report = tools.pressButton("plus");
    assert(report.success());
    assert((report.symbols == std::vector<std::string>{"+"}));
    assert((clicker.clicks.back() == std::pair<int, int>{376, 468}));

    report = tools.pressButton(" C ");
    assert(report.success());
    assert((report.symbols == std::vector<std::string>{"C"}));
    assert((clicker.clicks.back() == std::pair<int, int>{298, 300}));

    assert(tools.symbolForButton("Square Root").kind == ButtonSymbol::Kind::FUNCTION);
    assert(tools.symbolForButton("7").kind == ButtonSymbol::Kind::DIGIT);
    assert(tools.symbolForButton("Memory").kind == ButtonSymbol::Kind::NAMED);

    bool threw = false;
    try {
        tools.pressButton("Memory");
    } catch (const ButtonNotFoundError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tools.pressButton("   ");
    } catch (const UnsupportedInstructionError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[OK] Press button test passed\n\n";
}

void testOpenApplication() {
    std::cout << "[TEST] Open Application\n";

    FakeWindowLocator locator(WindowFrame{40, 30, true});
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    WindowFrame frame = tools.openApplication();
    assert(frame.originX == 40);
    assert(frame.originY == 30);
    assert(locator.openCalls == 1);
    assert(locator.focusCalls == 1);

    FakeWindowLocator missing(std::nullopt);
    CalculatorTools unavailable(sampleRegistry(), missing, clicker, quickSettings());
    bool threw = false;
    try {
        unavailable.openApplication();
    } catch (const WindowUnavailableError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[OK] Open application test passed\n\n";
}

void testDryCompile() {
    std::cout << "[TEST] Compile Without Desktop\n";

    FakeWindowLocator locator;
    RecordingClicker clicker;
    CalculatorTools tools(sampleRegistry(), locator, clicker, quickSettings());

    auto symbols = tools.compileInstruction("multiply 12 by 4");
    assert(ButtonCompiler::describe(symbols) == "1 → 2 → × → 4 → =");
    assert(locator.frameCalls == 0);
    assert(clicker.clicks.empty());

    std::cout << "[OK] Compile without desktop test passed\n\n";
}

int main() {
    std::cout << "=== CalcPilot Calculator Tools Test Suite ===\n\n";

    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testRunInstruction();
        testErrorsBeforeAnyClick();
        testWindowRetry();
        testWindowRetryExhausted();
        testPressButton();
        testOpenApplication();
        testDryCompile();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
