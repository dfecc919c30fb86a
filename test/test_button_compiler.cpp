#include <iostream>
#include <cassert>
#include "button_compiler/button_compiler.h"
#include "instruction_parser/instruction_parser.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"

using namespace calcpilot;

namespace {

std::vector<std::string> compileNames(const std::vector<Step>& steps) {
    ButtonCompiler compiler;
    return ButtonCompiler::names(compiler.compile(steps));
}

bool rejects(const std::vector<Step>& steps) {
    try {
        ButtonCompiler().compile(steps);
    } catch (const UnsupportedInstructionError&) {
        return true;
    }
    return false;
}

} // namespace

void testBinaryThenUnary() {
    std::cout << "[TEST] Binary Then Unary\n";

    auto names = compileNames({Step(Operator::ADD, 2, 3), Step(Operator::SQUARE)});
    assert((names == std::vector<std::string>{"2", "+", "3", "=", "square"}));

    names = compileNames({Step(Operator::ADD, 2, 3), Step(Operator::SQRT)});
    assert((names == std::vector<std::string>{"2", "+", "3", "=", "√"}));

    std::cout << "[OK] Binary then unary test passed\n\n";
}

void testMultiDigitOperands() {
    std::cout << "[TEST] Multi-digit Operands\n";

    ButtonCompiler compiler;
    auto symbols = compiler.compile({Step(Operator::MULTIPLY, 120, 45)});
    assert((ButtonCompiler::names(symbols) == std::vector<std::string>{"1", "2", "0", "×", "4", "5", "="}));
    assert(symbols[0].kind == ButtonSymbol::Kind::DIGIT);
    assert(symbols[3].kind == ButtonSymbol::Kind::OPERATOR);
    assert(symbols[6].kind == ButtonSymbol::Kind::EVALUATE);

    auto reversed = compileNames({Step(Operator::SUBTRACT, 20, 10)});
    assert((reversed == std::vector<std::string>{"2", "0", "-", "1", "0", "="}));

    auto zero = compileNames({Step(Operator::DIVIDE, 0, 7)});
    assert((zero == std::vector<std::string>{"0", "÷", "7", "="}));

    std::cout << "[OK] Multi-digit operands test passed\n\n";
}

void testRunningResult() {
    std::cout << "[TEST] Running Result\n";

    auto names = compileNames({Step(Operator::DIVIDE, 10, 2),
                               Step(Operator::MULTIPLY, std::nullopt, 4),
                               Step(Operator::SQUARE)});
    assert((names == std::vector<std::string>{"1", "0", "÷", "2", "=", "×", "4", "=", "square"}));

    std::cout << "[OK] Running result test passed\n\n";
}

void testEvaluateBeforeEveryUnary() {
    std::cout << "[TEST] Evaluate Placement\n";

    ButtonCompiler compiler;
    auto symbols = compiler.compile({Step(Operator::SUBTRACT, 9, 4),
                                     Step(Operator::SQUARE),
                                     Step(Operator::SQRT)});
    // Every binary step is closed by "=" before the following unary press
    size_t equalsCount = 0;
    for (size_t i = 0; i < symbols.size(); ++i) {
        if (symbols[i].kind == ButtonSymbol::Kind::FUNCTION) {
            assert(i > 0);
            assert(symbols[i - 1].kind == ButtonSymbol::Kind::EVALUATE ||
                   symbols[i - 1].kind == ButtonSymbol::Kind::FUNCTION);
        }
        if (symbols[i].kind == ButtonSymbol::Kind::EVALUATE) {
            ++equalsCount;
        }
    }
    assert(equalsCount == 1);
    assert(ButtonCompiler::describe(symbols) == "9 → - → 4 → = → square → √");

    std::cout << "[OK] Evaluate placement test passed\n\n";
}

void testParsedPipeline() {
    std::cout << "[TEST] Parsed Pipeline\n";

    InstructionParser parser;
    ButtonCompiler compiler;
    auto symbols = compiler.compile(parser.parse("Add 2 and 3 and then find the square of the result"));
    assert(ButtonCompiler::describe(symbols) == "2 → + → 3 → = → square");

    symbols = compiler.compile(parser.parse("Subtract 10 from 20"));
    assert(ButtonCompiler::describe(symbols) == "2 → 0 → - → 1 → 0 → =");

    std::cout << "[OK] Parsed pipeline test passed\n\n";
}

void testInvalidChains() {
    std::cout << "[TEST] Invalid Chains\n";

    assert(rejects({}));
    assert(rejects({Step(Operator::SQUARE)}));
    assert(rejects({Step(Operator::ADD, std::nullopt, 3)}));
    assert(rejects({Step(Operator::ADD, 2, std::nullopt)}));
    assert(rejects({Step(Operator::ADD, 1, 2), Step(Operator::SQUARE, 4)}));
    assert(rejects({Step(Operator::ADD, -1, 2)}));
    assert(!rejects({Step(Operator::ADD, 1, 2), Step(Operator::SQRT)}));

    std::cout << "[OK] Invalid chains test passed\n\n";
}

int main() {
    std::cout << "=== CalcPilot Button Compiler Test Suite ===\n\n";

    StructuredLogger::getInstance().setLogLevel(LogLevel::ERROR_LEVEL);

    try {
        testBinaryThenUnary();
        testMultiDigitOperands();
        testRunningResult();
        testEvaluateBeforeEveryUnary();
        testParsedPipeline();
        testInvalidChains();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
