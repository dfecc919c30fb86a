#include <iostream>
#include <functional>
#include <cassert>
#include "instruction_parser/instruction_parser.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"
#include "common/string_utils.h"

using namespace calcpilot;

namespace {

template<typename ErrorT>
ErrorT expectThrow(const std::function<void()>& action) {
    try {
        action();
    } catch (const ErrorT& e) {
        return e;
    }
    assert(false && "expected exception was not thrown");
    throw std::logic_error("unreachable");
}

} // namespace

void testSingleBinaryStep() {
    std::cout << "[TEST] Single Binary Step\n";

    InstructionParser parser;
    auto steps = parser.parse("Add 2 and 3");
    assert(steps.size() == 1);
    assert(steps[0] == Step(Operator::ADD, 2, 3));

    assert(parser.parse("what is 12 times 4")[0] == Step(Operator::MULTIPLY, 12, 4));
    assert(parser.parse("10 divided by 5")[0] == Step(Operator::DIVIDE, 10, 5));
    assert(parser.parse("3 multiplied by 7")[0] == Step(Operator::MULTIPLY, 3, 7));
    assert(parser.parse("9 minus 4")[0] == Step(Operator::SUBTRACT, 9, 4));
    assert(parser.parse("the sum of 6 and 7")[0] == Step(Operator::ADD, 6, 7));

    std::cout << "[OK] Single binary step test passed\n\n";
}

void testEveryOperatorKeyword() {
    std::cout << "[TEST] Every Operator Keyword\n";

    InstructionParser parser;
    const auto& keywords = Lexicon::standard().operatorKeywords();
    assert(keywords.size() >= 19);

    for (const auto& keyword : keywords) {
        std::string phrase = utils::StringUtils::join(keyword.tokens, " ");
        if (isUnary(keyword.op)) {
            auto steps = parser.parse("add 1 and 2 then " + phrase);
            assert(steps.size() == 2);
            assert(steps[1] == Step(keyword.op));
        } else {
            auto steps = parser.parse(phrase + " 6 and 3");
            assert(steps.size() == 1);
            assert(steps[0] == Step(keyword.op, 6, 3));
        }
    }

    assert(parser.parse("6 plus 3")[0].op == Operator::ADD);
    assert(parser.parse("addition of 6 and 3")[0].op == Operator::ADD);
    assert(parser.parse("subtraction of 3 and 6")[0] == Step(Operator::SUBTRACT, 3, 6));
    assert(parser.parse("multiplication of 6 and 3")[0].op == Operator::MULTIPLY);
    assert(parser.parse("division of 6 and 3")[0].op == Operator::DIVIDE);
    assert(parser.parse("add 1 and 2 then squared")[1].op == Operator::SQUARE);
    assert(parser.parse("add 1 and 2 then sqrt")[1].op == Operator::SQRT);
    assert(parser.parse("add 1 and 2 then take the root")[1].op == Operator::SQRT);

    std::cout << "[OK] Every operator keyword test passed\n\n";
}

void testChainedInstruction() {
    std::cout << "[TEST] Chained Instruction\n";

    InstructionParser parser;
    auto steps = parser.parse("Add 2 and 3 and then find the square of the result");
    assert(steps.size() == 2);
    assert(steps[0] == Step(Operator::ADD, 2, 3));
    assert(steps[1] == Step(Operator::SQUARE));

    steps = parser.parse("Add 2 and 3, then take the square root of the result.");
    assert(steps.size() == 2);
    assert(steps[1] == Step(Operator::SQRT));

    steps = parser.parse("divide 10 by 2 then multiply by 4 and then square it");
    assert(steps.size() == 3);
    assert(steps[0] == Step(Operator::DIVIDE, 10, 2));
    assert(steps[1] == Step(Operator::MULTIPLY, std::nullopt, 4));
    assert(steps[2] == Step(Operator::SQUARE));

    std::cout << "[OK] Chained instruction test passed\n\n";
}

void testSpelledNumbers() {
    std::cout << "[TEST] Spelled Numbers\n";

    InstructionParser parser;
    assert(parser.parse("add two and three")[0] == Step(Operator::ADD, 2, 3));
    assert(parser.parse("multiply twenty one by four")[0] == Step(Operator::MULTIPLY, 21, 4));
    assert(parser.parse("add forty and fifteen")[0] == Step(Operator::ADD, 40, 15));
    assert(parser.parse("Add twenty-five and 5")[0] == Step(Operator::ADD, 25, 5));

    auto adjacent = expectThrow<NumberParseError>([&] { parser.parse("add one two and three"); });
    assert(adjacent.getErrorInfo().details == "one two");

    expectThrow<NumberParseError>([&] { parser.parse("add twenty thirty and 1"); });
    expectThrow<NumberParseError>([&] { parser.parse("add two hundred and 5"); });

    // Digits and words next to each other are rejected the same way
    auto mixed = expectThrow<NumberParseError>([&] { parser.parse("add 2 five"); });
    assert(mixed.getErrorInfo().details == "2 five");
    auto wordThenDigit = expectThrow<NumberParseError>([&] { parser.parse("add twenty 5 and 1"); });
    assert(wordThenDigit.getErrorInfo().details == "twenty 5");
    expectThrow<NumberParseError>([&] { parser.parse("add 12 34"); });

    std::cout << "[OK] Spelled numbers test passed\n\n";
}

void testSubtractFrom() {
    std::cout << "[TEST] Subtract From\n";

    InstructionParser parser;
    assert(parser.parse("subtract 3 from 10")[0] == Step(Operator::SUBTRACT, 10, 3));
    assert(parser.parse("subtract 10 and 3")[0] == Step(Operator::SUBTRACT, 10, 3));

    std::cout << "[OK] Subtract from test passed\n\n";
}

void testNumberErrors() {
    std::cout << "[TEST] Number Errors\n";

    InstructionParser parser;
    auto decimal = expectThrow<NumberParseError>([&] { parser.parse("add 2.5 and 3"); });
    assert(decimal.getErrorInfo().details == "2.5");
    assert(decimal.getType() == ErrorType::NUMBER_PARSE);

    expectThrow<NumberParseError>([&] { parser.parse("add 99999999999999999999 and 1"); });
    expectThrow<NumberParseError>([&] { parser.parse("add 2x and 3"); });

    std::cout << "[OK] Number errors test passed\n\n";
}

void testUnsupportedInstructions() {
    std::cout << "[TEST] Unsupported Instructions\n";

    InstructionParser parser;
    expectThrow<UnsupportedInstructionError>([&] { parser.parse(""); });
    expectThrow<UnsupportedInstructionError>([&] { parser.parse("   \t "); });
    expectThrow<UnsupportedInstructionError>([&] { parser.parse("?!"); });

    auto noOperator = expectThrow<UnsupportedInstructionError>([&] { parser.parse("hello world"); });
    assert(noOperator.getErrorInfo().details == "hello world");

    auto laterClause = expectThrow<UnsupportedInstructionError>([&] { parser.parse("add 2 and 3 then celebrate"); });
    assert(laterClause.getErrorInfo().details == "celebrate");

    expectThrow<UnsupportedInstructionError>([&] { parser.parse("add 2 and subtract 3"); });

    std::cout << "[OK] Unsupported instructions test passed\n\n";
}

void testAmbiguousOperands() {
    std::cout << "[TEST] Ambiguous Operands\n";

    InstructionParser parser;
    expectThrow<AmbiguousOperandError>([&] { parser.parse("add 5"); });
    expectThrow<AmbiguousOperandError>([&] { parser.parse("add 1 and 2 and 3"); });
    expectThrow<AmbiguousOperandError>([&] { parser.parse("square 4"); });
    auto leadingUnary = expectThrow<AmbiguousOperandError>([&] { parser.parse("find the square of the result"); });
    assert(leadingUnary.getType() == ErrorType::AMBIGUOUS_OPERAND);
    expectThrow<AmbiguousOperandError>([&] { parser.parse("add 2 and 3 then square 5"); });
    expectThrow<AmbiguousOperandError>([&] { parser.parse("add 2 and 3 then multiply"); });

    std::cout << "[OK] Ambiguous operands test passed\n\n";
}

void testTokenizeAndClauses() {
    std::cout << "[TEST] Tokenize and Clauses\n";

    InstructionParser parser;
    auto tokens = parser.tokenize("Add 2 AND 3, then Square!");
    assert((tokens == std::vector<std::string>{"add", "2", "and", "3", "then", "square"}));

    auto clauses = parser.splitClauses(parser.tokenize("then add 2 and 3 and then and then square"));
    assert(clauses.size() == 2);
    assert((clauses[0] == std::vector<std::string>{"add", "2", "and", "3"}));
    assert((clauses[1] == std::vector<std::string>{"square"}));

    std::cout << "[OK] Tokenize and clauses test passed\n\n";
}

void testCustomLexicon() {
    std::cout << "[TEST] Custom Lexicon\n";

    Lexicon lexicon;
    lexicon.addConnective({"after", "that"});
    lexicon.addOperatorKeyword({"increase"}, Operator::ADD);

    InstructionParser parser(lexicon);
    auto steps = parser.parse("increase 4 and 1 after that square it");
    assert(steps.size() == 2);
    assert(steps[0] == Step(Operator::ADD, 4, 1));
    assert(steps[1] == Step(Operator::SQUARE));

    std::cout << "[OK] Custom lexicon test passed\n\n";
}

int main() {
    std::cout << "=== CalcPilot Instruction Parser Test Suite ===\n\n";

    StructuredLogger::getInstance().setLogLevel(LogLevel::ERROR_LEVEL);

    try {
        testSingleBinaryStep();
        testEveryOperatorKeyword();
        testChainedInstruction();
        testSpelledNumbers();
        testSubtractFrom();
        testNumberErrors();
        testUnsupportedInstructions();
        testAmbiguousOperands();
        testTokenizeAndClauses();
        testCustomLexicon();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
