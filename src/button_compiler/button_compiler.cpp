#include "button_compiler.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"

namespace calcpilot {

std::vector<ButtonSymbol> ButtonCompiler::compile(const std::vector<Step>& steps) const {
    if (steps.empty()) {
        throw UnsupportedInstructionError("Cannot compile an empty step chain");
    }

    std::vector<ButtonSymbol> symbols;
    for (size_t i = 0; i < steps.size(); ++i) {
        const Step& step = steps[i];
        validate(step, i);

        if (isUnary(step.op)) {
            symbols.push_back(ButtonSymbol::forOperator(step.op));
            continue;
        }

        if (step.operandA) {
            appendDigits(*step.operandA, symbols);
        }
        symbols.push_back(ButtonSymbol::forOperator(step.op));
        appendDigits(*step.operandB, symbols);
        symbols.push_back(ButtonSymbol::evaluate());
    }
    return symbols;
}

void ButtonCompiler::validate(const Step& step, size_t index) {
    std::string where = "step " + std::to_string(index) + " (" + operatorToString(step.op) + ")";

    if (isUnary(step.op)) {
        if (step.operandA || step.operandB) {
            throw UnsupportedInstructionError("Unary step must not carry operands", where);
        }
        if (index == 0) {
            throw UnsupportedInstructionError("Chain cannot start with a unary step", where);
        }
        return;
    }

    if (!step.operandB) {
        throw UnsupportedInstructionError("Binary step is missing its second operand", where);
    }
    if (index == 0 && !step.operandA) {
        throw UnsupportedInstructionError("First step of a chain needs both operands", where);
    }
    if ((step.operandA && *step.operandA < 0) || *step.operandB < 0) {
        throw UnsupportedInstructionError("Negative operands cannot be entered", where);
    }
}

void ButtonCompiler::appendDigits(int64_t value, std::vector<ButtonSymbol>& out) {
    for (char c : std::to_string(value)) {
        out.push_back(ButtonSymbol::digit(c - '0'));
    }
}

std::string ButtonCompiler::describe(const std::vector<ButtonSymbol>& symbols) {
    return utils::StringUtils::join(names(symbols), " → ");
}

std::vector<std::string> ButtonCompiler::names(const std::vector<ButtonSymbol>& symbols) {
    std::vector<std::string> result;
    result.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        result.push_back(symbol.name);
    }
    return result;
}

} // namespace calcpilot
