#include "types.h"

namespace calcpilot {

bool isUnary(Operator op) {
    return op == Operator::SQUARE || op == Operator::SQRT;
}

std::string operatorToString(Operator op) {
    switch (op) {
        case Operator::ADD: return "add";
        case Operator::SUBTRACT: return "subtract";
        case Operator::MULTIPLY: return "multiply";
        case Operator::DIVIDE: return "divide";
        case Operator::SQUARE: return "square";
        case Operator::SQRT: return "sqrt";
        default: return "unknown";
    }
}

ButtonSymbol ButtonSymbol::forOperator(Operator op) {
    switch (op) {
        case Operator::ADD: return ButtonSymbol(Kind::OPERATOR, "+");
        case Operator::SUBTRACT: return ButtonSymbol(Kind::OPERATOR, "-");
        case Operator::MULTIPLY: return ButtonSymbol(Kind::OPERATOR, "×");
        case Operator::DIVIDE: return ButtonSymbol(Kind::OPERATOR, "÷");
        case Operator::SQUARE: return ButtonSymbol(Kind::FUNCTION, "square");
        case Operator::SQRT: return ButtonSymbol(Kind::FUNCTION, "√");
    }
    return ButtonSymbol(Kind::NAMED, operatorToString(op));
}

std::string symbolKindToString(ButtonSymbol::Kind kind) {
    switch (kind) {
        case ButtonSymbol::Kind::DIGIT: return "digit";
        case ButtonSymbol::Kind::OPERATOR: return "operator";
        case ButtonSymbol::Kind::FUNCTION: return "function";
        case ButtonSymbol::Kind::EVALUATE: return "evaluate";
        case ButtonSymbol::Kind::NAMED: return "named";
        default: return "unknown";
    }
}

nlohmann::json ExecutionReport::toJson() const {
    nlohmann::json j;
    j["success"] = success();
    if (!instruction.empty()) {
        j["instruction"] = instruction;
    }
    j["buttons"] = symbols;
    j["total"] = total;
    j["succeeded"] = succeeded;
    j["cancelled"] = cancelled;
    if (failedIndex) {
        j["failed_index"] = *failedIndex;
        j["failed_button"] = failedSymbol;
        j["error_type"] = errorType;
        j["error"] = errorMessage;
    }
    return j;
}

} // namespace calcpilot
