#ifndef CALCPILOT_TYPES_H
#define CALCPILOT_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace calcpilot {

enum class Operator {
    ADD,
    SUBTRACT,
    MULTIPLY,
    DIVIDE,
    SQUARE,  // unary
    SQRT     // unary
};

bool isUnary(Operator op);
std::string operatorToString(Operator op);

// One parsed arithmetic action
struct Step {
    Operator op;
    std::optional<int64_t> operandA;
    std::optional<int64_t> operandB;

    Step() : op(Operator::ADD) {}
    Step(Operator o, std::optional<int64_t> a = std::nullopt, std::optional<int64_t> b = std::nullopt)
        : op(o), operandA(a), operandB(b) {}

    bool operator==(const Step& other) const {
        return op == other.op && operandA == other.operandA && operandB == other.operandB;
    }
};

// One press of a calculator button
struct ButtonSymbol {
    enum class Kind {
        DIGIT,
        OPERATOR,
        FUNCTION,
        EVALUATE,
        NAMED
    };

    Kind kind;
    std::string name;  // "0".."9", "+", "-", "×", "÷", "=", "square", "√", or any label for NAMED

    ButtonSymbol() : kind(Kind::NAMED) {}
    ButtonSymbol(Kind k, const std::string& n) : kind(k), name(n) {}

    static ButtonSymbol digit(int d) { return ButtonSymbol(Kind::DIGIT, std::to_string(d)); }
    static ButtonSymbol evaluate() { return ButtonSymbol(Kind::EVALUATE, "="); }
    static ButtonSymbol named(const std::string& label) { return ButtonSymbol(Kind::NAMED, label); }
    static ButtonSymbol forOperator(Operator op);

    bool operator==(const ButtonSymbol& other) const {
        return kind == other.kind && name == other.name;
    }
    bool operator!=(const ButtonSymbol& other) const { return !(*this == other); }
};

std::string symbolKindToString(ButtonSymbol::Kind kind);

// Window-relative pixels
struct BoundingBox {
    int left = 0;
    int top = 0;
    int width = 0;
    int height = 0;
};

struct ElementDescriptor {
    std::string id;
    std::vector<std::string> aliases;  // lowercase
    std::string label;
    BoundingBox boundingBox;
};

struct WindowFrame {
    int originX = 0;
    int originY = 0;
    bool visible = false;
};

struct ClickTarget {
    int x = 0;
    int y = 0;
    ButtonSymbol symbol;
    ElementDescriptor element;
};

struct ClickResult {
    bool success = false;
    std::string error;

    static ClickResult ok() { return ClickResult{true, ""}; }
    static ClickResult failed(const std::string& message) { return ClickResult{false, message}; }
};

struct ExecutionReport {
    std::string instruction;
    std::vector<std::string> symbols;
    size_t total = 0;
    std::vector<size_t> succeeded;
    std::optional<size_t> failedIndex;
    std::string failedSymbol;
    std::string errorType;
    std::string errorMessage;
    bool cancelled = false;

    bool success() const { return !failedIndex && !cancelled && succeeded.size() == total; }
    nlohmann::json toJson() const;
};

} // namespace calcpilot

#endif // CALCPILOT_TYPES_H
