#ifndef CALCPILOT_BUTTON_COMPILER_H
#define CALCPILOT_BUTTON_COMPILER_H

#include <string>
#include <vector>
#include <cstdint>
#include "../common/types.h"

namespace calcpilot {

/**
 * @brief Step chain to ordered button presses.
 *
 * Binary step: digits of A (if present), operator, digits of B, "=".
 * Unary step: the function button alone.
 */
class ButtonCompiler {
public:
    std::vector<ButtonSymbol> compile(const std::vector<Step>& steps) const;

    // "2 → + → 3 → ="
    static std::string describe(const std::vector<ButtonSymbol>& symbols);

    static std::vector<std::string> names(const std::vector<ButtonSymbol>& symbols);

private:
    static void appendDigits(int64_t value, std::vector<ButtonSymbol>& out);
    static void validate(const Step& step, size_t index);
};

} // namespace calcpilot

#endif // CALCPILOT_BUTTON_COMPILER_H
