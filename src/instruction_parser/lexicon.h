#ifndef CALCPILOT_LEXICON_H
#define CALCPILOT_LEXICON_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include "../common/types.h"

namespace calcpilot {

/**
 * @brief Word tables used by InstructionParser and ElementRegistry.
 *
 * Everything language-specific lives here as data. The parser and the
 * registry only walk these tables.
 */
class Lexicon {
public:
    struct OperatorKeyword {
        std::vector<std::string> tokens;
        Operator op;
    };

    struct ButtonSynonyms {
        ButtonSymbol symbol;
        std::vector<std::string> exactAliases;   // compared whole against descriptor aliases
        std::vector<std::string> labelKeywords;  // substring fallback against label text
    };

    // Built-in English tables
    static const Lexicon& standard();

    Lexicon();

    // Sorted longest first
    const std::vector<std::vector<std::string>>& connectives() const { return m_connectives; }
    const std::vector<OperatorKeyword>& operatorKeywords() const { return m_operatorKeywords; }

    // "zero".."nineteen"
    std::optional<int64_t> unitValue(const std::string& word) const;
    // "twenty".."ninety"
    std::optional<int64_t> tensValue(const std::string& word) const;
    // "hundred", "thousand"... recognised only so they can be rejected
    bool isScaleWord(const std::string& word) const;
    bool isNumberWord(const std::string& word) const;

    // Operand order marker in "subtract A from B"
    const std::string& reversalMarker() const { return m_reversalMarker; }

    const std::vector<ButtonSynonyms>& buttonSynonyms() const { return m_buttonSynonyms; }

    /**
     * @brief Synonym entry for a symbol, nullptr for NAMED or unknown symbols
     */
    const ButtonSynonyms* synonymsFor(const ButtonSymbol& symbol) const;

    /**
     * @brief Map a free-form button name ("plus", "x²", "7") to a known symbol
     * @return Empty if the name is not a known synonym
     */
    std::optional<ButtonSymbol> symbolForName(const std::string& name) const;

    void addConnective(const std::vector<std::string>& tokens);
    void addOperatorKeyword(const std::vector<std::string>& tokens, Operator op);

private:
    std::vector<std::vector<std::string>> m_connectives;
    std::vector<OperatorKeyword> m_operatorKeywords;
    std::map<std::string, int64_t> m_units;
    std::map<std::string, int64_t> m_tens;
    std::vector<std::string> m_scaleWords;
    std::string m_reversalMarker;
    std::vector<ButtonSynonyms> m_buttonSynonyms;

    void sortByLength();
};

} // namespace calcpilot

#endif // CALCPILOT_LEXICON_H
