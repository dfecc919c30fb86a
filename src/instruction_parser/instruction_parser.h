#ifndef CALCPILOT_INSTRUCTION_PARSER_H
#define CALCPILOT_INSTRUCTION_PARSER_H

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "lexicon.h"
#include "../common/types.h"

namespace calcpilot {

/**
 * @brief Turns "Add 2 and 3 and then square the result" into a Step chain.
 *
 * Keyword scanning over the Lexicon tables, no grammar. Throws
 * UnsupportedInstructionError, NumberParseError or AmbiguousOperandError.
 */
class InstructionParser {
public:
    explicit InstructionParser(const Lexicon& lexicon = Lexicon::standard());

    std::vector<Step> parse(const std::string& text) const;

    // Lowercased word tokens; punctuation and hyphens act as separators
    std::vector<std::string> tokenize(const std::string& text) const;

    // Splits on connectives, dropping empty clauses
    std::vector<std::vector<std::string>> splitClauses(const std::vector<std::string>& tokens) const;

private:
    struct NumberToken {
        int64_t value;
        size_t position;
    };

    const Lexicon& m_lexicon;

    std::optional<Operator> findOperator(const std::vector<std::string>& clause) const;
    std::vector<NumberToken> extractNumbers(const std::vector<std::string>& clause) const;
    Step buildStep(Operator op, const std::vector<NumberToken>& numbers,
                   const std::vector<std::string>& clause, size_t clauseIndex) const;
    bool hasReversalMarker(const std::vector<std::string>& clause, size_t from, size_t to) const;

    static bool matchesAt(const std::vector<std::string>& tokens, size_t pos,
                          const std::vector<std::string>& phrase);
    static int64_t parseDigits(const std::string& token);
};

} // namespace calcpilot

#endif // CALCPILOT_INSTRUCTION_PARSER_H
