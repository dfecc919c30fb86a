#include "instruction_parser.h"
#include "../common/error_handler.h"
#include "../common/string_utils.h"
#include "../common/structured_logger.h"
#include <limits>

namespace calcpilot {

namespace {
    bool isAsciiDigit(char c) {
        return c >= '0' && c <= '9';
    }

    bool isAsciiAlnum(char c) {
        return isAsciiDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    // Finds "2.5" style literals, returns the literal or empty
    std::string findDecimalLiteral(const std::string& text) {
        for (size_t i = 1; i + 1 < text.size(); ++i) {
            if (text[i] != '.' || !isAsciiDigit(text[i - 1]) || !isAsciiDigit(text[i + 1])) {
                continue;
            }
            size_t start = i - 1;
            while (start > 0 && isAsciiDigit(text[start - 1])) {
                --start;
            }
            size_t end = i + 1;
            while (end < text.size() && (isAsciiDigit(text[end]) || text[end] == '.')) {
                ++end;
            }
            return text.substr(start, end - start);
        }
        return "";
    }
}

InstructionParser::InstructionParser(const Lexicon& lexicon) : m_lexicon(lexicon) {}

std::vector<Step> InstructionParser::parse(const std::string& text) const {
    if (utils::StringUtils::isWhitespaceOnly(text)) {
        throw UnsupportedInstructionError("Instruction is empty");
    }

    auto tokens = tokenize(text);
    auto clauses = splitClauses(tokens);
    if (clauses.empty()) {
        throw UnsupportedInstructionError("Instruction contains no recognizable words", "", text);
    }

    std::vector<Step> steps;
    for (size_t i = 0; i < clauses.size(); ++i) {
        const auto& clause = clauses[i];
        auto op = findOperator(clause);
        if (!op) {
            throw UnsupportedInstructionError("No operator keyword found in clause",
                                              utils::StringUtils::join(clause, " "), text);
        }
        steps.push_back(buildStep(*op, extractNumbers(clause), clause, i));
    }

    SLOG_DEBUG().component("instruction_parser")
        .message("Instruction parsed")
        .context("instruction", text)
        .context("steps", steps.size());
    return steps;
}

std::vector<std::string> InstructionParser::tokenize(const std::string& text) const {
    std::string lower = utils::StringUtils::toLowerCase(text);

    std::string decimal = findDecimalLiteral(lower);
    if (!decimal.empty()) {
        throw NumberParseError("Decimal numbers are not supported", decimal, text);
    }

    std::string normalized;
    normalized.reserve(lower.size());
    for (char c : lower) {
        normalized += isAsciiAlnum(c) ? c : ' ';
    }
    return utils::StringUtils::splitWhitespace(normalized);
}

std::vector<std::vector<std::string>> InstructionParser::splitClauses(const std::vector<std::string>& tokens) const {
    std::vector<std::vector<std::string>> clauses;
    std::vector<std::string> current;

    size_t i = 0;
    while (i < tokens.size()) {
        bool split = false;
        for (const auto& connective : m_lexicon.connectives()) {
            if (matchesAt(tokens, i, connective)) {
                if (!current.empty()) {
                    clauses.push_back(current);
                    current.clear();
                }
                i += connective.size();
                split = true;
                break;
            }
        }
        if (!split) {
            current.push_back(tokens[i]);
            ++i;
        }
    }
    if (!current.empty()) {
        clauses.push_back(current);
    }
    return clauses;
}

std::optional<Operator> InstructionParser::findOperator(const std::vector<std::string>& clause) const {
    std::optional<Operator> found;

    size_t i = 0;
    while (i < clause.size()) {
        size_t advance = 1;
        for (const auto& keyword : m_lexicon.operatorKeywords()) {
            if (!matchesAt(clause, i, keyword.tokens)) {
                continue;
            }
            if (found && *found != keyword.op) {
                throw UnsupportedInstructionError(
                    "Clause names more than one operator",
                    operatorToString(*found) + " and " + operatorToString(keyword.op),
                    utils::StringUtils::join(clause, " "));
            }
            found = keyword.op;
            advance = keyword.tokens.size();
            break;
        }
        i += advance;
    }
    return found;
}

std::vector<InstructionParser::NumberToken>
InstructionParser::extractNumbers(const std::vector<std::string>& clause) const {
    std::vector<NumberToken> numbers;
    std::optional<size_t> lastNumber;
    bool lastWasBareTens = false;

    for (size_t i = 0; i < clause.size(); ++i) {
        const std::string& token = clause[i];
        bool adjacent = lastNumber && *lastNumber + 1 == i;

        if (m_lexicon.isScaleWord(token)) {
            throw NumberParseError("Numbers with scale words are not supported", token,
                                   utils::StringUtils::join(clause, " "));
        }

        if (auto tens = m_lexicon.tensValue(token)) {
            if (adjacent) {
                throw NumberParseError("Unsupported number composition",
                                       clause[i - 1] + " " + token,
                                       utils::StringUtils::join(clause, " "));
            }
            numbers.push_back({*tens, i});
            lastNumber = i;
            lastWasBareTens = true;
            continue;
        }

        if (auto unit = m_lexicon.unitValue(token)) {
            if (adjacent) {
                if (lastWasBareTens && *unit >= 1 && *unit <= 9) {
                    numbers.back().value += *unit;
                    lastNumber = i;
                    lastWasBareTens = false;
                    continue;
                }
                throw NumberParseError("Unsupported number composition",
                                       clause[i - 1] + " " + token,
                                       utils::StringUtils::join(clause, " "));
            }
            numbers.push_back({*unit, i});
            lastNumber = i;
            lastWasBareTens = false;
            continue;
        }

        bool allDigits = !token.empty();
        bool anyDigit = false;
        for (char c : token) {
            allDigits = allDigits && isAsciiDigit(c);
            anyDigit = anyDigit || isAsciiDigit(c);
        }

        if (allDigits) {
            if (adjacent) {
                throw NumberParseError("Unsupported number composition",
                                       clause[i - 1] + " " + token,
                                       utils::StringUtils::join(clause, " "));
            }
            numbers.push_back({parseDigits(token), i});
            lastNumber = i;
            lastWasBareTens = false;
        } else if (anyDigit) {
            throw NumberParseError("Unrecognized number token", token,
                                   utils::StringUtils::join(clause, " "));
        }
    }
    return numbers;
}

Step InstructionParser::buildStep(Operator op, const std::vector<NumberToken>& numbers,
                                  const std::vector<std::string>& clause, size_t clauseIndex) const {
    std::string clauseText = utils::StringUtils::join(clause, " ");

    if (isUnary(op)) {
        if (clauseIndex == 0) {
            throw AmbiguousOperandError("Unary operator has no previous result to apply to",
                                        operatorToString(op), clauseText);
        }
        if (!numbers.empty()) {
            throw AmbiguousOperandError("Unary operator applies to the previous result and takes no operand",
                                        std::to_string(numbers.front().value), clauseText);
        }
        return Step(op);
    }

    if (clauseIndex > 0 && numbers.size() == 1) {
        return Step(op, std::nullopt, numbers.front().value);
    }

    if (numbers.size() != 2) {
        std::string expected = clauseIndex == 0 ? "two operands" : "one or two operands";
        throw AmbiguousOperandError("Binary operator " + operatorToString(op) + " expects " + expected,
                                    "found " + std::to_string(numbers.size()), clauseText);
    }

    const NumberToken& first = numbers[0];
    const NumberToken& second = numbers[1];
    if (op == Operator::SUBTRACT && hasReversalMarker(clause, first.position, second.position)) {
        // "subtract A from B" enters B first
        return Step(op, second.value, first.value);
    }
    return Step(op, first.value, second.value);
}

bool InstructionParser::hasReversalMarker(const std::vector<std::string>& clause, size_t from, size_t to) const {
    for (size_t i = from + 1; i < to && i < clause.size(); ++i) {
        if (clause[i] == m_lexicon.reversalMarker()) {
            return true;
        }
    }
    return false;
}

bool InstructionParser::matchesAt(const std::vector<std::string>& tokens, size_t pos,
                                  const std::vector<std::string>& phrase) {
    if (phrase.empty() || pos + phrase.size() > tokens.size()) {
        return false;
    }
    for (size_t k = 0; k < phrase.size(); ++k) {
        if (tokens[pos + k] != phrase[k]) {
            return false;
        }
    }
    return true;
}

int64_t InstructionParser::parseDigits(const std::string& token) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    int64_t value = 0;
    for (char c : token) {
        int digit = c - '0';
        if (value > (max - digit) / 10) {
            throw NumberParseError("Number is too large", token);
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace calcpilot
