#include "lexicon.h"
#include "../common/string_utils.h"
#include <algorithm>

namespace calcpilot {

namespace {
    const char* const SPELLED_DIGITS[] = {
        "zero", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine"
    };

    const char* const TEENS[] = {
        "ten", "eleven", "twelve", "thirteen", "fourteen", "fifteen",
        "sixteen", "seventeen", "eighteen", "nineteen"
    };

    const char* const TENS[] = {
        "twenty", "thirty", "forty", "fifty", "sixty", "seventy", "eighty", "ninety"
    };
}

const Lexicon& Lexicon::standard() {
    static const Lexicon instance;
    return instance;
}

Lexicon::Lexicon() : m_reversalMarker("from") {
    m_connectives = {
        {"and", "then"},
        {"then"}
    };

    m_operatorKeywords = {
        {{"add"}, Operator::ADD},
        {{"plus"}, Operator::ADD},
        {{"addition"}, Operator::ADD},
        {{"sum"}, Operator::ADD},
        {{"subtract"}, Operator::SUBTRACT},
        {{"minus"}, Operator::SUBTRACT},
        {{"subtraction"}, Operator::SUBTRACT},
        {{"multiply"}, Operator::MULTIPLY},
        {{"multiplied"}, Operator::MULTIPLY},
        {{"times"}, Operator::MULTIPLY},
        {{"multiplication"}, Operator::MULTIPLY},
        {{"divide"}, Operator::DIVIDE},
        {{"divided"}, Operator::DIVIDE},
        {{"division"}, Operator::DIVIDE},
        {{"square"}, Operator::SQUARE},
        {{"squared"}, Operator::SQUARE},
        {{"square", "root"}, Operator::SQRT},
        {{"sqrt"}, Operator::SQRT},
        {{"root"}, Operator::SQRT}
    };

    for (int64_t i = 0; i < 10; ++i) {
        m_units[SPELLED_DIGITS[i]] = i;
        m_units[TEENS[i]] = 10 + i;
    }
    for (int64_t i = 0; i < 8; ++i) {
        m_tens[TENS[i]] = 20 + 10 * i;
    }
    m_scaleWords = {"hundred", "thousand", "million", "billion"};

    for (int d = 0; d < 10; ++d) {
        std::string glyph = std::to_string(d);
        m_buttonSynonyms.push_back({ButtonSymbol::digit(d),
                                    {glyph, glyph + " button", SPELLED_DIGITS[d]},
                                    {}});
    }

    m_buttonSynonyms.push_back({ButtonSymbol::forOperator(Operator::ADD),
                                {"+", "+ button", "plus", "add", "addition"},
                                {"addition", "plus button"}});
    m_buttonSynonyms.push_back({ButtonSymbol::forOperator(Operator::SUBTRACT),
                                {"-", "- button", "−", "− button", "minus", "subtract", "subtraction"},
                                {"subtraction", "minus button"}});
    m_buttonSynonyms.push_back({ButtonSymbol::forOperator(Operator::MULTIPLY),
                                {"×", "× button", "*", "x", "multiply", "multiplication", "times"},
                                {"multiplication", "multiply"}});
    m_buttonSynonyms.push_back({ButtonSymbol::forOperator(Operator::DIVIDE),
                                {"÷", "÷ button", "/", "divide", "division"},
                                {"division", "divide"}});
    m_buttonSynonyms.push_back({ButtonSymbol::evaluate(),
                                {"=", "= button", "equals", "equal"},
                                {"equals"}});
    m_buttonSynonyms.push_back({ButtonSymbol::forOperator(Operator::SQUARE),
                                {"square", "squared", "x²", "x² button", "x^2", "sqr"},
                                {"x²", "square of"}});
    m_buttonSynonyms.push_back({ButtonSymbol::forOperator(Operator::SQRT),
                                {"√", "√x", "√x button", "sqrt", "square root", "root"},
                                {"square root", "√x"}});

    sortByLength();
}

void Lexicon::sortByLength() {
    std::stable_sort(m_connectives.begin(), m_connectives.end(),
                     [](const auto& a, const auto& b) { return a.size() > b.size(); });
    std::stable_sort(m_operatorKeywords.begin(), m_operatorKeywords.end(),
                     [](const OperatorKeyword& a, const OperatorKeyword& b) {
                         return a.tokens.size() > b.tokens.size();
                     });
}

void Lexicon::addConnective(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        return;
    }
    m_connectives.push_back(tokens);
    sortByLength();
}

void Lexicon::addOperatorKeyword(const std::vector<std::string>& tokens, Operator op) {
    if (tokens.empty()) {
        return;
    }
    m_operatorKeywords.push_back({tokens, op});
    sortByLength();
}

std::optional<int64_t> Lexicon::unitValue(const std::string& word) const {
    auto it = m_units.find(word);
    if (it == m_units.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> Lexicon::tensValue(const std::string& word) const {
    auto it = m_tens.find(word);
    if (it == m_tens.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Lexicon::isScaleWord(const std::string& word) const {
    return std::find(m_scaleWords.begin(), m_scaleWords.end(), word) != m_scaleWords.end();
}

bool Lexicon::isNumberWord(const std::string& word) const {
    return m_units.count(word) > 0 || m_tens.count(word) > 0 || isScaleWord(word);
}

const Lexicon::ButtonSynonyms* Lexicon::synonymsFor(const ButtonSymbol& symbol) const {
    if (symbol.kind == ButtonSymbol::Kind::NAMED) {
        return nullptr;
    }
    for (const auto& entry : m_buttonSynonyms) {
        if (entry.symbol == symbol) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<ButtonSymbol> Lexicon::symbolForName(const std::string& name) const {
    std::string key = utils::StringUtils::toLowerCase(utils::StringUtils::trim(name));
    if (key.empty()) {
        return std::nullopt;
    }
    for (const auto& entry : m_buttonSynonyms) {
        if (key == entry.symbol.name) {
            return entry.symbol;
        }
        for (const auto& alias : entry.exactAliases) {
            if (key == alias) {
                return entry.symbol;
            }
        }
    }
    return std::nullopt;
}

} // namespace calcpilot
