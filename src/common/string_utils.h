#ifndef CALCPILOT_STRING_UTILS_H
#define CALCPILOT_STRING_UTILS_H

#include <string>
#include <vector>

namespace calcpilot {
namespace utils {

/**
 * @brief String helpers shared by the parser, registry and window lookup
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string trim(const std::string& str);

    /**
     * @brief Split on runs of whitespace, dropping empty pieces
     */
    static std::vector<std::string> splitWhitespace(const std::string& str);

    /**
     * @brief Case-sensitive prefix test
     */
    static bool startsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Case-sensitive suffix test
     */
    static bool endsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief ASCII lowercase; multi-byte UTF-8 sequences pass through untouched
     */
    static std::string toLowerCase(const std::string& str);

    /**
     * @brief ASCII uppercase; multi-byte UTF-8 sequences pass through untouched
     */
    static std::string toUpperCase(const std::string& str);

    /**
     * @brief Join strings with a delimiter
     * @param strings Pieces to join (can be empty)
     * @param delimiter Separator placed between pieces
     */
    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief True if the string is empty or only whitespace
     */
    static bool isWhitespaceOnly(const std::string& str);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace calcpilot

#endif // CALCPILOT_STRING_UTILS_H
