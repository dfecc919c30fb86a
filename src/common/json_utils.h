#ifndef CALCPILOT_JSON_UTILS_H
#define CALCPILOT_JSON_UTILS_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace calcpilot {
namespace utils {

/**
 * @brief Tolerant field extraction for registry documents and tool arguments
 */
class JsonUtils {
public:
    /**
     * @brief Get string field with default
     * @param json Object to read from (non-objects yield the default)
     * @param fieldName Field name
     * @param defaultValue Returned when the field is missing or not a string
     */
    static std::string getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue = "");

    /**
     * @brief Get integer field with default
     * @note Floats are truncated; numeric strings are parsed
     */
    static int getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue = 0);

    /**
     * @brief Copy an object-valued field into result
     * @return true if the field exists and is an object
     */
    static bool getObjectField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result);

    /**
     * @brief Copy an array-valued field into result
     * @return true if the field exists and is an array
     */
    static bool getArrayField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result);

    /**
     * @brief Check that every listed field is present
     * @param missing Receives the first missing field name, if any
     */
    static bool hasRequiredFields(const nlohmann::json& json, const std::vector<std::string>& requiredFields,
                                  std::string* missing = nullptr);

private:
    static bool hasField(const nlohmann::json& json, const std::string& fieldName);
};

} // namespace utils
} // namespace calcpilot

#endif // CALCPILOT_JSON_UTILS_H
