#ifndef CALCPILOT_FILE_UTILS_H
#define CALCPILOT_FILE_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace calcpilot {
namespace utils {

/**
 * @brief File I/O for configuration and registry documents
 */
class FileUtils {
public:
    /**
     * @brief Load and parse a JSON file
     * @param filePath Path to JSON file (must not be empty)
     * @param jsonOutput Receives the parsed document
     * @return true if the file was read and parsed
     * @note Failures are logged with the path and parser message
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);

    /**
     * @brief Save JSON through a temporary file and rename
     * @param filePath Destination path; parent directories are created
     * @param jsonData Document to write (pretty printed)
     * @return true if successful
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    /**
     * @brief True if the path names an existing regular file
     */
    static bool fileExists(const std::string& filePath);

    /**
     * @brief Create directory and parents if missing
     */
    static bool createDirectoryIfNotExists(const std::string& directoryPath);

private:
    static bool ensureParentDirectoryExists(const std::string& filePath);
};

} // namespace utils
} // namespace calcpilot

#endif // CALCPILOT_FILE_UTILS_H
