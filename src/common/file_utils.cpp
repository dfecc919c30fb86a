#include "file_utils.h"
#include "structured_logger.h"
#include <fstream>
#include <filesystem>

namespace calcpilot {
namespace utils {

namespace fs = std::filesystem;

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty file path provided to loadJsonFromFile");
        return false;
    }

    if (!fileExists(filePath)) {
        SLOG_ERROR().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    try {
        jsonOutput = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    SLOG_DEBUG().message("Loaded JSON from file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty file path provided to saveJsonToFile");
        return false;
    }

    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    std::string tempFilePath = filePath + ".tmp";
    std::error_code ec;
    {
        std::ofstream tempFile(tempFilePath);
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }
        tempFile << jsonData.dump(2);
        tempFile.flush();
        if (tempFile.fail()) {
            SLOG_ERROR().message("Failed to write JSON to temporary file").context("temp_path", tempFilePath);
            tempFile.close();
            fs::remove(tempFilePath, ec);
            return false;
        }
    }

    fs::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file")
            .context("path", filePath)
            .context("error", ec.message());
        std::error_code cleanup;
        fs::remove(tempFilePath, cleanup);
        return false;
    }

    SLOG_INFO().message("Saved JSON to file").context("path", filePath);
    return true;
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (filePath.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(filePath, ec);
}

bool FileUtils::createDirectoryIfNotExists(const std::string& directoryPath) {
    if (directoryPath.empty()) {
        return false;
    }
    std::error_code ec;
    if (fs::is_directory(directoryPath, ec)) {
        return true;
    }
    fs::create_directories(directoryPath, ec);
    if (ec) {
        SLOG_ERROR().message("Cannot create directory")
            .context("path", directoryPath)
            .context("error", ec.message());
        return false;
    }
    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    fs::path parent = fs::path(filePath).parent_path();
    return parent.empty() || createDirectoryIfNotExists(parent.string());
}

} // namespace utils
} // namespace calcpilot
