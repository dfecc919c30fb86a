#include "json_utils.h"
#include "structured_logger.h"

namespace calcpilot {
namespace utils {

bool JsonUtils::hasField(const nlohmann::json& json, const std::string& fieldName) {
    return !fieldName.empty() && json.is_object() && json.contains(fieldName);
}

std::string JsonUtils::getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue) {
    if (!hasField(json, fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_string()) {
        return field.get<std::string>();
    }
    if (field.is_number_integer()) {
        return std::to_string(field.get<long long>());
    }

    SLOG_WARNING().message("Field is not a string, using default").context("field", fieldName);
    return defaultValue;
}

int JsonUtils::getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue) {
    if (!hasField(json, fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number_integer()) {
        return field.get<int>();
    }
    if (field.is_number_float()) {
        return static_cast<int>(field.get<double>());
    }
    if (field.is_string()) {
        try {
            return std::stoi(field.get<std::string>());
        } catch (const std::exception&) {
            SLOG_WARNING().message("Cannot convert string field to integer, using default").context("field", fieldName);
            return defaultValue;
        }
    }

    SLOG_WARNING().message("Field is not a number, using default").context("field", fieldName);
    return defaultValue;
}

bool JsonUtils::getObjectField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result) {
    if (!hasField(json, fieldName) || !json[fieldName].is_object()) {
        return false;
    }
    result = json[fieldName];
    return true;
}

bool JsonUtils::getArrayField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result) {
    if (!hasField(json, fieldName) || !json[fieldName].is_array()) {
        return false;
    }
    result = json[fieldName];
    return true;
}

bool JsonUtils::hasRequiredFields(const nlohmann::json& json, const std::vector<std::string>& requiredFields,
                                  std::string* missing) {
    for (const auto& field : requiredFields) {
        if (!hasField(json, field)) {
            if (missing) {
                *missing = field;
            }
            return false;
        }
    }
    return true;
}

} // namespace utils
} // namespace calcpilot
