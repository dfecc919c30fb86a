#include "config_manager.h"
#include "structured_logger.h"
#include "error_handler.h"
#include "file_utils.h"
#include <cstdlib>

namespace calcpilot {

ConfigManager::ConfigManager() : m_config(defaults()) {}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    m_configPath = configPath;
    m_config = defaults();

    if (!utils::FileUtils::fileExists(configPath)) {
        SLOG_WARNING().message("Config file not found, writing defaults").context("config_path", configPath);
        return saveConfig(configPath);
    }

    nlohmann::json loaded;
    if (!utils::FileUtils::loadJsonFromFile(configPath, loaded) || !loaded.is_object()) {
        throw ConfigurationError("Configuration file is not a valid JSON object", configPath, "loadConfig");
    }

    // Keys absent from the file keep their defaults
    m_config.merge_patch(loaded);
    validate();

    SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
    return true;
}

bool ConfigManager::saveConfig(const std::string& configPath) const {
    if (!utils::FileUtils::saveJsonToFile(configPath, m_config)) {
        SLOG_ERROR().message("Failed to save configuration").context("config_path", configPath);
        return false;
    }
    return true;
}

void ConfigManager::resetToDefaults() {
    m_config = defaults();
    m_configPath.clear();
}

nlohmann::json ConfigManager::defaults() {
    return nlohmann::json{
        {"application", {
            {"window_title", "Calculator"},
#ifdef _WIN32
            {"launch_command", "calc.exe"},
#else
            {"launch_command", "gnome-calculator"},
#endif
            {"launch_timeout_ms", 5000},
            {"excluded_titles", nlohmann::json::array({"cursor", "code", "visual studio", "pycharm", "intellij"})}
        }},
        {"registry", {
            {"path", "data/calc/fdom.json"},
            {"state", "root"}
        }},
        {"execution", {
            {"settle_delay_ms", 500},
            {"click_delay_ms", 10},
            {"focus_before_click", true},
            {"focus_delay_ms", 100},
            {"window_retry_count", 2},
            {"window_retry_delay_ms", 1000}
        }},
        {"logging", {
            {"level", "INFO"},
            {"file", "logs/calcpilot.log"},
            {"max_size_mb", 10},
            {"max_files", 5},
            {"async", false},
            {"slow_operation_ms", 2000}
        }}
    };
}

void ConfigManager::validate() const {
    const std::vector<std::pair<std::string, std::string>> nonNegative = {
        {"application", "launch_timeout_ms"},
        {"execution", "settle_delay_ms"},
        {"execution", "click_delay_ms"},
        {"execution", "focus_delay_ms"},
        {"execution", "window_retry_count"},
        {"execution", "window_retry_delay_ms"},
        {"logging", "max_size_mb"},
        {"logging", "max_files"},
        {"logging", "slow_operation_ms"}
    };

    auto lookup = [this](const std::string& section, const std::string& key) -> const nlohmann::json& {
        auto sectionIt = m_config.find(section);
        if (sectionIt == m_config.end() || !sectionIt->is_object()) {
            throw ConfigurationError("Configuration section missing or not an object", section, m_configPath);
        }
        auto keyIt = sectionIt->find(key);
        if (keyIt == sectionIt->end()) {
            throw ConfigurationError("Configuration key missing", section + "." + key, m_configPath);
        }
        return *keyIt;
    };

    for (const auto& [section, key] : nonNegative) {
        const auto& value = lookup(section, key);
        if (!value.is_number_integer() || value.get<long long>() < 0) {
            throw ConfigurationError("Configuration value must be a non-negative integer",
                                     section + "." + key + " = " + value.dump(), m_configPath);
        }
    }

    const auto& registryPath = lookup("registry", "path");
    if (!registryPath.is_string() || registryPath.get<std::string>().empty()) {
        throw ConfigurationError("registry.path must be a non-empty string", "", m_configPath);
    }
    if (!lookup("application", "excluded_titles").is_array()) {
        throw ConfigurationError("application.excluded_titles must be an array", "", m_configPath);
    }
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

std::string ConfigManager::getWindowTitle() const {
    return get<std::string>("application", "window_title", "Calculator");
}

std::string ConfigManager::getLaunchCommand() const {
    return get<std::string>("application", "launch_command", "");
}

int ConfigManager::getLaunchTimeoutMs() const {
    return get<int>("application", "launch_timeout_ms", 5000);
}

std::vector<std::string> ConfigManager::getExcludedTitles() const {
    return get<std::vector<std::string>>("application", "excluded_titles", {});
}

std::string ConfigManager::getRegistryPath() const {
    std::string fromEnv = getEnvironmentVariable("CALCPILOT_REGISTRY");
    if (!fromEnv.empty()) {
        return fromEnv;
    }
    return get<std::string>("registry", "path", "data/calc/fdom.json");
}

std::string ConfigManager::getRegistryState() const {
    return get<std::string>("registry", "state", "root");
}

int ConfigManager::getSettleDelayMs() const {
    return get<int>("execution", "settle_delay_ms", 500);
}

int ConfigManager::getClickDelayMs() const {
    return get<int>("execution", "click_delay_ms", 10);
}

bool ConfigManager::getFocusBeforeClick() const {
    return get<bool>("execution", "focus_before_click", true);
}

int ConfigManager::getFocusDelayMs() const {
    return get<int>("execution", "focus_delay_ms", 100);
}

int ConfigManager::getWindowRetryCount() const {
    return get<int>("execution", "window_retry_count", 2);
}

int ConfigManager::getWindowRetryDelayMs() const {
    return get<int>("execution", "window_retry_delay_ms", 1000);
}

std::string ConfigManager::getLogFile() const {
    return get<std::string>("logging", "file", "logs/calcpilot.log");
}

std::string ConfigManager::getLogLevel() const {
    return get<std::string>("logging", "level", "INFO");
}

int ConfigManager::getLogMaxSizeMb() const {
    return get<int>("logging", "max_size_mb", 10);
}

int ConfigManager::getLogMaxFiles() const {
    return get<int>("logging", "max_files", 5);
}

bool ConfigManager::getLogAsync() const {
    return get<bool>("logging", "async", false);
}

int ConfigManager::getSlowOperationMs() const {
    return get<int>("logging", "slow_operation_ms", 2000);
}

std::string ConfigManager::getConfigPath() const {
    return m_configPath;
}

} // namespace calcpilot
