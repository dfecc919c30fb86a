#ifndef CALCPILOT_CONFIG_MANAGER_H
#define CALCPILOT_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace calcpilot {

class ConfigManager {
public:
    static ConfigManager& getInstance();

    // Missing file: defaults are kept and written out. Unreadable file: ConfigurationError.
    bool loadConfig(const std::string& configPath = "config/calcpilot.json");
    bool saveConfig(const std::string& configPath) const;
    void resetToDefaults();

    // Application window
    std::string getWindowTitle() const;
    std::string getLaunchCommand() const;
    int getLaunchTimeoutMs() const;
    std::vector<std::string> getExcludedTitles() const;

    // Element registry; CALCPILOT_REGISTRY overrides the path
    std::string getRegistryPath() const;
    std::string getRegistryState() const;

    // Execution pacing
    int getSettleDelayMs() const;
    int getClickDelayMs() const;
    bool getFocusBeforeClick() const;
    int getFocusDelayMs() const;
    int getWindowRetryCount() const;
    int getWindowRetryDelayMs() const;

    // Logging
    std::string getLogFile() const;
    std::string getLogLevel() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;
    bool getLogAsync() const;
    int getSlowOperationMs() const;

    std::string getConfigPath() const;

    template<typename T>
    T get(const std::string& section, const std::string& key, const T& fallback) const;

    template<typename T>
    void set(const std::string& section, const std::string& key, const T& value);

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    nlohmann::json m_config;
    std::string m_configPath;

    static nlohmann::json defaults();
    void validate() const;
    std::string getEnvironmentVariable(const std::string& name) const;
};

template<typename T>
T ConfigManager::get(const std::string& section, const std::string& key, const T& fallback) const {
    if (!m_config.contains(section) || !m_config[section].is_object() ||
        !m_config[section].contains(key)) {
        return fallback;
    }
    try {
        return m_config[section][key].get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

template<typename T>
void ConfigManager::set(const std::string& section, const std::string& key, const T& value) {
    m_config[section][key] = value;
}

} // namespace calcpilot

#endif // CALCPILOT_CONFIG_MANAGER_H
