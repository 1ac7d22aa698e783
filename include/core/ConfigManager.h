#ifndef BULK_RENAME_CONFIG_MANAGER_H
#define BULK_RENAME_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>

#include "core/Error.h"

namespace BulkRename {

/**
 * Manages application configuration
 *
 * Values live in a JSON document addressed by dotted keys
 * ("rename.padding"). Loaded files are merged over the built-in
 * defaults, so a user file only needs the keys it changes.
 */
class ConfigManager {
public:
    // Singleton pattern
    static ConfigManager& getInstance();

    // Delete copy constructor and assignment
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Load configuration from file
     * @param filePath Path to configuration file
     * @return Error with CONFIG_FILE_NOT_FOUND or CONFIG_PARSE_ERROR on failure
     */
    Result<void> loadConfig(const std::string& filePath);

    /**
     * Save configuration to file
     * @param filePath Path to save configuration (empty = last loaded path)
     */
    Result<void> saveConfig(const std::string& filePath = "");

    /**
     * Path of the last loaded or saved file, empty if none
     */
    const std::string& getConfigFilePath() const { return m_configFilePath; }

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    bool getBool(const std::string& key, bool defaultValue = false) const;

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setBool(const std::string& key, bool value);

    bool hasKey(const std::string& key) const;

    void clear();
    void resetToDefaults();

    /**
     * Check the loaded values
     * @return One message per problem, empty if the configuration is usable
     */
    std::vector<std::string> validate() const;

    void setChangeCallback(std::function<void(const std::string&)> callback);

    std::string exportToJson(bool prettyPrint = true) const;

    /**
     * Replace the configuration with a JSON document merged over the defaults
     * @return false if the text is not a JSON object
     */
    bool importFromJson(const std::string& jsonString);

    static nlohmann::json getDefaultConfig();

    static nlohmann::json mergeConfigs(const nlohmann::json& base,
                                       const nlohmann::json& overlay);

    /**
     * Default location: $HOME/.bulkrename/config.json
     */
    static std::string getDefaultConfigPath();

    // Specific application configurations
    struct RenameConfig {
        bool fullMatch;
        bool recursive;
        int padding;
        std::string onError;   // "stop" or "continue"
        std::string root;
    };

    struct LogConfig {
        std::string level;
        bool console;
        bool color;
        std::string directory;
    };

    RenameConfig getRenameConfig() const;
    LogConfig getLogConfig() const;

private:
    ConfigManager();
    ~ConfigManager() = default;

    nlohmann::json m_config;
    nlohmann::json m_defaultConfig;

    std::string m_configFilePath;

    std::function<void(const std::string&)> m_changeCallback;

    // Helper methods
    void initializeDefaults();
    const nlohmann::json* navigateToKey(const std::string& key) const;
    void setValueAtKey(const std::string& key, const nlohmann::json& value);
    std::vector<std::string> splitKey(const std::string& key) const;
    void notifyChange(const std::string& key);
};

} // namespace BulkRename

#endif // BULK_RENAME_CONFIG_MANAGER_H
