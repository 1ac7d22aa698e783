/**
 * ConfigManager Implementation
 */

#include "core/ConfigManager.h"
#include "core/LogManager.h"
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace BulkRename {

ConfigManager::ConfigManager() {
    initializeDefaults();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

std::string ConfigManager::getDefaultConfigPath() {
    std::string home;
    const char* homeEnv = std::getenv("HOME");
    if (homeEnv) {
        home = homeEnv;
    }
    if (home.empty()) {
        home = ".";
    }
    return home + "/.bulkrename/config.json";
}

Result<void> ConfigManager::loadConfig(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return Error(ErrorCode::CONFIG_FILE_NOT_FOUND, "Failed to open config file", filePath);
    }

    nlohmann::json loaded;
    try {
        file >> loaded;
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorCode::CONFIG_PARSE_ERROR, "Error parsing config file",
                     filePath + ": " + e.what());
    }

    if (!loaded.is_object()) {
        return Error(ErrorCode::CONFIG_PARSE_ERROR, "Config root must be a JSON object", filePath);
    }

    m_config = mergeConfigs(m_defaultConfig, loaded);
    m_configFilePath = filePath;

    LogManager::instance().logWithContext(LogLevel::Debug, LogCategory::Config,
        "config loaded", "", filePath);

    if (m_changeCallback) {
        m_changeCallback("config_loaded");
    }

    return Result<void>();
}

Result<void> ConfigManager::saveConfig(const std::string& filePath) {
    std::string targetPath = filePath.empty() ? m_configFilePath : filePath;
    if (targetPath.empty()) {
        return Error(ErrorCode::CONFIG_WRITE_ERROR, "No config file path specified");
    }

    std::ofstream file(targetPath);
    if (!file.is_open()) {
        return Error(ErrorCode::CONFIG_WRITE_ERROR, "Failed to open config file for writing", targetPath);
    }

    file << m_config.dump(4) << "\n";
    file.flush();
    if (file.fail()) {
        return Error(ErrorCode::CONFIG_WRITE_ERROR, "Failed to write config file", targetPath);
    }

    m_configFilePath = targetPath;
    return Result<void>();
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_string()) {
        return value->get<std::string>();
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_number_integer()) {
        return value->get<int>();
    }
    return defaultValue;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    const nlohmann::json* value = navigateToKey(key);
    if (value && value->is_boolean()) {
        return value->get<bool>();
    }
    return defaultValue;
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    setValueAtKey(key, nlohmann::json(value));
    notifyChange(key);
}

void ConfigManager::setInt(const std::string& key, int value) {
    setValueAtKey(key, nlohmann::json(value));
    notifyChange(key);
}

void ConfigManager::setBool(const std::string& key, bool value) {
    setValueAtKey(key, nlohmann::json(value));
    notifyChange(key);
}

bool ConfigManager::hasKey(const std::string& key) const {
    return navigateToKey(key) != nullptr;
}

void ConfigManager::clear() {
    m_config = nlohmann::json::object();
    notifyChange("config_cleared");
}

void ConfigManager::resetToDefaults() {
    m_config = m_defaultConfig;
    m_configFilePath.clear();
    notifyChange("config_reset");
}

std::vector<std::string> ConfigManager::validate() const {
    std::vector<std::string> problems;

    const nlohmann::json* padding = navigateToKey("rename.padding");
    if (padding && !padding->is_number_integer()) {
        problems.push_back("rename.padding must be an integer");
    } else if (padding && padding->get<int>() < 0) {
        problems.push_back("rename.padding must not be negative");
    }

    for (const char* key : {"rename.fullMatch", "rename.recursive", "log.console", "log.color"}) {
        const nlohmann::json* value = navigateToKey(key);
        if (value && !value->is_boolean()) {
            problems.push_back(std::string(key) + " must be a boolean");
        }
    }

    std::string onError = getString("rename.onError", "stop");
    if (onError != "stop" && onError != "continue") {
        problems.push_back("rename.onError must be \"stop\" or \"continue\", got \"" + onError + "\"");
    }

    std::string level = getString("log.level", "info");
    if (!LogManager::isValidLevelName(level)) {
        problems.push_back("log.level is not a known level: \"" + level + "\"");
    }

    return problems;
}

std::string ConfigManager::exportToJson(bool prettyPrint) const {
    if (prettyPrint) {
        return m_config.dump(4);
    }
    return m_config.dump();
}

bool ConfigManager::importFromJson(const std::string& jsonString) {
    nlohmann::json parsed = nlohmann::json::parse(jsonString, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LogManager::instance().log(LogLevel::Warning, LogCategory::Config,
            "import failed", "text is not a JSON object");
        return false;
    }
    m_config = mergeConfigs(m_defaultConfig, parsed);
    notifyChange("config_imported");
    return true;
}

void ConfigManager::setChangeCallback(std::function<void(const std::string&)> callback) {
    m_changeCallback = callback;
}

// Helper methods
void ConfigManager::initializeDefaults() {
    m_defaultConfig = {
        {"rename", {
            {"fullMatch", false},
            {"recursive", false},
            {"padding", 0},
            {"onError", "stop"},
            {"root", "."}
        }},
        {"log", {
            {"level", "info"},
            {"console", true},
            {"color", true},
            {"directory", ""}
        }}
    };
    m_config = m_defaultConfig;
}

const nlohmann::json* ConfigManager::navigateToKey(const std::string& key) const {
    auto keys = splitKey(key);
    if (keys.empty()) return nullptr;

    const nlohmann::json* current = &m_config;
    for (const auto& k : keys) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(k);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

void ConfigManager::setValueAtKey(const std::string& key, const nlohmann::json& value) {
    auto keys = splitKey(key);
    if (keys.empty()) return;

    nlohmann::json* current = &m_config;
    for (size_t i = 0; i < keys.size() - 1; ++i) {
        if (!current->contains(keys[i]) || !(*current)[keys[i]].is_object()) {
            (*current)[keys[i]] = nlohmann::json::object();
        }
        current = &(*current)[keys[i]];
    }

    (*current)[keys.back()] = value;
}

std::vector<std::string> ConfigManager::splitKey(const std::string& key) const {
    std::vector<std::string> result;
    std::stringstream ss(key);
    std::string item;

    while (std::getline(ss, item, '.')) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

void ConfigManager::notifyChange(const std::string& key) {
    if (m_changeCallback) {
        m_changeCallback(key);
    }
}

nlohmann::json ConfigManager::getDefaultConfig() {
    return getInstance().m_defaultConfig;
}

nlohmann::json ConfigManager::mergeConfigs(const nlohmann::json& base, const nlohmann::json& overlay) {
    nlohmann::json result = base;

    for (const auto& item : overlay.items()) {
        const std::string& key = item.key();
        const nlohmann::json& value = item.value();

        if (result.contains(key) && result[key].is_object() && value.is_object()) {
            result[key] = mergeConfigs(result[key], value);
        } else {
            result[key] = value;
        }
    }

    return result;
}

ConfigManager::RenameConfig ConfigManager::getRenameConfig() const {
    RenameConfig config;
    config.fullMatch = getBool("rename.fullMatch", false);
    config.recursive = getBool("rename.recursive", false);
    config.padding = getInt("rename.padding", 0);
    config.onError = getString("rename.onError", "stop");
    config.root = getString("rename.root", ".");
    return config;
}

ConfigManager::LogConfig ConfigManager::getLogConfig() const {
    LogConfig config;
    config.level = getString("log.level", "info");
    config.console = getBool("log.console", true);
    config.color = getBool("log.color", true);
    config.directory = getString("log.directory", "");
    return config;
}

} // namespace BulkRename
