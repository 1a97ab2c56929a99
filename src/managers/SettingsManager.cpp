/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>

namespace Stormfire {

namespace {

void writeEscaped(std::ofstream& file, const std::string& text) {
    file << '"';
    for (char c : text) {
        switch (c) {
        case '"':  file << "\\\""; break;
        case '\\': file << "\\\\"; break;
        case '\n': file << "\\n"; break;
        case '\t': file << "\\t"; break;
        default:   file << c; break;
        }
    }
    file << '"';
}

} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR(std::format("Failed to load settings from {}: {}", filepath, reader.getLastError()));
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    size_t loaded = 0;
    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;
            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double number = value.asNumber();
                if (std::trunc(number) == number && std::abs(number) < 2147483647.0) {
                    settingValue = static_cast<int>(number);
                } else {
                    settingValue = static_cast<float>(number);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            m_settings[categoryName][key] = std::move(settingValue);
            ++loaded;
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from {}", loaded, filepath));
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    file << "{\n";
    size_t categoryIndex = 0;
    for (const auto& [categoryName, categorySettings] : m_settings) {
        file << "  ";
        writeEscaped(file, categoryName);
        file << ": {\n";

        size_t keyIndex = 0;
        for (const auto& [key, value] : categorySettings) {
            file << "    ";
            writeEscaped(file, key);
            file << ": ";
            std::visit([&file](auto&& arg) {
                using T = std::decay_t<decltype(arg)>;
                if constexpr (std::is_same_v<T, bool>) {
                    file << (arg ? "true" : "false");
                } else if constexpr (std::is_same_v<T, std::string>) {
                    writeEscaped(file, arg);
                } else if constexpr (std::is_same_v<T, float>) {
                    // Whole floats keep a decimal point in the file
                    std::string text = std::format("{}", arg);
                    if (text.find_first_of(".e") == std::string::npos) {
                        text += ".0";
                    }
                    file << text;
                } else {
                    file << arg;
                }
            }, value);
            file << (++keyIndex < categorySettings.size() ? ",\n" : "\n");
        }

        file << "  }" << (++categoryIndex < m_settings.size() ? ",\n" : "\n");
    }
    file << "}\n";

    if (!file.good()) {
        SETTINGS_ERROR("Error while writing settings file: " + filepath);
        return false;
    }
    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

const SettingsManager::SettingValue* SettingsManager::find(const std::string& category, const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }
    auto keyIt = categoryIt->second.find(key);
    return keyIt == categoryIt->second.end() ? nullptr : &keyIt->second;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
    return find(category, key) != nullptr;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }
    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> keys;
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return keys;
    }
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace Stormfire
