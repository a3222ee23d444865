/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <tuple>

namespace MapForge {

SettingsManager::SettingValue SettingsManager::toSettingValue(const std::string& text, bool quoted) {
    if (quoted) {
        return text;
    }
    if (text == "yes" || text == "no" || text == "true" || text == "false") {
        return text == "yes" || text == "true";
    }
    try {
        return static_cast<int>(ScalarTraits<int32_t>::parse(text, "int"));
    } catch (const MapError&) {
        // not an integer, try float next
    }
    try {
        return ScalarTraits<float>::parse(text, "float");
    } catch (const MapError&) {
        return text;
    }
}

bool SettingsManager::loadFromFile(const std::filesystem::path& filepath) {
    ClauseReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath.string() + " - " + reader.getLastError());
        return false;
    }

    std::vector<std::tuple<std::string, std::string, SettingValue>> loaded;
    for (const auto& category : reader.getRoot().entries()) {
        if (!category.key || !category.value.isObject()) {
            SETTINGS_WARNING(std::format("{}: top-level entry '{}' is not a category block, skipping",
                                         filepath.string(), category.key.value_or("")));
            continue;
        }
        for (const auto& setting : category.value.entries()) {
            if (!setting.value.isScalar()) {
                SETTINGS_WARNING(std::format("{}: setting '{}.{}' is not a scalar, skipping",
                                             filepath.string(), *category.key, *setting.key));
                continue;
            }
            loaded.emplace_back(*category.key, *setting.key,
                                toSettingValue(setting.value.asScalar(), setting.value.isQuoted()));
        }
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [category, key, value] : loaded) {
            m_settings[category][key] = value;
        }
    }
    for (const auto& [category, key, value] : loaded) {
        notifyListeners(category, key, value);
    }

    SETTINGS_INFO(std::format("Loaded {} settings from file: {}", loaded.size(), filepath.string()));
    return true;
}

bool SettingsManager::saveToFile(const std::filesystem::path& filepath) const {
    ClauseValue document = ClauseValue::block();
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

        std::vector<std::string> categories;
        for (const auto& [category, _] : m_settings) {
            categories.push_back(category);
        }
        std::sort(categories.begin(), categories.end());

        for (const auto& category : categories) {
            const CategorySettings& settings = m_settings.at(category);
            std::vector<std::string> keys;
            for (const auto& [key, _] : settings) {
                keys.push_back(key);
            }
            std::sort(keys.begin(), keys.end());

            ClauseValue block = ClauseValue::block();
            for (const auto& key : keys) {
                block.add(key, std::visit([](auto&& arg) -> ClauseValue {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, bool>) {
                        return ClauseValue::scalar(ScalarTraits<bool>::format(arg));
                    } else if constexpr (std::is_same_v<T, int>) {
                        return ClauseValue::scalar(std::to_string(arg));
                    } else if constexpr (std::is_same_v<T, float>) {
                        std::string text = ScalarTraits<float>::format(arg);
                        // Keep a fraction so the value reloads as float
                        if (text.find_first_of(".e") == std::string::npos) {
                            text += ".0";
                        }
                        return ClauseValue::scalar(std::move(text));
                    } else {
                        return ClauseValue::scalar(arg, true);
                    }
                }, settings.at(key)));
            }
            document.add(category, std::move(block));
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath.string());
        return false;
    }
    file << document.toDocument();
    if (!file) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath.string());
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath.string());
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.contains(key);
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

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category, ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);

    size_t id = m_nextCallbackId++;
    m_listeners.push_back({id, category, std::move(callback)});
    return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
    std::lock_guard<std::mutex> lock(m_listenersMutex);
    std::erase_if(m_listeners, [callbackId](const ListenerInfo& info) { return info.id == callbackId; });
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

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void SettingsManager::notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue) {
    std::vector<ChangeCallback> matching;
    {
        std::lock_guard<std::mutex> lock(m_listenersMutex);
        for (const auto& listener : m_listeners) {
            // An empty category watches everything
            if (listener.category.empty() || listener.category == category) {
                matching.push_back(listener.callback);
            }
        }
    }

    // Callbacks may register or unregister listeners
    for (const auto& callback : matching) {
        callback(category, key, newValue);
    }
}

} // namespace MapForge
