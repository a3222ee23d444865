/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <filesystem>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace MapForge {

/**
 * @brief Thread-safe key/value settings grouped in categories
 *
 * Persisted in the clause format, one block per category:
 *
 *   layout = {
 *       manifest = "map/default.map"
 *       strategic_regions = "map/strategicregions"
 *   }
 *   report = { verbose = yes }
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile(root / "mapforge.cfg");
 *   auto manifest = settings.get<std::string>("layout", "manifest", "map/default.map");
 */
class SettingsManager {
public:
    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    // Called after a value is stored, with no lock held; may register or
    // unregister listeners
    using ChangeCallback = std::function<void(const std::string& category,
                                             const std::string& key,
                                             const SettingValue& newValue)>;

    /**
     * @brief Merges the categories of a clause settings file
     * @return false when the file cannot be read or parsed; settings already
     *         held are left untouched in that case
     *
     * Scalars read as bool (yes/no/true/false), then int, then float; anything
     * else, and every quoted value, is a string. Top-level entries that are not
     * blocks and nested blocks inside a category are skipped with a warning.
     */
    bool loadFromFile(const std::filesystem::path& filepath);

    // Writes every category as a clause block, categories and keys sorted
    bool saveToFile(const std::filesystem::path& filepath) const;

    /**
     * @brief Reads one value
     * @return defaultValue when the key is absent or holds another type; an
     *         int is accepted for T = float
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    /**
     * @brief Stores one value and notifies listeners of the category
     * @return false for types other than int, float, bool and string-like
     */
    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    // Drops the category once its last key is gone
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    // An empty category watches every category
    size_t registerChangeListener(const std::string& category, ChangeCallback callback);
    void unregisterChangeListener(size_t callbackId);

    // Both sorted
    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;

    struct ListenerInfo {
        size_t id;
        std::string category;
        ChangeCallback callback;
    };

    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    std::vector<ListenerInfo> m_listeners;
    mutable std::mutex m_listenersMutex;
    size_t m_nextCallbackId = 0;

    void notifyListeners(const std::string& category, const std::string& key, const SettingValue& newValue);
    static SettingValue toSettingValue(const std::string& text, bool quoted);

    SettingsManager() = default;
    ~SettingsManager() = default;
    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }
    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        // Whole numbers load as int
        if (const int* whole = std::get_if<int>(&keyIt->second)) {
            return static_cast<float>(*whole);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* stored = std::get_if<T>(&keyIt->second)) {
            return *stored;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
        m_settings[category][key] = settingValue;
    }

    // Listeners run without the settings lock so they may read settings
    notifyListeners(category, key, settingValue);
    return true;
}

} // namespace MapForge

#endif // SETTINGS_MANAGER_HPP
