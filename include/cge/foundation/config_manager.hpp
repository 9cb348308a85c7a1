#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed access and change watchers.

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cge/foundation/game_result.hpp"

namespace cge::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration manager giving typed access to dotted keys
/// (e.g. "rules.cultivation.mana_cost").
///
/// The YAML tree is flattened into a key-value map at load time to avoid
/// yaml-cpp reference-semantic pitfalls. The engine is single-threaded, so
/// the manager is owned by one caller and carries no lock.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any previous content.
    /// @return Success or ConfigLoadFailed.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when the key is absent.
    /// A present key of the wrong type is still a ConfigTypeMismatch.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Distinct child names directly below @p prefix, sorted.
    /// For "difficulties" with keys "difficulties.easy.name" and
    /// "difficulties.hard.name" this yields {"easy", "hard"}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    GameResult<void> loadNode(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    entries_[std::string(key)] = YAML::Node(value);
    notifyWatchers(key);
}

} // namespace cge::foundation
