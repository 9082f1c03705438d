#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed dotted-key access and watchers.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "rsk/foundation/kit_result.hpp"

namespace rsk::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration store.
///
/// The YAML tree is flattened into dotted keys ("circuit_breaker.failure_threshold")
/// on load, which sidesteps yaml-cpp's reference semantics when values are
/// later overwritten with set().
///
/// Example:
/// @code
///   ConfigManager config;
///   if (auto loaded = config.load("toolkit.yaml"); !loaded) {
///       RSK_LOG_ERROR(LogCategory::Core, std::string(loaded.error().message()));
///   }
///   auto concurrency = config.getOr<int>("pool.concurrency", 5);
/// @endcode
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    KitResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    KitResult<void> loadFromString(std::string_view yaml);

    /// Typed value by dotted key.
    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    KitResult<T> get(std::string_view key) const;

    /// Typed value, or @p fallback when the key is absent.
    /// A present but malformed value still reports ConfigTypeMismatch.
    template <typename T>
    KitResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value and notify watchers for @p key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback fired when @p key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All flattened keys, sorted.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
KitResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return KitResult<T>::err(
            KitError(ErrorCode::ConfigKeyNotFound,
                     std::string("config key not found: ") + std::string(key)));
    }
    try {
        return KitResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return KitResult<T>::err(
            KitError(ErrorCode::ConfigTypeMismatch,
                     std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
KitResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return KitResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace rsk::foundation
