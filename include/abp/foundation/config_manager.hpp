#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "abp/foundation/planner_result.hpp"

namespace abp::foundation {

/// YAML configuration flattened into dotted keys.
///
/// Maps are flattened ("catalog.capacity.couch"); sequences and scalars
/// are stored as leaves, so a duration range `[3, 8]` is read back with
/// `get<std::vector<float>>("catalog.durations.wander")`.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    PlannerResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    PlannerResult<void> loadFromString(std::string_view document);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    PlannerResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back when the key is absent.
    /// A present key of the wrong type is still an error.
    template <typename T>
    PlannerResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a leaf value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Direct child names below @p prefix, sorted.
    ///
    /// For entries "catalog.capacity.couch" and "catalog.capacity.kitchen",
    /// childKeys("catalog.capacity") yields {"couch", "kitchen"}.
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
PlannerResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return PlannerResult<T>::err(
            PlannerError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key),
                         std::string(key)));
    }
    try {
        return PlannerResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return PlannerResult<T>::err(
            PlannerError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key),
                         std::string(key)));
    }
}

template <typename T>
PlannerResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return PlannerResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace abp::foundation
